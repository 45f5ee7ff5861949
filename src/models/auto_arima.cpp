#include "tabstat/models/auto_arima.hpp"

#include "tabstat/core/errors.hpp"
#include "tabstat/utils/logging.hpp"
#include "tabstat/utils/stationarity.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <map>
#include <stdexcept>
#include <thread>
#include <utility>

namespace tabstat::models {

namespace {

constexpr double kAicTieTolerance = 1e-9;

} // namespace

class AutoARIMA::CandidateEvaluator {
public:
	CandidateEvaluator(const std::vector<double> &data, int d, int conditioning, unsigned threads)
	    : data_(data), d_(d), conditioning_(conditioning), threads_(threads) {
	}

	CandidateResult evaluate(const Order &order) const;

	/// Fits every order; the returned results line up with `orders`.
	std::vector<CandidateResult> evaluateAll(const std::vector<Order> &orders) const;

private:
	const std::vector<double> &data_;
	int d_;
	int conditioning_;
	unsigned threads_;
};

AutoARIMA::CandidateResult AutoARIMA::CandidateEvaluator::evaluate(const Order &order) const {
	CandidateResult result;
	result.order = order;

	try {
		auto model = ARIMABuilder()
		                 .withAR(order.p)
		                 .withDifferencing(d_)
		                 .withMA(order.q)
		                 .withConditioning(conditioning_)
		                 .build();
		model->fit(data_);

		// Reject models with roots inside 1.01, as auto.arima does.
		if (!ARIMA::rootsOutsideUnitCircle(model->arCoefficients()) ||
		    !ARIMA::rootsOutsideUnitCircle(-model->maCoefficients())) {
			TABSTAT_DEBUG("AutoARIMA: ARIMA({},{},{}) is not admissible", order.p, d_, order.q);
			return result;
		}

		const auto aic = model->aic();
		if (aic && std::isfinite(*aic)) {
			result.valid = true;
			result.aic = *aic;
			result.model = std::move(model);
			TABSTAT_DEBUG("AutoARIMA: ARIMA({},{},{}) AIC={:.4f}", order.p, d_, order.q, result.aic);
		}
	} catch (const std::exception &ex) {
		TABSTAT_DEBUG("AutoARIMA: Failed to fit ARIMA({},{},{}): {}", order.p, d_, order.q, ex.what());
	}

	return result;
}

std::vector<AutoARIMA::CandidateResult> AutoARIMA::CandidateEvaluator::evaluateAll(
    const std::vector<Order> &orders) const {
	std::vector<CandidateResult> results(orders.size());
	if (orders.empty()) {
		return results;
	}

	unsigned n_threads = threads_ == 0 ? std::thread::hardware_concurrency() : threads_;
	n_threads = std::max(1u, std::min<unsigned>(n_threads, static_cast<unsigned>(orders.size())));

	if (n_threads == 1) {
		for (std::size_t i = 0; i < orders.size(); ++i) {
			results[i] = evaluate(orders[i]);
		}
		return results;
	}

	// evaluate() never throws, so workers need no failure channel.
	std::atomic<std::size_t> next{0};
	auto worker = [&]() {
		for (std::size_t i = next.fetch_add(1); i < orders.size(); i = next.fetch_add(1)) {
			results[i] = evaluate(orders[i]);
		}
	};
	std::vector<std::thread> pool;
	pool.reserve(n_threads);
	for (unsigned i = 0; i < n_threads; ++i) {
		pool.emplace_back(worker);
	}
	for (auto &thread : pool) {
		thread.join();
	}
	return results;
}

bool AutoARIMA::better(const CandidateResult &a, const CandidateResult &b) {
	if (!a.valid) {
		return false;
	}
	if (!b.valid) {
		return true;
	}
	const double tolerance = kAicTieTolerance * std::max(1.0, std::abs(b.aic));
	if (a.aic < b.aic - tolerance) {
		return true;
	}
	if (a.aic > b.aic + tolerance) {
		return false;
	}
	const int a_size = a.order.p + a.order.q;
	const int b_size = b.order.p + b.order.q;
	if (a_size != b_size) {
		return a_size < b_size;
	}
	return a.order.p < b.order.p;
}

void AutoARIMA::fit(const core::TimeSeries &ts) {
	fit(ts.values());
}

void AutoARIMA::fit(const std::vector<double> &values) {
	const std::size_t n = values.size();
	if (n < 2) {
		throw InsufficientDataError("time-series models need at least 2 points, got " + std::to_string(n));
	}
	for (double v : values) {
		if (!std::isfinite(v)) {
			throw std::invalid_argument("AutoARIMA requires finite observations.");
		}
	}

	is_fitted_ = false;
	fitted_model_.reset();
	diagnostics_ = AutoARIMADiagnostics{};
	diagnostics_.training_data_size = n;

	// The differenced series must keep at least two points.
	int d = 0;
	if (allow_differencing_) {
		const int max_d = std::min<int>(max_d_, static_cast<int>(n) - 2);
		d = utils::Stationarity::ndiffs(values, std::max(0, max_d));
	}

	const int m = static_cast<int>(n) - d;
	const int length_cap = std::max(0, m / 3 - 1);
	const int max_p = std::min(max_p_, length_cap);
	const int max_q = std::min(max_q_, length_cap);
	diagnostics_.search_max_p = max_p;
	diagnostics_.search_max_q = max_q;

	TABSTAT_DEBUG("AutoARIMA: n={}, d={}, searching p<={}, q<={}", n, d, max_p, max_q);

	// Every candidate is scored on the same observations so their AICs compare.
	const CandidateEvaluator evaluator(values, d, max_p, threads_);
	std::map<std::pair<int, int>, CandidateResult> evaluated;

	auto runBatch = [&](const std::vector<Order> &wanted) {
		std::vector<Order> pending;
		for (const auto &order : wanted) {
			const auto key = std::make_pair(order.p, order.q);
			const bool seen = evaluated.count(key) > 0 ||
			                  std::any_of(pending.begin(), pending.end(), [&](const Order &o) {
				                  return o.p == order.p && o.q == order.q;
			                  });
			if (seen) {
				continue;
			}
			if (static_cast<int>(evaluated.size() + pending.size()) >= max_models_) {
				break;
			}
			pending.push_back(order);
		}
		auto results = evaluator.evaluateAll(pending);
		for (auto &result : results) {
			++diagnostics_.models_evaluated;
			if (!result.valid) {
				++diagnostics_.models_failed;
			}
			evaluated.emplace(std::make_pair(result.order.p, result.order.q), std::move(result));
		}
	};

	auto inBounds = [&](const Order &order) {
		return order.p >= 0 && order.q >= 0 && order.p <= max_p && order.q <= max_q;
	};

	std::vector<Order> seeds;
	for (const Order &seed : {Order{0, 0}, Order{1, 0}, Order{0, 1}, Order{2, 2}}) {
		if (inBounds(seed)) {
			seeds.push_back(seed);
		}
	}
	runBatch(seeds);

	const CandidateResult *current = nullptr;
	for (const auto &seed : seeds) {
		const auto it = evaluated.find(std::make_pair(seed.p, seed.q));
		if (it != evaluated.end() && (current == nullptr || better(it->second, *current))) {
			current = &it->second;
		}
	}
	if (current == nullptr || !current->valid) {
		throw ModelFitFailedError("no admissible ARIMA model with d=" + std::to_string(d) + " (" +
		                          std::to_string(diagnostics_.models_failed) + " candidates failed)");
	}

	// Stepwise descent: the whole neighbourhood is fitted before choosing the move.
	while (true) {
		std::vector<Order> neighbours;
		for (int dp = -1; dp <= 1; ++dp) {
			for (int dq = -1; dq <= 1; ++dq) {
				const Order order{current->order.p + dp, current->order.q + dq};
				if ((dp != 0 || dq != 0) && inBounds(order)) {
					neighbours.push_back(order);
				}
			}
		}
		runBatch(neighbours);

		const CandidateResult *best_neighbour = nullptr;
		for (const auto &order : neighbours) {
			const auto it = evaluated.find(std::make_pair(order.p, order.q));
			if (it == evaluated.end()) {
				continue;
			}
			if (best_neighbour == nullptr || better(it->second, *best_neighbour)) {
				best_neighbour = &it->second;
			}
		}
		if (best_neighbour == nullptr || !better(*best_neighbour, *current)) {
			break;
		}
		current = best_neighbour;
	}

	const auto key = std::make_pair(current->order.p, current->order.q);
	fitted_model_ = std::move(evaluated.at(key).model);

	components_.p = fitted_model_->p();
	components_.d = fitted_model_->d();
	components_.q = fitted_model_->q();
	components_.include_constant = fitted_model_->hasConstant();

	metrics_ = AutoARIMAMetrics{};
	metrics_.log_likelihood = fitted_model_->logLikelihood();
	metrics_.aic = fitted_model_->aic().value_or(std::numeric_limits<double>::quiet_NaN());
	metrics_.bic = fitted_model_->bic().value_or(std::numeric_limits<double>::quiet_NaN());
	metrics_.sigma2 = fitted_model_->sigma2();

	is_fitted_ = true;
	TABSTAT_INFO("AutoARIMA selected ARIMA({},{},{}) with AIC={:.4f} after {} models ({} failed)", components_.p,
	             components_.d, components_.q, metrics_.aic, diagnostics_.models_evaluated,
	             diagnostics_.models_failed);
}

core::Forecast AutoARIMA::predict(int horizon) {
	if (!is_fitted_) {
		throw std::logic_error("AutoARIMA::predict called before fit.");
	}
	return fitted_model_->predict(horizon);
}

AutoARIMA &AutoARIMA::setMaxP(int max_p) {
	if (max_p < 0) {
		throw std::invalid_argument("max_p must be non-negative.");
	}
	max_p_ = max_p;
	return *this;
}

AutoARIMA &AutoARIMA::setMaxD(int max_d) {
	if (max_d < 0 || max_d > 2) {
		throw std::invalid_argument("max_d must be 0, 1, or 2.");
	}
	max_d_ = max_d;
	return *this;
}

AutoARIMA &AutoARIMA::setMaxQ(int max_q) {
	if (max_q < 0) {
		throw std::invalid_argument("max_q must be non-negative.");
	}
	max_q_ = max_q;
	return *this;
}

AutoARIMA &AutoARIMA::setMaxModels(int max_models) {
	if (max_models <= 0) {
		throw std::invalid_argument("max_models must be positive.");
	}
	max_models_ = max_models;
	return *this;
}

AutoARIMA &AutoARIMA::setAllowDifferencing(bool allow) {
	allow_differencing_ = allow;
	return *this;
}

AutoARIMA &AutoARIMA::setThreads(unsigned threads) {
	threads_ = threads;
	return *this;
}

const AutoARIMAComponents &AutoARIMA::components() const {
	if (!is_fitted_) {
		throw std::logic_error("AutoARIMA::components accessed before fit.");
	}
	return components_;
}

const AutoARIMAMetrics &AutoARIMA::metrics() const {
	if (!is_fitted_) {
		throw std::logic_error("AutoARIMA::metrics accessed before fit.");
	}
	return metrics_;
}

const AutoARIMADiagnostics &AutoARIMA::diagnostics() const {
	if (!is_fitted_) {
		throw std::logic_error("AutoARIMA::diagnostics accessed before fit.");
	}
	return diagnostics_;
}

const ARIMA &AutoARIMA::model() const {
	if (!is_fitted_) {
		throw std::logic_error("AutoARIMA::model accessed before fit.");
	}
	return *fitted_model_;
}

const std::vector<double> &AutoARIMA::fittedValues() const {
	if (!is_fitted_) {
		throw std::logic_error("AutoARIMA::fittedValues accessed before fit.");
	}
	return fitted_model_->fittedValues();
}

} // namespace tabstat::models
