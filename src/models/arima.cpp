#include "tabstat/models/arima.hpp"

#include "tabstat/utils/logging.hpp"
#include "tabstat/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>
#include <utility>

namespace tabstat::models {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kInfinity = std::numeric_limits<double>::infinity();

} // namespace

ARIMA::ARIMA(int p, int d, int q, bool include_constant, int conditioning)
    : p_(p), d_(d), q_(q), include_constant_(include_constant), conditioning_(conditioning) {
	if (p_ < 0 || q_ < 0) {
		throw std::invalid_argument("ARIMA orders p and q must be non-negative.");
	}
	if (d_ < 0 || d_ > 2) {
		throw std::invalid_argument("ARIMA differencing order d must be between 0 and 2.");
	}
	if (conditioning_ < 0) {
		throw std::invalid_argument("ARIMA conditioning length must be non-negative.");
	}
}

int ARIMA::parameterCount() const {
	return p_ + q_ + (include_constant_ ? 1 : 0) + 1;
}

std::vector<double> ARIMA::difference(const std::vector<double> &data, int d) {
	if (d < 0) {
		throw std::invalid_argument("Differencing order must be non-negative.");
	}
	if (data.size() <= static_cast<std::size_t>(d)) {
		throw std::invalid_argument("Not enough data to difference " + std::to_string(d) + " times.");
	}
	std::vector<double> result = data;
	for (int i = 0; i < d; ++i) {
		std::vector<double> next(result.size() - 1);
		for (std::size_t t = 1; t < result.size(); ++t) {
			next[t - 1] = result[t] - result[t - 1];
		}
		result = std::move(next);
	}
	return result;
}

std::vector<double> ARIMA::integrate(const std::vector<double> &forecast_diff, const std::vector<double> &last_values,
                                     int d) {
	if (d < 0 || last_values.size() != static_cast<std::size_t>(d)) {
		throw std::invalid_argument("Integration needs one trailing value per differencing level.");
	}
	std::vector<double> levels = last_values;
	std::vector<double> result;
	result.reserve(forecast_diff.size());
	for (double step : forecast_diff) {
		double value = step;
		for (int k = d - 1; k >= 0; --k) {
			value += levels[static_cast<std::size_t>(k)];
			levels[static_cast<std::size_t>(k)] = value;
		}
		result.push_back(value);
	}
	return result;
}

bool ARIMA::rootsOutsideUnitCircle(const Eigen::VectorXd &coeffs, double margin) {
	// Trailing zeros lower the polynomial degree without moving any roots.
	Eigen::Index k = coeffs.size();
	while (k > 0 && std::abs(coeffs(k - 1)) < 1e-10) {
		--k;
	}
	if (k == 0) {
		return true;
	}
	for (Eigen::Index i = 0; i < k; ++i) {
		if (!std::isfinite(coeffs(i))) {
			return false;
		}
	}
	if (k == 1) {
		return std::abs(coeffs(0)) < 1.0 / margin;
	}

	// Eigenvalues of the companion matrix are the reciprocals of the polynomial roots.
	Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(k, k);
	companion.row(0) = coeffs.head(k).transpose();
	for (Eigen::Index i = 1; i < k; ++i) {
		companion(i, i - 1) = 1.0;
	}
	Eigen::EigenSolver<Eigen::MatrixXd> solver(companion, false);
	if (solver.info() != Eigen::Success) {
		return false;
	}
	const auto &eigenvalues = solver.eigenvalues();
	for (Eigen::Index i = 0; i < eigenvalues.size(); ++i) {
		if (std::abs(eigenvalues(i)) >= 1.0 / margin) {
			return false;
		}
	}
	return true;
}

Eigen::VectorXd ARIMA::yuleWalker(const std::vector<double> &centered, int p) {
	if (p == 0) {
		return Eigen::VectorXd();
	}
	const auto n = centered.size();
	Eigen::VectorXd acov = Eigen::VectorXd::Zero(p + 1);
	for (int lag = 0; lag <= p; ++lag) {
		double sum = 0.0;
		for (std::size_t t = static_cast<std::size_t>(lag); t < n; ++t) {
			sum += centered[t] * centered[t - static_cast<std::size_t>(lag)];
		}
		acov(lag) = sum / static_cast<double>(n);
	}
	if (!(acov(0) > 0.0)) {
		return Eigen::VectorXd::Zero(p);
	}

	Eigen::MatrixXd R(p, p);
	for (int i = 0; i < p; ++i) {
		for (int j = 0; j < p; ++j) {
			R(i, j) = acov(std::abs(i - j));
		}
	}
	Eigen::VectorXd phi = R.colPivHouseholderQr().solve(acov.segment(1, p));
	if (!phi.allFinite()) {
		return Eigen::VectorXd::Zero(p);
	}
	return phi;
}

double ARIMA::conditionalSumOfSquares(const Eigen::VectorXd &ar, const Eigen::VectorXd &ma,
                                      std::vector<double> *errors_out) const {
	const auto m = differenced_history_.size();
	const auto p = static_cast<std::size_t>(p_);
	const std::size_t start = firstScoredIndex();
	std::vector<double> errors(m, 0.0);
	double sum_sq = 0.0;

	for (std::size_t t = p; t < m; ++t) {
		double prediction = 0.0;
		for (int i = 0; i < p_; ++i) {
			prediction += ar(i) * (differenced_history_[t - 1 - static_cast<std::size_t>(i)] - intercept_);
		}
		for (int j = 0; j < q_; ++j) {
			const auto lag = static_cast<std::size_t>(j) + 1;
			if (t >= lag) {
				prediction += ma(j) * errors[t - lag];
			}
		}
		errors[t] = (differenced_history_[t] - intercept_) - prediction;
		// Errors before `start` still feed the MA recursion but are not scored.
		if (t >= start) {
			sum_sq += errors[t] * errors[t];
		}
	}

	if (errors_out) {
		*errors_out = std::move(errors);
	}
	return std::isfinite(sum_sq) ? sum_sq : kInfinity;
}

void ARIMA::fit(const core::TimeSeries &ts) {
	fit(ts.values());
}

void ARIMA::fit(const std::vector<double> &values) {
	if (values.size() < 2) {
		throw std::invalid_argument("ARIMA requires at least two observations.");
	}
	is_fitted_ = false;
	history_ = values;
	differenced_history_ = difference(values, d_);

	const auto m = differenced_history_.size();
	const std::size_t start = firstScoredIndex();
	if (m <= start) {
		throw std::invalid_argument("Not enough data for the AR order and conditioning after differencing.");
	}
	const std::size_t n_eff = m - start;
	const int k = parameterCount();
	// The variance is not a regression parameter, so n_eff may equal k.
	if (n_eff < static_cast<std::size_t>(k)) {
		throw std::invalid_argument("Not enough observations to estimate " + std::to_string(k) + " parameters.");
	}

	last_values_.clear();
	for (int level = 0; level < d_; ++level) {
		last_values_.push_back(difference(values, level).back());
	}

	const double w_mean = std::accumulate(differenced_history_.begin(), differenced_history_.end(), 0.0) /
	                      static_cast<double>(m);
	intercept_ = include_constant_ ? w_mean : 0.0;

	std::vector<double> centered(m);
	double mean_square = 0.0;
	for (std::size_t t = 0; t < m; ++t) {
		centered[t] = differenced_history_[t] - intercept_;
		mean_square += differenced_history_[t] * differenced_history_[t];
	}
	mean_square /= static_cast<double>(m);

	// Yule-Walker starting values, pulled towards zero until they are stationary.
	Eigen::VectorXd ar_start = yuleWalker(centered, p_);
	for (int attempt = 0; attempt < 20 && !rootsOutsideUnitCircle(ar_start); ++attempt) {
		ar_start *= 0.5;
	}
	if (!rootsOutsideUnitCircle(ar_start)) {
		ar_start.setZero();
	}

	ar_coeffs_ = ar_start;
	ma_coeffs_ = Eigen::VectorXd::Zero(q_);

	if (p_ + q_ > 0) {
		std::vector<double> initial(static_cast<std::size_t>(p_ + q_), 0.0);
		for (int i = 0; i < p_; ++i) {
			initial[static_cast<std::size_t>(i)] = ar_start(i);
		}

		const auto objective = [this](const std::vector<double> &params) {
			Eigen::VectorXd ar(p_);
			Eigen::VectorXd ma(q_);
			for (int i = 0; i < p_; ++i) {
				ar(i) = params[static_cast<std::size_t>(i)];
			}
			for (int j = 0; j < q_; ++j) {
				ma(j) = params[static_cast<std::size_t>(p_ + j)];
			}
			if (!rootsOutsideUnitCircle(ar) || !rootsOutsideUnitCircle(-ma)) {
				return kInfinity;
			}
			return conditionalSumOfSquares(ar, ma, nullptr);
		};

		const double start_value = objective(initial);
		utils::NelderMeadOptimizer::Options options;
		options.max_iterations = 300 * (p_ + q_);
		options.tolerance = std::max(1e-14, 1e-10 * (std::isfinite(start_value) ? start_value : 1.0));

		const utils::NelderMeadOptimizer optimizer;
		const auto result = optimizer.minimize(objective, initial, options);
		if (!std::isfinite(result.value)) {
			throw std::runtime_error("ARIMA optimisation found no admissible parameters.");
		}
		for (int i = 0; i < p_; ++i) {
			ar_coeffs_(i) = result.best[static_cast<std::size_t>(i)];
		}
		for (int j = 0; j < q_; ++j) {
			ma_coeffs_(j) = result.best[static_cast<std::size_t>(p_ + j)];
		}
	}

	const double sum_sq = conditionalSumOfSquares(ar_coeffs_, ma_coeffs_, &innovations_);
	residuals_.assign(innovations_.begin() + static_cast<std::ptrdiff_t>(start), innovations_.end());
	if (!std::isfinite(sum_sq)) {
		throw std::runtime_error("ARIMA residuals are not finite.");
	}

	// An exact fit would make the likelihood unbounded; keep the variance above a scale-aware floor.
	const double variance_floor = 1e-10 * std::max(1.0, mean_square);
	sigma2_ = std::max(sum_sq / static_cast<double>(n_eff), variance_floor);

	const double n = static_cast<double>(n_eff);
	log_likelihood_ = -0.5 * n * (std::log(2.0 * kPi * sigma2_) + 1.0);
	aic_ = -2.0 * log_likelihood_ + 2.0 * static_cast<double>(k);
	bic_ = -2.0 * log_likelihood_ + static_cast<double>(k) * std::log(n);

	// The residual of w_t is also the one-step error of y_{t+d}.
	fitted_values_.assign(values.size(), std::numeric_limits<double>::quiet_NaN());
	for (std::size_t i = 0; i < residuals_.size(); ++i) {
		const std::size_t index = i + start + static_cast<std::size_t>(d_);
		fitted_values_[index] = values[index] - residuals_[i];
	}

	is_fitted_ = true;
	TABSTAT_DEBUG("ARIMA({},{},{}) fitted: sigma2={:.6g}, loglik={:.4f}, AIC={:.4f}", p_, d_, q_, sigma2_,
	              log_likelihood_, *aic_);
}

core::Forecast ARIMA::predict(int horizon) {
	if (!is_fitted_) {
		throw std::logic_error("ARIMA: call fit() before predict().");
	}
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}

	const auto m = differenced_history_.size();
	std::vector<double> centered(m);
	for (std::size_t t = 0; t < m; ++t) {
		centered[t] = differenced_history_[t] - intercept_;
	}
	std::vector<double> errors = innovations_;

	std::vector<double> forecast_diff;
	forecast_diff.reserve(static_cast<std::size_t>(horizon));
	for (int h = 0; h < horizon; ++h) {
		const std::size_t t = centered.size();
		double prediction = 0.0;
		for (int i = 0; i < p_; ++i) {
			prediction += ar_coeffs_(i) * centered[t - 1 - static_cast<std::size_t>(i)];
		}
		for (int j = 0; j < q_; ++j) {
			const auto lag = static_cast<std::size_t>(j) + 1;
			if (t >= lag) {
				prediction += ma_coeffs_(j) * errors[t - lag];
			}
		}
		centered.push_back(prediction);
		errors.push_back(0.0);
		forecast_diff.push_back(prediction + intercept_);
	}

	core::Forecast forecast;
	forecast.point = integrate(forecast_diff, last_values_, d_);
	return forecast;
}

ARIMABuilder &ARIMABuilder::withAR(int p) {
	p_ = p;
	return *this;
}

ARIMABuilder &ARIMABuilder::withDifferencing(int d) {
	d_ = d;
	return *this;
}

ARIMABuilder &ARIMABuilder::withMA(int q) {
	q_ = q;
	return *this;
}

ARIMABuilder &ARIMABuilder::withConditioning(int n) {
	conditioning_ = n;
	return *this;
}

ARIMABuilder &ARIMABuilder::withConstant(bool include_constant) {
	include_constant_ = include_constant;
	return *this;
}

std::unique_ptr<ARIMA> ARIMABuilder::build() {
	const bool constant = include_constant_.value_or(d_ <= 1);
	return std::unique_ptr<ARIMA>(new ARIMA(p_, d_, q_, constant, conditioning_));
}

} // namespace tabstat::models
