#include "tabstat/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace tabstat::utils {

namespace {

using Vertex = std::pair<std::vector<double>, double>;

void sortSimplex(std::vector<Vertex> &simplex) {
	std::stable_sort(simplex.begin(), simplex.end(),
	                 [](const Vertex &lhs, const Vertex &rhs) { return lhs.second < rhs.second; });
}

std::vector<double> centroid(const std::vector<Vertex> &simplex) {
	const std::size_t n = simplex.front().first.size();
	std::vector<double> center(n, 0.0);
	const std::size_t count = simplex.size() - 1; // exclude worst

	for (std::size_t i = 0; i < count; ++i) {
		const auto &point = simplex[i].first;
		for (std::size_t j = 0; j < n; ++j) {
			center[j] += point[j];
		}
	}
	for (double &value : center) {
		value /= static_cast<double>(count);
	}
	return center;
}

// center + coefficient * (to - center)
std::vector<double> along(const std::vector<double> &center, const std::vector<double> &to, double coefficient) {
	std::vector<double> point(center.size());
	for (std::size_t i = 0; i < center.size(); ++i) {
		point[i] = center[i] + coefficient * (to[i] - center[i]);
	}
	return point;
}

} // namespace

void NelderMeadOptimizer::enforceBounds(std::vector<double> &point, const std::vector<double> &lower,
                                        const std::vector<double> &upper) {
	for (std::size_t i = 0; i < point.size(); ++i) {
		if (!lower.empty()) {
			point[i] = std::max(lower[i], point[i]);
		}
		if (!upper.empty()) {
			point[i] = std::min(upper[i], point[i]);
		}
	}
}

double NelderMeadOptimizer::simplexSpread(const std::vector<double> &values) {
	const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
	double accum = 0.0;
	for (double v : values) {
		const double diff = v - mean;
		accum += diff * diff;
	}
	return std::sqrt(accum / static_cast<double>(values.size()));
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const Objective &objective,
                                                          const std::vector<double> &initial,
                                                          const Options &options,
                                                          const std::vector<double> &lower_bounds,
                                                          const std::vector<double> &upper_bounds) const {
	if ((!lower_bounds.empty() && lower_bounds.size() != initial.size()) ||
	    (!upper_bounds.empty() && upper_bounds.size() != initial.size())) {
		throw std::invalid_argument("Nelder-Mead bounds must match the parameter dimension.");
	}

	Result result;
	if (initial.empty()) {
		result.value = objective(initial);
		result.converged = true;
		return result;
	}

	// Non-finite objective values rank last so they never displace a usable vertex.
	const Objective guarded = [&objective](const std::vector<double> &point) {
		const double value = objective(point);
		return std::isfinite(value) ? value : std::numeric_limits<double>::infinity();
	};

	result = runOnce(guarded, initial, options, lower_bounds, upper_bounds);
	for (int restart = 0; restart < options.restarts; ++restart) {
		Result next = runOnce(guarded, result.best, options, lower_bounds, upper_bounds);
		next.iterations += result.iterations;
		const bool improved = next.value < result.value - options.tolerance;
		result = std::move(next);
		if (!improved) {
			break;
		}
	}
	return result;
}

NelderMeadOptimizer::Result NelderMeadOptimizer::runOnce(const Objective &objective,
                                                         const std::vector<double> &initial,
                                                         const Options &options,
                                                         const std::vector<double> &lower_bounds,
                                                         const std::vector<double> &upper_bounds) const {
	const std::size_t n = initial.size();
	std::vector<Vertex> simplex;
	simplex.reserve(n + 1);

	std::vector<double> start = initial;
	enforceBounds(start, lower_bounds, upper_bounds);
	simplex.emplace_back(start, objective(start));
	for (std::size_t i = 0; i < n; ++i) {
		std::vector<double> vertex = start;
		const double step = std::abs(vertex[i]) > 1e-3 ? options.step * std::max(1.0, std::abs(vertex[i])) : options.step;
		vertex[i] += step;
		enforceBounds(vertex, lower_bounds, upper_bounds);
		if (vertex[i] == start[i]) {
			vertex[i] -= 2.0 * step;
			enforceBounds(vertex, lower_bounds, upper_bounds);
		}
		simplex.emplace_back(vertex, objective(vertex));
	}
	sortSimplex(simplex);

	Result result;
	for (int iter = 0; iter < options.max_iterations; ++iter) {
		result.iterations = iter + 1;
		std::vector<double> values;
		values.reserve(simplex.size());
		for (const auto &item : simplex) {
			values.push_back(item.second);
		}
		if (std::isfinite(simplex.back().second) && simplexSpread(values) < options.tolerance) {
			result.converged = true;
			break;
		}

		const Vertex worst = simplex.back();
		const std::vector<double> center = centroid(simplex);

		auto reflect_point = along(center, worst.first, -options.alpha);
		enforceBounds(reflect_point, lower_bounds, upper_bounds);
		const double reflect_value = objective(reflect_point);

		if (reflect_value < simplex.front().second) {
			auto expand_point = along(center, reflect_point, options.gamma);
			enforceBounds(expand_point, lower_bounds, upper_bounds);
			const double expand_value = objective(expand_point);
			if (expand_value < reflect_value) {
				simplex.back() = {std::move(expand_point), expand_value};
			} else {
				simplex.back() = {std::move(reflect_point), reflect_value};
			}
		} else if (reflect_value < simplex[simplex.size() - 2].second) {
			simplex.back() = {std::move(reflect_point), reflect_value};
		} else {
			// Outside contraction when the reflection beat the worst vertex, inside otherwise.
			const bool outside = reflect_value < worst.second;
			auto contract_point = along(center, outside ? reflect_point : worst.first, options.rho);
			enforceBounds(contract_point, lower_bounds, upper_bounds);
			const double contract_value = objective(contract_point);

			if (contract_value < std::min(reflect_value, worst.second)) {
				simplex.back() = {std::move(contract_point), contract_value};
			} else {
				const auto best_point = simplex.front().first;
				for (std::size_t i = 1; i < simplex.size(); ++i) {
					simplex[i].first = along(best_point, simplex[i].first, options.sigma);
					enforceBounds(simplex[i].first, lower_bounds, upper_bounds);
					simplex[i].second = objective(simplex[i].first);
				}
			}
		}
		sortSimplex(simplex);
	}

	result.best = simplex.front().first;
	result.value = simplex.front().second;
	return result;
}

} // namespace tabstat::utils
