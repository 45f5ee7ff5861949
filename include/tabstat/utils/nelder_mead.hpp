#pragma once

#include <functional>
#include <limits>
#include <utility>
#include <vector>

namespace tabstat::utils {

/**
 * @brief Derivative-free simplex minimiser used for ARMA likelihood fitting.
 */
class NelderMeadOptimizer {
public:
	struct Options {
		double alpha = 1.0; // reflection
		double gamma = 2.0; // expansion
		double rho = 0.5;   // contraction
		double sigma = 0.5; // shrink
		double step = 0.1;  // initial simplex step
		int max_iterations = 500;
		double tolerance = 1e-8;
		// Restarts from the best vertex with a fresh simplex to escape collapse.
		int restarts = 1;
	};

	struct Result {
		std::vector<double> best;
		double value = std::numeric_limits<double>::quiet_NaN();
		int iterations = 0;
		bool converged = false;
	};

	using Objective = std::function<double(const std::vector<double> &)>;

	Result minimize(const Objective &objective, const std::vector<double> &initial, const Options &options,
	                const std::vector<double> &lower_bounds = {}, const std::vector<double> &upper_bounds = {}) const;

private:
	Result runOnce(const Objective &objective, const std::vector<double> &initial, const Options &options,
	               const std::vector<double> &lower_bounds, const std::vector<double> &upper_bounds) const;

	static void enforceBounds(std::vector<double> &point, const std::vector<double> &lower,
	                          const std::vector<double> &upper);

	static double simplexSpread(const std::vector<double> &values);
};

} // namespace tabstat::utils
