#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tabstat::utils {

/**
 * @brief In-sample error summary shared by the regression and forecasting engines.
 */
struct AccuracyMetrics {
	double mae = std::numeric_limits<double>::quiet_NaN();
	double mse = std::numeric_limits<double>::quiet_NaN();
	double rmse = std::numeric_limits<double>::quiet_NaN();
	// Unset when the actual values have no variance.
	std::optional<double> r_squared;
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);
	/**
	 * @brief Coefficient of determination.
	 *
	 * Unset when the variance of `actual` is negligible relative to its magnitude.
	 */
	static std::optional<double> r2(const std::vector<double> &actual, const std::vector<double> &predicted);

	/**
	 * @brief Computes every metric of AccuracyMetrics in one call.
	 * @throws std::invalid_argument when the vectors are empty or differ in length.
	 */
	static AccuracyMetrics summarize(const std::vector<double> &actual, const std::vector<double> &predicted);

	static double mean(const std::vector<double> &values);

	/**
	 * @brief Sum of squared deviations from the mean.
	 */
	static double sumSquaredDeviations(const std::vector<double> &values);
};

} // namespace tabstat::utils
