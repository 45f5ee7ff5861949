#pragma once

#include <cstddef>
#include <vector>

namespace tabstat::utils {

class Stationarity final {
public:
	// KPSS critical value at the 5% level for the level-stationary null.
	static constexpr double kKpssCritical5 = 0.463;
	// Shorter series are not tested and are treated as stationary.
	static constexpr std::size_t kMinKpssLength = 10;

	/**
	 * @brief KPSS level-stationarity statistic with a Newey-West long-run variance.
	 *
	 * Returns 0 for series shorter than kMinKpssLength or without variance.
	 */
	static double kpssStatistic(const std::vector<double> &data);

	/**
	 * @brief Number of differences needed before KPSS stops rejecting stationarity.
	 *
	 * Differences while the statistic exceeds `critical`, up to `max_d` times.
	 */
	static int ndiffs(const std::vector<double> &data, int max_d, double critical = kKpssCritical5);
};

} // namespace tabstat::utils
