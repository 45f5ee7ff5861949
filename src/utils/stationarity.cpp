#include "tabstat/utils/stationarity.hpp"

#include "tabstat/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace tabstat::utils {

double Stationarity::kpssStatistic(const std::vector<double> &data) {
	const std::size_t n = data.size();
	if (n < kMinKpssLength) {
		return 0.0;
	}

	const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(n);
	std::vector<double> residuals;
	residuals.reserve(n);
	for (double val : data) {
		residuals.push_back(val - mean);
	}

	double variance = 0.0;
	for (double resid : residuals) {
		variance += resid * resid;
	}
	variance /= static_cast<double>(n);
	if (variance <= std::numeric_limits<double>::epsilon() * std::max(1.0, mean * mean)) {
		return 0.0;
	}

	double cumsum = 0.0;
	double sum_sq_partial = 0.0;
	for (double resid : residuals) {
		cumsum += resid;
		sum_sq_partial += cumsum * cumsum;
	}

	// Schwert bandwidth floor(4 * (n/100)^(1/4)) with Bartlett weights.
	int bandwidth = static_cast<int>(std::floor(4.0 * std::pow(static_cast<double>(n) / 100.0, 0.25)));
	bandwidth = std::max(1, std::min(bandwidth, static_cast<int>(n) / 4));

	double long_run_var = variance;
	for (int lag = 1; lag <= bandwidth; ++lag) {
		double autocovariance = 0.0;
		for (std::size_t t = static_cast<std::size_t>(lag); t < n; ++t) {
			autocovariance += residuals[t] * residuals[t - static_cast<std::size_t>(lag)];
		}
		autocovariance /= static_cast<double>(n);
		const double weight = 1.0 - static_cast<double>(lag) / static_cast<double>(bandwidth + 1);
		long_run_var += 2.0 * weight * autocovariance;
	}
	if (long_run_var <= 0.0) {
		long_run_var = variance;
	}

	const double n_sq = static_cast<double>(n) * static_cast<double>(n);
	return sum_sq_partial / (n_sq * long_run_var);
}

int Stationarity::ndiffs(const std::vector<double> &data, int max_d, double critical) {
	if (max_d < 0) {
		throw std::invalid_argument("max_d must be non-negative.");
	}

	std::vector<double> current = data;
	for (int d = 0; d < max_d; ++d) {
		if (current.size() < kMinKpssLength) {
			return d;
		}
		const double statistic = kpssStatistic(current);
		TABSTAT_DEBUG("KPSS statistic at d={}: {:.4f} (critical {:.3f})", d, statistic, critical);
		if (statistic < critical) {
			return d;
		}
		std::vector<double> next;
		next.reserve(current.size() - 1);
		for (std::size_t i = 1; i < current.size(); ++i) {
			next.push_back(current[i] - current[i - 1]);
		}
		current = std::move(next);
	}
	return max_d;
}

} // namespace tabstat::utils
