#include "tabstat/utils/metrics.hpp"

#include <numeric>

namespace tabstat::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

} // namespace

double Metrics::mean(const std::vector<double> &values) {
	if (values.empty()) {
		throw std::invalid_argument("Cannot take the mean of an empty vector.");
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double Metrics::sumSquaredDeviations(const std::vector<double> &values) {
	const double center = mean(values);
	double sum = 0.0;
	for (double v : values) {
		const double diff = v - center;
		sum += diff * diff;
	}
	return sum;
}

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);

	const double ss_tot = sumSquaredDeviations(actual);
	const double magnitude = std::inner_product(actual.begin(), actual.end(), actual.begin(), 0.0);
	// Relative to the data's scale, so tiny-valued series still get an R-squared.
	if (ss_tot <= std::numeric_limits<double>::epsilon() * magnitude) {
		return std::nullopt;
	}

	double ss_res = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff_res = actual[i] - predicted[i];
		ss_res += diff_res * diff_res;
	}
	return 1.0 - (ss_res / ss_tot);
}

AccuracyMetrics Metrics::summarize(const std::vector<double> &actual, const std::vector<double> &predicted) {
	AccuracyMetrics metrics;
	metrics.mae = mae(actual, predicted);
	metrics.mse = mse(actual, predicted);
	metrics.rmse = std::sqrt(metrics.mse);
	metrics.r_squared = r2(actual, predicted);
	metrics.n = actual.size();
	return metrics;
}

} // namespace tabstat::utils
