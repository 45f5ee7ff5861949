#pragma once

#include "tabstat/core/forecast.hpp"
#include "tabstat/core/time_series.hpp"
#include "tabstat/utils/metrics.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace tabstat::models {

/**
 * @class IForecaster
 * @brief An interface for the univariate forecasting models.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates point forecasts for `horizon` future steps.
	 */
	virtual core::Forecast predict(int horizon) = 0;

	/**
	 * @brief One-step-ahead in-sample predictions aligned with the fitted series.
	 *
	 * Entries without a prediction (the start-up values of differencing or
	 * autoregression) are NaN.
	 */
	virtual const std::vector<double> &fittedValues() const = 0;

	virtual std::string getName() const = 0;

	/**
	 * @brief Error metrics of the one-step predictions against the series they were fitted on.
	 * @throws std::invalid_argument when no point has a prediction.
	 */
	utils::AccuracyMetrics inSampleAccuracy(const core::TimeSeries &ts) const {
		const auto &fitted = fittedValues();
		const auto &values = ts.values();
		if (fitted.size() != values.size()) {
			throw std::invalid_argument("Fitted values do not match the series length.");
		}
		std::vector<double> actual;
		std::vector<double> predicted;
		actual.reserve(values.size());
		predicted.reserve(values.size());
		for (std::size_t i = 0; i < values.size(); ++i) {
			if (!std::isnan(fitted[i])) {
				actual.push_back(values[i]);
				predicted.push_back(fitted[i]);
			}
		}
		return utils::Metrics::summarize(actual, predicted);
	}
};

} // namespace tabstat::models
