#pragma once

#include "tabstat/core/forecast.hpp"
#include "tabstat/core/time_series.hpp"
#include "tabstat/models/iforecaster.hpp"

#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace tabstat::models {

enum class ForecastModel {
	Arima,  ///< automatic (p, d, q) selection
	Arma,   ///< automatic (p, q) selection with d fixed at 0
	Linear  ///< least-squares trend on the observation index
};

/**
 * @brief Parses a model name case-insensitively.
 *
 * Accepts "arima", "arma", "linear", "simple_linear_regression" and "simple-trend".
 * @throws InvalidParameterError for anything else.
 */
ForecastModel parseForecastModel(const std::string &name);

std::string_view toString(ForecastModel model);

/**
 * @brief Straight-line trend y = intercept + slope * i over the observation index i.
 *
 * Future steps continue the index past the last observation.
 */
class LinearTrendForecaster final : public IForecaster {
public:
	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "LinearTrend";
	}

	const std::vector<double> &fittedValues() const override {
		return fitted_values_;
	}

	double intercept() const {
		return intercept_;
	}
	double slope() const {
		return slope_;
	}

private:
	double intercept_ = 0.0;
	double slope_ = 0.0;
	std::size_t n_ = 0;
	std::vector<double> fitted_values_;
	bool is_fitted_ = false;
};

struct ForecasterOptions {
	int max_p = 5;
	int max_q = 5;
	int max_d = 2;
	int max_models = 94;
	unsigned n_threads = 0; // 0 = hardware concurrency
};

/**
 * Everything a forecast request reports back. Order and likelihood fields
 * describe the selected ARIMA model and stay at their defaults for the linear
 * trend, which reports its line through `intercept` and `slope`.
 */
struct ForecastResult {
	ForecastModel model = ForecastModel::Arima;
	core::Forecast forecast;

	/// In-sample RMSE of one-step predictions on the original scale.
	double rmse = std::numeric_limits<double>::quiet_NaN();
	std::vector<double> fitted;

	int p = 0;
	int d = 0;
	int q = 0;
	bool include_constant = false;
	std::vector<double> ar_coefficients;
	std::vector<double> ma_coefficients;
	double intercept = 0.0;
	double slope = 0.0;
	double sigma2 = std::numeric_limits<double>::quiet_NaN();
	double log_likelihood = std::numeric_limits<double>::quiet_NaN();
	double aic = std::numeric_limits<double>::quiet_NaN();
	int models_evaluated = 0;
	int models_failed = 0;

	core::Frequency frequency = core::Frequency::daily();
	/// False when no regular spacing was found and one day was assumed.
	bool frequency_inferred = false;

	/// Set for a constant series, which is forecast as its value without a model.
	bool degenerate = false;
	std::string note;
};

/**
 * Univariate forecasting front door: validates the request, settles the
 * frequency, fits the requested model family and stamps the forecast with
 * timestamps continuing the series.
 */
class TimeSeriesForecaster {
public:
	explicit TimeSeriesForecaster(ForecasterOptions options = {});

	/**
	 * @throws InvalidParameterError, InsufficientDataError, ModelFitFailedError
	 */
	ForecastResult forecast(const core::TimeSeries &series, int horizon, ForecastModel model) const;
	ForecastResult forecast(const core::TimeSeries &series, int horizon, const std::string &model_type) const;

	const ForecasterOptions &options() const {
		return options_;
	}

private:
	ForecastResult forecastArima(const core::TimeSeries &series, int horizon, bool allow_differencing) const;
	static ForecastResult forecastLinear(const core::TimeSeries &series, int horizon);
	static ForecastResult forecastConstant(const core::TimeSeries &series, int horizon);

	ForecasterOptions options_;
};

} // namespace tabstat::models
