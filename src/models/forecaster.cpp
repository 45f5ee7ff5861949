#include "tabstat/models/forecaster.hpp"

#include "tabstat/core/errors.hpp"
#include "tabstat/models/auto_arima.hpp"
#include "tabstat/models/linear_regression.hpp"
#include "tabstat/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace tabstat::models {

namespace {

std::string lowercase(const std::string &text) {
	std::string result = text;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return result;
}

bool isConstant(const std::vector<double> &values) {
	const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
	const double scale = std::max(1.0, std::max(std::abs(*lo), std::abs(*hi)));
	return (*hi - *lo) <= 1e-12 * scale;
}

double inSampleRmse(const IForecaster &model, const core::TimeSeries &series) {
	const auto &fitted = model.fittedValues();
	const bool any = std::any_of(fitted.begin(), fitted.end(), [](double v) { return !std::isnan(v); });
	if (!any) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return model.inSampleAccuracy(series).rmse;
}

} // namespace

ForecastModel parseForecastModel(const std::string &name) {
	const std::string key = lowercase(name);
	if (key == "arima") {
		return ForecastModel::Arima;
	}
	if (key == "arma") {
		return ForecastModel::Arma;
	}
	if (key == "linear" || key == "simple_linear_regression" || key == "simple-trend") {
		return ForecastModel::Linear;
	}
	throw InvalidParameterError("unknown model_type '" + name + "'");
}

std::string_view toString(ForecastModel model) {
	switch (model) {
	case ForecastModel::Arima:
		return "arima";
	case ForecastModel::Arma:
		return "arma";
	case ForecastModel::Linear:
		return "linear";
	}
	return "unknown";
}

void LinearTrendForecaster::fit(const core::TimeSeries &ts) {
	const auto &values = ts.values();
	const std::size_t n = values.size();
	if (n < 2) {
		throw std::invalid_argument("LinearTrendForecaster requires at least two observations.");
	}

	if (n == 2) {
		// A line through two points leaves no residual degrees of freedom for OLS.
		intercept_ = values[0];
		slope_ = values[1] - values[0];
	} else {
		Eigen::MatrixXd X(static_cast<Eigen::Index>(n), 1);
		for (std::size_t i = 0; i < n; ++i) {
			X(static_cast<Eigen::Index>(i), 0) = static_cast<double>(i);
		}
		const Eigen::VectorXd y = Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(n));
		LinearRegression regression;
		const auto &result = regression.fit(y, X, {"t"});
		intercept_ = result.coefficients(0);
		slope_ = result.coefficients(1);
	}

	n_ = n;
	fitted_values_.resize(n);
	for (std::size_t i = 0; i < n; ++i) {
		fitted_values_[i] = intercept_ + slope_ * static_cast<double>(i);
	}
	is_fitted_ = true;
}

core::Forecast LinearTrendForecaster::predict(int horizon) {
	if (!is_fitted_) {
		throw std::logic_error("LinearTrendForecaster: call fit() before predict().");
	}
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}
	core::Forecast forecast;
	forecast.point.reserve(static_cast<std::size_t>(horizon));
	for (int h = 0; h < horizon; ++h) {
		forecast.point.push_back(intercept_ + slope_ * static_cast<double>(n_ + static_cast<std::size_t>(h)));
	}
	return forecast;
}

TimeSeriesForecaster::TimeSeriesForecaster(ForecasterOptions options) : options_(options) {
	if (options_.max_p < 0 || options_.max_q < 0) {
		throw InvalidParameterError("max_p and max_q must be non-negative");
	}
	if (options_.max_d < 0 || options_.max_d > 2) {
		throw InvalidParameterError("max_d must be 0, 1 or 2");
	}
	if (options_.max_models <= 0) {
		throw InvalidParameterError("max_models must be positive");
	}
}

ForecastResult TimeSeriesForecaster::forecast(const core::TimeSeries &series, int horizon,
                                              const std::string &model_type) const {
	return forecast(series, horizon, parseForecastModel(model_type));
}

ForecastResult TimeSeriesForecaster::forecast(const core::TimeSeries &series, int horizon, ForecastModel model) const {
	if (horizon <= 0) {
		throw InvalidParameterError("horizon must be positive, got " + std::to_string(horizon));
	}
	if (series.size() < 2) {
		throw InsufficientDataError("forecasting needs at least 2 points, got " + std::to_string(series.size()));
	}
	for (double v : series.values()) {
		if (!std::isfinite(v)) {
			throw InvalidParameterError("series values must be finite");
		}
	}

	core::Frequency frequency = core::Frequency::daily();
	bool inferred = false;
	if (const auto known = series.frequency()) {
		frequency = *known;
		inferred = true;
	} else if (const auto detected = series.inferFrequency()) {
		frequency = *detected;
		inferred = true;
	} else {
		TABSTAT_DEBUG("No regular spacing in {} timestamps; assuming a daily frequency", series.size());
	}

	ForecastResult result;
	if (isConstant(series.values())) {
		result = forecastConstant(series, horizon);
	} else {
		switch (model) {
		case ForecastModel::Arima:
			result = forecastArima(series, horizon, true);
			break;
		case ForecastModel::Arma:
			result = forecastArima(series, horizon, false);
			break;
		case ForecastModel::Linear:
			result = forecastLinear(series, horizon);
			break;
		}
	}

	result.model = model;
	result.frequency = frequency;
	result.frequency_inferred = inferred;
	result.forecast.stamp(series.futureTimestamps(horizon, frequency));

	TABSTAT_INFO("Forecast {} steps with {} at frequency {} (in-sample RMSE {:.4f})", horizon, toString(model),
	             frequency.label(), result.rmse);
	return result;
}

ForecastResult TimeSeriesForecaster::forecastArima(const core::TimeSeries &series, int horizon,
                                                   bool allow_differencing) const {
	AutoARIMA auto_arima;
	auto_arima.setMaxP(options_.max_p)
	    .setMaxQ(options_.max_q)
	    .setMaxD(options_.max_d)
	    .setMaxModels(options_.max_models)
	    .setAllowDifferencing(allow_differencing)
	    .setThreads(options_.n_threads);

	ForecastResult result;
	try {
		auto_arima.fit(series);
		result.forecast = auto_arima.predict(horizon);
	} catch (const AnalysisError &) {
		throw;
	} catch (const std::exception &ex) {
		throw ModelFitFailedError(ex.what());
	}

	const auto &components = auto_arima.components();
	const auto &metrics = auto_arima.metrics();
	const auto &diagnostics = auto_arima.diagnostics();
	const auto &model = auto_arima.model();

	result.p = components.p;
	result.d = components.d;
	result.q = components.q;
	result.include_constant = components.include_constant;
	result.ar_coefficients.assign(model.arCoefficients().data(),
	                              model.arCoefficients().data() + model.arCoefficients().size());
	result.ma_coefficients.assign(model.maCoefficients().data(),
	                              model.maCoefficients().data() + model.maCoefficients().size());
	result.intercept = model.intercept();
	result.sigma2 = metrics.sigma2;
	result.log_likelihood = metrics.log_likelihood;
	result.aic = metrics.aic;
	result.models_evaluated = diagnostics.models_evaluated;
	result.models_failed = diagnostics.models_failed;
	result.fitted = auto_arima.fittedValues();
	result.rmse = inSampleRmse(auto_arima, series);
	return result;
}

ForecastResult TimeSeriesForecaster::forecastLinear(const core::TimeSeries &series, int horizon) {
	LinearTrendForecaster trend;
	ForecastResult result;
	try {
		trend.fit(series);
		result.forecast = trend.predict(horizon);
	} catch (const AnalysisError &) {
		throw;
	} catch (const std::exception &ex) {
		throw ModelFitFailedError(ex.what());
	}
	result.intercept = trend.intercept();
	result.slope = trend.slope();
	result.fitted = trend.fittedValues();
	result.rmse = inSampleRmse(trend, series);
	return result;
}

ForecastResult TimeSeriesForecaster::forecastConstant(const core::TimeSeries &series, int horizon) {
	const double level = series.values().front();
	ForecastResult result;
	result.degenerate = true;
	result.note = "series is constant; forecast repeats its value without fitting a model";
	result.intercept = level;
	result.sigma2 = 0.0;
	result.fitted.assign(series.size(), level);
	result.rmse = 0.0;
	result.forecast.point.assign(static_cast<std::size_t>(horizon), level);
	TABSTAT_INFO("Constant series of {} points; skipping model fitting", series.size());
	return result;
}

} // namespace tabstat::models
