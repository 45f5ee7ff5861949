#include "tabstat/analyzer.hpp"

#include "tabstat/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace tabstat {

Analyzer::Analyzer(AnalysisConfig config) : config_(std::move(config)) {
	if (const auto level = config_.logLevel()) {
		utils::Logging::init(*level);
	}
}

cleaning::CleanedTable Analyzer::clean(const core::Table &table, const std::vector<std::string> &columns) const {
	auto cleaned = cleaning::TabularCleaner::clean(table, columns);
	if (cleaned.empty()) {
		TABSTAT_DEBUG("No row of {} survived cleaning for {} columns", cleaned.sourceRowCount(), columns.size());
	}
	return cleaned;
}

models::CorrelationMatrix Analyzer::correlate(const core::Table &table,
                                              const std::vector<std::string> &columns) const {
	const auto wanted = columns.empty() ? table.columnNames() : columns;
	return models::CorrelationEngine::correlate(clean(table, wanted));
}

models::RegressionResult Analyzer::fitOls(const core::Table &table, const std::string &target,
                                          const std::vector<std::string> &features) const {
	std::vector<std::string> columns{target};
	columns.insert(columns.end(), features.begin(), features.end());
	const auto cleaned = clean(table, columns);

	models::LinearRegression regression;
	return regression.fit(cleaned, target, features);
}

models::ForestResult Analyzer::fitForest(const core::Table &table, const std::string &target,
                                         const std::vector<std::string> &features) const {
	return fitForest(table, target, features, config_.trees());
}

models::ForestResult Analyzer::fitForest(const core::Table &table, const std::string &target,
                                         const std::vector<std::string> &features, int n_trees) const {
	// Parameters are checked before the table is touched.
	models::RandomForest forest(config_.forestOptions(n_trees));

	std::vector<std::string> columns{target};
	columns.insert(columns.end(), features.begin(), features.end());
	const auto cleaned = clean(table, columns);
	return forest.fit(cleaned, target, features);
}

models::ForecastResult Analyzer::forecast(const core::Table &table, const std::string &date_column,
                                          const std::string &value_column, int horizon,
                                          const std::string &model_type) const {
	const auto model = models::parseForecastModel(model_type);
	if (horizon <= 0) {
		throw InvalidParameterError("horizon must be positive, got " + std::to_string(horizon));
	}

	const auto cleaned =
	    cleaning::TabularCleaner::cleanSeries(table, date_column, value_column, config_.duplicatePolicy());
	if (cleaned.size() < 2) {
		throw InsufficientDataError("forecasting needs at least 2 usable points, got " +
		                            std::to_string(cleaned.size()));
	}
	if (!cleaned.strictlyIncreasing()) {
		throw InvalidParameterError(std::to_string(cleaned.duplicate_timestamps) +
		                            " rows share a timestamp; choose a duplicate policy other than Preserve");
	}

	const models::TimeSeriesForecaster forecaster(config_.forecasterOptions());
	return forecaster.forecast(cleaned.toTimeSeries(), horizon, model);
}

models::ForecastResult Analyzer::forecast(const core::TimeSeries &series, int horizon,
                                          const std::string &model_type) const {
	const models::TimeSeriesForecaster forecaster(config_.forecasterOptions());
	return forecaster.forecast(series, horizon, model_type);
}

} // namespace tabstat
