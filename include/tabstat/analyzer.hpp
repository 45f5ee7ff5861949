#pragma once

#include "tabstat/cleaning/tabular_cleaner.hpp"
#include "tabstat/config.hpp"
#include "tabstat/core/errors.hpp"
#include "tabstat/core/table.hpp"
#include "tabstat/models/correlation.hpp"
#include "tabstat/models/forecaster.hpp"
#include "tabstat/models/linear_regression.hpp"
#include "tabstat/models/random_forest.hpp"

#include <string>
#include <vector>

namespace tabstat {

/**
 * @class Analyzer
 * @brief One entry point per analysis over a raw table.
 *
 * Every call cleans the table for the columns it needs and hands the result
 * to the matching engine. Calls share no mutable state, so one Analyzer may
 * serve concurrent requests.
 */
class Analyzer {
public:
	explicit Analyzer(AnalysisConfig config = {});

	const AnalysisConfig &config() const {
		return config_;
	}

	/**
	 * @brief Drops every row where one of `columns` is missing or not numeric.
	 * @throws MissingColumnError, InsufficientDataError
	 */
	cleaning::CleanedTable clean(const core::Table &table, const std::vector<std::string> &columns) const;

	/**
	 * @brief Pearson matrix over `columns`, or over every column of the table when empty.
	 */
	models::CorrelationMatrix correlate(const core::Table &table, const std::vector<std::string> &columns = {}) const;

	models::RegressionResult fitOls(const core::Table &table, const std::string &target,
	                                const std::vector<std::string> &features) const;

	/// Uses the configured tree count.
	models::ForestResult fitForest(const core::Table &table, const std::string &target,
	                               const std::vector<std::string> &features) const;
	models::ForestResult fitForest(const core::Table &table, const std::string &target,
	                               const std::vector<std::string> &features, int n_trees) const;

	/**
	 * @brief Forecasts `value_column` indexed by `date_column`.
	 *
	 * Rows sharing a timestamp are resolved with the configured duplicate
	 * policy; with DuplicateTimestampPolicy::Preserve they are rejected as
	 * InvalidParameterError.
	 */
	models::ForecastResult forecast(const core::Table &table, const std::string &date_column,
	                                const std::string &value_column, int horizon,
	                                const std::string &model_type) const;

	models::ForecastResult forecast(const core::TimeSeries &series, int horizon, const std::string &model_type) const;

private:
	AnalysisConfig config_;
};

} // namespace tabstat
