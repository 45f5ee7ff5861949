#include "tabstat/cleaning/tabular_cleaner.hpp"

#include "tabstat/cleaning/coercion.hpp"
#include "tabstat/core/errors.hpp"
#include "tabstat/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace tabstat::cleaning {

namespace {

void requireColumns(const core::Table &table, const std::vector<std::string> &columns) {
	for (const auto &name : columns) {
		if (!table.hasColumn(name)) {
			throw MissingColumnError(name);
		}
	}
}

std::optional<double> finiteNumber(const core::Row &row, const std::string &column) {
	const auto it = row.find(column);
	if (it == row.end()) {
		return std::nullopt;
	}
	const auto number = coerceNumeric(it->second);
	if (!number || !std::isfinite(*number)) {
		return std::nullopt;
	}
	return number;
}

} // namespace

CleanedTable::CleanedTable(std::vector<std::string> columns, std::map<std::string, std::vector<double>> data,
                           std::size_t source_rows)
    : columns_(std::move(columns)), data_(std::move(data)), source_rows_(source_rows) {
	row_count_ = columns_.empty() ? 0 : data_.at(columns_.front()).size();
	for (const auto &name : columns_) {
		if (data_.at(name).size() != row_count_) {
			throw std::invalid_argument("CleanedTable columns must have equal length.");
		}
	}
	if (row_count_ > source_rows_) {
		throw std::invalid_argument("CleanedTable cannot hold more rows than its source.");
	}
}

const std::vector<double> &CleanedTable::column(const std::string &name) const {
	const auto it = data_.find(name);
	if (it == data_.end()) {
		throw MissingColumnError(name);
	}
	return it->second;
}

bool CleanedSeries::strictlyIncreasing() const {
	for (std::size_t i = 1; i < timestamps.size(); ++i) {
		if (!(timestamps[i] > timestamps[i - 1])) {
			return false;
		}
	}
	return true;
}

core::TimeSeries CleanedSeries::toTimeSeries() const {
	return core::TimeSeries(timestamps, values);
}

CleanedTable TabularCleaner::clean(const core::Table &table, const std::vector<std::string> &columns) {
	std::vector<std::string> unique_columns;
	unique_columns.reserve(columns.size());
	for (const auto &name : columns) {
		if (std::find(unique_columns.begin(), unique_columns.end(), name) == unique_columns.end()) {
			unique_columns.push_back(name);
		}
	}
	if (unique_columns.empty()) {
		throw InsufficientDataError("no columns requested");
	}
	requireColumns(table, unique_columns);

	std::map<std::string, std::vector<double>> data;
	for (const auto &name : unique_columns) {
		data[name].reserve(table.rowCount());
	}

	std::vector<double> parsed(unique_columns.size());
	for (const auto &row : table.rows()) {
		bool keep = true;
		for (std::size_t c = 0; c < unique_columns.size() && keep; ++c) {
			const auto value = finiteNumber(row, unique_columns[c]);
			if (value) {
				parsed[c] = *value;
			} else {
				keep = false;
			}
		}
		if (!keep) {
			continue;
		}
		for (std::size_t c = 0; c < unique_columns.size(); ++c) {
			data[unique_columns[c]].push_back(parsed[c]);
		}
	}

	CleanedTable cleaned(std::move(unique_columns), std::move(data), table.rowCount());
	TABSTAT_DEBUG("Cleaner kept {} of {} rows across {} columns", cleaned.rowCount(), cleaned.sourceRowCount(),
	              cleaned.columns().size());
	return cleaned;
}

CleanedSeries TabularCleaner::cleanSeries(const core::Table &table, const std::string &date_column,
                                          const std::string &value_column, DuplicateTimestampPolicy policy) {
	requireColumns(table, {date_column, value_column});

	struct Observation {
		core::TimePoint timestamp;
		double value;
	};
	std::vector<Observation> observations;
	observations.reserve(table.rowCount());

	for (const auto &row : table.rows()) {
		const auto date_it = row.find(date_column);
		if (date_it == row.end()) {
			continue;
		}
		const auto timestamp = coerceDate(date_it->second);
		const auto value = finiteNumber(row, value_column);
		if (!timestamp || !value) {
			continue;
		}
		observations.push_back({*timestamp, *value});
	}

	std::stable_sort(observations.begin(), observations.end(),
	                 [](const Observation &lhs, const Observation &rhs) { return lhs.timestamp < rhs.timestamp; });

	CleanedSeries series;
	series.source_rows = table.rowCount();
	series.timestamps.reserve(observations.size());
	series.values.reserve(observations.size());

	std::size_t i = 0;
	while (i < observations.size()) {
		std::size_t j = i + 1;
		while (j < observations.size() && observations[j].timestamp == observations[i].timestamp) {
			++j;
		}
		series.duplicate_timestamps += j - i - 1;

		switch (policy) {
		case DuplicateTimestampPolicy::Preserve:
			for (std::size_t k = i; k < j; ++k) {
				series.timestamps.push_back(observations[k].timestamp);
				series.values.push_back(observations[k].value);
			}
			break;
		case DuplicateTimestampPolicy::KeepFirst:
			series.timestamps.push_back(observations[i].timestamp);
			series.values.push_back(observations[i].value);
			break;
		case DuplicateTimestampPolicy::KeepLast:
			series.timestamps.push_back(observations[j - 1].timestamp);
			series.values.push_back(observations[j - 1].value);
			break;
		case DuplicateTimestampPolicy::Mean: {
			double sum = 0.0;
			for (std::size_t k = i; k < j; ++k) {
				sum += observations[k].value;
			}
			series.timestamps.push_back(observations[i].timestamp);
			series.values.push_back(sum / static_cast<double>(j - i));
			break;
		}
		}
		i = j;
	}

	if (series.duplicate_timestamps > 0) {
		TABSTAT_DEBUG("Series cleaner found {} duplicate timestamps", series.duplicate_timestamps);
	}
	return series;
}

} // namespace tabstat::cleaning
