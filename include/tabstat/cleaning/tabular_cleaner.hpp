#pragma once

#include "tabstat/core/table.hpp"
#include "tabstat/core/time_series.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace tabstat::cleaning {

/**
 * @brief Equal-length columns of finite doubles, produced by TabularCleaner.
 */
class CleanedTable {
public:
	CleanedTable() = default;
	CleanedTable(std::vector<std::string> columns, std::map<std::string, std::vector<double>> data,
	             std::size_t source_rows);

	const std::vector<std::string> &columns() const {
		return columns_;
	}

	/**
	 * @brief Values of one column.
	 * @throws MissingColumnError when the column is not part of the table.
	 */
	const std::vector<double> &column(const std::string &name) const;

	bool hasColumn(const std::string &name) const {
		return data_.count(name) != 0;
	}

	std::size_t rowCount() const {
		return row_count_;
	}

	/**
	 * @brief True when cleaning dropped every row.
	 */
	bool empty() const {
		return row_count_ == 0;
	}

	std::size_t sourceRowCount() const {
		return source_rows_;
	}
	std::size_t droppedRowCount() const {
		return source_rows_ - row_count_;
	}

private:
	std::vector<std::string> columns_;
	std::map<std::string, std::vector<double>> data_;
	std::size_t row_count_ = 0;
	std::size_t source_rows_ = 0;
};

/**
 * @brief How rows sharing a timestamp are treated by cleanSeries().
 */
enum class DuplicateTimestampPolicy {
	Preserve,  ///< keep every row in its original relative order
	KeepFirst, ///< keep the earliest row of each run
	KeepLast,  ///< keep the latest row of each run
	Mean       ///< collapse the run into its mean value
};

/**
 * @brief Date-aware cleaning output: timestamps sorted ascending with values.
 */
struct CleanedSeries {
	std::vector<core::TimePoint> timestamps;
	std::vector<double> values;
	std::size_t source_rows = 0;
	std::size_t duplicate_timestamps = 0;

	std::size_t size() const {
		return values.size();
	}
	bool empty() const {
		return values.empty();
	}
	bool strictlyIncreasing() const;

	/**
	 * @throws std::invalid_argument when timestamps repeat.
	 */
	core::TimeSeries toTimeSeries() const;
};

class TabularCleaner {
public:
	/**
	 * @brief Keeps the rows where every requested column coerces to a finite number.
	 *
	 * Every requested column must appear in at least one row; otherwise a
	 * MissingColumnError is raised before any coercion happens. Duplicate names
	 * in `columns` are collapsed. An all-dropped result is returned as an empty
	 * table, not raised.
	 *
	 * @throws MissingColumnError, InsufficientDataError (no columns requested)
	 */
	static CleanedTable clean(const core::Table &table, const std::vector<std::string> &columns);

	/**
	 * @brief Extracts a (timestamp, value) series sorted by timestamp.
	 *
	 * Rows whose date or value fails coercion are dropped. Sorting is stable so
	 * rows with equal timestamps keep their original order before the
	 * duplicate policy is applied.
	 */
	static CleanedSeries cleanSeries(const core::Table &table, const std::string &date_column,
	                                 const std::string &value_column,
	                                 DuplicateTimestampPolicy policy = DuplicateTimestampPolicy::Preserve);
};

} // namespace tabstat::cleaning
