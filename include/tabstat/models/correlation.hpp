#pragma once

#include "tabstat/cleaning/tabular_cleaner.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tabstat::models {

enum class CorrelationOrder {
	Input,        ///< order the columns were requested in
	Alphabetical, ///< lexicographic by column name
	MeanAbsolute  ///< descending mean |r| against the other columns
};

enum class CorrelationStrength {
	StrongPositive,
	ModeratePositive,
	Weak,
	ModerateNegative,
	StrongNegative,
	Undefined
};

/**
 * @brief Buckets a coefficient: |r| > 0.7 is strong, |r| > 0.3 moderate, NaN undefined.
 */
CorrelationStrength classifyCorrelation(double r);
std::string_view toString(CorrelationStrength strength);

/**
 * @brief Symmetric Pearson matrix over a fixed list of columns.
 *
 * Cells involving a zero-variance column are NaN (except the diagonal) and the
 * column is listed in zeroVarianceColumns().
 */
class CorrelationMatrix {
public:
	CorrelationMatrix(std::vector<std::string> columns, Eigen::MatrixXd values,
	                  std::vector<std::string> zero_variance_columns, std::size_t observations);

	const std::vector<std::string> &columns() const {
		return columns_;
	}
	const Eigen::MatrixXd &values() const {
		return values_;
	}
	const std::vector<std::string> &zeroVarianceColumns() const {
		return zero_variance_columns_;
	}
	std::size_t observations() const {
		return observations_;
	}
	std::size_t size() const {
		return columns_.size();
	}

	/**
	 * @throws MissingColumnError for unknown names.
	 */
	double at(const std::string &row, const std::string &column) const;

	/**
	 * @brief Column order for presentation; the matrix itself is unchanged.
	 */
	std::vector<std::string> orderedColumns(CorrelationOrder order) const;

	CorrelationMatrix reordered(CorrelationOrder order) const;

private:
	std::size_t indexOf(const std::string &name) const;

	std::vector<std::string> columns_;
	Eigen::MatrixXd values_;
	std::vector<std::string> zero_variance_columns_;
	std::size_t observations_ = 0;
};

class CorrelationEngine {
public:
	/**
	 * @brief Pairwise Pearson correlation of every column of a cleaned table.
	 * @throws InsufficientDataError with fewer than two columns or no rows.
	 */
	static CorrelationMatrix correlate(const cleaning::CleanedTable &table);
};

} // namespace tabstat::models
