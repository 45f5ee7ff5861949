#include "tabstat/models/correlation.hpp"

#include "tabstat/core/errors.hpp"
#include "tabstat/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace tabstat::models {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

CorrelationStrength classifyCorrelation(double r) {
	if (std::isnan(r)) {
		return CorrelationStrength::Undefined;
	}
	if (r > 0.7) {
		return CorrelationStrength::StrongPositive;
	}
	if (r > 0.3) {
		return CorrelationStrength::ModeratePositive;
	}
	if (r < -0.7) {
		return CorrelationStrength::StrongNegative;
	}
	if (r < -0.3) {
		return CorrelationStrength::ModerateNegative;
	}
	return CorrelationStrength::Weak;
}

std::string_view toString(CorrelationStrength strength) {
	switch (strength) {
	case CorrelationStrength::StrongPositive:
		return "strong positive";
	case CorrelationStrength::ModeratePositive:
		return "moderate positive";
	case CorrelationStrength::Weak:
		return "weak";
	case CorrelationStrength::ModerateNegative:
		return "moderate negative";
	case CorrelationStrength::StrongNegative:
		return "strong negative";
	case CorrelationStrength::Undefined:
		return "undefined";
	}
	return "undefined";
}

CorrelationMatrix::CorrelationMatrix(std::vector<std::string> columns, Eigen::MatrixXd values,
                                     std::vector<std::string> zero_variance_columns, std::size_t observations)
    : columns_(std::move(columns)), values_(std::move(values)),
      zero_variance_columns_(std::move(zero_variance_columns)), observations_(observations) {
	const auto n = static_cast<Eigen::Index>(columns_.size());
	if (values_.rows() != n || values_.cols() != n) {
		throw std::invalid_argument("Correlation values must be square and match the column count.");
	}
}

std::size_t CorrelationMatrix::indexOf(const std::string &name) const {
	const auto it = std::find(columns_.begin(), columns_.end(), name);
	if (it == columns_.end()) {
		throw MissingColumnError(name);
	}
	return static_cast<std::size_t>(std::distance(columns_.begin(), it));
}

double CorrelationMatrix::at(const std::string &row, const std::string &column) const {
	return values_(static_cast<Eigen::Index>(indexOf(row)), static_cast<Eigen::Index>(indexOf(column)));
}

std::vector<std::string> CorrelationMatrix::orderedColumns(CorrelationOrder order) const {
	std::vector<std::size_t> index(columns_.size());
	std::iota(index.begin(), index.end(), 0);

	switch (order) {
	case CorrelationOrder::Input:
		break;
	case CorrelationOrder::Alphabetical:
		std::stable_sort(index.begin(), index.end(),
		                 [&](std::size_t lhs, std::size_t rhs) { return columns_[lhs] < columns_[rhs]; });
		break;
	case CorrelationOrder::MeanAbsolute: {
		// Undefined cells are skipped; a column with no defined partner scores 0.
		std::vector<double> score(columns_.size(), 0.0);
		for (std::size_t i = 0; i < columns_.size(); ++i) {
			double sum = 0.0;
			std::size_t count = 0;
			for (std::size_t j = 0; j < columns_.size(); ++j) {
				const double r = values_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
				if (i != j && !std::isnan(r)) {
					sum += std::abs(r);
					++count;
				}
			}
			score[i] = count > 0 ? sum / static_cast<double>(count) : 0.0;
		}
		std::stable_sort(index.begin(), index.end(),
		                 [&](std::size_t lhs, std::size_t rhs) { return score[lhs] > score[rhs]; });
		break;
	}
	}

	std::vector<std::string> ordered;
	ordered.reserve(index.size());
	for (auto i : index) {
		ordered.push_back(columns_[i]);
	}
	return ordered;
}

CorrelationMatrix CorrelationMatrix::reordered(CorrelationOrder order) const {
	auto names = orderedColumns(order);
	const auto n = static_cast<Eigen::Index>(names.size());
	std::vector<Eigen::Index> source(names.size());
	for (std::size_t i = 0; i < names.size(); ++i) {
		source[i] = static_cast<Eigen::Index>(indexOf(names[i]));
	}
	Eigen::MatrixXd permuted(n, n);
	for (Eigen::Index i = 0; i < n; ++i) {
		for (Eigen::Index j = 0; j < n; ++j) {
			permuted(i, j) = values_(source[static_cast<std::size_t>(i)], source[static_cast<std::size_t>(j)]);
		}
	}
	return CorrelationMatrix(std::move(names), std::move(permuted), zero_variance_columns_, observations_);
}

CorrelationMatrix CorrelationEngine::correlate(const cleaning::CleanedTable &table) {
	const auto &columns = table.columns();
	if (columns.size() < 2) {
		throw InsufficientDataError("correlation needs at least two columns");
	}
	if (table.empty()) {
		throw InsufficientDataError("no rows left after cleaning");
	}

	const std::size_t n = table.rowCount();
	const std::size_t k = columns.size();

	// Centre each column once; the pairwise pass then only needs dot products.
	std::vector<std::vector<double>> centered(k);
	std::vector<double> norms(k, 0.0);
	std::vector<std::string> zero_variance;
	for (std::size_t c = 0; c < k; ++c) {
		const auto &values = table.column(columns[c]);
		const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(n);
		centered[c].resize(n);
		double sum_sq = 0.0;
		for (std::size_t i = 0; i < n; ++i) {
			centered[c][i] = values[i] - mean;
			sum_sq += centered[c][i] * centered[c][i];
		}
		norms[c] = std::sqrt(sum_sq);
		if (!(norms[c] > 0.0)) {
			zero_variance.push_back(columns[c]);
		}
	}

	Eigen::MatrixXd result = Eigen::MatrixXd::Identity(static_cast<Eigen::Index>(k), static_cast<Eigen::Index>(k));
	for (std::size_t a = 0; a < k; ++a) {
		for (std::size_t b = a + 1; b < k; ++b) {
			double r = kNaN;
			if (norms[a] > 0.0 && norms[b] > 0.0) {
				double cross = 0.0;
				for (std::size_t i = 0; i < n; ++i) {
					cross += centered[a][i] * centered[b][i];
				}
				r = std::max(-1.0, std::min(1.0, cross / (norms[a] * norms[b])));
			}
			result(static_cast<Eigen::Index>(a), static_cast<Eigen::Index>(b)) = r;
			result(static_cast<Eigen::Index>(b), static_cast<Eigen::Index>(a)) = r;
		}
	}

	if (!zero_variance.empty()) {
		TABSTAT_INFO("Correlation undefined for {} zero-variance column(s)", zero_variance.size());
	}
	return CorrelationMatrix(columns, std::move(result), std::move(zero_variance), n);
}

} // namespace tabstat::models
