#pragma once

#include "tabstat/cleaning/tabular_cleaner.hpp"
#include "tabstat/core/table.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tests::helpers {

inline tabstat::core::Table makeTable(std::vector<tabstat::core::Row> rows) {
	return tabstat::core::Table(std::move(rows));
}

// Cleaned table built directly from numeric columns, all rows kept.
inline tabstat::cleaning::CleanedTable makeCleaned(const std::vector<std::pair<std::string, std::vector<double>>> &columns) {
	std::vector<std::string> names;
	std::map<std::string, std::vector<double>> data;
	std::size_t rows = 0;
	for (const auto &[name, values] : columns) {
		names.push_back(name);
		data[name] = values;
		rows = values.size();
	}
	return tabstat::cleaning::CleanedTable(std::move(names), std::move(data), rows);
}

} // namespace tests::helpers
