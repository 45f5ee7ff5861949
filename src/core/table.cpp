#include "tabstat/core/table.hpp"

#include <algorithm>
#include <stdexcept>

namespace tabstat::core {

Table::Table(std::vector<Row> rows) : rows_(std::move(rows)) {
	for (const auto &row : rows_) {
		registerColumns(row);
	}
}

void Table::addRow(Row row) {
	registerColumns(row);
	rows_.push_back(std::move(row));
}

bool Table::hasColumn(const std::string &name) const {
	return std::find(column_order_.begin(), column_order_.end(), name) != column_order_.end();
}

Value Table::at(std::size_t row, const std::string &column) const {
	if (row >= rows_.size()) {
		throw std::out_of_range("Table row index out of range.");
	}
	const auto &record = rows_[row];
	const auto it = record.find(column);
	if (it == record.end()) {
		return Value{};
	}
	return it->second;
}

void Table::registerColumns(const Row &row) {
	// std::map iterates keys sorted, so first-seen order within a single row is alphabetical.
	for (const auto &entry : row) {
		if (!hasColumn(entry.first)) {
			column_order_.push_back(entry.first);
		}
	}
}

} // namespace tabstat::core
