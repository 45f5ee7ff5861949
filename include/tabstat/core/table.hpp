#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tabstat::core {

/**
 * @brief A single cell as delivered by the client: missing, a number or text.
 *
 * Spreadsheet-serial dates arrive as plain numbers.
 */
using Value = std::variant<std::monostate, double, std::string>;

inline bool isMissing(const Value &value) {
	return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief One record. Missing entries are simply absent keys.
 */
using Row = std::map<std::string, Value>;

/**
 * @class Table
 * @brief Ordered rows whose column set is the union of keys across rows.
 */
class Table {
public:
	Table() = default;
	explicit Table(std::vector<Row> rows);

	void addRow(Row row);

	const std::vector<Row> &rows() const {
		return rows_;
	}
	std::size_t rowCount() const {
		return rows_.size();
	}
	bool empty() const {
		return rows_.empty();
	}

	/**
	 * @brief Column names in first-seen order across rows.
	 */
	const std::vector<std::string> &columnNames() const {
		return column_order_;
	}

	bool hasColumn(const std::string &name) const;

	/**
	 * @brief Returns the cell at (row, column); missing when the key is absent.
	 */
	Value at(std::size_t row, const std::string &column) const;

private:
	void registerColumns(const Row &row);

	std::vector<Row> rows_;
	std::vector<std::string> column_order_;
};

} // namespace tabstat::core
