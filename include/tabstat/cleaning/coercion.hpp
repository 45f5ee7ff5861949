#pragma once

#include "tabstat/core/table.hpp"
#include "tabstat/core/time_series.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tabstat::cleaning {

/**
 * @brief Spreadsheet serial numbers above this value are read as dates.
 *
 * 25569 is the serial of 1970-01-01 in the 1900 date system.
 */
inline constexpr double kSpreadsheetSerialThreshold = 25569.0;

/**
 * @brief Converts a cell to a number.
 *
 * Numbers pass through unchanged (NaN included). Text is trimmed and must parse
 * completely as a decimal number. Missing cells and unparseable text yield
 * std::nullopt. Never throws.
 */
std::optional<double> coerceNumeric(const core::Value &value);

/**
 * @brief Converts a cell to a UTC timestamp.
 *
 * Numbers greater than kSpreadsheetSerialThreshold are days (fractional days
 * allowed) since 1899-12-30. Text goes through parseDate(). Everything else
 * yields std::nullopt. Never throws.
 */
std::optional<core::TimePoint> coerceDate(const core::Value &value);

/**
 * @brief Permissive calendar parser for textual dates.
 *
 * Accepts ISO dates and date-times (T or space separated, optional fractional
 * seconds, optional Z or numeric UTC offset), YYYY/MM/DD, MM/DD/YYYY,
 * DD.MM.YYYY, YYYY-MM, month-name forms such as "Jan 5 2024" or
 * "January 5, 2024", and a bare four digit year.
 */
std::optional<core::TimePoint> parseDate(std::string_view text);

/**
 * @brief Converts a spreadsheet serial day number to a timestamp.
 */
std::optional<core::TimePoint> fromSpreadsheetSerial(double serial);

std::string_view trim(std::string_view text);

} // namespace tabstat::cleaning
