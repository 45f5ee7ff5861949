#include <catch2/catch.hpp>

#include "tabstat/cleaning/coercion.hpp"

#include <cmath>
#include <limits>
#include <string>

using namespace tabstat::cleaning;
using tabstat::core::Value;
using tabstat::core::calendar::formatIso;
using tabstat::core::calendar::makeTimePoint;

TEST_CASE("Numbers pass through numeric coercion unchanged", "[cleaning][coercion]") {
	REQUIRE(coerceNumeric(Value{2.5}) == 2.5);
	REQUIRE(coerceNumeric(Value{-0.0}) == 0.0);

	const auto nan = coerceNumeric(Value{std::numeric_limits<double>::quiet_NaN()});
	REQUIRE(nan.has_value());
	REQUIRE(std::isnan(*nan));
}

TEST_CASE("Numeric text is trimmed and fully consumed", "[cleaning][coercion]") {
	REQUIRE(coerceNumeric(Value{std::string("  42 ")}) == 42.0);
	REQUIRE(coerceNumeric(Value{std::string("-1.5e3")}) == -1500.0);
	REQUIRE(coerceNumeric(Value{std::string(".25")}) == 0.25);

	REQUIRE_FALSE(coerceNumeric(Value{std::string("12abc")}).has_value());
	REQUIRE_FALSE(coerceNumeric(Value{std::string("0x1A")}).has_value());
	REQUIRE_FALSE(coerceNumeric(Value{std::string("")}).has_value());
	REQUIRE_FALSE(coerceNumeric(Value{std::string("   ")}).has_value());
	REQUIRE_FALSE(coerceNumeric(Value{}).has_value());
}

TEST_CASE("Spreadsheet serials above the threshold are dates", "[cleaning][coercion][dates]") {
	const auto day = coerceDate(Value{45292.0});
	REQUIRE(day.has_value());
	REQUIRE(*day == makeTimePoint(2024, 1, 1));

	const auto noon = coerceDate(Value{45292.5});
	REQUIRE(noon.has_value());
	REQUIRE(*noon == makeTimePoint(2024, 1, 1, 12));

	REQUIRE_FALSE(coerceDate(Value{kSpreadsheetSerialThreshold}).has_value());
	REQUIRE_FALSE(coerceDate(Value{100.0}).has_value());
	REQUIRE_FALSE(coerceDate(Value{-45292.0}).has_value());
	REQUIRE_FALSE(coerceDate(Value{std::numeric_limits<double>::infinity()}).has_value());
	REQUIRE_FALSE(coerceDate(Value{}).has_value());
}

TEST_CASE("ISO dates and date-times parse to UTC", "[cleaning][coercion][dates]") {
	REQUIRE(parseDate("2024-01-03") == makeTimePoint(2024, 1, 3));
	REQUIRE(parseDate(" 2024-01-03 ") == makeTimePoint(2024, 1, 3));
	REQUIRE(parseDate("2024-01-03T10:15:30") == makeTimePoint(2024, 1, 3, 10, 15, 30));
	REQUIRE(parseDate("2024-01-03 10:15") == makeTimePoint(2024, 1, 3, 10, 15));
	REQUIRE(parseDate("2024-01-03T10:15:30Z") == makeTimePoint(2024, 1, 3, 10, 15, 30));
	REQUIRE(parseDate("2024-01-03T10:15:30+02:00") == makeTimePoint(2024, 1, 3, 8, 15, 30));
	REQUIRE(parseDate("2024-01-03T00:30:00-0100") == makeTimePoint(2024, 1, 3, 1, 30, 0));

	const auto fractional = parseDate("2024-01-03T10:15:30.250");
	REQUIRE(fractional.has_value());
	REQUIRE(*fractional - makeTimePoint(2024, 1, 3, 10, 15, 30) == std::chrono::milliseconds{250});
}

TEST_CASE("Regional and named-month formats parse", "[cleaning][coercion][dates]") {
	const auto expected = makeTimePoint(2024, 1, 5);
	REQUIRE(parseDate("2024/01/05") == expected);
	REQUIRE(parseDate("01/05/2024") == expected);
	REQUIRE(parseDate("05.01.2024") == expected);
	REQUIRE(parseDate("Jan 5 2024") == expected);
	REQUIRE(parseDate("5 Jan 2024") == expected);
	REQUIRE(parseDate("January 5, 2024") == expected);
	REQUIRE(parseDate("2024-03") == makeTimePoint(2024, 3, 1));
	REQUIRE(parseDate("2024") == makeTimePoint(2024, 1, 1));
}

TEST_CASE("Month and year text is the first of that month", "[cleaning][coercion][dates]") {
	const auto january = coerceDate(Value{std::string("January 2024")});
	REQUIRE(january.has_value());
	REQUIRE(formatIso(*january) == "2024-01-01");
	REQUIRE(parseDate("March 2024") == makeTimePoint(2024, 3, 1));
	REQUIRE(parseDate("Sep 1999") == makeTimePoint(1999, 9, 1));

	REQUIRE(parseDate("January 20 2024") == makeTimePoint(2024, 1, 20));
	REQUIRE(parseDate("January 20, 2024") == makeTimePoint(2024, 1, 20));
}

TEST_CASE("Dates outside the representable range do not parse", "[cleaning][coercion][dates]") {
	REQUIRE_FALSE(parseDate("1500-06-01").has_value());
	REQUIRE_FALSE(parseDate("2300-01-01").has_value());
	REQUIRE_FALSE(parseDate("9999-12-31T23:59:59").has_value());
	REQUIRE_FALSE(parseDate("1500").has_value());
	REQUIRE_FALSE(parseDate("3000").has_value());
	REQUIRE_FALSE(parseDate("June 1066").has_value());

	REQUIRE(parseDate("1678-01-01") == makeTimePoint(1678, 1, 1));
	REQUIRE(parseDate("2261-12-31") == makeTimePoint(2261, 12, 31));

	REQUIRE(coerceDate(Value{132219.0}) == makeTimePoint(2261, 12, 31));
	REQUIRE_FALSE(coerceDate(Value{132220.0}).has_value());
	REQUIRE_FALSE(coerceDate(Value{2958465.0}).has_value());
	REQUIRE_FALSE(coerceDate(Value{1e12}).has_value());
}

TEST_CASE("Invalid calendar text does not parse", "[cleaning][coercion][dates]") {
	REQUIRE_FALSE(parseDate("").has_value());
	REQUIRE_FALSE(parseDate("yesterday").has_value());
	REQUIRE_FALSE(parseDate("2024-02-30").has_value());
	REQUIRE_FALSE(parseDate("2024-13-01").has_value());
	REQUIRE_FALSE(parseDate("2024-01-03 garbage").has_value());
	REQUIRE_FALSE(coerceDate(Value{std::string("not a date")}).has_value());
}

TEST_CASE("Dates format back to their ISO text", "[cleaning][coercion][dates]") {
	REQUIRE(formatIso(*parseDate("2024-01-04")) == "2024-01-04");
}
