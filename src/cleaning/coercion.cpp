#include "tabstat/cleaning/coercion.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <time.h>

namespace tabstat::cleaning {

namespace {

// Serial of 2262-01-01, the first day past core::calendar::kMaxYear.
constexpr double kFirstUnrepresentableSerial = 132220.0;

struct DateFormat {
	const char *pattern;
	bool has_seconds;
	bool allow_offset;
};

// Longest patterns first so a prefix match never shadows a fuller one. "%B %Y"
// precedes the day-of-month forms, which would read "January 2024" as day 20 of year 24.
constexpr std::array<DateFormat, 20> kDateFormats{{
    {"%Y-%m-%dT%H:%M:%S", true, true},
    {"%Y-%m-%d %H:%M:%S", true, true},
    {"%Y-%m-%dT%H:%M", false, true},
    {"%Y-%m-%d %H:%M", false, true},
    {"%Y-%m-%d", false, false},
    {"%Y/%m/%d %H:%M:%S", true, false},
    {"%Y/%m/%d %H:%M", false, false},
    {"%Y/%m/%d", false, false},
    {"%m/%d/%Y %H:%M:%S", true, false},
    {"%m/%d/%Y %H:%M", false, false},
    {"%m/%d/%Y", false, false},
    {"%d.%m.%Y %H:%M:%S", true, false},
    {"%d.%m.%Y", false, false},
    {"%B %Y", false, false},
    {"%B %d, %Y", false, false},
    {"%B %d %Y", false, false},
    {"%d %B %Y", false, false},
    {"%d-%b-%Y", false, false},
    {"%Y %B %d", false, false},
    {"%Y-%m", false, false},
}};

bool isDigits(std::string_view text) {
	if (text.empty()) {
		return false;
	}
	for (char c : text) {
		if (!std::isdigit(static_cast<unsigned char>(c))) {
			return false;
		}
	}
	return true;
}

// Consumes ".123456" after a seconds field. Returns nanoseconds.
bool parseFraction(std::string_view &rest, std::int64_t &nanos) {
	nanos = 0;
	if (rest.empty() || rest.front() != '.') {
		return true;
	}
	rest.remove_prefix(1);
	std::size_t digits = 0;
	std::int64_t scale = 100000000;
	while (!rest.empty() && std::isdigit(static_cast<unsigned char>(rest.front()))) {
		if (digits < 9) {
			nanos += (rest.front() - '0') * scale;
			scale /= 10;
		}
		++digits;
		rest.remove_prefix(1);
	}
	return digits > 0;
}

// Consumes "Z", "+hh:mm", "+hhmm" or "+hh". Returns the offset east of UTC in seconds.
bool parseOffset(std::string_view &rest, std::int64_t &offset_seconds) {
	offset_seconds = 0;
	if (rest.empty()) {
		return true;
	}
	if (rest == "Z" || rest == "z") {
		rest.remove_prefix(1);
		return true;
	}
	const char sign = rest.front();
	if (sign != '+' && sign != '-') {
		return false;
	}
	std::string_view body = rest.substr(1);
	std::string_view hours;
	std::string_view minutes = "00";
	if (body.size() == 5 && body[2] == ':') {
		hours = body.substr(0, 2);
		minutes = body.substr(3, 2);
	} else if (body.size() == 4) {
		hours = body.substr(0, 2);
		minutes = body.substr(2, 2);
	} else if (body.size() == 2) {
		hours = body;
	} else {
		return false;
	}
	if (!isDigits(hours) || !isDigits(minutes)) {
		return false;
	}
	const int h = (hours[0] - '0') * 10 + (hours[1] - '0');
	const int m = (minutes[0] - '0') * 10 + (minutes[1] - '0');
	if (h > 23 || m > 59) {
		return false;
	}
	offset_seconds = (sign == '+' ? 1 : -1) * (h * 3600 + m * 60);
	rest = std::string_view{};
	return true;
}

std::optional<core::TimePoint> buildTimePoint(const std::tm &tm, std::int64_t nanos, std::int64_t offset_seconds) {
	const int year = tm.tm_year + 1900;
	const unsigned month = static_cast<unsigned>(tm.tm_mon + 1);
	const unsigned day = static_cast<unsigned>(tm.tm_mday);
	if (!core::calendar::representable(year)) {
		return std::nullopt;
	}
	if (month < 1 || month > 12 || day < 1 || day > core::calendar::lastDayOfMonth(year, month)) {
		return std::nullopt;
	}
	if (tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) {
		return std::nullopt;
	}
	auto tp = core::calendar::makeTimePoint(year, month, day, tm.tm_hour, tm.tm_min, tm.tm_sec);
	tp += std::chrono::duration_cast<core::TimePoint::duration>(std::chrono::nanoseconds{nanos});
	tp -= std::chrono::duration_cast<core::TimePoint::duration>(std::chrono::seconds{offset_seconds});
	return tp;
}

} // namespace

std::string_view trim(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
		text.remove_prefix(1);
	}
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
		text.remove_suffix(1);
	}
	return text;
}

std::optional<double> coerceNumeric(const core::Value &value) {
	if (const auto *number = std::get_if<double>(&value)) {
		return *number;
	}
	const auto *text = std::get_if<std::string>(&value);
	if (!text) {
		return std::nullopt;
	}

	const std::string trimmed(trim(*text));
	if (trimmed.empty()) {
		return std::nullopt;
	}
	// strtod also reads hexadecimal literals; tabular sources never mean those.
	if (trimmed.find_first_of("xX") != std::string::npos) {
		return std::nullopt;
	}

	char *end = nullptr;
	const double parsed = std::strtod(trimmed.c_str(), &end);
	if (end != trimmed.c_str() + trimmed.size()) {
		return std::nullopt;
	}
	return parsed;
}

std::optional<core::TimePoint> fromSpreadsheetSerial(double serial) {
	if (!std::isfinite(serial) || serial <= kSpreadsheetSerialThreshold || serial >= kFirstUnrepresentableSerial) {
		return std::nullopt;
	}
	// Whole microseconds keep fractional-day noise out of the result.
	const double micros = std::round((serial - kSpreadsheetSerialThreshold) * 86400.0 * 1e6);
	const std::chrono::microseconds since_epoch{static_cast<std::int64_t>(micros)};
	return core::TimePoint{std::chrono::duration_cast<core::TimePoint::duration>(since_epoch)};
}

std::optional<core::TimePoint> parseDate(std::string_view text) {
	const std::string trimmed(trim(text));
	if (trimmed.empty()) {
		return std::nullopt;
	}

	if (trimmed.size() == 4 && isDigits(trimmed)) {
		const int year = std::atoi(trimmed.c_str());
		if (!core::calendar::representable(year)) {
			return std::nullopt;
		}
		return core::calendar::makeTimePoint(year, 1, 1);
	}

	for (const auto &format : kDateFormats) {
		std::tm tm{};
		tm.tm_mday = 1;
		const char *end = strptime(trimmed.c_str(), format.pattern, &tm);
		if (!end) {
			continue;
		}

		std::string_view rest(end);
		std::int64_t nanos = 0;
		std::int64_t offset_seconds = 0;
		if (format.has_seconds && !parseFraction(rest, nanos)) {
			continue;
		}
		if (format.allow_offset && !parseOffset(rest, offset_seconds)) {
			continue;
		}
		if (!rest.empty()) {
			continue;
		}
		if (auto tp = buildTimePoint(tm, nanos, offset_seconds)) {
			return tp;
		}
	}
	return std::nullopt;
}

std::optional<core::TimePoint> coerceDate(const core::Value &value) {
	if (const auto *number = std::get_if<double>(&value)) {
		return fromSpreadsheetSerial(*number);
	}
	if (const auto *text = std::get_if<std::string>(&value)) {
		return parseDate(*text);
	}
	return std::nullopt;
}

} // namespace tabstat::cleaning
