#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tabstat::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @class Frequency
 * @brief Spacing between consecutive observations.
 *
 * Either a fixed duration (seconds, hours, days, weeks...) or a calendar step
 * of whole months, which cannot be expressed as a duration.
 */
class Frequency {
public:
	static Frequency fixed(std::chrono::nanoseconds step);
	static Frequency months(int step, bool end_of_month = false);
	static Frequency daily() {
		return fixed(std::chrono::hours{24});
	}

	bool isCalendar() const {
		return months_ > 0;
	}
	std::chrono::nanoseconds step() const {
		return step_;
	}
	int monthStep() const {
		return months_;
	}
	bool endOfMonth() const {
		return end_of_month_;
	}

	/**
	 * @brief Moves a time point forward by `count` steps.
	 */
	TimePoint advance(TimePoint from, int count = 1) const;

	/**
	 * @brief Human readable label such as "1D", "7D", "1h", "1M" or "12M".
	 */
	std::string label() const;

	bool operator==(const Frequency &other) const {
		return step_ == other.step_ && months_ == other.months_ && end_of_month_ == other.end_of_month_;
	}
	bool operator!=(const Frequency &other) const {
		return !(*this == other);
	}

private:
	Frequency() = default;

	std::chrono::nanoseconds step_{0};
	int months_ = 0;
	bool end_of_month_ = false;
};

/**
 * @class TimeSeries
 * @brief Univariate series with strictly increasing timestamps.
 */
class TimeSeries {
public:
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<double> values);

	std::size_t size() const {
		return values_.size();
	}
	bool empty() const {
		return values_.empty();
	}
	const std::vector<TimePoint> &timestamps() const {
		return timestamps_;
	}
	const std::vector<double> &values() const {
		return values_;
	}

	std::optional<Frequency> frequency() const {
		return frequency_;
	}
	void setFrequency(const Frequency &frequency) {
		frequency_ = frequency;
	}

	/**
	 * @brief Infers the sampling frequency from the timestamps.
	 *
	 * Calendar month steps are recognised first. Otherwise the gap is used when
	 * all gaps agree within `tolerance`, or the unique most common gap among the
	 * last five. Returns std::nullopt when neither applies.
	 */
	std::optional<Frequency> inferFrequency(std::chrono::nanoseconds tolerance = std::chrono::nanoseconds{0}) const;

	/**
	 * @brief Produces `horizon` timestamps continuing after the last observation.
	 */
	std::vector<TimePoint> futureTimestamps(int horizon, const Frequency &frequency) const;

private:
	void validateTimestampOrder() const;
	std::optional<Frequency> inferMonthlyFrequency() const;

	std::vector<TimePoint> timestamps_;
	std::vector<double> values_;
	std::optional<Frequency> frequency_;
};

namespace calendar {

struct CivilDate {
	std::int64_t year = 1970;
	unsigned month = 1;
	unsigned day = 1;
};

// Whole years a nanosecond TimePoint can hold.
inline constexpr std::int64_t kMinYear = 1678;
inline constexpr std::int64_t kMaxYear = 2261;

inline constexpr bool representable(std::int64_t year) {
	return year >= kMinYear && year <= kMaxYear;
}

std::int64_t daysFromCivil(std::int64_t year, unsigned month, unsigned day);
CivilDate civilFromDays(std::int64_t days);
unsigned lastDayOfMonth(std::int64_t year, unsigned month);

/**
 * @brief Builds a UTC time point from calendar fields.
 *
 * Throws std::out_of_range when `year` is outside [kMinYear, kMaxYear].
 */
TimePoint makeTimePoint(std::int64_t year, unsigned month, unsigned day, int hour = 0, int minute = 0,
                        int second = 0);

/**
 * @brief Formats a time point as "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS" when it has a time of day.
 */
std::string formatIso(TimePoint tp);

} // namespace calendar

} // namespace tabstat::core
