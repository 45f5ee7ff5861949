#include "tabstat/core/time_series.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace tabstat::core {

namespace {

constexpr std::int64_t kNanosecondsPerDay = 86400LL * 1000000000LL;

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
	std::int64_t quotient = value / divisor;
	if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
		--quotient;
	}
	return quotient;
}

struct Decomposed {
	calendar::CivilDate date;
	std::int64_t time_of_day_ns = 0;
};

Decomposed decompose(TimePoint tp) {
	const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
	const auto days = floorDiv(ns, kNanosecondsPerDay);
	Decomposed out;
	out.date = calendar::civilFromDays(days);
	out.time_of_day_ns = ns - days * kNanosecondsPerDay;
	return out;
}

TimePoint compose(const calendar::CivilDate &date, std::int64_t time_of_day_ns) {
	const auto days = calendar::daysFromCivil(date.year, date.month, date.day);
	const std::chrono::nanoseconds since_epoch{days * kNanosecondsPerDay + time_of_day_ns};
	return TimePoint{std::chrono::duration_cast<TimePoint::duration>(since_epoch)};
}

std::int64_t monthIndex(const calendar::CivilDate &date) {
	return date.year * 12 + static_cast<std::int64_t>(date.month) - 1;
}

} // namespace

namespace calendar {

// Howard Hinnant's civil calendar algorithms (proleptic Gregorian).
std::int64_t daysFromCivil(std::int64_t year, unsigned month, unsigned day) {
	year -= month <= 2 ? 1 : 0;
	const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
	const auto yoe = static_cast<unsigned>(year - era * 400);
	const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilDate civilFromDays(std::int64_t days) {
	days += 719468;
	const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
	const auto doe = static_cast<unsigned>(days - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	CivilDate date;
	date.day = doy - (153 * mp + 2) / 5 + 1;
	date.month = mp < 10 ? mp + 3 : mp - 9;
	date.year = static_cast<std::int64_t>(yoe) + era * 400 + (date.month <= 2 ? 1 : 0);
	return date;
}

unsigned lastDayOfMonth(std::int64_t year, unsigned month) {
	static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2) {
		const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
		return leap ? 29 : 28;
	}
	return kDays[month - 1];
}

TimePoint makeTimePoint(std::int64_t year, unsigned month, unsigned day, int hour, int minute, int second) {
	if (!representable(year)) {
		throw std::out_of_range("Year " + std::to_string(year) + " is outside the supported time range.");
	}
	const std::int64_t tod = (static_cast<std::int64_t>(hour) * 3600 + minute * 60 + second) * 1000000000LL;
	return compose(CivilDate{year, month, day}, tod);
}

std::string formatIso(TimePoint tp) {
	const auto parts = decompose(tp);
	char buffer[32];
	if (parts.time_of_day_ns == 0) {
		std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", static_cast<long long>(parts.date.year),
		              parts.date.month, parts.date.day);
	} else {
		const auto seconds = parts.time_of_day_ns / 1000000000LL;
		std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02lld:%02lld:%02lld",
		              static_cast<long long>(parts.date.year), parts.date.month, parts.date.day,
		              static_cast<long long>(seconds / 3600), static_cast<long long>((seconds / 60) % 60),
		              static_cast<long long>(seconds % 60));
	}
	return buffer;
}

} // namespace calendar

Frequency Frequency::fixed(std::chrono::nanoseconds step) {
	if (step <= std::chrono::nanoseconds::zero()) {
		throw std::invalid_argument("Frequency step must be positive.");
	}
	Frequency frequency;
	frequency.step_ = step;
	return frequency;
}

Frequency Frequency::months(int step, bool end_of_month) {
	if (step <= 0) {
		throw std::invalid_argument("Monthly frequency step must be positive.");
	}
	Frequency frequency;
	frequency.months_ = step;
	frequency.end_of_month_ = end_of_month;
	return frequency;
}

TimePoint Frequency::advance(TimePoint from, int count) const {
	if (!isCalendar()) {
		const auto offset = std::chrono::duration_cast<TimePoint::duration>(step_ * count);
		return from + offset;
	}

	const auto parts = decompose(from);
	const std::int64_t target = monthIndex(parts.date) + static_cast<std::int64_t>(months_) * count;
	calendar::CivilDate date;
	date.year = floorDiv(target, 12);
	date.month = static_cast<unsigned>(target - date.year * 12) + 1;
	const unsigned last = calendar::lastDayOfMonth(date.year, date.month);
	date.day = end_of_month_ ? last : std::min(parts.date.day, last);
	return compose(date, parts.time_of_day_ns);
}

std::string Frequency::label() const {
	if (isCalendar()) {
		if (months_ % 12 == 0) {
			return std::to_string(months_ / 12) + "Y";
		}
		return std::to_string(months_) + (end_of_month_ ? "ME" : "M");
	}
	const auto ns = step_.count();
	if (ns % kNanosecondsPerDay == 0) {
		return std::to_string(ns / kNanosecondsPerDay) + "D";
	}
	if (ns % 3600000000000LL == 0) {
		return std::to_string(ns / 3600000000000LL) + "h";
	}
	if (ns % 60000000000LL == 0) {
		return std::to_string(ns / 60000000000LL) + "min";
	}
	if (ns % 1000000000LL == 0) {
		return std::to_string(ns / 1000000000LL) + "s";
	}
	return std::to_string(ns) + "ns";
}

TimeSeries::TimeSeries(std::vector<TimePoint> timestamps, std::vector<double> values)
    : timestamps_(std::move(timestamps)), values_(std::move(values)) {
	if (timestamps_.size() != values_.size()) {
		throw std::invalid_argument("TimeSeries timestamps and values must have equal length.");
	}
	validateTimestampOrder();
}

void TimeSeries::validateTimestampOrder() const {
	for (std::size_t i = 1; i < timestamps_.size(); ++i) {
		if (!(timestamps_[i] > timestamps_[i - 1])) {
			throw std::invalid_argument("TimeSeries timestamps must be strictly increasing and unique.");
		}
	}
}

std::optional<Frequency> TimeSeries::inferMonthlyFrequency() const {
	if (timestamps_.size() < 2) {
		return std::nullopt;
	}

	std::vector<Decomposed> parts;
	parts.reserve(timestamps_.size());
	for (const auto &tp : timestamps_) {
		parts.push_back(decompose(tp));
	}

	const auto &first = parts.front();
	bool same_day = true;
	bool month_end = true;
	for (const auto &part : parts) {
		if (part.time_of_day_ns != first.time_of_day_ns) {
			return std::nullopt;
		}
		same_day = same_day && part.date.day == first.date.day;
		month_end = month_end && part.date.day == calendar::lastDayOfMonth(part.date.year, part.date.month);
	}
	if (!same_day && !month_end) {
		return std::nullopt;
	}

	const std::int64_t step = monthIndex(parts[1].date) - monthIndex(parts[0].date);
	if (step <= 0) {
		return std::nullopt;
	}
	for (std::size_t i = 2; i < parts.size(); ++i) {
		if (monthIndex(parts[i].date) - monthIndex(parts[i - 1].date) != step) {
			return std::nullopt;
		}
	}
	return Frequency::months(static_cast<int>(step), !same_day);
}

std::optional<Frequency> TimeSeries::inferFrequency(std::chrono::nanoseconds tolerance) const {
	if (timestamps_.size() < 2) {
		return std::nullopt;
	}
	if (auto monthly = inferMonthlyFrequency()) {
		return monthly;
	}

	const auto normalized_tolerance = (tolerance >= std::chrono::nanoseconds::zero()) ? tolerance : -tolerance;

	std::vector<std::chrono::nanoseconds> differences;
	differences.reserve(timestamps_.size() - 1);
	for (std::size_t i = 0; i + 1 < timestamps_.size(); ++i) {
		const auto diff = std::chrono::duration_cast<std::chrono::nanoseconds>(timestamps_[i + 1] - timestamps_[i]);
		if (diff <= std::chrono::nanoseconds::zero()) {
			return std::nullopt;
		}
		differences.push_back(diff);
	}

	const auto base_diff = differences.front();
	const bool within_tolerance = std::all_of(differences.begin() + 1, differences.end(), [&](const auto &diff) {
		const auto delta = diff > base_diff ? diff - base_diff : base_diff - diff;
		return delta <= normalized_tolerance;
	});
	if (within_tolerance) {
		return Frequency::fixed(base_diff);
	}

	// Irregular spacing: take the dominant gap among the most recent observations.
	const std::size_t max_samples = 5;
	const std::size_t start_index = differences.size() > max_samples ? differences.size() - max_samples : 0;
	struct Cluster {
		std::int64_t canonical = 0;
		std::size_t count = 0;
	};
	std::vector<Cluster> clusters;
	clusters.reserve(max_samples);
	const auto tolerance_count = normalized_tolerance.count();
	for (std::size_t i = start_index; i < differences.size(); ++i) {
		const auto diff_count = differences[i].count();
		bool assigned = false;
		for (auto &cluster : clusters) {
			const auto delta =
			    (diff_count >= cluster.canonical) ? diff_count - cluster.canonical : cluster.canonical - diff_count;
			if (delta <= tolerance_count) {
				++cluster.count;
				assigned = true;
				break;
			}
		}
		if (!assigned) {
			clusters.push_back(Cluster{diff_count, 1});
		}
	}

	std::size_t best_index = 0;
	std::size_t best_count = clusters[0].count;
	bool unique_best = true;
	for (std::size_t i = 1; i < clusters.size(); ++i) {
		const auto count = clusters[i].count;
		if (count > best_count) {
			best_index = i;
			best_count = count;
			unique_best = true;
		} else if (count == best_count) {
			unique_best = false;
		}
	}
	if (!unique_best) {
		return std::nullopt;
	}
	return Frequency::fixed(std::chrono::nanoseconds(clusters[best_index].canonical));
}

std::vector<TimePoint> TimeSeries::futureTimestamps(int horizon, const Frequency &frequency) const {
	if (timestamps_.empty()) {
		throw std::logic_error("Cannot extend an empty TimeSeries.");
	}
	std::vector<TimePoint> future;
	future.reserve(horizon > 0 ? static_cast<std::size_t>(horizon) : 0);
	const auto last = timestamps_.back();
	for (int step = 1; step <= horizon; ++step) {
		future.push_back(frequency.advance(last, step));
	}
	return future;
}

} // namespace tabstat::core
