#pragma once

#include "tabstat/core/time_series.hpp"

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace tabstat::core {

/**
 * @struct Forecast
 * @brief Point predictions for future steps, optionally stamped with their timestamps.
 */
struct Forecast {
	/// Point forecasts, one per step.
	std::vector<double> point;

	/// Timestamps of the forecast steps; empty until the caller assigns them.
	std::vector<TimePoint> timestamps;

	bool empty() const {
		return point.empty();
	}

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return point.size();
	}

	/// Attaches timestamps; their count must match the horizon.
	void stamp(std::vector<TimePoint> future) {
		if (future.size() != point.size()) {
			throw std::invalid_argument("Forecast timestamps must match the horizon.");
		}
		timestamps = std::move(future);
	}
};

} // namespace tabstat::core
