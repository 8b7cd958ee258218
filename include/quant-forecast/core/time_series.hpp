#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace quantforecast::core {

/**
 * @class TimeSeries
 * @brief Represents a prepared, time-ordered univariate series.
 *
 * Timestamps and values are stored in separate vectors for cache-efficient
 * numerical processing. Timestamps are strictly increasing; the number of
 * timestamps always matches the number of values.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param timestamps A vector of strictly increasing time points.
	 * @param values A vector of corresponding values.
	 * @param label Optional name of the measured quantity (e.g. the source column).
	 * @throws std::invalid_argument If the sizes differ or timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, std::string label = {})
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), label_(std::move(label)) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		validateTimestampOrder();
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	const std::string &label() const {
		return label_;
	}

	/**
	 * @brief Gets the number of data points in the series.
	 */
	std::size_t size() const {
		return values_.size();
	}

	/**
	 * @brief Checks if the time series is empty.
	 */
	bool isEmpty() const {
		return values_.empty();
	}

	const TimePoint &lastTimestamp() const {
		if (timestamps_.empty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return timestamps_.back();
	}

	Value lastValue() const {
		if (values_.empty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return values_.back();
	}

	std::size_t countMissingValues() const {
		std::size_t count = 0;
		for (double v : values_) {
			if (!std::isfinite(v)) {
				++count;
			}
		}
		return count;
	}

	bool hasMissingValues() const {
		return countMissingValues() > 0;
	}

	/**
	 * @brief Returns a copy with every non-finite observation dropped.
	 */
	TimeSeries sanitized() const {
		std::vector<TimePoint> ts;
		std::vector<Value> vs;
		ts.reserve(size());
		vs.reserve(size());
		for (std::size_t i = 0; i < size(); ++i) {
			if (std::isfinite(values_[i])) {
				ts.push_back(timestamps_[i]);
				vs.push_back(values_[i]);
			}
		}
		return TimeSeries(std::move(ts), std::move(vs), label_);
	}

private:
	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw std::invalid_argument("Timestamps must be strictly increasing.");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	std::string label_;
};

} // namespace quantforecast::core
