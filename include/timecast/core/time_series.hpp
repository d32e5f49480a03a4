#pragma once

#include "timecast/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace timecast::core {

/**
 * @class TimeSeries
 * @brief An immutable, regularly sampled window of observations.
 *
 * Timestamps and values are stored in separate vectors for cache-efficient
 * numerical processing. Every consecutive pair of timestamps is exactly one
 * sampling period apart; a missing observation is an explicit NaN at its
 * timestamp. Infinite observations are rejected. Exogenous regressors are aligned position by position with
 * the primary values and travel with every slice.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;
	using Frequency = std::chrono::nanoseconds;
	using RegressorTable = std::map<std::string, std::vector<double>>;
	using Metadata = std::unordered_map<std::string, std::string>;

	/**
	 * @brief Constructs a window.
	 * @param timestamps Strictly increasing time points, one sampling period apart.
	 * @param values Observations; NaN marks an explicit gap.
	 * @param frequency Sampling period, strictly positive.
	 * @param regressors Named exogenous series aligned with @p values.
	 * @throws MalformedInputError If any invariant is violated.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, Frequency frequency,
	           RegressorTable regressors = {}, Metadata metadata = {})
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), frequency_(frequency),
	      regressors_(std::move(regressors)), metadata_(std::move(metadata)) {
		validate();
	}

	/**
	 * @brief Constructs a window whose sampling period is read off the timestamps.
	 * @throws MalformedInputError If fewer than two timestamps are given or spacing is irregular.
	 */
	static TimeSeries withInferredFrequency(std::vector<TimePoint> timestamps, std::vector<Value> values,
	                                        RegressorTable regressors = {}) {
		if (timestamps.size() < 2) {
			throw MalformedInputError("Cannot infer a sampling frequency from fewer than two timestamps.");
		}
		const auto frequency = std::chrono::duration_cast<Frequency>(timestamps[1] - timestamps[0]);
		return TimeSeries(std::move(timestamps), std::move(values), frequency, std::move(regressors));
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	Frequency frequency() const {
		return frequency_;
	}

	std::size_t size() const {
		return timestamps_.size();
	}

	TimePoint startTime() const {
		return timestamps_.front();
	}

	TimePoint endTime() const {
		return timestamps_.back();
	}

	const Metadata &metadata() const {
		return metadata_;
	}

	bool hasRegressors() const {
		return !regressors_.empty();
	}

	const RegressorTable &regressors() const {
		return regressors_;
	}

	bool hasRegressor(const std::string &name) const {
		return regressors_.find(name) != regressors_.end();
	}

	/**
	 * @brief Values of a single regressor.
	 * @throws std::out_of_range If the regressor does not exist.
	 */
	const std::vector<double> &regressor(const std::string &name) const {
		const auto it = regressors_.find(name);
		if (it == regressors_.end()) {
			throw std::out_of_range("Regressor '" + name + "' not found.");
		}
		return it->second;
	}

	std::vector<std::string> regressorNames() const {
		std::vector<std::string> names;
		names.reserve(regressors_.size());
		for (const auto &entry : regressors_) {
			names.push_back(entry.first);
		}
		return names;
	}

	/**
	 * @brief Restricts the window to timestamps in the half-open range [start, end).
	 * @throws RangeError If the range holds no observation.
	 */
	TimeSeries slice(TimePoint start, TimePoint end) const {
		const auto first = std::lower_bound(timestamps_.begin(), timestamps_.end(), start);
		const auto last = std::lower_bound(timestamps_.begin(), timestamps_.end(), end);
		if (start >= end || first >= last) {
			throw RangeError("Slice range selects no observation.");
		}
		return sliceIndex(static_cast<std::size_t>(first - timestamps_.begin()),
		                  static_cast<std::size_t>(last - timestamps_.begin()));
	}

	/**
	 * @brief Positional slice over the half-open index range [begin, end).
	 * @throws RangeError If the range is empty or exceeds the window.
	 */
	TimeSeries sliceIndex(std::size_t begin, std::size_t end) const {
		if (begin >= end || end > size()) {
			throw RangeError("Slice [" + std::to_string(begin) + ", " + std::to_string(end) +
			                 ") is empty or exceeds a window of " + std::to_string(size()) + " observations.");
		}
		const auto b = static_cast<std::ptrdiff_t>(begin);
		const auto e = static_cast<std::ptrdiff_t>(end);

		RegressorTable sliced_regressors;
		for (const auto &entry : regressors_) {
			sliced_regressors.emplace(entry.first,
			                          std::vector<double>(entry.second.begin() + b, entry.second.begin() + e));
		}
		return TimeSeries(std::vector<TimePoint>(timestamps_.begin() + b, timestamps_.begin() + e),
		                  std::vector<Value>(values_.begin() + b, values_.begin() + e), frequency_,
		                  std::move(sliced_regressors), metadata_);
	}

	/**
	 * @brief Splits off the last @p test_length observations.
	 * @return A (train, test) pair; train strictly precedes test.
	 * @throws InsufficientDataError If the test window would be empty or swallow the whole series.
	 */
	std::pair<TimeSeries, TimeSeries> splitTrainTest(std::size_t test_length) const {
		if (test_length == 0) {
			throw InsufficientDataError("Test window must hold at least one observation.");
		}
		if (test_length >= size()) {
			throw InsufficientDataError("Test length " + std::to_string(test_length) +
			                            " leaves no training data in a window of " + std::to_string(size()) +
			                            " observations.");
		}
		const std::size_t boundary = size() - test_length;
		return {sliceIndex(0, boundary), sliceIndex(boundary, size())};
	}

	bool hasGaps() const {
		return gapCount() > 0;
	}

	std::size_t gapCount() const {
		return static_cast<std::size_t>(
		    std::count_if(values_.begin(), values_.end(), [](double v) { return std::isnan(v); }));
	}

	/**
	 * @brief Returns a copy with explicit gaps filled by linear interpolation.
	 *
	 * Leading and trailing gaps take the nearest observed value.
	 * @throws MalformedInputError If the window holds no observed value at all.
	 */
	TimeSeries interpolated() const {
		if (!hasGaps()) {
			return *this;
		}
		std::vector<Value> filled = values_;
		const std::size_t n = filled.size();

		std::size_t first_valid = n;
		for (std::size_t i = 0; i < n; ++i) {
			if (!std::isnan(filled[i])) {
				first_valid = i;
				break;
			}
		}
		if (first_valid == n) {
			throw MalformedInputError("Window contains no finite observation to interpolate from.");
		}
		for (std::size_t i = 0; i < first_valid; ++i) {
			filled[i] = filled[first_valid];
		}

		std::size_t last_valid = first_valid;
		for (std::size_t i = first_valid + 1; i < n; ++i) {
			if (std::isnan(filled[i])) {
				continue;
			}
			const std::size_t span = i - last_valid;
			for (std::size_t j = last_valid + 1; j < i; ++j) {
				const double weight = static_cast<double>(j - last_valid) / static_cast<double>(span);
				filled[j] = filled[last_valid] + weight * (filled[i] - filled[last_valid]);
			}
			last_valid = i;
		}
		for (std::size_t i = last_valid + 1; i < n; ++i) {
			filled[i] = filled[last_valid];
		}
		return withValues(std::move(filled));
	}

	/// Same timestamps and regressors, different observations.
	TimeSeries withValues(std::vector<Value> values) const {
		return TimeSeries(timestamps_, std::move(values), frequency_, regressors_, metadata_);
	}

	/// Same observations, replaced regressor table.
	TimeSeries withRegressors(RegressorTable regressors) const {
		return TimeSeries(timestamps_, values_, frequency_, std::move(regressors), metadata_);
	}

	TimeSeries withMetadata(Metadata metadata) const {
		return TimeSeries(timestamps_, values_, frequency_, regressors_, std::move(metadata));
	}

	/// The @p horizon timestamps that follow the last observation.
	std::vector<TimePoint> futureTimestamps(std::size_t horizon) const {
		std::vector<TimePoint> future;
		future.reserve(horizon);
		for (std::size_t h = 1; h <= horizon; ++h) {
			future.push_back(endTime() +
			                 std::chrono::duration_cast<TimePoint::duration>(frequency_ * static_cast<long long>(h)));
		}
		return future;
	}

private:
	void validate() const {
		if (timestamps_.empty()) {
			throw MalformedInputError("A time series window must hold at least one observation.");
		}
		if (timestamps_.size() != values_.size()) {
			throw MalformedInputError("Timestamps and values vectors must have the same size.");
		}
		if (frequency_ <= Frequency::zero()) {
			throw MalformedInputError("Sampling frequency must be strictly positive.");
		}
		for (std::size_t i = 0; i < values_.size(); ++i) {
			if (std::isinf(values_[i])) {
				throw MalformedInputError("Observation at index " + std::to_string(i) +
				                          " is infinite; only NaN may mark a gap.");
			}
		}
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			const auto diff = timestamps_[i] - timestamps_[i - 1];
			if (diff <= TimePoint::duration::zero()) {
				throw MalformedInputError("Timestamps must be strictly increasing (violated at index " +
				                          std::to_string(i) + ").");
			}
			if (std::chrono::duration_cast<Frequency>(diff) != frequency_) {
				throw MalformedInputError("Timestamp spacing at index " + std::to_string(i) +
				                          " does not match the declared frequency; gaps must be explicit.");
			}
		}
		for (const auto &entry : regressors_) {
			if (entry.second.size() != values_.size()) {
				throw MalformedInputError("Regressor '" + entry.first + "' length must match time series length.");
			}
			for (double v : entry.second) {
				if (!std::isfinite(v)) {
					throw MalformedInputError("Regressor '" + entry.first + "' contains non-finite values.");
				}
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	Frequency frequency_;
	RegressorTable regressors_;
	Metadata metadata_;
};

} // namespace timecast::core
