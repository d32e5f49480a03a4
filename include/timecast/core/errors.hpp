#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace timecast::core {

/**
 * @class Error
 * @brief Root of every error raised by the forecasting pipeline.
 *
 * Configuration mistakes are reported separately as std::invalid_argument.
 */
class Error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/// A slicing request selected no observation.
class RangeError : public Error {
public:
	using Error::Error;
};

/// A split request cannot leave a non-empty training and test window.
class InsufficientDataError : public Error {
public:
	using Error::Error;
};

/// Input handed over by the ingestion side violates the window invariants.
class MalformedInputError : public Error {
public:
	using Error::Error;
};

/// A model could not be fitted (too little data, no convergence, bad numbers).
class TrainingError : public Error {
public:
	using Error::Error;
};

/// A model could not produce a forecast (not fitted, bad horizon, bad regressors).
class PredictionError : public Error {
public:
	using Error::Error;
};

/// A candidate exceeded its time budget.
class TimeoutError : public Error {
public:
	using Error::Error;
};

/**
 * @struct FoldSkippedWarning
 * @brief Non-fatal record of a validation fold that could not be evaluated.
 */
struct FoldSkippedWarning {
	std::size_t fold_id = 0;
	std::size_t train_length = 0;
	std::size_t required_length = 0;
	std::string reason;
};

/// Cross-validation produced no evaluated fold for a candidate.
class ValidationError : public Error {
public:
	explicit ValidationError(const std::string &message, std::vector<FoldSkippedWarning> skipped = {})
	    : Error(message), skipped_(std::move(skipped)) {
	}

	/// Folds that were skipped on the way to this error.
	const std::vector<FoldSkippedWarning> &skipped() const {
		return skipped_;
	}

private:
	std::vector<FoldSkippedWarning> skipped_;
};

struct CandidateFailure {
	std::string model;
	std::string reason;
};

/**
 * @class NoViableModelError
 * @brief Raised when no candidate survives selection.
 *
 * Carries the reason every candidate was excluded so callers can explain the outcome.
 */
class NoViableModelError : public Error {
public:
	explicit NoViableModelError(const std::string &message, std::vector<CandidateFailure> failures = {})
	    : Error(describe(message, failures)), failures_(std::move(failures)) {
	}

	const std::vector<CandidateFailure> &failures() const {
		return failures_;
	}

private:
	static std::string describe(const std::string &message, const std::vector<CandidateFailure> &failures) {
		std::string text = message;
		for (const auto &failure : failures) {
			text += "\n  " + failure.model + ": " + failure.reason;
		}
		return text;
	}

	std::vector<CandidateFailure> failures_;
};

} // namespace timecast::core
