#pragma once

#include <stdexcept>
#include <string>

namespace quantforecast::core {

/**
 * @class ValidationError
 * @brief Base class for every input problem detected before numeric work starts.
 */
class ValidationError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/// The input table has no rows.
class EmptyInputError : public ValidationError {
public:
	EmptyInputError() : ValidationError("Data cannot be empty.") {
	}
};

/// A requested column does not exist in the input table.
class MissingColumnError : public ValidationError {
public:
	MissingColumnError(const std::string &role, const std::string &column)
	    : ValidationError(role + " column '" + column + "' not found in data."), column_(column) {
	}

	const std::string &column() const {
		return column_;
	}

private:
	std::string column_;
};

/// Not enough rows (or usable rows) to forecast, or a non-positive horizon.
class InsufficientDataError : public ValidationError {
public:
	using ValidationError::ValidationError;
};

/// The target column does not hold numeric values.
class NonNumericTargetError : public ValidationError {
public:
	explicit NonNumericTargetError(const std::string &column)
	    : ValidationError("Target column '" + column + "' must be numeric.") {
	}
};

/// A date cell could not be interpreted as a timestamp.
class DateParseError : public ValidationError {
public:
	using ValidationError::ValidationError;
};

/// Two usable rows share the same timestamp.
class DuplicateTimestampError : public ValidationError {
public:
	using ValidationError::ValidationError;
};

/**
 * @class ForecastError
 * @brief Raised when a numeric stage fails on input that passed validation.
 */
class ForecastError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace quantforecast::core
