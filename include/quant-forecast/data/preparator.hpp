#pragma once

#include "quant-forecast/core/config.hpp"
#include "quant-forecast/core/time_series.hpp"
#include "quant-forecast/data/table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace quantforecast::data {

/**
 * @class DataPreparator
 * @brief Turns a raw table into a clean, time-ordered univariate series.
 *
 * Validation runs before any numeric work and reports the first problem found
 * through the typed errors of core/errors.hpp:
 *  - EmptyInputError when the table has no rows
 *  - MissingColumnError when the target or date column is absent
 *  - InsufficientDataError when fewer than min_data_points rows (or usable rows) exist
 *  - NonNumericTargetError when the target column is not numeric
 *  - DateParseError / DuplicateTimestampError for unusable date cells
 *
 * The input table is never modified.
 */
class DataPreparator {
public:
	explicit DataPreparator(std::size_t min_data_points = core::ForecastConfig{}.min_data_points);

	core::TimeSeries prepare(const Table &table, const std::string &target_column,
	                         const std::string &date_column) const;

	/// Runs only the up-front checks, without parsing or sorting.
	void validate(const Table &table, const std::string &target_column, const std::string &date_column) const;

private:
	using TimePoint = core::TimeSeries::TimePoint;

	static std::vector<std::optional<TimePoint>> parseDates(const Column &column);

	std::size_t min_data_points_;
};

} // namespace quantforecast::data
