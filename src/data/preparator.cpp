#include "quant-forecast/data/preparator.hpp"
#include "quant-forecast/core/errors.hpp"
#include "quant-forecast/utils/dates.hpp"
#include "quant-forecast/utils/logging.hpp"

#include <algorithm>
#include <optional>

namespace quantforecast::data {

DataPreparator::DataPreparator(std::size_t min_data_points) : min_data_points_(min_data_points) {
	if (min_data_points_ < 2) {
		throw std::invalid_argument("min_data_points must be at least 2.");
	}
}

void DataPreparator::validate(const Table &table, const std::string &target_column,
                              const std::string &date_column) const {
	if (table.empty()) {
		throw core::EmptyInputError();
	}
	if (!table.hasColumn(target_column)) {
		throw core::MissingColumnError("Target", target_column);
	}
	if (!table.hasColumn(date_column)) {
		throw core::MissingColumnError("Date", date_column);
	}
	if (table.rowCount() < min_data_points_) {
		throw core::InsufficientDataError("Insufficient data points. Need at least " +
		                                  std::to_string(min_data_points_) + ", got " +
		                                  std::to_string(table.rowCount()) + ".");
	}
	if (table.column(target_column).type() != ColumnType::Numeric) {
		throw core::NonNumericTargetError(target_column);
	}
}

std::vector<std::optional<DataPreparator::TimePoint>> DataPreparator::parseDates(const Column &column) {
	std::vector<std::optional<TimePoint>> parsed(column.size());
	for (std::size_t row = 0; row < column.size(); ++row) {
		if (column.isMissing(row)) {
			continue;
		}
		switch (column.type()) {
		case ColumnType::Timestamp:
			parsed[row] = column.timestampAt(row);
			break;
		case ColumnType::Text: {
			const auto &text = *column.textAt(row);
			auto tp = utils::parseTimestamp(text);
			if (!tp) {
				throw core::DateParseError("Cannot parse '" + text + "' in date column '" + column.name() +
				                           "' at row " + std::to_string(row) + ".");
			}
			parsed[row] = *tp;
			break;
		}
		case ColumnType::Numeric:
			throw core::DateParseError("Date column '" + column.name() + "' must hold dates, not numbers.");
		}
	}
	return parsed;
}

core::TimeSeries DataPreparator::prepare(const Table &table, const std::string &target_column,
                                         const std::string &date_column) const {
	validate(table, target_column, date_column);

	const auto &target = table.column(target_column);
	const auto dates = parseDates(table.column(date_column));

	std::vector<std::size_t> usable;
	usable.reserve(table.rowCount());
	for (std::size_t row = 0; row < table.rowCount(); ++row) {
		if (dates[row].has_value() && !target.isMissing(row)) {
			usable.push_back(row);
		}
	}

	const std::size_t dropped = table.rowCount() - usable.size();
	if (dropped > 0) {
		QUANT_DEBUG("Dropped {} rows with a missing '{}' or '{}' value.", dropped, target_column, date_column);
	}
	if (usable.size() < min_data_points_) {
		throw core::InsufficientDataError("Insufficient usable data points. Need at least " +
		                                  std::to_string(min_data_points_) + ", got " +
		                                  std::to_string(usable.size()) + ".");
	}

	std::stable_sort(usable.begin(), usable.end(),
	                 [&dates](std::size_t lhs, std::size_t rhs) { return *dates[lhs] < *dates[rhs]; });

	std::vector<TimePoint> timestamps;
	std::vector<double> values;
	timestamps.reserve(usable.size());
	values.reserve(usable.size());
	for (std::size_t row : usable) {
		const TimePoint tp = *dates[row];
		if (!timestamps.empty() && !(tp > timestamps.back())) {
			throw core::DuplicateTimestampError("Date column '" + date_column + "' contains " +
			                                    utils::formatDate(tp) + " more than once.");
		}
		timestamps.push_back(tp);
		values.push_back(*target.numericAt(row));
	}

	QUANT_DEBUG("Prepared '{}' series with {} points.", target_column, values.size());
	return core::TimeSeries(std::move(timestamps), std::move(values), target_column);
}

} // namespace quantforecast::data
