#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace quantforecast::data {

enum class ColumnType { Numeric, Text, Timestamp };

std::string toString(ColumnType type);

/**
 * @class Column
 * @brief A named, typed column of a Table; every cell may be missing.
 *
 * Only the storage matching the column type is populated.
 */
class Column {
public:
	using TimePoint = std::chrono::system_clock::time_point;

	static Column numeric(std::string name, std::vector<std::optional<double>> values);
	/// Convenience overload where NaN marks a missing cell.
	static Column numeric(std::string name, const std::vector<double> &values);
	static Column text(std::string name, std::vector<std::optional<std::string>> values);
	static Column timestamps(std::string name, std::vector<std::optional<TimePoint>> values);

	const std::string &name() const {
		return name_;
	}

	ColumnType type() const {
		return type_;
	}

	std::size_t size() const;

	/// True for empty cells; NaN counts as missing in numeric columns.
	bool isMissing(std::size_t row) const;

	std::optional<double> numericAt(std::size_t row) const;
	const std::optional<std::string> &textAt(std::size_t row) const;
	const std::optional<TimePoint> &timestampAt(std::size_t row) const;

private:
	Column(std::string name, ColumnType type);

	void checkRow(std::size_t row) const;
	void requireType(ColumnType expected) const;

	std::string name_;
	ColumnType type_;
	std::vector<std::optional<double>> numeric_;
	std::vector<std::optional<std::string>> text_;
	std::vector<std::optional<TimePoint>> timestamps_;
};

/**
 * @class Table
 * @brief In-memory columnar table handed over by the ingestion layer.
 */
class Table {
public:
	Table() = default;

	/**
	 * @brief Appends a column.
	 * @throws std::invalid_argument on a duplicate name or a row count mismatch.
	 */
	Table &addColumn(Column column);

	bool hasColumn(const std::string &name) const;

	/// @throws std::out_of_range when no column has that name.
	const Column &column(const std::string &name) const;

	std::vector<std::string> columnNames() const;

	std::size_t rowCount() const {
		return columns_.empty() ? 0 : columns_.front().size();
	}

	bool empty() const {
		return rowCount() == 0;
	}

private:
	std::vector<Column> columns_;
};

} // namespace quantforecast::data
