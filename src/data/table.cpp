#include "quant-forecast/data/table.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace quantforecast::data {

std::string toString(ColumnType type) {
	switch (type) {
	case ColumnType::Numeric:
		return "numeric";
	case ColumnType::Text:
		return "text";
	case ColumnType::Timestamp:
		return "timestamp";
	}
	throw std::invalid_argument("Unknown column type.");
}

// --- Column ---

Column::Column(std::string name, ColumnType type) : name_(std::move(name)), type_(type) {
	if (name_.empty()) {
		throw std::invalid_argument("Column name must not be empty.");
	}
}

Column Column::numeric(std::string name, std::vector<std::optional<double>> values) {
	Column column(std::move(name), ColumnType::Numeric);
	column.numeric_ = std::move(values);
	return column;
}

Column Column::numeric(std::string name, const std::vector<double> &values) {
	std::vector<std::optional<double>> cells;
	cells.reserve(values.size());
	for (double v : values) {
		if (std::isnan(v)) {
			cells.emplace_back(std::nullopt);
		} else {
			cells.emplace_back(v);
		}
	}
	return numeric(std::move(name), std::move(cells));
}

Column Column::text(std::string name, std::vector<std::optional<std::string>> values) {
	Column column(std::move(name), ColumnType::Text);
	column.text_ = std::move(values);
	return column;
}

Column Column::timestamps(std::string name, std::vector<std::optional<TimePoint>> values) {
	Column column(std::move(name), ColumnType::Timestamp);
	column.timestamps_ = std::move(values);
	return column;
}

std::size_t Column::size() const {
	switch (type_) {
	case ColumnType::Numeric:
		return numeric_.size();
	case ColumnType::Text:
		return text_.size();
	case ColumnType::Timestamp:
		return timestamps_.size();
	}
	return 0;
}

bool Column::isMissing(std::size_t row) const {
	checkRow(row);
	switch (type_) {
	case ColumnType::Numeric:
		return !numeric_[row].has_value() || std::isnan(*numeric_[row]);
	case ColumnType::Text:
		return !text_[row].has_value();
	case ColumnType::Timestamp:
		return !timestamps_[row].has_value();
	}
	return true;
}

std::optional<double> Column::numericAt(std::size_t row) const {
	requireType(ColumnType::Numeric);
	checkRow(row);
	if (isMissing(row)) {
		return std::nullopt;
	}
	return numeric_[row];
}

const std::optional<std::string> &Column::textAt(std::size_t row) const {
	requireType(ColumnType::Text);
	checkRow(row);
	return text_[row];
}

const std::optional<Column::TimePoint> &Column::timestampAt(std::size_t row) const {
	requireType(ColumnType::Timestamp);
	checkRow(row);
	return timestamps_[row];
}

void Column::checkRow(std::size_t row) const {
	if (row >= size()) {
		throw std::out_of_range("Row " + std::to_string(row) + " is outside column '" + name_ + "'.");
	}
}

void Column::requireType(ColumnType expected) const {
	if (type_ != expected) {
		throw std::logic_error("Column '" + name_ + "' is " + toString(type_) + ", not " + toString(expected) + ".");
	}
}

// --- Table ---

Table &Table::addColumn(Column column) {
	if (hasColumn(column.name())) {
		throw std::invalid_argument("Duplicate column '" + column.name() + "'.");
	}
	if (!columns_.empty() && column.size() != rowCount()) {
		throw std::invalid_argument("Column '" + column.name() + "' has " + std::to_string(column.size()) +
		                            " rows, expected " + std::to_string(rowCount()) + ".");
	}
	columns_.push_back(std::move(column));
	return *this;
}

bool Table::hasColumn(const std::string &name) const {
	for (const auto &column : columns_) {
		if (column.name() == name) {
			return true;
		}
	}
	return false;
}

const Column &Table::column(const std::string &name) const {
	for (const auto &column : columns_) {
		if (column.name() == name) {
			return column;
		}
	}
	throw std::out_of_range("No column named '" + name + "'.");
}

std::vector<std::string> Table::columnNames() const {
	std::vector<std::string> names;
	names.reserve(columns_.size());
	for (const auto &column : columns_) {
		names.push_back(column.name());
	}
	return names;
}

} // namespace quantforecast::data
