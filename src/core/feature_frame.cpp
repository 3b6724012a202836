#include "agri-yield/core/feature_frame.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace agriyield::core {

namespace {

bool allMissing(const FeatureFrame::NumericColumn &values) {
	return std::all_of(values.begin(), values.end(), [](double v) { return isMissing(v); });
}

FeatureFrame::ColumnData missingColumn(ColumnType type, std::size_t rows) {
	if (type == ColumnType::Numeric) {
		return FeatureFrame::NumericColumn(rows, kMissing);
	}
	return FeatureFrame::TextColumn(rows);
}

ColumnType typeOf(const FeatureFrame::ColumnData &data) {
	return std::holds_alternative<FeatureFrame::NumericColumn>(data) ? ColumnType::Numeric : ColumnType::Text;
}

void appendColumn(FeatureFrame::ColumnData &target, const FeatureFrame::ColumnData &source) {
	if (auto *numeric = std::get_if<FeatureFrame::NumericColumn>(&target)) {
		const auto &tail = std::get<FeatureFrame::NumericColumn>(source);
		numeric->insert(numeric->end(), tail.begin(), tail.end());
	} else {
		auto &text = std::get<FeatureFrame::TextColumn>(target);
		const auto &tail = std::get<FeatureFrame::TextColumn>(source);
		text.insert(text.end(), tail.begin(), tail.end());
	}
}

// Brings both halves of a concatenated column to one type.
void reconcile(FeatureFrame::ColumnData &head, FeatureFrame::ColumnData &tail, const std::string &name) {
	if (typeOf(head) == typeOf(tail)) {
		return;
	}
	auto &numeric_side = typeOf(head) == ColumnType::Numeric ? head : tail;
	const auto &values = std::get<FeatureFrame::NumericColumn>(numeric_side);
	if (!allMissing(values)) {
		throw std::invalid_argument("Column '" + name + "' is numeric on one side and text on the other.");
	}
	numeric_side = FeatureFrame::TextColumn(values.size());
}

} // namespace

bool FeatureFrame::hasColumn(std::string_view name) const {
	return index_.find(std::string(name)) != index_.end();
}

std::optional<std::size_t> FeatureFrame::columnIndex(std::string_view name) const {
	auto it = index_.find(std::string(name));
	if (it == index_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::size_t FeatureFrame::requireIndex(std::string_view name) const {
	auto idx = columnIndex(name);
	if (!idx) {
		throw std::invalid_argument("Column '" + std::string(name) + "' not found.");
	}
	return *idx;
}

ColumnType FeatureFrame::columnType(std::string_view name) const {
	return typeOf(data_[requireIndex(name)]);
}

bool FeatureFrame::isNumeric(std::string_view name) const {
	auto idx = columnIndex(name);
	return idx && typeOf(data_[*idx]) == ColumnType::Numeric;
}

const FeatureFrame::NumericColumn &FeatureFrame::numeric(std::string_view name) const {
	const auto *column = std::get_if<NumericColumn>(&data_[requireIndex(name)]);
	if (!column) {
		throw std::invalid_argument("Column '" + std::string(name) + "' is not numeric.");
	}
	return *column;
}

FeatureFrame::NumericColumn &FeatureFrame::numeric(std::string_view name) {
	auto *column = std::get_if<NumericColumn>(&data_[requireIndex(name)]);
	if (!column) {
		throw std::invalid_argument("Column '" + std::string(name) + "' is not numeric.");
	}
	return *column;
}

const FeatureFrame::TextColumn &FeatureFrame::text(std::string_view name) const {
	const auto *column = std::get_if<TextColumn>(&data_[requireIndex(name)]);
	if (!column) {
		throw std::invalid_argument("Column '" + std::string(name) + "' is not a text column.");
	}
	return *column;
}

void FeatureFrame::checkLength(std::size_t length, const std::string &name) const {
	if (!names_.empty() && length != rows_) {
		throw std::invalid_argument("Column '" + name + "' has " + std::to_string(length) + " rows, expected " +
		                            std::to_string(rows_) + ".");
	}
}

void FeatureFrame::setNumeric(const std::string &name, NumericColumn values) {
	auto idx = columnIndex(name);
	if (idx) {
		if (names_.size() > 1) {
			checkLength(values.size(), name);
		}
		rows_ = values.size();
		data_[*idx] = std::move(values);
		return;
	}
	checkLength(values.size(), name);
	rows_ = values.size();
	index_.emplace(name, names_.size());
	names_.push_back(name);
	data_.emplace_back(std::move(values));
}

void FeatureFrame::setText(const std::string &name, TextColumn values) {
	auto idx = columnIndex(name);
	if (idx) {
		if (names_.size() > 1) {
			checkLength(values.size(), name);
		}
		rows_ = values.size();
		data_[*idx] = std::move(values);
		return;
	}
	checkLength(values.size(), name);
	rows_ = values.size();
	index_.emplace(name, names_.size());
	names_.push_back(name);
	data_.emplace_back(std::move(values));
}

void FeatureFrame::rebuildIndex() {
	index_.clear();
	for (std::size_t i = 0; i < names_.size(); ++i) {
		if (!index_.emplace(names_[i], i).second) {
			throw std::invalid_argument("Duplicate column name '" + names_[i] + "'.");
		}
	}
}

bool FeatureFrame::dropColumn(std::string_view name) {
	auto idx = columnIndex(name);
	if (!idx) {
		return false;
	}
	names_.erase(names_.begin() + static_cast<std::ptrdiff_t>(*idx));
	data_.erase(data_.begin() + static_cast<std::ptrdiff_t>(*idx));
	rebuildIndex();
	if (names_.empty()) {
		rows_ = 0;
	}
	return true;
}

std::size_t FeatureFrame::dropColumnsIf(const std::function<bool(const std::string &)> &predicate) {
	std::vector<std::string> kept_names;
	std::vector<ColumnData> kept_data;
	for (std::size_t i = 0; i < names_.size(); ++i) {
		if (!predicate(names_[i])) {
			kept_names.push_back(std::move(names_[i]));
			kept_data.push_back(std::move(data_[i]));
		}
	}
	const std::size_t dropped = names_.size() - kept_names.size();
	names_ = std::move(kept_names);
	data_ = std::move(kept_data);
	rebuildIndex();
	if (names_.empty()) {
		rows_ = 0;
	}
	return dropped;
}

void FeatureFrame::renameColumns(const std::function<std::string(const std::string &)> &mapper) {
	for (auto &name : names_) {
		name = mapper(name);
	}
	rebuildIndex();
}

std::vector<std::string> FeatureFrame::numericColumnNames() const {
	std::vector<std::string> result;
	for (std::size_t i = 0; i < names_.size(); ++i) {
		if (typeOf(data_[i]) == ColumnType::Numeric) {
			result.push_back(names_[i]);
		}
	}
	return result;
}

FeatureFrame FeatureFrame::selectRows(const std::vector<std::size_t> &indices) const {
	FeatureFrame result;
	for (std::size_t i = 0; i < names_.size(); ++i) {
		if (const auto *numeric_column = std::get_if<NumericColumn>(&data_[i])) {
			NumericColumn values;
			values.reserve(indices.size());
			for (auto row : indices) {
				values.push_back(numeric_column->at(row));
			}
			result.setNumeric(names_[i], std::move(values));
		} else {
			const auto &text_column = std::get<TextColumn>(data_[i]);
			TextColumn values;
			values.reserve(indices.size());
			for (auto row : indices) {
				values.push_back(text_column.at(row));
			}
			result.setText(names_[i], std::move(values));
		}
	}
	return result;
}

FeatureFrame FeatureFrame::selectColumns(const std::vector<std::string> &names) const {
	FeatureFrame result;
	for (const auto &name : names) {
		const auto &data = data_[requireIndex(name)];
		if (const auto *numeric_column = std::get_if<NumericColumn>(&data)) {
			result.setNumeric(name, *numeric_column);
		} else {
			result.setText(name, std::get<TextColumn>(data));
		}
	}
	return result;
}

FeatureFrame FeatureFrame::concat(const FeatureFrame &other) const {
	std::vector<std::string> order = names_;
	std::unordered_set<std::string> seen(names_.begin(), names_.end());
	for (const auto &name : other.names_) {
		if (seen.insert(name).second) {
			order.push_back(name);
		}
	}

	FeatureFrame result;
	for (const auto &name : order) {
		auto left_idx = columnIndex(name);
		auto right_idx = other.columnIndex(name);
		const ColumnType type = left_idx ? typeOf(data_[*left_idx]) : typeOf(other.data_[*right_idx]);

		ColumnData head = left_idx ? data_[*left_idx] : missingColumn(type, rows_);
		ColumnData tail = right_idx ? other.data_[*right_idx] : missingColumn(type, other.rows_);
		reconcile(head, tail, name);
		appendColumn(head, tail);

		if (auto *numeric_column = std::get_if<NumericColumn>(&head)) {
			result.setNumeric(name, std::move(*numeric_column));
		} else {
			result.setText(name, std::move(std::get<TextColumn>(head)));
		}
	}
	return result;
}

} // namespace agriyield::core
