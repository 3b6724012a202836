#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace agriyield::core {

enum class ColumnType {
	Numeric,
	Text
};

inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

inline bool isMissing(double value) {
	return std::isnan(value);
}

inline bool isMissing(const std::string &value) {
	return value.empty();
}

/**
 * @class FeatureFrame
 * @brief A small column-oriented table of named numeric and text columns.
 *
 * Numeric cells use NaN for missing values and text cells use the empty
 * string. All columns always share the same number of rows; the first column
 * added to an empty frame fixes the row count.
 */
class FeatureFrame {
public:
	using NumericColumn = std::vector<double>;
	using TextColumn = std::vector<std::string>;
	using ColumnData = std::variant<NumericColumn, TextColumn>;

	FeatureFrame() = default;

	std::size_t rows() const noexcept {
		return rows_;
	}

	std::size_t columns() const noexcept {
		return names_.size();
	}

	bool empty() const noexcept {
		return rows_ == 0 || names_.empty();
	}

	const std::vector<std::string> &columnNames() const noexcept {
		return names_;
	}

	bool hasColumn(std::string_view name) const;
	std::optional<std::size_t> columnIndex(std::string_view name) const;
	ColumnType columnType(std::string_view name) const;
	bool isNumeric(std::string_view name) const;

	/**
	 * @brief Typed access to a column.
	 * @throws std::invalid_argument if the column is absent or has the other type.
	 */
	const NumericColumn &numeric(std::string_view name) const;
	NumericColumn &numeric(std::string_view name);
	const TextColumn &text(std::string_view name) const;

	/// Adds a column at the end, or replaces an existing column in place.
	void setNumeric(const std::string &name, NumericColumn values);
	void setText(const std::string &name, TextColumn values);

	bool dropColumn(std::string_view name);
	std::size_t dropColumnsIf(const std::function<bool(const std::string &)> &predicate);

	/**
	 * @brief Renames every column through @p mapper.
	 * @throws std::invalid_argument if two columns end up with the same name.
	 */
	void renameColumns(const std::function<std::string(const std::string &)> &mapper);

	std::vector<std::string> numericColumnNames() const;

	FeatureFrame selectRows(const std::vector<std::size_t> &indices) const;
	FeatureFrame selectColumns(const std::vector<std::string> &names) const;

	/**
	 * @brief Stacks @p other below this frame, matching columns by name.
	 *
	 * Columns only present in @p other are appended in its order. Cells that
	 * a side does not have are missing. A numeric column that is entirely
	 * missing on one side adopts the text type of the other side.
	 *
	 * @throws std::invalid_argument on a numeric/text conflict with real data.
	 */
	FeatureFrame concat(const FeatureFrame &other) const;

private:
	std::size_t requireIndex(std::string_view name) const;
	void checkLength(std::size_t length, const std::string &name) const;
	void rebuildIndex();

	std::size_t rows_ = 0;
	std::vector<std::string> names_;
	std::vector<ColumnData> data_;
	std::unordered_map<std::string, std::size_t> index_;
};

} // namespace agriyield::core
