#pragma once

#include "agri-yield/core/feature_frame.hpp"
#include "agri-yield/models/iregressor.hpp"
#include "agri-yield/models/model_readers.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agriyield::models {

/**
 * @struct ColumnNameRewrite
 * @brief Character substitution applied to column names that start with one
 *        of the given prefixes, e.g. "province_name_An Giang" ->
 *        "province_name_An_Giang".
 */
struct ColumnNameRewrite {
	std::vector<std::string> prefixes;
	char from = ' ';
	char to = '_';

	std::string apply(const std::string &column) const;
};

/**
 * @struct ModelSpec
 * @brief Where and how to load one named model.
 *
 * Candidate file patterns ('*' and '?' wildcards) are grouped; the first
 * group with any match wins and within it the newest file is taken.
 */
struct ModelSpec {
	std::string name;
	ModelFormat format = ModelFormat::LightGBMText;
	std::vector<std::vector<std::string>> candidates;
	std::optional<ColumnNameRewrite> column_name_rewrite;
};

/**
 * @struct ModelEntry
 * @brief A loaded model with everything needed to score it uniformly.
 */
struct ModelEntry {
	std::string name;
	std::shared_ptr<const IRegressor> model;
	/// Declared input order; unset means every column in frame order
	std::optional<std::vector<std::string>> expected_columns;
	std::optional<ColumnNameRewrite> column_name_rewrite;
	std::string source;
};

/// Matches a file name against a pattern with '*' and '?' wildcards.
bool matchesPattern(const std::string &name, const std::string &pattern);

/**
 * @brief Picks the model file for @p spec inside @p directory.
 * @return The chosen path, or nullopt when no candidate matches.
 */
std::optional<std::string> selectModelFile(const std::string &directory, const ModelSpec &spec);

/**
 * @brief Reads "<model file>.columns.json" when present: either a JSON array
 *        of names or an object with a "feature_names" array.
 * @throws std::invalid_argument if the sidecar exists but is malformed.
 */
std::optional<std::vector<std::string>> readColumnsSidecar(const std::string &model_path);

/**
 * @class ModelBank
 * @brief A fixed set of named models scored against one feature row.
 *
 * Loading and scoring never fail as a whole: a model that cannot be loaded
 * or scored is logged and left out.
 */
class ModelBank {
public:
	ModelBank() = default;
	explicit ModelBank(std::vector<ModelEntry> entries);

	/**
	 * @brief Loads every model in @p specs that can be found in @p directory.
	 *
	 * Missing files and unreadable artifacts are logged as warnings.
	 */
	static ModelBank load(const std::string &directory, const std::vector<ModelSpec> &specs);

	/// @throws std::invalid_argument on a duplicate name or a null model
	void add(ModelEntry entry);

	std::size_t size() const noexcept {
		return entries_.size();
	}

	bool empty() const noexcept {
		return entries_.empty();
	}

	bool contains(const std::string &name) const;
	std::vector<std::string> names() const;
	const std::vector<ModelEntry> &entries() const noexcept {
		return entries_;
	}

	/**
	 * @brief Builds the input vector of one model from the first row of @p frame.
	 *
	 * Column names are rewritten first, then the expected columns present in
	 * the frame are taken in the model's declared order.
	 *
	 * @throws std::invalid_argument if a needed column is text or the result
	 *         does not have the model's width.
	 */
	static std::vector<double> alignRow(const ModelEntry &entry, const core::FeatureFrame &frame);

	/**
	 * @brief Scores the first row of @p frame with every model.
	 * @return Predictions of the models that scored to a finite value.
	 */
	std::map<std::string, double> score(const core::FeatureFrame &frame) const;

private:
	std::vector<ModelEntry> entries_;
};

} // namespace agriyield::models
