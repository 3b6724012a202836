#pragma once

#include "agri-yield/core/feature_frame.hpp"
#include "agri-yield/transform/transformer.hpp"

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace agriyield::transform {

/**
 * @class IFeatureTransform
 * @brief A pre-fitted scale/encode transform over whole feature rows.
 *
 * Implementations map a frame with the training-time column schema to a
 * numeric matrix with one row per input row and one column per output name.
 */
class IFeatureTransform {
public:
	virtual ~IFeatureTransform() = default;

	/**
	 * @brief Scales and encodes @p frame.
	 * @throws std::invalid_argument if a column the transform needs is absent
	 *         or has the wrong type.
	 */
	virtual Eigen::MatrixXd transform(const core::FeatureFrame &frame) const = 0;

	/// Output column names, in matrix column order.
	virtual std::vector<std::string> featureNamesOut() const = 0;
};

enum class UnknownCategory {
	Ignore,
	Error
};

enum class Remainder {
	Drop,
	Passthrough
};

struct OneHotEncoding {
	/// Known categories per input column of the branch
	std::vector<std::vector<std::string>> categories;
	UnknownCategory handle_unknown = UnknownCategory::Ignore;
};

/**
 * @struct ColumnBranch
 * @brief One named branch of a ColumnTransformer.
 *
 * A branch is either numeric (one prefitted Pipeline per column) or
 * categorical (optional constant fill per column followed by one-hot
 * encoding).
 */
struct ColumnBranch {
	std::string name;
	std::vector<std::string> columns;

	std::vector<Pipeline> numeric_steps;

	std::vector<std::string> text_fill;
	std::optional<OneHotEncoding> one_hot;

	bool isCategorical() const noexcept {
		return one_hot.has_value();
	}
};

/**
 * @class ColumnTransformer
 * @brief Fitted column-wise transform in the layout of scikit-learn's
 *        ColumnTransformer, read from a JSON artifact.
 *
 * Artifact layout:
 * @code
 * {
 *   "format": "column_transformer",
 *   "verbose_feature_names_out": true,
 *   "remainder": "drop" | "passthrough",
 *   "remainder_columns": ["..."],
 *   "transformers": [
 *     {"name": "num", "columns": ["..."], "steps": [
 *       {"type": "simple_imputer", "statistics": [...]},
 *       {"type": "standard_scaler", "mean": [...], "scale": [...]},
 *       {"type": "min_max_scaler", "data_min": [...], "data_max": [...], "feature_range": [0, 1]}]},
 *     {"name": "cat", "columns": ["..."], "steps": [
 *       {"type": "simple_imputer", "statistics": ["..."]},
 *       {"type": "one_hot_encoder", "categories": [["..."]], "handle_unknown": "ignore"}]}
 *   ]
 * }
 * @endcode
 */
class ColumnTransformer final : public IFeatureTransform {
public:
	ColumnTransformer(std::vector<ColumnBranch> branches, Remainder remainder,
	                  std::vector<std::string> remainder_columns, bool verbose_feature_names_out);

	/// @throws std::invalid_argument on a malformed artifact
	static ColumnTransformer fromJson(const std::string &text);

	/// @throws std::runtime_error if the file cannot be read
	static ColumnTransformer load(const std::string &path);

	Eigen::MatrixXd transform(const core::FeatureFrame &frame) const override;
	std::vector<std::string> featureNamesOut() const override;

	std::size_t branchCount() const noexcept {
		return branches_.size();
	}

private:
	std::string outputName(const std::string &branch, const std::string &feature) const;

	std::vector<ColumnBranch> branches_;
	Remainder remainder_;
	std::vector<std::string> remainder_columns_;
	bool verbose_feature_names_out_;
};

} // namespace agriyield::transform
