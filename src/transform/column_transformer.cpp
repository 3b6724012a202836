#include "agri-yield/transform/feature_transform.hpp"
#include "agri-yield/transform/transformers.hpp"
#include "agri-yield/utils/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace agriyield::transform {

namespace {

std::vector<double> numberArray(const json &step, const char *key, std::size_t expected) {
	if (!step.contains(key) || !step.at(key).is_array()) {
		throw std::invalid_argument(std::string("ColumnTransformer: step is missing array '") + key + "'.");
	}
	std::vector<double> values;
	for (const auto &value : step.at(key)) {
		values.push_back(value.is_null() ? core::kMissing : value.get<double>());
	}
	if (values.size() != expected) {
		throw std::invalid_argument(std::string("ColumnTransformer: '") + key + "' does not match the column count.");
	}
	return values;
}

std::vector<std::unique_ptr<Transformer>> numericStep(const json &step, const std::string &type, std::size_t column,
                                                     std::size_t width) {
	std::vector<std::unique_ptr<Transformer>> steps;
	if (type == "simple_imputer") {
		steps.push_back(std::make_unique<ConstantImputer>(numberArray(step, "statistics", width)[column]));
	} else if (type == "standard_scaler") {
		StandardScaleParams params;
		if (step.contains("mean")) {
			params.mean = numberArray(step, "mean", width)[column];
		}
		if (step.contains("scale")) {
			params.scale = numberArray(step, "scale", width)[column];
		}
		auto scaler = std::make_unique<StandardScaler>();
		scaler->withParameters(params);
		steps.push_back(std::move(scaler));
	} else if (type == "min_max_scaler") {
		const auto data_min = numberArray(step, "data_min", width);
		const auto data_max = numberArray(step, "data_max", width);
		auto range = step.value("feature_range", std::vector<double>{0.0, 1.0});
		if (range.size() != 2) {
			throw std::invalid_argument("ColumnTransformer: feature_range must have two values.");
		}
		auto scaler = std::make_unique<MinMaxScaler>();
		scaler->withScaledRange(range[0], range[1]).withDataRange(data_min[column], data_max[column]);
		steps.push_back(std::move(scaler));
	} else {
		throw std::invalid_argument("ColumnTransformer: unsupported numeric step '" + type + "'.");
	}
	return steps;
}

ColumnBranch parseBranch(const json &spec) {
	ColumnBranch branch;
	branch.name = spec.at("name").get<std::string>();
	branch.columns = spec.at("columns").get<std::vector<std::string>>();
	const std::size_t width = branch.columns.size();
	const json steps = spec.value("steps", json::array());

	bool categorical = false;
	for (const auto &step : steps) {
		categorical = categorical || step.at("type").get<std::string>() == "one_hot_encoder";
	}

	if (categorical) {
		for (std::size_t i = 0; i < steps.size(); ++i) {
			const auto type = steps[i].at("type").get<std::string>();
			if (type == "one_hot_encoder") {
				if (i + 1 != steps.size()) {
					throw std::invalid_argument("ColumnTransformer: one_hot_encoder must be the last step of '" +
					                            branch.name + "'.");
				}
				OneHotEncoding encoding;
				for (const auto &categories : steps[i].at("categories")) {
					encoding.categories.push_back(categories.get<std::vector<std::string>>());
				}
				if (encoding.categories.size() != width) {
					throw std::invalid_argument("ColumnTransformer: categories do not match the column count.");
				}
				const auto unknown = steps[i].value("handle_unknown", std::string("error"));
				if (unknown == "ignore" || unknown == "infrequent_if_exist") {
					encoding.handle_unknown = UnknownCategory::Ignore;
				} else if (unknown == "error") {
					encoding.handle_unknown = UnknownCategory::Error;
				} else {
					throw std::invalid_argument("ColumnTransformer: unsupported handle_unknown '" + unknown + "'.");
				}
				branch.one_hot = std::move(encoding);
			} else if (type == "simple_imputer") {
				if (steps[i].contains("statistics")) {
					branch.text_fill = steps[i].at("statistics").get<std::vector<std::string>>();
				} else {
					branch.text_fill.assign(width, steps[i].at("fill_value").get<std::string>());
				}
				if (branch.text_fill.size() != width) {
					throw std::invalid_argument("ColumnTransformer: statistics do not match the column count.");
				}
			} else {
				throw std::invalid_argument("ColumnTransformer: unsupported categorical step '" + type + "'.");
			}
		}
		return branch;
	}

	for (std::size_t column = 0; column < width; ++column) {
		std::vector<std::unique_ptr<Transformer>> chain;
		for (const auto &step : steps) {
			for (auto &transformer : numericStep(step, step.at("type").get<std::string>(), column, width)) {
				chain.push_back(std::move(transformer));
			}
		}
		branch.numeric_steps.push_back(Pipeline::prefitted(std::move(chain)));
	}
	return branch;
}

const core::FeatureFrame::NumericColumn &numericInput(const core::FeatureFrame &frame, const std::string &column) {
	if (!frame.hasColumn(column)) {
		throw std::invalid_argument("ColumnTransformer: input is missing column '" + column + "'.");
	}
	if (!frame.isNumeric(column)) {
		throw std::invalid_argument("ColumnTransformer: column '" + column + "' is not numeric.");
	}
	return frame.numeric(column);
}

} // namespace

ColumnTransformer::ColumnTransformer(std::vector<ColumnBranch> branches, Remainder remainder,
                                     std::vector<std::string> remainder_columns, bool verbose_feature_names_out)
	: branches_(std::move(branches)), remainder_(remainder), remainder_columns_(std::move(remainder_columns)),
	  verbose_feature_names_out_(verbose_feature_names_out) {
	for (const auto &branch : branches_) {
		if (!branch.isCategorical() && branch.numeric_steps.size() != branch.columns.size()) {
			throw std::invalid_argument("ColumnTransformer: branch '" + branch.name +
			                            "' needs one step pipeline per column.");
		}
	}
}

ColumnTransformer ColumnTransformer::fromJson(const std::string &text) {
	json root;
	try {
		root = json::parse(text);
	} catch (const json::parse_error &e) {
		throw std::invalid_argument(std::string("ColumnTransformer: invalid JSON: ") + e.what());
	}

	try {
		const auto format = root.value("format", std::string("column_transformer"));
		if (format != "column_transformer") {
			throw std::invalid_argument("ColumnTransformer: unexpected artifact format '" + format + "'.");
		}

		std::vector<ColumnBranch> branches;
		for (const auto &spec : root.value("transformers", json::array())) {
			branches.push_back(parseBranch(spec));
		}

		const auto remainder_name = root.value("remainder", std::string("drop"));
		Remainder remainder;
		if (remainder_name == "drop") {
			remainder = Remainder::Drop;
		} else if (remainder_name == "passthrough") {
			remainder = Remainder::Passthrough;
		} else {
			throw std::invalid_argument("ColumnTransformer: unsupported remainder '" + remainder_name + "'.");
		}

		return ColumnTransformer(std::move(branches), remainder,
		                         root.value("remainder_columns", std::vector<std::string>{}),
		                         root.value("verbose_feature_names_out", true));
	} catch (const json::exception &e) {
		throw std::invalid_argument(std::string("ColumnTransformer: malformed artifact: ") + e.what());
	}
}

ColumnTransformer ColumnTransformer::load(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("Could not open preprocessor artifact: " + path);
	}
	std::ostringstream buffer;
	buffer << file.rdbuf();
	auto transformer = fromJson(buffer.str());
	AGRIYIELD_DEBUG("Loaded column transformer with {} branches from {}", transformer.branchCount(), path);
	return transformer;
}

std::string ColumnTransformer::outputName(const std::string &branch, const std::string &feature) const {
	return verbose_feature_names_out_ ? branch + "__" + feature : feature;
}

std::vector<std::string> ColumnTransformer::featureNamesOut() const {
	std::vector<std::string> names;
	for (const auto &branch : branches_) {
		if (!branch.isCategorical()) {
			for (const auto &column : branch.columns) {
				names.push_back(outputName(branch.name, column));
			}
			continue;
		}
		for (std::size_t i = 0; i < branch.columns.size(); ++i) {
			for (const auto &category : branch.one_hot->categories[i]) {
				names.push_back(outputName(branch.name, branch.columns[i] + "_" + category));
			}
		}
	}
	if (remainder_ == Remainder::Passthrough) {
		for (const auto &column : remainder_columns_) {
			names.push_back(outputName("remainder", column));
		}
	}
	return names;
}

Eigen::MatrixXd ColumnTransformer::transform(const core::FeatureFrame &frame) const {
	const auto rows = static_cast<Eigen::Index>(frame.rows());
	const auto width = static_cast<Eigen::Index>(featureNamesOut().size());
	Eigen::MatrixXd output = Eigen::MatrixXd::Zero(rows, width);

	Eigen::Index offset = 0;
	for (const auto &branch : branches_) {
		if (!branch.isCategorical()) {
			for (std::size_t i = 0; i < branch.columns.size(); ++i) {
				auto values = numericInput(frame, branch.columns[i]);
				branch.numeric_steps[i].transform(values);
				output.col(offset++) = Eigen::Map<const Eigen::VectorXd>(values.data(), rows);
			}
			continue;
		}

		for (std::size_t i = 0; i < branch.columns.size(); ++i) {
			const auto &column = branch.columns[i];
			if (!frame.hasColumn(column)) {
				throw std::invalid_argument("ColumnTransformer: input is missing column '" + column + "'.");
			}
			if (frame.isNumeric(column)) {
				throw std::invalid_argument("ColumnTransformer: categorical column '" + column + "' is numeric.");
			}
			const auto &cells = frame.text(column);
			const auto &categories = branch.one_hot->categories[i];
			for (Eigen::Index row = 0; row < rows; ++row) {
				std::string value = cells[static_cast<std::size_t>(row)];
				if (core::isMissing(value) && !branch.text_fill.empty()) {
					value = branch.text_fill[i];
				}
				auto it = std::find(categories.begin(), categories.end(), value);
				if (it != categories.end()) {
					output(row, offset + static_cast<Eigen::Index>(std::distance(categories.begin(), it))) = 1.0;
				} else if (branch.one_hot->handle_unknown == UnknownCategory::Error) {
					throw std::invalid_argument("ColumnTransformer: unknown category '" + value + "' in column '" +
					                            column + "'.");
				}
			}
			offset += static_cast<Eigen::Index>(categories.size());
		}
	}

	if (remainder_ == Remainder::Passthrough) {
		for (const auto &column : remainder_columns_) {
			const auto &values = numericInput(frame, column);
			output.col(offset++) = Eigen::Map<const Eigen::VectorXd>(values.data(), rows);
		}
	}
	return output;
}

} // namespace agriyield::transform
