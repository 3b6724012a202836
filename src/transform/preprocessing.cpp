#include "agri-yield/transform/preprocessing.hpp"

#include <stdexcept>
#include <unordered_set>

namespace agriyield::transform {

core::FeatureFrame applyPreprocessor(const IFeatureTransform *transform, const core::FeatureFrame &engineered) {
	if (!transform) {
		return engineered;
	}

	const Eigen::MatrixXd scaled = transform->transform(engineered);
	const auto names = transform->featureNamesOut();
	if (static_cast<std::size_t>(scaled.cols()) != names.size()) {
		throw std::runtime_error("Preprocessor produced " + std::to_string(scaled.cols()) + " columns but declares " +
		                         std::to_string(names.size()) + " names.");
	}

	core::FeatureFrame labeled;
	std::unordered_set<std::string> seen;
	for (std::size_t col = 0; col < names.size(); ++col) {
		if (!seen.insert(names[col]).second) {
			throw std::runtime_error("Preprocessor declares duplicate output column '" + names[col] + "'.");
		}
		const auto column = scaled.col(static_cast<Eigen::Index>(col));
		labeled.setNumeric(names[col], core::FeatureFrame::NumericColumn(column.data(), column.data() + column.size()));
	}
	return labeled;
}

} // namespace agriyield::transform
