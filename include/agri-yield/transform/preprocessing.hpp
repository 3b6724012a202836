#pragma once

#include "agri-yield/core/feature_frame.hpp"
#include "agri-yield/transform/feature_transform.hpp"

namespace agriyield::transform {

/**
 * @brief Applies a fitted feature transform to the engineered rows and labels
 *        the result with the transform's output names.
 *
 * Without a transform (@p transform is null) the engineered frame is
 * returned unscaled.
 *
 * @throws std::runtime_error if the transform's output width does not match
 *         its declared names.
 */
core::FeatureFrame applyPreprocessor(const IFeatureTransform *transform, const core::FeatureFrame &engineered);

} // namespace agriyield::transform
