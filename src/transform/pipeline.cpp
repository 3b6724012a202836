#include "agri-yield/transform/transformer.hpp"
#include <stdexcept>

namespace agriyield::transform {

Pipeline::Pipeline(std::vector<std::unique_ptr<Transformer>> transformers)
    : transformers_(std::move(transformers)), is_fitted_(false) {
}

Pipeline Pipeline::prefitted(std::vector<std::unique_ptr<Transformer>> transformers) {
    Pipeline pipeline(std::move(transformers));
    pipeline.is_fitted_ = true;
    return pipeline;
}

void Pipeline::addTransformer(std::unique_ptr<Transformer> transformer) {
    if (is_fitted_) {
        throw std::runtime_error("Cannot add transformers after pipeline is fitted");
    }
    transformers_.push_back(std::move(transformer));
}

void Pipeline::ensureFitted() const {
    if (!is_fitted_) {
        throw std::runtime_error("Pipeline must be fitted before transform operations");
    }
}

void Pipeline::fit(const std::vector<double> &data) {
    // Each step is fitted on the output of the previous one.
    std::vector<double> scratch = data;
    for (auto &transformer : transformers_) {
        transformer->fitTransform(scratch);
    }
    is_fitted_ = true;
}

void Pipeline::fitTransform(std::vector<double> &data) {
    for (auto &transformer : transformers_) {
        transformer->fitTransform(data);
    }
    is_fitted_ = true;
}

void Pipeline::transform(std::vector<double> &data) const {
    ensureFitted();
    for (const auto &transformer : transformers_) {
        transformer->transform(data);
    }
}

void Pipeline::inverseTransform(std::vector<double> &data) const {
    ensureFitted();
    for (auto it = transformers_.rbegin(); it != transformers_.rend(); ++it) {
        (*it)->inverseTransform(data);
    }
}

} // namespace agriyield::transform
