#pragma once

#include "agri-yield/transform/transformer.hpp"
#include <optional>
#include <vector>

namespace agriyield::transform {

/**
 * @brief log1p of the value clipped at zero; inverse is expm1.
 *
 * Used for the skewed yield and area columns so that zero and negative raw
 * values still map to a defined output.
 */
class Log1p final : public Transformer {
public:
	Log1p() = default;

	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	static double forward(double value);
	static double inverse(double value);
};

class ConstantImputer final : public Transformer {
public:
	ConstantImputer() = default;
	explicit ConstantImputer(double fill_value);

	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	[[nodiscard]] std::optional<double> fillValue() const noexcept { return fill_value_; }

private:
	std::optional<double> fill_value_;
};

class MinMaxScaler final : public Transformer {
public:
	MinMaxScaler();

	MinMaxScaler &withScaledRange(double min, double max);
	MinMaxScaler &withDataRange(double min, double max);

	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

private:
	void ensureParams() const;
	void computeScale(double input_min, double input_max);

	double output_min_;
	double output_max_;
	bool has_params_;
	double input_min_;
	double input_max_;
	double scale_factor_;
	double offset_;
};

struct StandardScaleParams {
	double mean = 0.0;
	double scale = 1.0;

	/// Mean and population standard deviation of the non-missing values.
	static StandardScaleParams fromData(const std::vector<double> &data);
};

class StandardScaler final : public Transformer {
public:
	StandardScaler();

	StandardScaler &withParameters(StandardScaleParams params);

	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

private:
	void ensureParams() const;
	double effectiveScale() const;

	std::optional<StandardScaleParams> params_;
};

} // namespace agriyield::transform
