#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace agriyield::models {

/**
 * @class IRegressor
 * @brief An interface for fitted regression models scored one row at a time.
 *
 * Models are loaded from artifacts and never refitted, so the interface is
 * read-only and implementations are safe to share between threads.
 */
class IRegressor {
public:
	virtual ~IRegressor() = default;

	/**
	 * @brief Scores one feature row.
	 * @param row Feature values in the model's training column order.
	 * @throws std::invalid_argument if the row width does not match numFeatures().
	 */
	virtual double predict(const std::vector<double> &row) const = 0;

	/// Training column names when the artifact records them.
	virtual std::optional<std::vector<std::string>> featureNames() const = 0;

	virtual std::size_t numFeatures() const = 0;

	/**
	 * @brief Gets the name of the model family.
	 * @return A string such as "LightGBM".
	 */
	virtual std::string getName() const = 0;
};

} // namespace agriyield::models
