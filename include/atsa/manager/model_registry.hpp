#pragma once

#include "atsa/models/iforecaster.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace atsa::manager {

enum class ModelType { Arima, Sarima, HoltWinters, Prophet, MovingAverage, Lstm };

/// Registry key, e.g. "holt-winters".
std::string toString(ModelType type);

std::optional<ModelType> parseModelType(const std::string &name);

/**
 * @struct ModelDescriptor
 * @brief Catalog entry describing a registered model type.
 */
struct ModelDescriptor {
	ModelType type;
	std::string name;
	std::string description;
	std::vector<std::string> parameters;
	std::string suitable_for;
};

/**
 * @class ModelRegistry
 * @brief Closed set of model types that can be constructed from a parameter map.
 *
 * Prophet and the LSTM network are optional build features; a registry never
 * lists a type whose implementation was not compiled in, and requests for it
 * fail with core::UnknownModelError.
 */
class ModelRegistry {
public:
	/// Registers every type available in this build.
	ModelRegistry();

	/// Registers the given subset of the types available in this build.
	explicit ModelRegistry(const std::set<ModelType> &requested);

	/// Types whose implementation is compiled into the library.
	static std::set<ModelType> compiledCapabilities();

	bool contains(ModelType type) const;

	const std::set<ModelType> &types() const {
		return types_;
	}

	/// @throws core::UnknownModelError If @p name is not a registered type.
	ModelType resolve(const std::string &name) const;

	/**
	 * @brief Constructs an unfitted model.
	 * @throws core::UnknownModelError For an unregistered type.
	 * @throws core::InvalidParameterError For parameters of the wrong type or range.
	 */
	std::unique_ptr<models::IForecaster> create(const std::string &model_type, const nlohmann::json &parameters) const;

	std::vector<ModelDescriptor> catalog() const;

private:
	std::set<ModelType> types_;
};

} // namespace atsa::manager
