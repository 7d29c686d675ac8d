#pragma once

#include "atsa/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <string>
#include <type_traits>
#include <vector>

namespace atsa::models {

namespace detail {

template <typename T>
struct IsIntegerVector : std::false_type {};

template <typename U, typename A>
struct IsIntegerVector<std::vector<U, A>> : std::bool_constant<std::is_integral_v<U> && !std::is_same_v<U, bool>> {};

/// Integer targets only accept JSON integers, so 12.5 is rejected rather than truncated.
template <typename T>
bool hasIntegerShape(const nlohmann::json &value) {
	if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
		return value.is_number_integer();
	} else if constexpr (IsIntegerVector<T>::value) {
		if (!value.is_array()) {
			return false;
		}
		for (const auto &entry : value) {
			if (!entry.is_number_integer()) {
				return false;
			}
		}
		return true;
	} else {
		return true;
	}
}

} // namespace detail

/**
 * @brief Reads an optional model parameter.
 *
 * The first key of @p keys present and non-null wins, so aliases can be
 * listed after the canonical name.
 * @throws core::InvalidParameterError When the value has the wrong type, including
 *         a fractional number where an integer is expected.
 */
template <typename T>
T getParam(const nlohmann::json &params, std::initializer_list<const char *> keys, const T &default_value) {
	if (!params.is_object()) {
		return default_value;
	}
	for (const char *key : keys) {
		auto it = params.find(key);
		if (it == params.end() || it->is_null()) {
			continue;
		}
		if (!detail::hasIntegerShape<T>(*it)) {
			throw core::InvalidParameterError(std::string("Parameter '") + key + "' must be an integer, got " +
			                                  it->dump());
		}
		try {
			return it->get<T>();
		} catch (const nlohmann::json::exception &) {
			throw core::InvalidParameterError(std::string("Parameter '") + key + "' has an invalid type: " +
			                                  it->dump());
		}
	}
	return default_value;
}

template <typename T>
T getParam(const nlohmann::json &params, const char *key, const T &default_value) {
	return getParam<T>(params, {key}, default_value);
}

} // namespace atsa::models
