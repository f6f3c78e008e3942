/**
 * @file JsonObject.hpp
 * @brief Opaque JSON mapping carried inside value objects.
 */

#pragma once
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace docling::domain {

/// String keys to arbitrary JSON values. Copied by value, never aliased.
using JsonObject = std::map<std::string, nlohmann::json>;

} // namespace docling::domain
