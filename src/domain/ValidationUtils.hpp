/**
 * @file ValidationUtils.hpp
 * @brief Fail-fast argument checks used by builders.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include "DoclingErrors.hpp"

namespace docling::domain {

class ValidationUtils {
public:
    /** @brief True when the string is empty or holds only whitespace. */
    static bool IsBlank(const std::string& value) {
        return std::all_of(value.begin(), value.end(),
                           [](unsigned char c) { return std::isspace(c) != 0; });
    }

    /**
     * @brief Returns @p value unchanged, or throws if it is blank.
     * @param name Field name used in the error message.
     */
    static const std::string& EnsureNotBlank(const std::string& value, const std::string& name) {
        if (IsBlank(value)) {
            throw ConfigurationError(name + " cannot be null or blank");
        }
        return value;
    }

    template <typename T>
    static const std::shared_ptr<T>& EnsureNotNull(const std::shared_ptr<T>& value, const std::string& name) {
        if (!value) {
            throw ConfigurationError(name + " cannot be null");
        }
        return value;
    }
};

} // namespace docling::domain
