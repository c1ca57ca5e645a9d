#pragma once

#include <scriptor/exceptions.h>
#include <string>
#include <optional>
#include <cstdlib>
#include <cstddef>
#include <type_traits>

namespace scriptor {

    bool load_env(const std::string& path = ".env");

    template <typename T = std::string>
    T env(const std::string& key, std::optional<T> default_value = std::nullopt) {
        const char* val = std::getenv(key.c_str());

        if (val == nullptr || *val == '\0') {
            if (default_value.has_value()) {
                return default_value.value();
            }
            throw ConfigurationError("Missing environment variable: " + key);
        }

        std::string s_val = val;

        try {
            if constexpr (std::is_same_v<T, std::string>) {
                return s_val;
            }
            else if constexpr (std::is_same_v<T, int>) {
                return std::stoi(s_val);
            }
            else if constexpr (std::is_same_v<T, std::size_t>) {
                return static_cast<std::size_t>(std::stoul(s_val));
            }
            else if constexpr (std::is_same_v<T, double>) {
                return std::stod(s_val);
            }
            else if constexpr (std::is_same_v<T, bool>) {
                return (s_val == "true" || s_val == "1" || s_val == "yes");
            }
            else {
                static_assert(sizeof(T) == 0, "Unsupported type for scriptor::env");
            }
        } catch (const std::logic_error&) {
            throw ConfigurationError("Invalid value for environment variable " + key + ": " + s_val);
        }
    }
}
