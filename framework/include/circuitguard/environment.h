#pragma once

#include <charconv>
#include <chrono>
#include <string>
#include <optional>
#include <cstdlib>
#include <stdexcept>
#include <type_traits>

namespace circuitguard {

    /**
     * @brief Loads KEY=VALUE pairs from a dotenv file into the process environment.
     * Accepts "export KEY=VALUE", quoted values and trailing # comments on
     * unquoted values. With overwrite=false, variables already set win.
     * @return false if the file could not be opened.
     */
    bool load_env(const std::string& path = ".env", bool overwrite = true);

    // Whole-string base-10 parse; "3x", "" and out-of-range values are rejected.
    template <typename N>
    N parse_number(const std::string& key, const std::string& s_val) {
        N value{};
        const char* begin = s_val.data();
        const char* end = begin + s_val.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr != end) {
            throw std::invalid_argument("Invalid numeric value for " + key + ": '" + s_val + "'");
        }
        return value;
    }

    /**
     * @brief Typed environment lookup.
     * std::chrono::milliseconds reads a plain integer count of milliseconds.
     * @throws std::runtime_error if key is unset and no default is given,
     *         std::invalid_argument if the value does not parse as T.
     */
    template <typename T = std::string>
    T env(const std::string& key, std::optional<T> default_value = std::nullopt) {
        const char* val = std::getenv(key.c_str());

        if (val == nullptr) {
            if (default_value.has_value()) {
                return default_value.value();
            }
            throw std::runtime_error("Missing environment variable: " + key);
        }

        std::string s_val = val;

        if constexpr (std::is_same_v<T, std::string>) {
            return s_val;
        }
        else if constexpr (std::is_same_v<T, int>) {
            return parse_number<int>(key, s_val);
        }
        else if constexpr (std::is_same_v<T, double>) {
            size_t pos = 0;
            double value = 0.0;
            try {
                value = std::stod(s_val, &pos);
            } catch (const std::out_of_range&) {
                pos = 0;
            }
            if (pos == 0 || pos != s_val.size()) {
                throw std::invalid_argument("Invalid numeric value for " + key + ": '" + s_val + "'");
            }
            return value;
        }
        else if constexpr (std::is_same_v<T, bool>) {
            return (s_val == "true" || s_val == "1" || s_val == "yes" || s_val == "on");
        }
        else if constexpr (std::is_same_v<T, std::chrono::milliseconds>) {
            return std::chrono::milliseconds(parse_number<std::chrono::milliseconds::rep>(key, s_val));
        }
        else {
            static_assert(sizeof(T) == 0, "Unsupported type for circuitguard::env");
        }
    }
}
