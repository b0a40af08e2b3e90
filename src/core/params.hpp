/**
 * @file params.hpp
 * @brief Typed parameter map used for action inputs/outputs and policy specs.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cluster_pilot {

using StringList = std::vector<std::string>;
using ParamValue = std::variant<bool, int64_t, double, std::string, StringList>;

/**
 * @brief Ordered key → value map with typed accessors.
 *
 * Accessors are strict: a key holding a value of a different type reads as
 * absent, except that integers are readable as doubles.
 */
class Params {
public:
    Params() = default;
    Params(std::initializer_list<std::pair<const std::string, ParamValue>> init)
        : values_(init) {}

    void set(std::string key, ParamValue value);
    bool erase(const std::string& key);
    [[nodiscard]] bool contains(const std::string& key) const;

    [[nodiscard]] std::optional<bool> get_bool(const std::string& key) const;
    [[nodiscard]] std::optional<int64_t> get_int(const std::string& key) const;
    [[nodiscard]] std::optional<double> get_double(const std::string& key) const;
    [[nodiscard]] std::optional<std::string> get_string(const std::string& key) const;
    [[nodiscard]] std::optional<StringList> get_list(const std::string& key) const;

    /// Append to a list value, creating it if absent.
    void append(const std::string& key, std::string item);

    [[nodiscard]] const ParamValue* find(const std::string& key) const;
    [[nodiscard]] size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    [[nodiscard]] auto begin() const { return values_.begin(); }
    [[nodiscard]] auto end() const { return values_.end(); }

    /// Keys whose value differs between two maps (added, removed or changed).
    [[nodiscard]] static std::vector<std::string> diff_keys(const Params& before,
                                                            const Params& after);

    /// Render as a compact JSON object.
    [[nodiscard]] std::string to_json() const;

    bool operator==(const Params&) const = default;

private:
    std::map<std::string, ParamValue> values_;
};

[[nodiscard]] std::string to_string(const ParamValue& value);

/// Escape a string for embedding in a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

}  // namespace cluster_pilot
