/**
 * @file params.cpp
 * @brief Params implementation and JSON rendering helpers.
 * @author Dimitris Kafetzis
 */

#include "core/params.hpp"

#include <iomanip>
#include <set>
#include <sstream>

namespace cluster_pilot {

void Params::set(std::string key, ParamValue value) {
    values_[std::move(key)] = std::move(value);
}

bool Params::erase(const std::string& key) {
    return values_.erase(key) > 0;
}

bool Params::contains(const std::string& key) const {
    return values_.count(key) > 0;
}

const ParamValue* Params::find(const std::string& key) const {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

std::optional<bool> Params::get_bool(const std::string& key) const {
    const auto* v = find(key);
    if (v == nullptr) return std::nullopt;
    if (const auto* b = std::get_if<bool>(v)) return *b;
    return std::nullopt;
}

std::optional<int64_t> Params::get_int(const std::string& key) const {
    const auto* v = find(key);
    if (v == nullptr) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(v)) return *i;
    return std::nullopt;
}

std::optional<double> Params::get_double(const std::string& key) const {
    const auto* v = find(key);
    if (v == nullptr) return std::nullopt;
    if (const auto* d = std::get_if<double>(v)) return *d;
    if (const auto* i = std::get_if<int64_t>(v)) return static_cast<double>(*i);
    return std::nullopt;
}

std::optional<std::string> Params::get_string(const std::string& key) const {
    const auto* v = find(key);
    if (v == nullptr) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(v)) return *s;
    return std::nullopt;
}

std::optional<StringList> Params::get_list(const std::string& key) const {
    const auto* v = find(key);
    if (v == nullptr) return std::nullopt;
    if (const auto* l = std::get_if<StringList>(v)) return *l;
    return std::nullopt;
}

void Params::append(const std::string& key, std::string item) {
    auto& slot = values_[key];
    auto* list = std::get_if<StringList>(&slot);
    if (list == nullptr) {
        slot = StringList{};
        list = std::get_if<StringList>(&slot);
    }
    list->push_back(std::move(item));
}

std::vector<std::string> Params::diff_keys(const Params& before, const Params& after) {
    std::set<std::string> keys;
    for (const auto& [k, v] : before.values_) {
        auto it = after.values_.find(k);
        if (it == after.values_.end() || it->second != v) keys.insert(k);
    }
    for (const auto& [k, v] : after.values_) {
        if (before.values_.count(k) == 0) keys.insert(k);
    }
    return {keys.begin(), keys.end()};
}

std::string json_escape(std::string_view text) {
    std::ostringstream oss;
    for (char c : text) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

namespace {

void write_json_value(std::ostringstream& oss, const ParamValue& value) {
    std::visit([&oss](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<V, int64_t> || std::is_same_v<V, double>) {
            oss << v;
        } else if constexpr (std::is_same_v<V, std::string>) {
            oss << '"' << json_escape(v) << '"';
        } else {
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                oss << '"' << json_escape(v[i]) << '"';
            }
            oss << ']';
        }
    }, value);
}

}  // namespace

std::string Params::to_json() const {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [k, v] : values_) {
        if (!first) oss << ',';
        first = false;
        oss << '"' << json_escape(k) << "\":";
        write_json_value(oss, v);
    }
    oss << '}';
    return oss.str();
}

std::string to_string(const ParamValue& value) {
    std::ostringstream oss;
    write_json_value(oss, value);
    return oss.str();
}

}  // namespace cluster_pilot
