#include "metadata.hpp"
#include "util.hpp"
#include <cstdlib>

namespace engram {

nlohmann::json metadata_value_to_json(const MetadataValue& value) {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

std::optional<MetadataValue> metadata_value_from_json(const nlohmann::json& j) {
    if (j.is_string()) return MetadataValue{j.get<std::string>()};
    if (j.is_boolean()) return MetadataValue{j.get<bool>()};
    if (j.is_number()) return MetadataValue{j.get<double>()};
    if (j.is_array()) {
        std::vector<std::string> items;
        for (const auto& item : j) {
            if (item.is_string()) items.push_back(item.get<std::string>());
        }
        return MetadataValue{std::move(items)};
    }
    return std::nullopt;
}

nlohmann::json metadata_to_json(const Metadata& md) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : md) {
        j[key] = metadata_value_to_json(value);
    }
    return j;
}

Metadata metadata_from_json(const nlohmann::json& j) {
    Metadata md;
    if (!j.is_object()) return md;
    for (const auto& [key, value] : j.items()) {
        if (auto v = metadata_value_from_json(value)) {
            md.emplace(key, std::move(*v));
        }
    }
    return md;
}

std::optional<std::string> metadata_string(const Metadata& md, const std::string& key) {
    auto it = md.find(key);
    if (it == md.end()) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    return std::nullopt;
}

std::vector<std::string> metadata_list(const Metadata& md, const std::string& key) {
    auto it = md.find(key);
    if (it == md.end()) return {};
    if (const auto* l = std::get_if<std::vector<std::string>>(&it->second)) return *l;
    return {};
}

std::optional<std::pair<std::string, MetadataValue>> parse_metadata_arg(const std::string& arg) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) return std::nullopt;

    std::string key = trim(arg.substr(0, eq));
    std::string raw = trim(arg.substr(eq + 1));
    if (key.empty()) return std::nullopt;

    if (raw == "true")  return std::make_pair(key, MetadataValue{true});
    if (raw == "false") return std::make_pair(key, MetadataValue{false});

    if (!raw.empty()) {
        char* end = nullptr;
        double num = std::strtod(raw.c_str(), &end);
        if (end && *end == '\0') return std::make_pair(key, MetadataValue{num});
    }
    return std::make_pair(key, MetadataValue{raw});
}

} // namespace engram
