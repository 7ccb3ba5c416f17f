#include "depver/registry_loader.hpp"
#include "depver/errors.hpp"
#include "depver/log.hpp"
#include "depver/struct_table.hpp"

#include <fstream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

namespace depver {

namespace {

std::string ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) throw LoadError("Registry file not found: " + path);

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) throw LoadError("Failed to read registry file: " + path);
    return ss.str();
}

std::optional<std::string> ReadHash(const nlohmann::json& entry, std::size_t idx) {
    if (entry.contains("integrity") && entry.contains("sha256")) {
        Logger::warn("dependencies[{}] has both 'integrity' and 'sha256', using 'integrity'", idx);
    }
    for (const char* key : {"integrity", "sha256"}) {
        if (!entry.contains(key) || entry[key].is_null()) continue;
        if (!entry[key].is_string()) {
            throw LoadError("dependencies[" + std::to_string(idx) + "]." + key + " must be a string");
        }
        return entry[key].get<std::string>();
    }
    return std::nullopt;
}

std::string RequireString(const nlohmann::json& entry, const char* key, std::size_t idx) {
    if (!entry.contains(key) || !entry[key].is_string()) {
        throw LoadError("dependencies[" + std::to_string(idx) + "] is missing string field '" + key + "'");
    }
    return entry[key].get<std::string>();
}

} // namespace

Registry RegistryLoader::load_from_json(const std::string& json_path) {
    Logger::verbose("Loading registry: {}", json_path);
    auto registry = parse_json(ReadFile(json_path));
    Logger::info("Loaded {} dependency records from {}", registry.size(), json_path);
    return registry;
}

Registry RegistryLoader::parse_json(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw LoadError(std::string("Malformed registry JSON: ") + e.what());
    }

    if (!j.is_object() || !j.contains("dependencies") || !j["dependencies"].is_array()) {
        throw LoadError("Registry JSON must contain a 'dependencies' array");
    }

    RegistryBuilder builder;
    const auto& deps = j["dependencies"];
    for (std::size_t i = 0; i < deps.size(); ++i) {
        const auto& entry = deps[i];
        if (!entry.is_object()) {
            throw LoadError("dependencies[" + std::to_string(i) + "] must be an object");
        }
        builder.add(RequireString(entry, "name", i),
                    RequireString(entry, "version", i),
                    ReadHash(entry, i));
    }

    Logger::verbose("Registry loaded: {} records", builder.size());
    return builder.build();
}

Registry RegistryLoader::load_from_struct_table(const std::string& path) {
    Logger::verbose("Loading struct table: {}", path);

    RegistryBuilder builder;
    for (auto& rec : parse_struct_table(ReadFile(path))) {
        builder.add(std::move(rec));
    }
    return builder.build();
}

} // namespace depver
