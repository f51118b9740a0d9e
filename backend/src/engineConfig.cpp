#include "engineConfig.hpp"
#include "errors.hpp"
#include "persistenceStore.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace {

const json* member(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return nullptr;
    return &*it;
}

bool readBool(const json& object, const char* key, const std::string& name, bool current) {
    const json* value = member(object, key);
    if (!value) return current;
    if (!value->is_boolean()) throw ConfigError("config key '" + name + "' must be true or false");
    return value->get<bool>();
}

std::string readString(const json& object, const char* key, const std::string& name, const std::string& current) {
    const json* value = member(object, key);
    if (!value) return current;
    if (!value->is_string()) throw ConfigError("config key '" + name + "' must be a string");
    return value->get<std::string>();
}

long long readInteger(const json& object, const char* key, const std::string& name,
                      long long current, long long min, long long max) {
    const json* value = member(object, key);
    if (!value) return current;
    if (!value->is_number_integer()) throw ConfigError("config key '" + name + "' must be an integer");
    long long number = value->get<long long>();
    if (number < min || number > max) {
        throw ConfigError("config key '" + name + "' must be between " + std::to_string(min) +
                          " and " + std::to_string(max));
    }
    return number;
}

const json* readSection(const json& document, const char* key) {
    const json* section = member(document, key);
    if (section && !section->is_object()) {
        throw ConfigError(std::string("config key '") + key + "' must be an object");
    }
    return section;
}

}

std::string EngineConfig::dataDir() const {
    if (data_dir.empty()) return PersistenceStore::defaultDataDir();
    if (data_dir[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home && *home) return std::string(home) + data_dir.substr(1);
    }
    return data_dir;
}

std::string EngineConfig::statePath() const {
    return (std::filesystem::path(dataDir()) / "known_devices.json").string();
}

void EngineConfig::parse(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    std::string level = readString(document, "log_level", "log_level", "");
    if (!level.empty() && !Log::parseLevel(level, log_level)) {
        throw ConfigError("config key 'log_level' has unknown level '" + level + "'");
    }
    data_dir = readString(document, "data_dir", "data_dir", data_dir);
    oui_database = readString(document, "oui_database", "oui_database", oui_database);
    autosave = readBool(document, "autosave", "autosave", autosave);

    if (const json* section = readSection(document, "scan")) {
        scan.concurrency = static_cast<size_t>(
            readInteger(*section, "concurrency", "scan.concurrency", scan.concurrency, 1, 1024));
        probe.ping_timeout_ms = static_cast<int>(
            readInteger(*section, "ping_timeout_ms", "scan.ping_timeout_ms", probe.ping_timeout_ms, 1, 60000));
        probe.port_timeout_ms = static_cast<int>(
            readInteger(*section, "port_timeout_ms", "scan.port_timeout_ms", probe.port_timeout_ms, 1, 60000));
        arp_wait_ms = static_cast<int>(
            readInteger(*section, "arp_wait_ms", "scan.arp_wait_ms", arp_wait_ms, 0, 60000));
        scan.resolve_hostnames = readBool(*section, "resolve_hostnames", "scan.resolve_hostnames",
                                          scan.resolve_hostnames);
        record_offline_hosts = readBool(*section, "record_offline_hosts", "scan.record_offline_hosts",
                                        record_offline_hosts);

        if (const json* ports = member(*section, "standby_ports")) {
            if (!ports->is_array()) throw ConfigError("config key 'scan.standby_ports' must be an array");
            std::vector<uint16_t> parsed;
            for (const auto& port : *ports) {
                if (!port.is_number_integer() || port.get<long long>() < 1 || port.get<long long>() > 65535) {
                    throw ConfigError("config key 'scan.standby_ports' must hold ports 1-65535");
                }
                parsed.push_back(static_cast<uint16_t>(port.get<long long>()));
            }
            probe.standby_ports = parsed;
        }
    }

    if (const json* section = readSection(document, "cast")) {
        cast.port = static_cast<uint16_t>(readInteger(*section, "port", "cast.port", cast.port, 1, 65535));
        cast.concurrency = static_cast<size_t>(
            readInteger(*section, "concurrency", "cast.concurrency", cast.concurrency, 1, 1024));
        cast.directed_broadcast = readBool(*section, "directed_broadcast", "cast.directed_broadcast",
                                           cast.directed_broadcast);
    }
}

void EngineConfig::parseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot read configuration file " + path);
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::exception& e) {
        throw ConfigError("configuration file " + path + " is not valid JSON: " + e.what());
    }
    parse(document);
    LOG_DEBUG("Loaded configuration from ", path);
}
