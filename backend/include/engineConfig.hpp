#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "castDispatcher.hpp"
#include "livenessProber.hpp"
#include "logging.hpp"
#include "networkDiscovery.hpp"

/**
 * Runtime configuration of one engine instance
 *
 * Every value has a default; a JSON file only needs the keys it changes:
 *   {"log_level": "info", "data_dir": "~/.wol_caster", "oui_database": "",
 *    "autosave": true,
 *    "scan": {"concurrency": 50, "ping_timeout_ms": 500, "port_timeout_ms": 200,
 *             "standby_ports": [80, 443, 22, 23, 3389, 5900], "arp_wait_ms": 1000,
 *             "resolve_hostnames": true, "record_offline_hosts": false},
 *    "cast": {"port": 9, "concurrency": 32, "directed_broadcast": false}}
 * Unknown keys are ignored.
 */
class EngineConfig {
public:
    Log::Level log_level = Log::Level::Info;
    std::string data_dir;               // Empty means PersistenceStore::defaultDataDir()
    std::string oui_database;           // Optional vendor file merged over the builtin table
    bool autosave = true;               // Save state after every scan and import

    ProbeSettings probe;
    ScanOptions scan;
    int arp_wait_ms = 1000;
    bool record_offline_hosts = false;

    CastSettings cast;

    // Location of the persisted state document inside data_dir
    std::string statePath() const;

    // data_dir with defaults and "~" expanded
    std::string dataDir() const;

    /**
     * Applies the keys of a JSON document over the current values
     * Throws ConfigError naming the key on a wrong type or out-of-range value
     */
    void parse(const nlohmann::json& document);

    /**
     * Reads and applies a JSON configuration file
     * Throws ConfigError if the file cannot be read or parsed
     */
    void parseFile(const std::string& path);
};
