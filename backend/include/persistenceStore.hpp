#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "device.hpp"
#include "targetSet.hpp"

/**
 * Durable aggregate: every known device grouped by interface, plus the
 * current target selections
 */
struct PersistedState {
    std::map<std::string, std::vector<Device>> interfaces;
    TargetSet targets;

    bool empty() const { return interfaces.empty() && targets.empty(); }
};

enum class ExportFormat {
    Text,
    Csv,
    Json
};

bool parseExportFormat(const std::string& name, ExportFormat& format);

/**
 * Validated content of an import file, not yet merged anywhere
 */
struct ImportDocument {
    std::vector<DeviceRecord> devices;
    std::vector<TargetSelection> targets;
};

/**
 * Outcome of a merge import
 */
struct ImportSummary {
    size_t devices_read = 0;
    size_t devices_added = 0;
    size_t devices_updated = 0;
    size_t targets_read = 0;
    size_t targets_added = 0;
};

/**
 * PersistenceStore reads and writes the state document and produces the
 * user-facing exports
 *
 * State file (JSON):
 *   {"version": 1,
 *    "interfaces": {"eth0": [device, ...]},
 *    "targets": [{"type": "network", "interface": "eth0", "cidr": "192.168.1.0/24"},
 *                {"type": "device", "interface": "eth0", "ip": "192.168.1.20"}]}
 * Device object (state file and JSON export):
 *   {"interface", "ip", "hostname", "mac", "status", "vendor", "last_seen"}
 *   with null for absent values and last_seen in epoch seconds
 */
class PersistenceStore {
private:
    std::string state_path;

public:
    /**
     * @param state_path: Location of the state document
     */
    explicit PersistenceStore(const std::string& state_path);

    // $HOME/.wol_caster, or ./.wol_caster if HOME is unset
    static std::string defaultDataDir();

    const std::string& getStatePath() const { return state_path; }

    /**
     * Reads the state document
     * @return: Empty state if the file does not exist yet
     * Throws CorruptStateError if the file exists but cannot be parsed
     */
    PersistedState load() const;

    /**
     * Writes the state document atomically (temp file + rename)
     * Throws StorageError on I/O failure
     */
    void save(const PersistedState& state) const;

    // Deletes the state document if present
    void erase() const;

    /**
     * Writes a human readable export
     * @param format: Text (labeled blocks), Csv (RFC 4180) or Json (array)
     * Throws StorageError on I/O failure
     */
    void exportTo(const PersistedState& state, const std::string& path, ExportFormat format) const;

    /**
     * Reads and validates a JSON export or state document
     * Throws ImportFormatError on any shape mismatch; nothing is merged
     */
    ImportDocument readImport(const std::string& path) const;

    /**
     * Merges a JSON export or state document into existing
     *
     * Imported devices are upserted by (interface, IP): present fields
     * overwrite, absent ones are kept, devices missing from the file stay.
     * Imported selections are unioned into the target set.
     * @return: The merged state; existing is never modified
     * Throws ImportFormatError if the file is not one of the JSON shapes
     * produced by exportTo() or save(), before anything is merged
     */
    PersistedState importFrom(const std::string& path, const PersistedState& existing,
                              ImportSummary* summary = nullptr) const;

    static std::string renderText(const PersistedState& state);
    static std::string renderCsv(const PersistedState& state);
    static nlohmann::json renderJson(const PersistedState& state);
    static nlohmann::json renderState(const PersistedState& state);
};
