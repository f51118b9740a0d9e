#include "persistenceStore.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace {

// Latest last_seen, in epoch milliseconds, that system_clock can hold
const long long kMaxLastSeenMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::duration::max()).count();

json optionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json lastSeenToJson(std::chrono::system_clock::time_point when) {
    if (when.time_since_epoch().count() == 0) return nullptr;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
    return static_cast<double>(ms) / 1000.0;
}

std::string lastSeenToText(std::chrono::system_clock::time_point when) {
    if (when.time_since_epoch().count() == 0) return "";
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    struct tm utc;
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

json deviceToJson(const Device& device) {
    std::optional<MacAddress> mac = device.effectiveMac();
    return json{
        {"interface", device.interface_name},
        {"ip", device.ip_address},
        {"hostname", optionalString(device.hostname)},
        {"mac", mac ? json(formatMac(*mac)) : json(nullptr)},
        {"status", statusToString(device.status)},
        {"vendor", optionalString(device.vendor)},
        {"last_seen", lastSeenToJson(device.last_seen)}
    };
}

json selectionToJson(const TargetSelection& selection) {
    switch (selection.kind) {
        case TargetSelection::Kind::Network:
            return json{{"type", "network"}, {"interface", selection.interface_name}, {"cidr", selection.cidr}};
        case TargetSelection::Kind::Device:
            return json{{"type", "device"}, {"interface", selection.interface_name}, {"ip", selection.ip_address}};
    }
    return json();
}

// Reads an optional string member; null and missing are both "absent"
std::optional<std::string> readOptionalString(const json& object, const char* key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw ImportFormatError(where + ": field '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

DeviceRecord parseDevice(const json& object, const std::string& group_interface, const std::string& where) {
    if (!object.is_object()) {
        throw ImportFormatError(where + ": device entry must be an object");
    }

    DeviceRecord record;

    std::optional<std::string> interface_name = readOptionalString(object, "interface", where);
    record.interface_name = interface_name ? *interface_name : group_interface;
    if (record.interface_name.empty()) {
        throw ImportFormatError(where + ": missing required field 'interface'");
    }

    std::optional<std::string> ip = readOptionalString(object, "ip", where);
    if (!ip) {
        throw ImportFormatError(where + ": missing required field 'ip'");
    }
    uint32_t address = 0;
    if (!tryParseIPv4(*ip, address)) {
        throw ImportFormatError(where + ": invalid ip '" + *ip + "'");
    }
    record.ip_address = formatIPv4(address);

    record.hostname = readOptionalString(object, "hostname", where);
    record.vendor = readOptionalString(object, "vendor", where);

    std::optional<std::string> mac_text = readOptionalString(object, "mac", where);
    if (mac_text && !mac_text->empty()) {
        MacAddress mac{};
        if (!tryParseMac(*mac_text, mac)) {
            throw ImportFormatError(where + ": invalid mac '" + *mac_text + "'");
        }
        record.mac = mac;
    }

    std::optional<std::string> status_text = readOptionalString(object, "status", where);
    if (status_text) {
        DeviceStatus status = DeviceStatus::Unknown;
        if (!statusFromString(*status_text, status)) {
            throw ImportFormatError(where + ": invalid status '" + *status_text + "'");
        }
        record.status = status;
    }

    auto last_seen = object.find("last_seen");
    if (last_seen != object.end() && !last_seen->is_null()) {
        if (!last_seen->is_number() || last_seen->get<double>() < 0) {
            throw ImportFormatError(where + ": field 'last_seen' must be a non-negative number");
        }
        double ms = last_seen->get<double>() * 1000.0;
        if (ms > static_cast<double>(kMaxLastSeenMs)) {
            throw ImportFormatError(where + ": field 'last_seen' is beyond the representable time range");
        }
        record.last_seen = std::chrono::system_clock::time_point(std::chrono::milliseconds(std::llround(ms)));
    }

    return record;
}

TargetSelection parseSelection(const json& object, const std::string& where) {
    if (!object.is_object()) {
        throw ImportFormatError(where + ": target entry must be an object");
    }
    std::optional<std::string> type = readOptionalString(object, "type", where);
    std::optional<std::string> interface_name = readOptionalString(object, "interface", where);
    if (!type || !interface_name) {
        throw ImportFormatError(where + ": target needs 'type' and 'interface'");
    }

    try {
        if (*type == "network") {
            std::optional<std::string> cidr = readOptionalString(object, "cidr", where);
            if (!cidr) throw ImportFormatError(where + ": network target without 'cidr'");
            return TargetSelection::network(*interface_name, *cidr);
        }
        if (*type == "device") {
            std::optional<std::string> ip = readOptionalString(object, "ip", where);
            if (!ip) throw ImportFormatError(where + ": device target without 'ip'");
            return TargetSelection::device(*interface_name, *ip);
        }
    } catch (const InvalidInterfaceError& e) {
        throw ImportFormatError(where + ": " + e.what());
    } catch (const InvalidAddressError& e) {
        throw ImportFormatError(where + ": " + e.what());
    }
    throw ImportFormatError(where + ": unknown target type '" + *type + "'");
}

/**
 * Accepts the JSON export (array of devices) or the state document
 * Throws ImportFormatError on any shape mismatch
 */
ImportDocument parseDocument(const json& document) {
    ImportDocument parsed;

    if (document.is_array()) {
        size_t index = 0;
        for (const auto& entry : document) {
            parsed.devices.push_back(parseDevice(entry, "", "device #" + std::to_string(index++)));
        }
        return parsed;
    }

    if (!document.is_object() || !document.contains("interfaces")) {
        throw ImportFormatError("expected a device array or an object with 'interfaces'");
    }

    const json& interfaces = document["interfaces"];
    if (!interfaces.is_object()) {
        throw ImportFormatError("'interfaces' must map interface names to device arrays");
    }
    for (const auto& group : interfaces.items()) {
        if (!group.value().is_array()) {
            throw ImportFormatError("devices of interface '" + group.key() + "' must be an array");
        }
        size_t index = 0;
        for (const auto& entry : group.value()) {
            parsed.devices.push_back(parseDevice(entry, group.key(),
                                                 group.key() + " device #" + std::to_string(index++)));
        }
    }

    if (document.contains("targets")) {
        const json& targets = document["targets"];
        if (!targets.is_array()) {
            throw ImportFormatError("'targets' must be an array");
        }
        size_t index = 0;
        for (const auto& entry : targets) {
            parsed.targets.push_back(parseSelection(entry, "target #" + std::to_string(index++)));
        }
    }

    return parsed;
}

// Builds a state from a parsed document without merging anything
PersistedState stateFromDocument(const ImportDocument& parsed) {
    PersistedState state;
    for (const auto& record : parsed.devices) {
        Device device;
        applyRecord(device, record);
        auto& group = state.interfaces[device.interface_name];
        bool replaced = false;
        for (auto& existing : group) {
            if (existing.ip_address == device.ip_address) {
                existing = device;
                replaced = true;
                break;
            }
        }
        if (!replaced) group.push_back(device);
    }
    for (const auto& selection : parsed.targets) {
        state.targets.add(selection);
    }
    return state;
}

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos &&
        (value.empty() || (value.front() != ' ' && value.back() != ' '))) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw StorageError("cannot open " + path + " for writing");
    }
    file << content;
    file.close();
    if (!file) {
        throw StorageError("failed writing " + path);
    }
}

}

bool parseExportFormat(const std::string& name, ExportFormat& format) {
    if (name == "text" || name == "txt") format = ExportFormat::Text;
    else if (name == "csv") format = ExportFormat::Csv;
    else if (name == "json") format = ExportFormat::Json;
    else return false;
    return true;
}

PersistenceStore::PersistenceStore(const std::string& state_path) : state_path(state_path) {}

std::string PersistenceStore::defaultDataDir() {
    const char* home = std::getenv("HOME");
    std::filesystem::path base = (home && *home) ? std::filesystem::path(home) : std::filesystem::current_path();
    return (base / ".wol_caster").string();
}

PersistedState PersistenceStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(state_path, ec)) {
        LOG_DEBUG("No state file at ", state_path, ", starting empty");
        return PersistedState();
    }

    std::ifstream file(state_path);
    if (!file.is_open()) {
        throw CorruptStateError("cannot read state file " + state_path);
    }

    try {
        json document = json::parse(file);
        PersistedState state = stateFromDocument(parseDocument(document));
        LOG_DEBUG("Loaded ", state.interfaces.size(), " interfaces and ",
                  state.targets.size(), " targets from ", state_path);
        return state;
    } catch (const json::exception& e) {
        throw CorruptStateError("state file " + state_path + " is not valid JSON: " + e.what());
    } catch (const ImportFormatError& e) {
        throw CorruptStateError("state file " + state_path + " has unexpected content: " + e.what());
    }
}

void PersistenceStore::save(const PersistedState& state) const {
    std::filesystem::path path(state_path);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw StorageError("cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    // Write beside the target, then rename so a crash never leaves half a file
    std::string temp_path = state_path + ".tmp";
    writeFile(temp_path, renderState(state).dump(2));
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        throw StorageError("cannot replace " + state_path);
    }
    LOG_DEBUG("Saved state to ", state_path);
}

void PersistenceStore::erase() const {
    std::error_code ec;
    std::filesystem::remove(state_path, ec);
    if (ec) {
        LOG_WARNING("Cannot delete ", state_path, ": ", ec.message());
    }
}

void PersistenceStore::exportTo(const PersistedState& state, const std::string& path, ExportFormat format) const {
    switch (format) {
        case ExportFormat::Text:
            writeFile(path, renderText(state));
            break;
        case ExportFormat::Csv:
            writeFile(path, renderCsv(state));
            break;
        case ExportFormat::Json:
            writeFile(path, renderJson(state).dump(2) + "\n");
            break;
    }
    LOG_INFO("Exported device history to ", path);
}

ImportDocument PersistenceStore::readImport(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ImportFormatError("cannot open " + path);
    }

    try {
        return parseDocument(json::parse(file));
    } catch (const json::exception& e) {
        throw ImportFormatError(path + " is not a JSON export: " + e.what());
    }
}

PersistedState PersistenceStore::importFrom(const std::string& path, const PersistedState& existing,
                                            ImportSummary* summary) const {
    // Parse and validate everything before touching the merge target
    ImportDocument parsed = readImport(path);

    PersistedState merged = existing;
    ImportSummary counts;
    counts.devices_read = parsed.devices.size();
    counts.targets_read = parsed.targets.size();

    for (const auto& record : parsed.devices) {
        auto& group = merged.interfaces[record.interface_name];
        Device* target = nullptr;
        for (auto& device : group) {
            if (device.ip_address == record.ip_address) {
                target = &device;
                break;
            }
        }

        if (target) {
            applyRecord(*target, record);
            counts.devices_updated++;
        } else {
            Device device;
            applyRecord(device, record);
            group.push_back(device);
            counts.devices_added++;
        }
    }

    for (const auto& selection : parsed.targets) {
        if (merged.targets.add(selection)) counts.targets_added++;
    }

    LOG_INFO("Imported ", path, ": ", counts.devices_added, " devices added, ",
             counts.devices_updated, " updated, ", counts.targets_added, " targets added");
    if (summary) *summary = counts;
    return merged;
}

std::string PersistenceStore::renderText(const PersistedState& state) {
    std::ostringstream out;
    auto orDash = [](const std::string& value) { return value.empty() ? std::string("-") : value; };

    for (const auto& group : state.interfaces) {
        for (const auto& device : group.second) {
            std::optional<MacAddress> mac = device.effectiveMac();
            out << "Interface: " << group.first << "\n"
                << "IP:        " << device.ip_address << "\n"
                << "Hostname:  " << orDash(device.hostname.value_or("")) << "\n"
                << "MAC:       " << (mac ? formatMac(*mac) : std::string("-")) << "\n"
                << "Status:    " << statusToString(device.status) << "\n"
                << "Vendor:    " << orDash(device.vendor.value_or("")) << "\n"
                << "Last seen: " << orDash(lastSeenToText(device.last_seen)) << "\n"
                << "\n";
        }
    }
    return out.str();
}

std::string PersistenceStore::renderCsv(const PersistedState& state) {
    std::ostringstream out;
    out << "interface,ip,hostname,mac,status,vendor,last_seen\r\n";

    for (const auto& group : state.interfaces) {
        for (const auto& device : group.second) {
            std::optional<MacAddress> mac = device.effectiveMac();
            out << csvField(group.first) << ","
                << csvField(device.ip_address) << ","
                << csvField(device.hostname.value_or("")) << ","
                << csvField(mac ? formatMac(*mac) : "") << ","
                << csvField(statusToString(device.status)) << ","
                << csvField(device.vendor.value_or("")) << ","
                << csvField(lastSeenToText(device.last_seen)) << "\r\n";
        }
    }
    return out.str();
}

json PersistenceStore::renderJson(const PersistedState& state) {
    json devices = json::array();
    for (const auto& group : state.interfaces) {
        for (Device device : group.second) {
            device.interface_name = group.first;
            devices.push_back(deviceToJson(device));
        }
    }
    return devices;
}

json PersistenceStore::renderState(const PersistedState& state) {
    json interfaces = json::object();
    for (const auto& group : state.interfaces) {
        json devices = json::array();
        for (Device device : group.second) {
            device.interface_name = group.first;
            devices.push_back(deviceToJson(device));
        }
        interfaces[group.first] = devices;
    }

    json targets = json::array();
    for (const auto& selection : state.targets.getSelections()) {
        targets.push_back(selectionToJson(selection));
    }

    return json{{"version", 1}, {"interfaces", interfaces}, {"targets", targets}};
}
