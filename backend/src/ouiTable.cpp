#include "ouiTable.hpp"
#include "logging.hpp"
#include <cctype>
#include <fstream>

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

/**
 * Reads a 6 hex digit prefix, ignoring ':' and '-' separators
 * @param text: Prefix field of one table line
 * @param oui: Receives the 24-bit prefix
 * @return: false if the field is not exactly 6 hex digits
 */
bool parsePrefix(const std::string& text, uint32_t& oui) {
    std::string digits;
    for (char c : text) {
        if (c == ':' || c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        digits += c;
    }
    if (digits.size() != 6) return false;
    oui = static_cast<uint32_t>(std::stoul(digits, nullptr, 16));
    return true;
}

}

OuiTable OuiTable::builtin() {
    OuiTable table;
    table.add(0x005056, "VMware");
    table.add(0x000C29, "VMware");
    table.add(0x000569, "VMware");
    table.add(0x001A11, "Google");
    table.add(0x00163E, "Xen");
    table.add(0x525400, "QEMU");
    table.add(0x080027, "VirtualBox");
    table.add(0x00155D, "Microsoft Hyper-V");
    table.add(0xB827EB, "Raspberry Pi Foundation");
    table.add(0xDCA632, "Raspberry Pi Trading");
    table.add(0x001132, "Synology");
    return table;
}

OuiTable OuiTable::load(const std::string& path) {
    OuiTable table = builtin();
    if (path.empty()) return table;

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARNING("Cannot open OUI database ", path, ", using builtin vendor table");
        return table;
    }

    size_t added = table.parse(file);
    LOG_INFO("Loaded ", added, " OUI entries from ", path);
    return table;
}

size_t OuiTable::parse(std::istream& in) {
    size_t added = 0;
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t split = line.find_first_of(" \t");
        if (split == std::string::npos) continue;

        uint32_t oui = 0;
        if (!parsePrefix(line.substr(0, split), oui)) continue;

        std::string vendor = trim(line.substr(split));
        // IEEE oui.txt: "00-50-56   (hex)		VMware, Inc."
        if (vendor.compare(0, 5, "(hex)") == 0) {
            vendor = trim(vendor.substr(5));
        }
        if (vendor.empty()) continue;

        add(oui, vendor);
        added++;
    }
    return added;
}

std::optional<std::string> OuiTable::vendorOf(const MacAddress& mac) const {
    uint32_t oui = (static_cast<uint32_t>(mac[0]) << 16) |
                   (static_cast<uint32_t>(mac[1]) << 8) |
                   static_cast<uint32_t>(mac[2]);
    auto it = vendors.find(oui);
    if (it == vendors.end()) return std::nullopt;
    return it->second;
}
