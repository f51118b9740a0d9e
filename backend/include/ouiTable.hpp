#pragma once

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include "networkTypes.hpp"

/**
 * Read-only map from OUI (first 3 MAC octets) to vendor name
 * Built once before any scan starts and never mutated afterwards, so
 * concurrent lookups need no locking
 */
class OuiTable {
private:
    std::map<uint32_t, std::string> vendors;

public:
    OuiTable() = default;

    // Common virtual NIC prefixes that are always available
    static OuiTable builtin();

    /**
     * Builtin entries plus every entry found in a vendor file
     * @param path: File with "XXXXXX<TAB>Vendor", "XX:XX:XX<TAB>Vendor" or
     *              IEEE "XX-XX-XX (hex)<TAB>Vendor" lines; '#' starts a comment
     * A missing or unreadable file logs a warning and yields the builtin table
     */
    static OuiTable load(const std::string& path);

    /**
     * Adds entries parsed from a stream in the same formats as load()
     * @return: Number of entries added
     */
    size_t parse(std::istream& in);

    void add(uint32_t oui, const std::string& vendor) { vendors[oui] = vendor; }

    std::optional<std::string> vendorOf(const MacAddress& mac) const;

    size_t size() const { return vendors.size(); }
};
