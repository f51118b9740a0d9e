#pragma once

#include <stdexcept>
#include <string>

/**
 * Base class for every error the engine reports to its callers
 * Unreachable hosts and failed sends are NOT errors; they end up in
 * the scan/cast summaries instead
 */
class WolError : public std::runtime_error {
public:
    explicit WolError(const std::string& what) : std::runtime_error(what) {}
};

// Interface address or netmask cannot be turned into a subnet
class InvalidInterfaceError : public WolError {
public:
    explicit InvalidInterfaceError(const std::string& what) : WolError(what) {}
};

// Text is not a dotted-quad IPv4 address
class InvalidAddressError : public WolError {
public:
    explicit InvalidAddressError(const std::string& what) : WolError(what) {}
};

// Hardware address is not exactly 6 octets
class InvalidMACError : public WolError {
public:
    explicit InvalidMACError(const std::string& what) : WolError(what) {}
};

// Persisted state file exists but cannot be parsed
class CorruptStateError : public WolError {
public:
    explicit CorruptStateError(const std::string& what) : WolError(what) {}
};

// Import file is not the JSON shape produced by export or persistence
class ImportFormatError : public WolError {
public:
    explicit ImportFormatError(const std::string& what) : WolError(what) {}
};

// A scan (or cast) was requested while another one is still running
class OperationInProgressError : public WolError {
public:
    explicit OperationInProgressError(const std::string& what) : WolError(what) {}
};

class ConfigError : public WolError {
public:
    explicit ConfigError(const std::string& what) : WolError(what) {}
};

// Writing the state file or an export failed
class StorageError : public WolError {
public:
    explicit StorageError(const std::string& what) : WolError(what) {}
};
