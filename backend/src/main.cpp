#include <iostream>
#include <iomanip>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <getopt.h>
#include "errors.hpp"
#include "logging.hpp"
#include "wolEngine.hpp"

std::atomic<bool> g_interrupted{false};

/**
 * Signal handler for cooperative cancellation
 * The running scan or cast is cancelled from the main loop; a second
 * interrupt exits immediately
 */
void signalHandler(int signum) {
    static volatile sig_atomic_t already_interrupted = 0;

    if (already_interrupted) {
        std::_Exit(128 + signum);
    }

    already_interrupted = 1;
    g_interrupted = true;
}

void usage(const std::string& prog) {
    std::cout << "Usage: " << prog << " [-c config.json] [-v | -q] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  interfaces                          List usable IPv4 interfaces\n"
              << "  scan [iface...]                     Scry the subnets of the given (default: all) interfaces\n"
              << "  list                                Show known devices\n"
              << "  target add-network <iface> <cidr>   Select a whole network\n"
              << "  target add-device <iface> <ip>      Select one device\n"
              << "  target remove-network <iface> <cidr>\n"
              << "  target remove-device <iface> <ip>\n"
              << "  target clear                        Drop every selection\n"
              << "  target show                         Show selections\n"
              << "  resolve                             Show the packets a cast would send\n"
              << "  cast [port]                         Send magic packets to the resolved targets\n"
              << "  export <text|csv|json> <path>       Write the device history\n"
              << "  import <path>                       Merge a JSON export\n"
              << "  clear-history                       Forget every device and selection\n";
}

/**
 * Waits for a background operation, cancelling it on SIGINT
 */
template<typename Summary>
Summary waitInterruptible(OperationHandle<Summary>& handle) {
    bool cancelled = false;
    while (!handle.finished()) {
        if (g_interrupted && !cancelled) {
            std::cout << "\nInterrupt received. Finishing work in flight..." << std::endl;
            handle.cancel();
            cancelled = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return handle.wait();
}

void printDevice(const Device& device) {
    std::optional<MacAddress> mac = device.effectiveMac();
    std::cout << std::left
              << std::setw(10) << device.interface_name
              << std::setw(17) << device.ip_address
              << std::setw(19) << (mac ? formatMac(*mac) : std::string("-"))
              << std::setw(9) << statusToString(device.status)
              << std::setw(24) << device.vendor.value_or("-")
              << device.hostname.value_or("-")
              << std::endl;
}

int cmdInterfaces(WolEngine& engine) {
    for (const auto& iface : engine.listInterfaces()) {
        std::cout << std::left << std::setw(10) << iface.name
                  << std::setw(17) << iface.ip_address
                  << iface.cidr() << std::endl;
    }
    return 0;
}

int cmdScan(WolEngine& engine, const std::vector<std::string>& names) {
    std::vector<NetworkInterface> available = engine.listInterfaces();
    std::vector<NetworkInterface> selected;

    if (names.empty()) {
        selected = available;
    } else {
        for (const auto& name : names) {
            bool found = false;
            for (const auto& iface : available) {
                if (iface.name == name) {
                    selected.push_back(iface);
                    found = true;
                }
            }
            if (!found) {
                std::cerr << "No usable IPv4 interface named " << name << std::endl;
                return 1;
            }
        }
    }

    if (selected.empty()) {
        std::cerr << "No interfaces to scan" << std::endl;
        return 1;
    }

    ScanObserver observer;
    observer.on_device = [](const Device& device) {
        if (isResponsive(device.status)) {
            std::cout << "\r";
            printDevice(device);
        }
    };
    observer.on_progress = [](const ScanProgress& progress) {
        std::cout << "\rScrying: " << progress.completed << "/" << progress.total
                  << " (" << static_cast<int>(progress.fraction() * 100) << "%)" << std::flush;
    };

    OperationHandle<ScanSummary> handle = engine.startScan(selected, observer);
    ScanSummary summary = waitInterruptible(handle);

    std::cout << "\n" << (summary.cancelled ? "Scan cancelled" : "Scan complete") << ": "
              << summary.completed << "/" << summary.total << " addresses, "
              << summary.online << " online, " << summary.standby << " standby, "
              << summary.offline << " offline, " << summary.failed() << " failed" << std::endl;
    for (const auto& failure : summary.failures) {
        std::cout << "  " << failure.interface_name << " " << failure.ip_address
                  << ": " << failure.reason << std::endl;
    }
    return 0;
}

int cmdList(WolEngine& engine) {
    std::vector<Device> devices = engine.getRegistry();
    if (devices.empty()) {
        std::cout << "No known devices. Run a scan first." << std::endl;
        return 0;
    }
    for (const auto& device : devices) {
        printDevice(device);
    }
    return 0;
}

int cmdTarget(WolEngine& engine, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "target needs a subcommand" << std::endl;
        return 2;
    }

    const std::string& action = args[0];
    if (action == "show") {
        for (const auto& selection : engine.getTargets()) {
            std::cout << selection.describe() << std::endl;
        }
        return 0;
    }
    if (action == "clear") {
        engine.clearTargets();
        engine.save();
        return 0;
    }

    if (args.size() != 3) {
        std::cerr << "target " << action << " needs <iface> and an address" << std::endl;
        return 2;
    }

    TargetSelection selection;
    if (action == "add-network" || action == "remove-network") {
        selection = TargetSelection::network(args[1], args[2]);
    } else if (action == "add-device" || action == "remove-device") {
        selection = TargetSelection::device(args[1], args[2]);
    } else {
        std::cerr << "Unknown target subcommand " << action << std::endl;
        return 2;
    }

    bool changed = action.compare(0, 4, "add-") == 0
        ? engine.addTarget(selection)
        : engine.removeTarget(selection);
    if (!changed) {
        std::cout << "Nothing to do for " << selection.describe() << std::endl;
    }
    engine.save();
    return 0;
}

void printResolution(const ResolutionReport& report) {
    for (const auto& target : report.targets) {
        std::cout << std::left << std::setw(10) << target.interface_name
                  << std::setw(17) << target.ip_address
                  << formatMac(target.mac) << std::endl;
    }
    for (const auto& skipped : report.unresolvable) {
        std::cout << std::left << std::setw(10) << skipped.interface_name
                  << std::setw(17) << skipped.ip_address
                  << "skipped: " << skipped.reason << std::endl;
    }
    std::cout << report.targets.size() << " packets, "
              << report.unresolvable.size() << " unresolvable" << std::endl;
}

int cmdResolve(WolEngine& engine) {
    printResolution(engine.resolveTargets());
    return 0;
}

int cmdCast(WolEngine& engine, const std::vector<std::string>& args) {
    uint16_t port = 0;
    if (!args.empty()) {
        int value = std::atoi(args[0].c_str());
        if (value < 1 || value > 65535) {
            std::cerr << "Invalid port " << args[0] << std::endl;
            return 2;
        }
        port = static_cast<uint16_t>(value);
    }

    ResolutionReport report = engine.resolveTargets();
    printResolution(report);
    if (report.targets.empty()) {
        return 0;
    }

    CastObserver observer;
    observer.on_progress = [](const CastProgress& progress) {
        std::cout << "\rCasting: " << progress.completed << "/" << progress.total << std::flush;
    };

    OperationHandle<CastSummary> handle = engine.startCast(report.targets, observer, port);
    CastSummary summary = waitInterruptible(handle);

    std::cout << "\n" << (summary.cancelled ? "Cast cancelled" : "Cast complete") << ": "
              << summary.sent << " sent, " << summary.failed << " failed, "
              << summary.skipped() << " skipped" << std::endl;
    for (const auto& failure : summary.failures) {
        std::cout << "  " << failure.target.ip_address << " (" << formatMac(failure.target.mac)
                  << "): " << failure.reason << std::endl;
    }
    return summary.failed == 0 ? 0 : 1;
}

int cmdExport(WolEngine& engine, const std::vector<std::string>& args) {
    ExportFormat format = ExportFormat::Text;
    if (args.size() != 2 || !parseExportFormat(args[0], format)) {
        std::cerr << "export needs <text|csv|json> <path>" << std::endl;
        return 2;
    }
    engine.exportTo(args[1], format);
    std::cout << "Exported to " << args[1] << std::endl;
    return 0;
}

int cmdImport(WolEngine& engine, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "import needs <path>" << std::endl;
        return 2;
    }
    ImportSummary summary = engine.importFrom(args[0]);
    std::cout << "Imported " << summary.devices_read << " devices ("
              << summary.devices_added << " added, " << summary.devices_updated << " updated), "
              << summary.targets_added << " of " << summary.targets_read << " targets added" << std::endl;
    return 0;
}

/**
 * Main function
 */
int main(int argc, char** argv) {
    std::string config_path;
    int verbosity = 0;

    int opt;
    while ((opt = getopt(argc, argv, "c:vqh")) != -1) {
        switch (opt) {
            case 'c': config_path = optarg; break;
            case 'v': verbosity++; break;
            case 'q': verbosity--; break;
            case 'h': usage(argv[0]); return 0;
            default:  usage(argv[0]); return 2;
        }
    }

    if (optind >= argc) {
        usage(argv[0]);
        return 2;
    }
    std::string command = argv[optind];
    std::vector<std::string> args(argv + optind + 1, argv + argc);

    EngineConfig config;
    try {
        if (config_path.empty()) {
            std::string fallback = (std::filesystem::path(config.dataDir()) / "config.json").string();
            std::error_code ec;
            if (std::filesystem::exists(fallback, ec)) config_path = fallback;
        }
        if (!config_path.empty()) {
            config.parseFile(config_path);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    Log::Level level = config.log_level;
    if (verbosity > 0) level = Log::Level::Debug;
    if (verbosity < 0) level = Log::Level::Error;
    Log::setLevel(level);

    // Register signal handler for Ctrl+C
    signal(SIGINT, signalHandler);

    try {
        WolEngine engine(config);
        if (!engine.load()) {
            std::cerr << "Warning: saved state was unreadable, starting fresh" << std::endl;
        }

        if (command == "interfaces")    return cmdInterfaces(engine);
        if (command == "scan")          return cmdScan(engine, args);
        if (command == "list")          return cmdList(engine);
        if (command == "target")        return cmdTarget(engine, args);
        if (command == "resolve")       return cmdResolve(engine);
        if (command == "cast")          return cmdCast(engine, args);
        if (command == "export")        return cmdExport(engine, args);
        if (command == "import")        return cmdImport(engine, args);
        if (command == "clear-history") {
            engine.clearHistory();
            return 0;
        }

        usage(argv[0]);
        return 2;
    } catch (const WolError& e) {
        LOG_ERROR(e.what());
        return 1;
    }
}
