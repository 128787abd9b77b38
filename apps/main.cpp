#include "hs602/core/Config.hpp"
#include "hs602/device/DeviceHandle.hpp"
#include "hs602/discovery/DiscoveryService.hpp"
#include "hs602/log/Log.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>

using namespace hs602;

namespace {

void usage(const char* argv0) {
    std::cerr << "usage:\n"
              << "  " << argv0 << " [-v] discover [window-ms]\n"
              << "  " << argv0 << " [-v] <host> get <name>\n"
              << "  " << argv0 << " [-v] <host> set <name> <value>\n"
              << "  " << argv0 << " [-v] <host> start|stop|identify|settings|params\n";
}

int fail(const std::error_code& ec) {
    std::cerr << "error: " << ec.message()
              << " (" << ec.category().name() << ":" << ec.value() << ")\n";
    return 1;
}

int runDiscover(int argc, char** argv, int first) {
    auto window = config::HS602_DISCOVERY_WINDOW;
    if (first < argc) {
        long ms = 0;
        std::string_view text(argv[first]);
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), ms);
        if (ec != std::errc() || ptr != text.data() + text.size() || ms <= 0) {
            std::cerr << "bad window '" << text << "'\n";
            return 2;
        }
        window = std::chrono::milliseconds{ms};
    }

    discovery::DiscoveryService service;
    auto found = service.discover(window);
    if (!found) {
        return fail(found.error());
    }
    if (found->empty()) {
        std::cout << "no devices answered\n";
    }
    for (const auto& address : *found) {
        std::cout << address << "\n";
    }
    return 0;
}

void listParameters(const device::ParameterRegistry& registry) {
    for (const auto& p : registry.parameters()) {
        std::cout << p.name << "\t" << device::toString(p.kind)
                  << (p.writable() ? (p.readable() ? "\trw" : "\two") : "\tro");
        for (const auto& option : p.options) {
            if (&option == &p.options.front()) std::cout << "\t";
            else std::cout << ",";
            std::cout << option.name;
        }
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    int arg = 1;
    if (arg < argc && std::strcmp(argv[arg], "-v") == 0) {
        setDebugLogging(true);
        ++arg;
    } else {
        // Keep stdout for results; only errors reach the terminal.
        setInfoLogHandler([](std::string_view) {});
    }

    if (arg >= argc) {
        usage(argv[0]);
        return 2;
    }

    const std::string_view target(argv[arg++]);
    if (target == "discover") {
        return runDiscover(argc, argv, arg);
    }
    if (arg >= argc) {
        usage(argv[0]);
        return 2;
    }
    const std::string_view command(argv[arg++]);

    device::DeviceHandle handle;
    if (command == "params") {
        listParameters(handle.parameters());
        return 0;
    }

    DeviceAddress address{std::string(target), config::HS602_CONTROL_PORT_DEFAULT, {}};
    if (auto ok = handle.connect(address); !ok) {
        return fail(ok.error());
    }

    int status = 0;
    if (command == "get" && arg < argc) {
        auto value = handle.get(argv[arg]);
        if (!value) {
            status = fail(value.error());
        } else {
            std::cout << *value << "\n";
        }
    } else if (command == "set" && arg + 1 < argc) {
        auto parameter = handle.parameters().find(argv[arg]);
        if (!parameter) {
            status = fail(parameter.error());
        } else if (auto value = device::parseValue(**parameter, argv[arg + 1]); !value) {
            status = fail(value.error());
        } else if (auto ok = handle.set(argv[arg], *value); !ok) {
            status = fail(ok.error());
        }
    } else if (command == "start" || command == "stop") {
        auto ok = command == "start" ? handle.startStreaming() : handle.stopStreaming();
        if (!ok) {
            status = fail(ok.error());
        }
    } else if (command == "identify") {
        if (auto ok = handle.identify(); !ok) {
            status = fail(ok.error());
        }
    } else if (command == "settings") {
        auto all = handle.settings();
        if (!all) {
            status = fail(all.error());
        } else {
            for (const auto& [name, value] : *all) {
                auto parameter = handle.parameters().find(name);
                std::cout << name << " = "
                          << (parameter ? device::displayValue(**parameter, value) : device::formatValue(value))
                          << "\n";
            }
        }
    } else {
        usage(argv[0]);
        status = 2;
    }

    handle.disconnect();
    return status;
}
