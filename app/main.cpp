#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/json.hpp>

#include "core/api/ConsoleJsonApi.h"
#include "core/config/ClientConfig.h"
#include "core/log/Logger.h"
#include "infrastructure/transport/InMemoryModbusTransport.h"
#include "layers/application/application_layer.h"
#include "layers/transport/discovery.h"
#include "layers/transport/transport_layer.h"

namespace {

enum class Command {
    None,
    ReadHolding,
    ReadInput,
    WriteSingle,
    WriteMultiple,
    Discover,
    StdinJson
};

struct StartupOptions {
    std::optional<std::string> configPath;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<std::uint8_t> unitId;
    std::optional<std::uint32_t> connectTimeoutMs;
    std::optional<std::uint32_t> responseTimeoutMs;
    std::optional<std::uint32_t> delayAfterConnectMs;
    std::optional<std::string> mode;

    Command command = Command::None;
    std::uint16_t address = 0;
    std::uint16_t count = 1;
    std::optional<std::uint16_t> value;
    std::vector<std::uint16_t> values;
    std::uint32_t repeat = 1;
    std::string discoverStart;

    bool dryRun = false;
    bool verbose = false;
    bool showHelp = false;
};

void printUsage() {
    std::cout
        << "Usage: ModbusLink [options] <command>\n"
        << "Connection:\n"
        << "  --config <file>                  JSON client configuration\n"
        << "  --host <ip|name>                 Server address (default: 127.0.0.1)\n"
        << "  --port <port>                    Server port (default: 502)\n"
        << "  --unit <0..255>                  Unit id (default: 1)\n"
        << "  --connect-timeout-ms <ms>        Connect timeout (default: 3000)\n"
        << "  --response-timeout-ms <ms>       Response timeout (default: 3000)\n"
        << "  --delay-after-connect-ms <ms>    Pause after connecting\n"
        << "  --mode <do_not_connect|auto_connect_keep|auto_connect_disconnect>\n"
        << "\n"
        << "Commands:\n"
        << "  --read-holding <addr> [--count <n>]\n"
        << "  --read-input <addr> [--count <n>]\n"
        << "  --write-single <addr> --value <v>\n"
        << "  --write-multiple <addr> --values <v1,v2,...>\n"
        << "  --discover <start-ip>            Find the first server from start-ip up to .255\n"
        << "  --stdin-json                     Execute JSON commands read from stdin, one per line\n"
        << "\n"
        << "Other:\n"
        << "  --repeat <n>                     Run the command n times (default: 1)\n"
        << "  --dry-run                        Use an in-memory register table, no network\n"
        << "  --verbose                        Debug logging\n"
        << "  --help                           Show this help\n";
}

template <typename UInt>
bool parseUnsigned(const std::string& text, UInt& out) {
    try {
        std::size_t consumed = 0;
        const unsigned long long value = std::stoull(text, &consumed, 0);
        if (consumed != text.size() || text.front() == '-' ||
            value > static_cast<unsigned long long>(std::numeric_limits<UInt>::max())) {
            return false;
        }
        out = static_cast<UInt>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseValueList(const std::string& text, std::vector<std::uint16_t>& out) {
    out.clear();
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        std::uint16_t value = 0;
        if (item.empty() || !parseUnsigned(item, value)) {
            return false;
        }
        out.push_back(value);
    }
    return !out.empty();
}

std::optional<StartupOptions> parseArgs(int argc, char* argv[], std::string& error) {
    StartupOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto getValue = [&](const std::string& key) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        auto getUnsigned = [&](const std::string& key, auto& out) -> bool {
            auto value = getValue(key);
            if (!value) {
                return false;
            }
            std::remove_reference_t<decltype(out)> parsed{};
            if (!parseUnsigned(*value, parsed)) {
                error = "Invalid " + key + " value: " + *value;
                return false;
            }
            out = parsed;
            return true;
        };

        auto setCommand = [&](Command command) -> bool {
            if (options.command != Command::None) {
                error = "Only one command may be given";
                return false;
            }
            options.command = command;
            return true;
        };

        if (arg == "--help") {
            options.showHelp = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "--dry-run") {
            options.dryRun = true;
            continue;
        }
        if (arg == "--config") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.configPath = *value;
            continue;
        }
        if (arg == "--host") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.host = *value;
            continue;
        }
        if (arg == "--mode") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.mode = *value;
            continue;
        }
        if (arg == "--port") {
            std::uint16_t port = 0;
            if (!getUnsigned(arg, port)) return std::nullopt;
            options.port = port;
            continue;
        }
        if (arg == "--unit") {
            std::uint8_t unit = 0;
            if (!getUnsigned(arg, unit)) return std::nullopt;
            options.unitId = unit;
            continue;
        }
        if (arg == "--connect-timeout-ms") {
            std::uint32_t ms = 0;
            if (!getUnsigned(arg, ms)) return std::nullopt;
            options.connectTimeoutMs = ms;
            continue;
        }
        if (arg == "--response-timeout-ms") {
            std::uint32_t ms = 0;
            if (!getUnsigned(arg, ms)) return std::nullopt;
            options.responseTimeoutMs = ms;
            continue;
        }
        if (arg == "--delay-after-connect-ms") {
            std::uint32_t ms = 0;
            if (!getUnsigned(arg, ms)) return std::nullopt;
            options.delayAfterConnectMs = ms;
            continue;
        }
        if (arg == "--read-holding" || arg == "--read-input") {
            if (!setCommand(arg == "--read-holding" ? Command::ReadHolding : Command::ReadInput)) return std::nullopt;
            if (!getUnsigned(arg, options.address)) return std::nullopt;
            continue;
        }
        if (arg == "--write-single") {
            if (!setCommand(Command::WriteSingle)) return std::nullopt;
            if (!getUnsigned(arg, options.address)) return std::nullopt;
            continue;
        }
        if (arg == "--write-multiple") {
            if (!setCommand(Command::WriteMultiple)) return std::nullopt;
            if (!getUnsigned(arg, options.address)) return std::nullopt;
            continue;
        }
        if (arg == "--discover") {
            if (!setCommand(Command::Discover)) return std::nullopt;
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.discoverStart = *value;
            continue;
        }
        if (arg == "--stdin-json") {
            if (!setCommand(Command::StdinJson)) return std::nullopt;
            continue;
        }
        if (arg == "--count") {
            if (!getUnsigned(arg, options.count)) return std::nullopt;
            continue;
        }
        if (arg == "--value") {
            std::uint16_t value = 0;
            if (!getUnsigned(arg, value)) return std::nullopt;
            options.value = value;
            continue;
        }
        if (arg == "--values") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            if (!parseValueList(*value, options.values)) {
                error = "Invalid --values list: " + *value;
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--repeat") {
            if (!getUnsigned(arg, options.repeat)) return std::nullopt;
            continue;
        }

        error = "Unknown argument: " + arg;
        return std::nullopt;
    }

    if (options.showHelp) {
        return options;
    }
    if (options.command == Command::None) {
        error = "No command given";
        return std::nullopt;
    }
    if (options.command == Command::WriteSingle && !options.value) {
        error = "--value is required with --write-single";
        return std::nullopt;
    }
    if (options.command == Command::WriteMultiple && options.values.empty()) {
        error = "--values is required with --write-multiple";
        return std::nullopt;
    }
    if (options.repeat == 0) {
        error = "--repeat must be at least 1";
        return std::nullopt;
    }

    return options;
}

bool buildClientConfig(const StartupOptions& options, config::ClientConfig& cfg, std::string& error) {
    if (options.configPath) {
        try {
            cfg = config::loadClientConfig(*options.configPath);
        } catch (const std::exception& e) {
            error = e.what();
            return false;
        }
    }

    if (options.host) cfg.host = *options.host;
    if (options.port) cfg.port = *options.port;
    if (options.unitId) cfg.unitId = *options.unitId;
    if (options.connectTimeoutMs) cfg.connectTimeout = std::chrono::milliseconds(*options.connectTimeoutMs);
    if (options.responseTimeoutMs) cfg.responseTimeout = std::chrono::milliseconds(*options.responseTimeoutMs);
    if (options.delayAfterConnectMs) cfg.delayAfterConnect = std::chrono::milliseconds(*options.delayAfterConnectMs);
    if (options.mode && !config::parseConnectionMode(*options.mode, cfg.connectionMode)) {
        error = "Unsupported --mode: " + *options.mode;
        return false;
    }
    return true;
}

bool runCommand(application::ApplicationCore& appCore, const StartupOptions& options) {
    boost::json::object result;
    std::string error;
    bool ok = false;

    switch (options.command) {
        case Command::ReadHolding:
        case Command::ReadInput:
            ok = appCore.readRegistersDetailed(std::nullopt, options.address, options.count,
                                               options.command == Command::ReadInput, result, error);
            break;
        case Command::WriteSingle:
            ok = appCore.writeSingleRegister(std::nullopt, options.address, *options.value, result, error);
            break;
        case Command::WriteMultiple:
            ok = appCore.writeMultipleRegisters(std::nullopt, options.address, options.values, result, error);
            break;
        case Command::None:
        case Command::Discover:
        case Command::StdinJson:
            return false;
    }

    if (result.empty()) {
        result["status"] = "error";
        result["error"] = error;
    }
    std::cout << boost::json::serialize(result) << std::endl;
    return ok;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string parseError;
    const auto parsed = parseArgs(argc, argv, parseError);
    if (!parsed) {
        std::cerr << parseError << "\n\n";
        printUsage();
        return 2;
    }

    const auto options = *parsed;
    if (options.showHelp) {
        printUsage();
        return 0;
    }

    logging::Logger::instance().setLevel(options.verbose ? logging::Level::Debug : logging::Level::Warning);

    config::ClientConfig cfg;
    std::string configError;
    if (!buildClientConfig(options, cfg, configError)) {
        std::cerr << configError << std::endl;
        return 2;
    }

    if (options.command == Command::Discover) {
        const auto found = transport::discover(options.discoverStart, cfg.port, cfg.connectTimeout);
        boost::json::object result;
        result["status"] = found ? "ok" : "not_found";
        if (found) {
            result["address"] = *found;
        }
        result["port"] = cfg.port;
        std::cout << boost::json::serialize(result) << std::endl;
        return found ? 0 : 1;
    }

    std::unique_ptr<transport::IModbusTransport> client;
    if (options.dryRun) {
        client = std::make_unique<transport::InMemoryModbusTransport>(cfg.connectionMode);
    } else {
        client = std::make_unique<transport::TcpClient>(cfg);
    }

    application::ApplicationCore appCore(*client);

    if (options.command == Command::StdinJson) {
        const api::ConsoleJsonApi consoleApi(appCore);
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            std::cout << consoleApi.handleLine(line) << std::endl;
        }
        client->disconnect();
        return 0;
    }

    bool allOk = true;
    for (std::uint32_t i = 0; i < options.repeat; ++i) {
        allOk = runCommand(appCore, options) && allOk;
    }

    client->disconnect();
    return allOk ? 0 : 1;
}
