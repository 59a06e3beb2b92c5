// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * dmxctl - DmxLink command-line controller
 *
 * Loads a JSON configuration, connects to the DMX interface (or an in-memory
 * device with --mock) and accepts line commands on stdin:
 *
 *   set <ch> <val>            setmany <ch>=<val> ...     get <ch>
 *   blackout                  pulse <ch> <val> <ms>      rate <hz>
 *   stats                     errors                     ports
 *   config                    help                       quit
 *
 * Usage: dmxctl [--mock] [--log-level <level>] <config.json>
 *        dmxctl --ports
 */

#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "codec/EngineConfigCodec.h"
#include "config/version.h"
#include "core/connection/ConnectionManager.h"
#include "hal/linux/SerialPort.h"
#include "hal/mock/MockSerialTransport.h"
#include "utils/Log.h"
#include "utils/TextParse.h"

using namespace dmxlink;
using dmxlink::utils::parseInteger;
using dmxlink::utils::parseNumber;
using dmxlink::utils::startsWith;

namespace {

// ============================================================================
// Input Helpers
// ============================================================================

bool parseChannel(const char* text, int& out) {
    long long value = 0;
    if (!utils::parseInteger(text, INT_MIN, INT_MAX, value)) return false;
    out = static_cast<int>(value);
    return true;
}

void printInvalidChannel(const char* text) {
    printf(DMX_CLR_RED "Invalid channel '%s' (must be 1-512)" DMX_ANSI_RESET "\n", text);
}

void printResult(const Result& r) {
    if (r.isOk()) {
        printf(DMX_CLR_GREEN "OK" DMX_ANSI_RESET "\n");
        return;
    }
    printf(DMX_CLR_RED "ERROR" DMX_ANSI_RESET " [%s] %s\n", errorCodeName(r.code), r.message.c_str());
    if (!r.hint.empty()) {
        printf("  hint: %s\n", r.hint.c_str());
    }
}

// ============================================================================
// Event Output
// ============================================================================

class ConsoleListener : public bus::IEngineListener {
public:
    void onEngineEvent(const bus::EngineEvent& event) override {
        switch (event.type) {
            case bus::EngineEventType::CONNECTED:
                printf("[event] connected (attempt %lu)\n", (unsigned long)event.attempt);
                break;
            case bus::EngineEventType::DISCONNECTED:
                printf("[event] disconnected\n");
                break;
            case bus::EngineEventType::DEGRADED:
                printf("[event] degraded: %s\n", event.error.message.c_str());
                break;
            case bus::EngineEventType::ERROR:
                printf("[event] error%s: %s\n", event.fatal ? " (fatal)" : "", event.error.message.c_str());
                if (!event.error.hint.empty()) {
                    printf("  hint: %s\n", event.error.hint.c_str());
                }
                break;
            default:
                break;
        }
        fflush(stdout);
    }
};

void printHelp() {
    printf("Commands:\n");
    printf("  set <ch> <val>           Set channel (1-512) to value (0-255)\n");
    printf("  setmany <ch>=<val> ...   Set several channels atomically\n");
    printf("  get <ch>                 Show channel value\n");
    printf("  blackout                 All channels to 0\n");
    printf("  pulse <ch> <val> <ms>    Set channel, return to 0 after ms\n");
    printf("  rate <hz>                Change refresh rate (1-44)\n");
    printf("  stats                    Transmission statistics\n");
    printf("  errors                   Error history summary\n");
    printf("  ports                    List serial ports\n");
    printf("  config                   Print active configuration\n");
    printf("  quit                     Disconnect and exit\n");
}

void printPorts() {
    std::vector<hal::PortInfo> ports = hal::SerialPort::listPorts();
    if (ports.empty()) {
        printf("No serial ports found\n");
        return;
    }
    for (const hal::PortInfo& p : ports) {
        printf("  %-20s %-10s", p.path.c_str(), p.driver.c_str());
        if (!p.vendorId.empty()) {
            printf(" %s:%s", p.vendorId.c_str(), p.productId.c_str());
        }
        if (!p.manufacturer.empty() || !p.product.empty()) {
            printf(" %s %s", p.manufacturer.c_str(), p.product.c_str());
        }
        if (!p.serialNumber.empty()) {
            printf(" (%s)", p.serialNumber.c_str());
        }
        printf("\n");
    }
}

void printStats(const connection::ConnectionManager& engine) {
    stats::Statistics s = engine.getStatistics();
    printf("\n=== DMX Statistics ===\n");
    printf("  State:         %s\n", connection::connectionStateName(engine.getState()));
    printf("  Rate:          %lu Hz\n", (unsigned long)engine.getFrameRate());
    printf("  FPS:           %lu\n", (unsigned long)s.fps);
    printf("  Frames:        %lu\n", (unsigned long)s.frameCount);
    printf("  Drops:         %lu\n", (unsigned long)s.dropCount);
    printf("  Send failures: %lu\n", (unsigned long)s.sendFailures);
    printf("  Connected:     %s\n", s.connected ? "yes" : "no");

    hal::TransportStats t = engine.getTransportStats();
    printf("  Port opens:    %lu\n", (unsigned long)t.opens);
    printf("  Port frames:   %lu (write errors %lu)\n", (unsigned long)t.framesSent, (unsigned long)t.writeErrors);
    printf("  Last send:     %lu us\n", (unsigned long)t.lastSendUs);
}

void printErrors(const connection::ConnectionManager& engine) {
    errors::ErrorStats e = engine.getErrorStats();
    printf("\n=== Error History ===\n");
    printf("  Total: %lu\n", (unsigned long)e.totalErrors);
    for (const auto& kv : e.errorsByCode) {
        printf("  %-18s %lu\n", errorCodeName(kv.first), (unsigned long)kv.second);
    }
    if (e.hasEntries) {
        printf("  Last:   [%lu ms] %s\n", (unsigned long)e.lastError.timestampMs, e.lastError.message.c_str());
        printf("  Oldest: [%lu ms] %s\n", (unsigned long)e.oldestError.timestampMs, e.oldestError.message.c_str());
    }
}

// ============================================================================
// Command Dispatch
// ============================================================================

/**
 * @return false when the session should end
 */
bool handleCommand(connection::ConnectionManager& engine, const codec::EngineConfig& config,
                   const std::string& line) {
    std::string input = utils::trim(line);
    if (input.empty()) return true;
    std::string inputLower = utils::toLower(input);

    // Tokenize (max 64 args is plenty for setmany)
    char buf[1024];
    snprintf(buf, sizeof(buf), "%s", inputLower.c_str());
    const char* argv[64];
    int argc = 0;
    for (char* tok = strtok(buf, " \t"); tok != nullptr && argc < 64; tok = strtok(nullptr, " \t")) {
        argv[argc++] = tok;
    }

    if (inputLower == "quit" || inputLower == "exit" || inputLower == "q") {
        return false;
    }
    else if (inputLower == "help" || inputLower == "?") {
        printHelp();
    }
    else if (startsWith(inputLower, "setmany")) {
        std::map<int, double> values;
        for (int i = 1; i < argc; i++) {
            const char* eq = strchr(argv[i], '=');
            int ch = 0;
            double value = 0.0;
            std::string chText(argv[i], eq ? static_cast<size_t>(eq - argv[i]) : strlen(argv[i]));
            if (eq == nullptr || !parseNumber(eq + 1, value)) {
                printf("Usage: setmany <ch>=<val> ...\n");
                return true;
            }
            if (!parseChannel(chText.c_str(), ch)) {
                printInvalidChannel(chText.c_str());
                return true;
            }
            values[ch] = value;
        }
        buffer::ChannelBatchResult batch = engine.setChannels(values);
        if (!batch.isOk()) {
            printResult(batch.status);
        }
        printf("Applied %u channel(s)", (unsigned)batch.applied);
        if (!batch.rejected.empty()) {
            printf(", rejected:");
            for (int ch : batch.rejected) printf(" %d", ch);
        }
        printf("\n");
    }
    else if (startsWith(inputLower, "set ")) {
        int ch = 0;
        double value = 0.0;
        if (argc != 3 || !parseNumber(argv[2], value)) {
            printf("Usage: set <ch> <val>\n");
            return true;
        }
        if (!parseChannel(argv[1], ch)) {
            printInvalidChannel(argv[1]);
            return true;
        }
        printResult(engine.setChannel(ch, value));
    }
    else if (startsWith(inputLower, "get ")) {
        int ch = 0;
        if (argc != 2) {
            printf("Usage: get <ch>\n");
            return true;
        }
        if (!parseChannel(argv[1], ch)) {
            printInvalidChannel(argv[1]);
            return true;
        }
        uint8_t value = 0;
        Result r = engine.getChannel(ch, value);
        if (r.isOk()) {
            printf("Channel %d = %u\n", ch, (unsigned)value);
        } else {
            printResult(r);
        }
    }
    else if (inputLower == "blackout") {
        engine.blackout();
        printf("Blackout\n");
    }
    else if (startsWith(inputLower, "pulse ")) {
        int ch = 0;
        long long holdMs = 0;
        double value = 0.0;
        if (argc != 4 || !parseNumber(argv[2], value) ||
            !parseInteger(argv[3], 0, UINT32_MAX, holdMs)) {
            printf("Usage: pulse <ch> <val> <ms>   (ms 0-%lu)\n", (unsigned long)UINT32_MAX);
            return true;
        }
        if (!parseChannel(argv[1], ch)) {
            printInvalidChannel(argv[1]);
            return true;
        }
        printResult(engine.pulseChannel(ch, value, static_cast<uint32_t>(holdMs)));
    }
    else if (startsWith(inputLower, "rate ")) {
        long long hz = 0;
        if (argc != 2 || !parseInteger(argv[1], scheduler::MIN_FRAME_RATE_HZ, scheduler::MAX_FRAME_RATE_HZ, hz)) {
            printf("Usage: rate <hz>   (%lu-%lu)\n",
                   (unsigned long)scheduler::MIN_FRAME_RATE_HZ, (unsigned long)scheduler::MAX_FRAME_RATE_HZ);
            return true;
        }
        printResult(engine.setFrameRate(static_cast<uint32_t>(hz)));
    }
    else if (inputLower == "stats") {
        printStats(engine);
    }
    else if (inputLower == "errors") {
        printErrors(engine);
    }
    else if (inputLower == "ports") {
        printPorts();
    }
    else if (inputLower == "config") {
        codec::EngineConfig active = config;
        active.connect = engine.getOptions();
        active.connect.frameRateHz = engine.getFrameRate();
        printf("%s\n", codec::EngineConfigCodec::encodeString(active).c_str());
    }
    else {
        printf("Unknown command '%s' (try 'help')\n", input.c_str());
    }
    fflush(stdout);
    return true;
}

void printUsage(const char* prog) {
    fprintf(stderr, "Usage: %s [--mock] [--log-level <level>] <config.json>\n", prog);
    fprintf(stderr, "       %s --ports\n", prog);
}

} // namespace

// ============================================================================
// Entry Point
// ============================================================================

int main(int argc, char** argv) {
    bool useMock = false;
    const char* configPath = nullptr;
    const char* levelOverride = nullptr;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--mock") == 0) {
            useMock = true;
        } else if (strcmp(argv[i], "--ports") == 0) {
            printPorts();
            return 0;
        } else if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            levelOverride = argv[++i];
        } else if (strcmp(argv[i], "--version") == 0) {
            printf("dmxctl %s\n", DMX_VERSION_STRING);
            return 0;
        } else if (argv[i][0] != '-' && configPath == nullptr) {
            configPath = argv[i];
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    if (configPath == nullptr) {
        printUsage(argv[0]);
        return 2;
    }

    codec::EngineConfigDecodeResult decoded = codec::EngineConfigCodec::loadFile(configPath);
    if (!decoded.success) {
        fprintf(stderr, "Configuration error: %s\n", decoded.errorMsg);
        return 2;
    }
    codec::EngineConfig config = decoded.config;

    if (levelOverride != nullptr && !utils::parseLogLevel(levelOverride, config.logLevel)) {
        fprintf(stderr, "Invalid log level '%s'\n", levelOverride);
        return 2;
    }

    utils::LogSink logSink(config.logLevel, stderr, config.logColor);
    utils::Logger log(logSink, "Main");
    log.info("dmxctl %s starting (%s)", DMX_VERSION_STRING, useMock ? "mock device" : config.connect.serial.portPath.c_str());

    std::unique_ptr<hal::ISerialTransport> transport;
    if (useMock) {
        transport.reset(new hal::MockSerialTransport(logSink));
    } else {
        transport.reset(new hal::SerialPort(logSink));
    }

    int exitCode = 0;
    {
        connection::ConnectionManager engine(*transport, logSink);
        ConsoleListener console;
        bus::Subscription sub = engine.subscribe(&console,
            bus::EVENT_MASK_ALL & ~bus::eventMask(bus::EngineEventType::FRAME));

        Result r = engine.connect(config.connect);
        if (!r.isOk()) {
            log.error("Connect failed: %s", r.message.c_str());
            if (!r.hint.empty()) {
                log.error("  %s", r.hint.c_str());
            }
            exitCode = 1;
        } else {
            printf("Connected to %s at %lu Hz (type 'help')\n",
                   config.connect.serial.portPath.c_str(), (unsigned long)engine.getFrameRate());
            fflush(stdout);

            std::string line;
            while (std::getline(std::cin, line)) {
                if (!handleCommand(engine, config, line)) {
                    break;
                }
            }
        }

        Result d = engine.disconnect();
        if (!d.isOk()) {
            log.warn("Disconnect: %s", d.message.c_str());
        }
        sub.reset();
    }

    transport.reset();
    return exitCode;
}
