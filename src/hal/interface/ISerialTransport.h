// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ISerialTransport.h
 * @brief Hardware abstraction interface for the DMX512 serial link
 *
 * Provides a platform-agnostic interface for a UART that can emit a DMX
 * frame: break, mark-after-break, then the 513 frame bytes.
 */

#pragma once

#include <cstdint>
#include <string>

#include "../../core/Frame.h"
#include "../../core/Result.h"

namespace dmxlink {
namespace hal {

/**
 * @brief Serial parity setting
 */
enum class Parity : uint8_t {
    None,
    Even,
    Odd
};

/**
 * @brief How the break condition is produced
 */
enum class BreakMode : uint8_t {
    Ioctl,      ///< UART break primitive (hold TX low for breakUs)
    BaudToggle  ///< Drop to breakBaudRate, write one 0x00, restore DMX baud
};

const char* parityName(Parity parity);
bool parseParity(const char* name, Parity& out);

const char* breakModeName(BreakMode mode);
bool parseBreakMode(const char* name, BreakMode& out);

/**
 * @brief Translate an errno from opening/configuring a port into a
 *        SERIAL_CONNECTION Result carrying an operator hint
 */
Result describeOpenError(int err, const std::string& path);

/**
 * @brief Serial port options
 */
struct SerialOptions {
    std::string portPath;               ///< Device node, e.g. /dev/ttyUSB0
    uint32_t baudRate = 250000;         ///< DMX512 line rate
    uint8_t dataBits = 8;
    uint8_t stopBits = 2;
    Parity parity = Parity::None;
    BreakMode breakMode = BreakMode::Ioctl;
    uint32_t breakUs = 176;             ///< Break length (DMX minimum 88)
    uint32_t mabUs = 12;                ///< Mark after break (DMX minimum 8)
    uint32_t breakBaudRate = 9600;      ///< Line rate used by BaudToggle
    uint32_t writeTimeoutMs = 500;      ///< Upper bound on one frame write
    uint32_t openTimeoutMs = 8000;      ///< Upper bound on one open attempt
};

/**
 * @brief Transport statistics
 */
struct TransportStats {
    uint32_t framesSent = 0;        ///< Frames fully written
    uint32_t writeErrors = 0;       ///< Failed sendFrame() calls
    uint32_t opens = 0;             ///< Successful open() calls
    uint32_t lastSendUs = 0;        ///< Duration of the last sendFrame() in microseconds
};

/**
 * @brief Abstract interface for a DMX serial transport
 *
 * Implementations:
 * - SerialPort: Linux tty (termios2, arbitrary baud rates)
 * - MockSerialTransport: in-memory device for tests and --mock runs
 *
 * Threading: the engine never calls open()/sendFrame()/close() from two
 * threads at once. open() runs on a short-lived worker so a hung device can
 * be abandoned; open()/close() run while the scheduler is stopped;
 * sendFrame() runs only on the scheduler thread. getStats() may be called
 * from any thread.
 */
class ISerialTransport {
public:
    virtual ~ISerialTransport() = default;

    /**
     * @brief Open and configure the port
     * @return SERIAL_CONNECTION error with an operator hint on failure
     */
    virtual Result open(const SerialOptions& options) = 0;

    /**
     * @brief Emit break + MAB + frame
     *
     * A failure leaves the port open; the caller decides what to do.
     */
    virtual Result sendFrame(const Frame& frame) = 0;

    /**
     * @brief Drain pending output and release the port. Idempotent.
     */
    virtual Result close() = 0;

    virtual bool isOpen() const = 0;

    /**
     * @brief Short identifier for logs ("serial:/dev/ttyUSB0", "mock")
     */
    virtual std::string getName() const = 0;

    virtual TransportStats getStats() const = 0;
};

} // namespace hal
} // namespace dmxlink
