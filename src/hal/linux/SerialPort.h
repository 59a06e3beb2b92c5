// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SerialPort.h
 * @brief Linux tty implementation of ISerialTransport
 *
 * Uses termios2 (BOTHER) so the 250000 baud DMX rate is set exactly rather
 * than rounded to the nearest Bxxx constant. The port is opened
 * non-blocking and locked with flock() so a second DMX program cannot
 * interleave writes on the same adapter.
 *
 * Break generation:
 *   Ioctl      - TIOCSBRK / sleep breakUs / TIOCCBRK / sleep mabUs
 *   BaudToggle - reconfigure to breakBaudRate, write 0x00, restore baud
 *                (a 0x00 at 9600 baud holds the line low for ~940 us)
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "../interface/ISerialTransport.h"
#include "../../utils/Log.h"

namespace dmxlink {
namespace hal {

/**
 * @brief A candidate serial device found on the host
 */
struct PortInfo {
    std::string path;           ///< /dev node
    std::string driver;         ///< Kernel driver name (ftdi_sio, cdc_acm, ...)
    std::string manufacturer;   ///< USB manufacturer string, if any
    std::string product;        ///< USB product string, if any
    std::string serialNumber;   ///< USB serial number, if any
    std::string vendorId;       ///< USB idVendor (hex), if any
    std::string productId;      ///< USB idProduct (hex), if any
};

class SerialPort : public ISerialTransport {
public:
    explicit SerialPort(utils::LogSink& logSink);
    ~SerialPort() override;

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    // ISerialTransport
    Result open(const SerialOptions& options) override;
    Result sendFrame(const Frame& frame) override;
    Result close() override;
    bool isOpen() const override;
    std::string getName() const override;
    TransportStats getStats() const override;

    /**
     * @brief Enumerate serial devices registered under /sys/class/tty
     *
     * Legacy 8250 placeholders (ttyS* with no hardware behind them) and
     * virtual consoles are skipped. Sorted by path.
     */
    static std::vector<PortInfo> listPorts();

    /**
     * @brief Same as listPorts() against an alternative sysfs class root
     */
    static std::vector<PortInfo> listPorts(const std::string& ttyClassRoot);

private:
    bool applyLineSettings(uint32_t baudRate, bool waitForDrain, int& outErrno);
    Result generateBreak();
    Result writeAll(const uint8_t* data, size_t length);
    bool drain();

    utils::Logger m_log;
    std::atomic<int> m_fd;
    SerialOptions m_options;

    mutable std::mutex m_statsMutex;
    TransportStats m_stats;
};

} // namespace hal
} // namespace dmxlink
