// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SerialPort.cpp
 * @brief Linux tty DMX transport
 *
 * <asm/termbits.h> provides termios2 and must not be mixed with <termios.h>
 * in this translation unit.
 */

#include "SerialPort.h"

#include <asm/termbits.h>
#include <dirent.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <stdlib.h>
#include <sys/file.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <thread>

namespace dmxlink {
namespace hal {

namespace {

using Clock = std::chrono::steady_clock;

void sleepMicros(uint32_t us) {
    std::this_thread::sleep_for(std::chrono::microseconds(us));
}

char parityLetter(Parity parity) {
    switch (parity) {
        case Parity::Even: return 'E';
        case Parity::Odd:  return 'O';
        default:           return 'N';
    }
}

// ==================== sysfs helpers ====================

std::string readSysfsAttr(const std::string& path) {
    std::ifstream in(path);
    std::string value;
    if (in.good()) {
        std::getline(in, value);
    }
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
        value.pop_back();
    }
    return value;
}

bool pathExists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

std::string linkBasename(const std::string& path) {
    char target[PATH_MAX];
    ssize_t len = ::readlink(path.c_str(), target, sizeof(target) - 1);
    if (len <= 0) {
        return std::string();
    }
    target[len] = '\0';
    const char* slash = strrchr(target, '/');
    return slash != nullptr ? std::string(slash + 1) : std::string(target);
}

std::string parentDir(const std::string& path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) {
        return std::string();
    }
    return path.substr(0, slash);
}

/**
 * Walk up from the tty's device node until the USB device directory
 * (the one carrying idVendor) is found.
 */
void fillUsbInfo(const std::string& devicePath, PortInfo& info) {
    char resolved[PATH_MAX];
    if (::realpath(devicePath.c_str(), resolved) == nullptr) {
        return;
    }
    std::string dir(resolved);
    for (int depth = 0; depth < 6 && !dir.empty(); ++depth) {
        if (pathExists(dir + "/idVendor")) {
            info.vendorId = readSysfsAttr(dir + "/idVendor");
            info.productId = readSysfsAttr(dir + "/idProduct");
            info.manufacturer = readSysfsAttr(dir + "/manufacturer");
            info.product = readSysfsAttr(dir + "/product");
            info.serialNumber = readSysfsAttr(dir + "/serial");
            return;
        }
        dir = parentDir(dir);
    }
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

SerialPort::SerialPort(utils::LogSink& logSink)
    : m_log(logSink, "Serial")
    , m_fd(-1)
{
}

SerialPort::~SerialPort() {
    if (isOpen()) {
        Result r = close();
        if (!r.isOk()) {
            m_log.warn("Close on destruction failed: %s", r.message.c_str());
        }
    }
}

// ============================================================================
// ISerialTransport
// ============================================================================

Result SerialPort::open(const SerialOptions& options) {
    if (options.portPath.empty()) {
        return Result::error(ErrorCode::CONFIGURATION, "Serial port path is empty");
    }

    if (isOpen()) {
        m_log.warn("open() while %s is open, closing it first", m_options.portPath.c_str());
        Result closed = close();
        if (!closed.isOk()) {
            m_log.warn("Close before reopen failed: %s", closed.message.c_str());
        }
    }

    const Clock::time_point started = Clock::now();
    const std::string& path = options.portPath;

    int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        return describeOpenError(errno, path);
    }

    // Advisory lock: other DMX tools on Linux take the same lock
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        return describeOpenError(err == EWOULDBLOCK ? EBUSY : err, path);
    }

    if (::ioctl(fd, TIOCEXCL) != 0) {
        m_log.debug("TIOCEXCL not supported on %s (errno=%d)", path.c_str(), errno);
    }

    m_options = options;
    m_fd = fd;

    int err = 0;
    if (!applyLineSettings(options.baudRate, false, err)) {
        ::close(fd);
        m_fd = -1;
        return describeOpenError(err, path);
    }

    // Discard anything a previous owner left queued
    if (::ioctl(fd, TCFLSH, TCIOFLUSH) != 0) {
        m_log.debug("TCFLSH failed on %s (errno=%d)", path.c_str(), errno);
    }

    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
    if (options.openTimeoutMs > 0 && elapsedMs > static_cast<long long>(options.openTimeoutMs)) {
        ::close(fd);
        m_fd = -1;
        char msg[160];
        snprintf(msg, sizeof(msg), "Opening %s took %lld ms (limit %lu ms)",
                 path.c_str(), (long long)elapsedMs, (unsigned long)options.openTimeoutMs);
        return Result::error(ErrorCode::TIMEOUT, msg,
                             "Device is slow to respond. Check the USB connection and adapter power");
    }

    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        m_stats.opens++;
    }

    m_log.info("Opened %s at %lu baud %u%c%u (break=%s %lu/%lu us)",
               path.c_str(), (unsigned long)options.baudRate, (unsigned)options.dataBits,
               parityLetter(options.parity), (unsigned)options.stopBits,
               breakModeName(options.breakMode),
               (unsigned long)options.breakUs, (unsigned long)options.mabUs);
    return Result::success();
}

Result SerialPort::sendFrame(const Frame& frame) {
    if (!isOpen()) {
        return Result::error(ErrorCode::NOT_CONNECTED, "Serial port is not open");
    }

    const Clock::time_point started = Clock::now();

    Result r = generateBreak();
    if (r.isOk()) {
        r = writeAll(frame.data(), frame.size());
    }

    uint32_t elapsedUs = static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - started).count());

    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_stats.lastSendUs = elapsedUs;
    if (r.isOk()) {
        m_stats.framesSent++;
    } else {
        m_stats.writeErrors++;
    }
    return r;
}

Result SerialPort::close() {
    int fd = m_fd.exchange(-1);
    if (fd < 0) {
        return Result::success();
    }

    // Let the final frame leave the UART before the handle goes away
    if (::ioctl(fd, TCSBRK, 1) != 0) {
        m_log.warn("Drain before close failed on %s: %s", m_options.portPath.c_str(), strerror(errno));
    }

    if (::close(fd) != 0) {
        int err = errno;
        char msg[160];
        snprintf(msg, sizeof(msg), "Closing %s failed: %s", m_options.portPath.c_str(), strerror(err));
        m_log.error("%s", msg);
        return Result::error(ErrorCode::SERIAL_CONNECTION, msg);
    }

    m_log.info("Closed %s", m_options.portPath.c_str());
    return Result::success();
}

bool SerialPort::isOpen() const {
    return m_fd.load() >= 0;
}

std::string SerialPort::getName() const {
    return "serial:" + m_options.portPath;
}

TransportStats SerialPort::getStats() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

// ============================================================================
// Line Control
// ============================================================================

bool SerialPort::applyLineSettings(uint32_t baudRate, bool waitForDrain, int& outErrno) {
    struct termios2 tio;
    if (::ioctl(m_fd.load(), TCGETS2, &tio) != 0) {
        outErrno = errno;
        return false;
    }

    // Raw mode
    tio.c_iflag = 0;
    tio.c_oflag = 0;
    tio.c_lflag = 0;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    tio.c_cflag &= ~(CBAUD | (CBAUD << IBSHIFT) | CSIZE | CSTOPB | PARENB | PARODD | CRTSCTS | HUPCL);
    tio.c_cflag |= BOTHER | (BOTHER << IBSHIFT) | CLOCAL | CREAD;

    switch (m_options.dataBits) {
        case 5:  tio.c_cflag |= CS5; break;
        case 6:  tio.c_cflag |= CS6; break;
        case 7:  tio.c_cflag |= CS7; break;
        default: tio.c_cflag |= CS8; break;
    }
    if (m_options.stopBits == 2) {
        tio.c_cflag |= CSTOPB;
    }
    if (m_options.parity == Parity::Even) {
        tio.c_cflag |= PARENB;
    } else if (m_options.parity == Parity::Odd) {
        tio.c_cflag |= PARENB | PARODD;
    }

    tio.c_ispeed = baudRate;
    tio.c_ospeed = baudRate;

    // TCSETSW2 waits for queued output to drain before switching
    if (::ioctl(m_fd.load(), waitForDrain ? TCSETSW2 : TCSETS2, &tio) != 0) {
        outErrno = errno;
        return false;
    }
    return true;
}

Result SerialPort::generateBreak() {
    const int fd = m_fd.load();

    if (m_options.breakMode == BreakMode::BaudToggle) {
        int err = 0;
        if (!applyLineSettings(m_options.breakBaudRate, true, err)) {
            char msg[128];
            snprintf(msg, sizeof(msg), "Switching to break baud %lu failed: %s",
                     (unsigned long)m_options.breakBaudRate, strerror(err));
            return Result::error(ErrorCode::FRAME_SEND, msg);
        }

        const uint8_t zero = 0x00;
        Result r = writeAll(&zero, 1);
        if (!r.isOk()) {
            return r;
        }

        if (!applyLineSettings(m_options.baudRate, true, err)) {
            char msg[128];
            snprintf(msg, sizeof(msg), "Restoring DMX baud %lu failed: %s",
                     (unsigned long)m_options.baudRate, strerror(err));
            return Result::error(ErrorCode::FRAME_SEND, msg);
        }
        sleepMicros(m_options.mabUs);
        return Result::success();
    }

    // The previous frame must be on the wire before the line is pulled low
    if (!drain()) {
        return Result::error(ErrorCode::FRAME_SEND,
                             std::string("Drain before break failed: ") + strerror(errno));
    }

    if (::ioctl(fd, TIOCSBRK) != 0) {
        return Result::error(ErrorCode::FRAME_SEND,
                             std::string("TIOCSBRK failed: ") + strerror(errno),
                             "Adapter does not support break; set port.breakMode to \"baud-toggle\"");
    }
    sleepMicros(m_options.breakUs);
    if (::ioctl(fd, TIOCCBRK) != 0) {
        return Result::error(ErrorCode::FRAME_SEND,
                             std::string("TIOCCBRK failed: ") + strerror(errno));
    }
    sleepMicros(m_options.mabUs);
    return Result::success();
}

Result SerialPort::writeAll(const uint8_t* data, size_t length) {
    const int fd = m_fd.load();
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(m_options.writeTimeoutMs);
    size_t written = 0;

    while (written < length) {
        ssize_t n = ::write(fd, data + written, length - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            int err = errno;
            char msg[160];
            snprintf(msg, sizeof(msg), "Write to %s failed after %u/%u bytes: %s",
                     m_options.portPath.c_str(), (unsigned)written, (unsigned)length, strerror(err));
            const char* hint = (err == EIO || err == ENXIO || err == ENODEV)
                ? "Device not found. Check if device is connected and powered on"
                : "";
            return Result::error(ErrorCode::FRAME_SEND, msg, hint);
        }

        // Kernel buffer full: wait for room until the write deadline
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0) {
            char msg[128];
            snprintf(msg, sizeof(msg), "Write timed out after %lu ms (%u/%u bytes)",
                     (unsigned long)m_options.writeTimeoutMs, (unsigned)written, (unsigned)length);
            return Result::error(ErrorCode::FRAME_SEND, msg);
        }
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int pr = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (pr < 0 && errno != EINTR) {
            return Result::error(ErrorCode::FRAME_SEND, std::string("poll failed: ") + strerror(errno));
        }
        if (pr > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
            return Result::error(ErrorCode::FRAME_SEND, "Serial device hung up",
                                 "Device not found. Check if device is connected and powered on");
        }
    }
    return Result::success();
}

bool SerialPort::drain() {
    // TCSBRK with a non-zero argument is tcdrain()
    while (::ioctl(m_fd.load(), TCSBRK, 1) != 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Port Enumeration
// ============================================================================

std::vector<PortInfo> SerialPort::listPorts() {
    return listPorts("/sys/class/tty");
}

std::vector<PortInfo> SerialPort::listPorts(const std::string& ttyClassRoot) {
    std::vector<PortInfo> ports;

    DIR* dir = ::opendir(ttyClassRoot.c_str());
    if (dir == nullptr) {
        return ports;
    }

    while (struct dirent* entry = ::readdir(dir)) {
        const std::string name(entry->d_name);
        if (name == "." || name == "..") {
            continue;
        }

        // Only ttys backed by a device; virtual consoles have none
        const std::string base = ttyClassRoot + "/" + name;
        const std::string device = base + "/device";
        if (!pathExists(device)) {
            continue;
        }

        PortInfo info;
        info.path = "/dev/" + name;
        info.driver = linkBasename(device + "/driver");

        // Legacy 8250 ports are always registered, hardware or not
        if (info.driver == "serial8250") {
            continue;
        }

        fillUsbInfo(device, info);
        ports.push_back(info);
    }
    ::closedir(dir);

    std::sort(ports.begin(), ports.end(), [](const PortInfo& a, const PortInfo& b) {
        return a.path < b.path;
    });
    return ports;
}

} // namespace hal
} // namespace dmxlink
