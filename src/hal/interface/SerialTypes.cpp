// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#include "ISerialTransport.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <strings.h>

namespace dmxlink {
namespace hal {

const char* parityName(Parity parity) {
    switch (parity) {
        case Parity::Even: return "even";
        case Parity::Odd:  return "odd";
        case Parity::None:
        default:           return "none";
    }
}

bool parseParity(const char* name, Parity& out) {
    if (name == nullptr) return false;
    if (strcasecmp(name, "none") == 0) { out = Parity::None; return true; }
    if (strcasecmp(name, "even") == 0) { out = Parity::Even; return true; }
    if (strcasecmp(name, "odd") == 0)  { out = Parity::Odd;  return true; }
    return false;
}

const char* breakModeName(BreakMode mode) {
    return mode == BreakMode::BaudToggle ? "baud-toggle" : "ioctl";
}

bool parseBreakMode(const char* name, BreakMode& out) {
    if (name == nullptr) return false;
    if (strcasecmp(name, "ioctl") == 0) { out = BreakMode::Ioctl; return true; }
    if (strcasecmp(name, "baud-toggle") == 0 || strcasecmp(name, "baudtoggle") == 0) {
        out = BreakMode::BaudToggle;
        return true;
    }
    return false;
}

Result describeOpenError(int err, const std::string& path) {
    char msg[192];
    snprintf(msg, sizeof(msg), "Failed to open %s: %s (errno=%d)", path.c_str(), strerror(err), err);

    std::string hint;
    switch (err) {
        case EACCES:
        case EPERM:
            hint = "Check port permissions. Try: sudo chmod 666 " + path +
                   " or add your user to the dialout group (sudo usermod -aG dialout $USER)";
            break;
        case ENOENT:
        case ENODEV:
        case ENXIO:
            hint = "Device not found. Check if device is connected and powered on, "
                   "and that the USB cable and serial driver are working";
            break;
        case EBUSY:
            hint = "Port is in use by another application. Close other DMX software using " + path;
            break;
        case ENOTTY:
        case EINVAL:
            hint = "Check that " + path + " is a serial device that supports the requested baud rate";
            break;
        default:
            hint = "Check the port path and the adapter connection";
            break;
    }
    return Result::error(ErrorCode::SERIAL_CONNECTION, msg, hint);
}

} // namespace hal
} // namespace dmxlink
