// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * DmxLink - Serial Helper Unit Tests
 *
 * Tests that need no hardware:
 * - errno -> operator hint mapping
 * - Parity / break mode names
 * - SerialPort failure paths (missing device, not a tty, closed port)
 * - Port enumeration against a fabricated /sys/class/tty tree
 * - Open, frame and close against a pseudo-terminal
 */

#include <unity.h>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

#include "../../src/hal/interface/ISerialTransport.h"
#include "../../src/hal/linux/SerialPort.h"

using namespace dmxlink;
using namespace dmxlink::hal;

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

void writeFile(const std::string& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

void makeDir(const std::string& path) {
    ::mkdir(path.c_str(), 0755);
}

void makeLink(const std::string& target, const std::string& linkPath) {
    if (::symlink(target.c_str(), linkPath.c_str()) != 0) {
        TEST_FAIL_MESSAGE("symlink() failed while building fake sysfs");
    }
}

/**
 * Builds:
 *   <root>/devices/usb1/1-1/            idVendor, idProduct, manufacturer, product, serial
 *   <root>/devices/usb1/1-1/1-1:1.0/    (tty device, driver -> ftdi_sio)
 *   <root>/devices/platform/serial8250/ (driver -> serial8250)
 *   <root>/devices/acm/                 (driver -> cdc_acm, no USB attributes)
 *   <root>/class/ttyUSB0/device -> usb interface
 *   <root>/class/ttyACM0/device -> acm
 *   <root>/class/ttyS0/device   -> serial8250
 *   <root>/class/tty0/          (no device link)
 */
std::string buildFakeSysfs() {
    char templ[] = "/tmp/dmxlink_sysfs_XXXXXX";
    char* made = ::mkdtemp(templ);
    if (made == nullptr) {
        return std::string();
    }
    std::string root(made);

    makeDir(root + "/devices");
    makeDir(root + "/devices/usb1");
    makeDir(root + "/devices/usb1/1-1");
    writeFile(root + "/devices/usb1/1-1/idVendor", "0403\n");
    writeFile(root + "/devices/usb1/1-1/idProduct", "6001\n");
    writeFile(root + "/devices/usb1/1-1/manufacturer", "FTDI\n");
    writeFile(root + "/devices/usb1/1-1/product", "DMX USB PRO\n");
    writeFile(root + "/devices/usb1/1-1/serial", "EN123456\n");
    makeDir(root + "/devices/usb1/1-1/1-1:1.0");
    makeLink("../../../../bus/usb-serial/drivers/ftdi_sio", root + "/devices/usb1/1-1/1-1:1.0/driver");

    makeDir(root + "/devices/platform");
    makeDir(root + "/devices/platform/serial8250");
    makeLink("../../../bus/platform/drivers/serial8250", root + "/devices/platform/serial8250/driver");

    makeDir(root + "/devices/acm");
    makeLink("../../bus/usb/drivers/cdc_acm", root + "/devices/acm/driver");

    makeDir(root + "/class");
    makeDir(root + "/class/ttyUSB0");
    makeLink(root + "/devices/usb1/1-1/1-1:1.0", root + "/class/ttyUSB0/device");
    makeDir(root + "/class/ttyACM0");
    makeLink(root + "/devices/acm", root + "/class/ttyACM0/device");
    makeDir(root + "/class/ttyS0");
    makeLink(root + "/devices/platform/serial8250", root + "/class/ttyS0/device");
    makeDir(root + "/class/tty0");
    return root;
}

void removeTree(const std::string& root) {
    std::string cmd = "rm -rf '" + root + "'";
    if (std::system(cmd.c_str()) != 0) {
        printf("  warning: could not remove %s\n", root.c_str());
    }
}

} // namespace

//==============================================================================
// Open Error Hints
//==============================================================================

void test_serial_hint_permission_denied() {
    Result r = describeOpenError(EACCES, "/dev/ttyUSB0");
    TEST_ASSERT_TRUE(r.code == ErrorCode::SERIAL_CONNECTION);
    TEST_ASSERT_TRUE(contains(r.hint, "permissions"));
    TEST_ASSERT_TRUE(contains(r.hint, "sudo chmod 666 /dev/ttyUSB0"));
    TEST_ASSERT_TRUE(contains(r.hint, "dialout"));
    TEST_ASSERT_TRUE(contains(r.message, "/dev/ttyUSB0"));
}

void test_serial_hint_device_not_found() {
    Result r = describeOpenError(ENOENT, "/dev/ttyUSB9");
    TEST_ASSERT_TRUE(r.code == ErrorCode::SERIAL_CONNECTION);
    TEST_ASSERT_TRUE(contains(r.hint, "Device not found"));
    TEST_ASSERT_TRUE(contains(describeOpenError(ENODEV, "/dev/x").hint, "Device not found"));
}

void test_serial_hint_port_busy() {
    Result r = describeOpenError(EBUSY, "/dev/ttyUSB0");
    TEST_ASSERT_TRUE(contains(r.hint, "in use by another application"));
    TEST_ASSERT_TRUE(contains(r.hint, "/dev/ttyUSB0"));
}

void test_serial_hint_generic_fallback() {
    Result r = describeOpenError(EIO, "/dev/ttyUSB0");
    TEST_ASSERT_TRUE(r.code == ErrorCode::SERIAL_CONNECTION);
    TEST_ASSERT_FALSE(r.hint.empty());
}

//==============================================================================
// Names
//==============================================================================

void test_serial_parity_names() {
    Parity p = Parity::None;
    TEST_ASSERT_TRUE(parseParity("EVEN", p));
    TEST_ASSERT_TRUE(p == Parity::Even);
    TEST_ASSERT_TRUE(parseParity("odd", p));
    TEST_ASSERT_TRUE(p == Parity::Odd);
    TEST_ASSERT_FALSE(parseParity("mark", p));
    TEST_ASSERT_EQUAL_STRING("none", parityName(Parity::None));
}

void test_serial_break_mode_names() {
    BreakMode m = BreakMode::Ioctl;
    TEST_ASSERT_TRUE(parseBreakMode("baud-toggle", m));
    TEST_ASSERT_TRUE(m == BreakMode::BaudToggle);
    TEST_ASSERT_TRUE(parseBreakMode("IOCTL", m));
    TEST_ASSERT_TRUE(m == BreakMode::Ioctl);
    TEST_ASSERT_FALSE(parseBreakMode("gpio", m));
    TEST_ASSERT_EQUAL_STRING("baud-toggle", breakModeName(BreakMode::BaudToggle));
}

void test_serial_default_options_are_dmx512() {
    SerialOptions options;
    TEST_ASSERT_EQUAL_UINT32(250000, options.baudRate);
    TEST_ASSERT_EQUAL_UINT8(8, options.dataBits);
    TEST_ASSERT_EQUAL_UINT8(2, options.stopBits);
    TEST_ASSERT_TRUE(options.parity == Parity::None);
    TEST_ASSERT_TRUE(options.breakUs >= 88);
    TEST_ASSERT_TRUE(options.mabUs >= 8);
}

//==============================================================================
// SerialPort Failure Paths
//==============================================================================

void test_serial_open_missing_device() {
    utils::LogSink sink(utils::LogLevel::None);
    SerialPort port(sink);
    SerialOptions options;
    options.portPath = "/dev/ttyDMXLINK_DOES_NOT_EXIST";

    Result r = port.open(options);
    TEST_ASSERT_TRUE(r.code == ErrorCode::SERIAL_CONNECTION);
    TEST_ASSERT_TRUE(contains(r.hint, "Device not found"));
    TEST_ASSERT_FALSE(port.isOpen());
}

void test_serial_open_empty_path() {
    utils::LogSink sink(utils::LogLevel::None);
    SerialPort port(sink);
    SerialOptions options;
    Result r = port.open(options);
    TEST_ASSERT_TRUE(r.code == ErrorCode::CONFIGURATION);
}

void test_serial_open_non_tty_fails() {
    utils::LogSink sink(utils::LogLevel::None);
    SerialPort port(sink);
    SerialOptions options;
    options.portPath = "/dev/null";

    Result r = port.open(options);
    TEST_ASSERT_TRUE(r.code == ErrorCode::SERIAL_CONNECTION);
    TEST_ASSERT_FALSE(port.isOpen());
}

void test_serial_send_and_close_when_closed() {
    utils::LogSink sink(utils::LogLevel::None);
    SerialPort port(sink);
    Result r = port.sendFrame(Frame());
    TEST_ASSERT_TRUE(r.code == ErrorCode::NOT_CONNECTED);
    TEST_ASSERT_TRUE(port.close().isOk());
    TEST_ASSERT_TRUE(port.close().isOk());
    TEST_ASSERT_EQUAL_UINT32(0, port.getStats().framesSent);
}

void test_serial_pty_open_send_close() {
    int master = ::posix_openpt(O_RDWR | O_NOCTTY);
    if (master < 0) {
        TEST_IGNORE_MESSAGE("No pseudo-terminal support");
    }
    if (::grantpt(master) != 0 || ::unlockpt(master) != 0 || ::ptsname(master) == nullptr) {
        ::close(master);
        TEST_IGNORE_MESSAGE("Pseudo-terminal setup failed");
    }
    const std::string slavePath = ::ptsname(master);

    utils::LogSink sink(utils::LogLevel::None);
    SerialPort port(sink);
    SerialOptions options;
    options.portPath = slavePath;

    Result r = port.open(options);
    TEST_ASSERT_TRUE_MESSAGE(r.isOk(), r.message.c_str());
    TEST_ASSERT_TRUE(port.isOpen());

    std::array<uint8_t, DMX_CHANNEL_COUNT> channels;
    channels.fill(0);
    channels[0] = 255;
    channels[511] = 7;
    TEST_ASSERT_TRUE(port.sendFrame(Frame(channels)).isOk());

    // The frame arrives on the master side unmodified (raw mode)
    uint8_t received[DMX_FRAME_SIZE];
    size_t got = 0;
    for (int i = 0; i < 50 && got < sizeof(received); ++i) {
        struct pollfd pfd;
        pfd.fd = master;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (::poll(&pfd, 1, 20) > 0) {
            ssize_t n = ::read(master, received + got, sizeof(received) - got);
            if (n > 0) {
                got += static_cast<size_t>(n);
            }
        }
    }
    TEST_ASSERT_EQUAL_UINT32(DMX_FRAME_SIZE, got);
    TEST_ASSERT_EQUAL_UINT8(DMX_START_CODE, received[0]);
    TEST_ASSERT_EQUAL_UINT8(255, received[1]);
    TEST_ASSERT_EQUAL_UINT8(7, received[512]);

    TransportStats stats = port.getStats();
    TEST_ASSERT_EQUAL_UINT32(1, stats.opens);
    TEST_ASSERT_EQUAL_UINT32(1, stats.framesSent);
    TEST_ASSERT_EQUAL_UINT32(0, stats.writeErrors);

    TEST_ASSERT_TRUE(port.close().isOk());
    TEST_ASSERT_FALSE(port.isOpen());
    ::close(master);
}

//==============================================================================
// Port Enumeration
//==============================================================================

void test_serial_list_ports_fake_sysfs() {
    std::string root = buildFakeSysfs();
    TEST_ASSERT_FALSE_MESSAGE(root.empty(), "mkdtemp failed");

    std::vector<PortInfo> ports = SerialPort::listPorts(root + "/class");
    removeTree(root);

    // ttyS0 (serial8250) and tty0 (no device) are skipped; sorted by path
    TEST_ASSERT_EQUAL_UINT32(2, ports.size());
    TEST_ASSERT_EQUAL_STRING("/dev/ttyACM0", ports[0].path.c_str());
    TEST_ASSERT_EQUAL_STRING("cdc_acm", ports[0].driver.c_str());
    TEST_ASSERT_TRUE(ports[0].vendorId.empty());

    TEST_ASSERT_EQUAL_STRING("/dev/ttyUSB0", ports[1].path.c_str());
    TEST_ASSERT_EQUAL_STRING("ftdi_sio", ports[1].driver.c_str());
    TEST_ASSERT_EQUAL_STRING("0403", ports[1].vendorId.c_str());
    TEST_ASSERT_EQUAL_STRING("6001", ports[1].productId.c_str());
    TEST_ASSERT_EQUAL_STRING("FTDI", ports[1].manufacturer.c_str());
    TEST_ASSERT_EQUAL_STRING("DMX USB PRO", ports[1].product.c_str());
    TEST_ASSERT_EQUAL_STRING("EN123456", ports[1].serialNumber.c_str());
}

void test_serial_list_ports_missing_root() {
    std::vector<PortInfo> ports = SerialPort::listPorts("/nonexistent/dmxlink/tty");
    TEST_ASSERT_EQUAL_UINT32(0, ports.size());
}

void run_serial_helper_tests() {
    RUN_TEST(test_serial_hint_permission_denied);
    RUN_TEST(test_serial_hint_device_not_found);
    RUN_TEST(test_serial_hint_port_busy);
    RUN_TEST(test_serial_hint_generic_fallback);
    RUN_TEST(test_serial_parity_names);
    RUN_TEST(test_serial_break_mode_names);
    RUN_TEST(test_serial_default_options_are_dmx512);
    RUN_TEST(test_serial_open_missing_device);
    RUN_TEST(test_serial_open_empty_path);
    RUN_TEST(test_serial_open_non_tty_fails);
    RUN_TEST(test_serial_send_and_close_when_closed);
    RUN_TEST(test_serial_pty_open_send_close);
    RUN_TEST(test_serial_list_ports_fake_sysfs);
    RUN_TEST(test_serial_list_ports_missing_root);
}
