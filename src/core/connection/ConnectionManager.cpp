// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#include "ConnectionManager.h"

#include <chrono>
#include <cmath>
#include <cstdio>

namespace dmxlink {
namespace connection {

using actors::Message;
using actors::MessageType;

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Degraded:     return "Degraded";
        case ConnectionState::Failed:       return "Failed";
        default:                            return "Unknown";
    }
}

uint32_t retryDelayForAttempt(const RetryPolicy& policy, uint32_t attempt) {
    if (attempt <= 1) {
        return 0;
    }
    double delay = static_cast<double>(policy.retryDelayMs) *
                   std::pow(policy.backoffMultiplier, static_cast<double>(attempt - 2));
    if (delay > static_cast<double>(policy.maxRetryDelayMs)) {
        return policy.maxRetryDelayMs;
    }
    return static_cast<uint32_t>(delay);
}

// ============================================================================
// Supervisor
// ============================================================================

namespace {

constexpr uint32_t RELEASE_POLL_MS = 5;

actors::ActorConfig supervisorConfig() {
    return actors::ActorConfig(
        "Supervisor",   // name
        32,             // queueSize
        0,              // tickIntervalMs (event-driven until a pulse is pending)
        2000            // stopTimeoutMs
    );
}

} // namespace

ConnectionManager::Supervisor::Supervisor(ConnectionManager& owner, utils::LogSink& logSink)
    : actors::Actor(supervisorConfig(), logSink)
    , m_owner(owner)
{
}

ConnectionManager::Supervisor::~Supervisor() {
    stop();
}

void ConnectionManager::Supervisor::onMessage(const Message& msg) {
    switch (msg.type) {
        case MessageType::RECONNECT:
            m_owner.handleReconnect(msg.param4);
            break;

        case MessageType::RELEASE_CHANNEL: {
            // param1/param2 = channel (hi/lo), param4 = hold time
            int channel = (static_cast<int>(msg.param1) << 8) | msg.param2;
            m_pendingReleases[channel] = msg.timestamp + msg.param4;
            if (getTickInterval() == 0) {
                setTickInterval(RELEASE_POLL_MS);
            }
            break;
        }

        default:
            log().debug("Unhandled message type 0x%02X", static_cast<uint8_t>(msg.type));
            break;
    }
}

void ConnectionManager::Supervisor::onTick() {
    const uint32_t now = getTickCount();
    for (auto it = m_pendingReleases.begin(); it != m_pendingReleases.end();) {
        if (static_cast<int32_t>(now - it->second) >= 0) {
            Result r = m_owner.m_buffer.setChannel(it->first, 0);
            if (!r.isOk()) {
                log().warn("Pulse release failed: %s", r.message.c_str());
            }
            it = m_pendingReleases.erase(it);
        } else {
            ++it;
        }
    }
    if (m_pendingReleases.empty()) {
        setTickInterval(0);
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

ConnectionManager::ConnectionManager(hal::ISerialTransport& transport, utils::LogSink& logSink)
    : m_log(logSink, "Connection")
    , m_transport(transport)
    , m_scheduler(m_buffer, transport, m_stats, logSink)
    , m_state(ConnectionState::Disconnected)
    , m_frameRateHz(scheduler::DEFAULT_FRAME_RATE_HZ)
    , m_reconnectOnFailure(true)
    , m_epoch(0)
    , m_shuttingDown(false)
    , m_openDone(true)
    , m_openAbandoned(false)
    , m_supervisor(*this, logSink)
{
    m_scheduler.setListener(this);
    m_supervisor.start();
}

ConnectionManager::~ConnectionManager() {
    m_shuttingDown = true;
    Result r = disconnect();
    if (!r.isOk()) {
        m_log.warn("Disconnect during shutdown: %s", r.message.c_str());
    }
    m_supervisor.stop();
    m_scheduler.stop();
    m_scheduler.setListener(nullptr);

    // The transport must outlive an abandoned open
    if (m_openThread.joinable()) {
        m_log.info("Waiting for a pending open to finish");
        m_openThread.join();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

Result ConnectionManager::validateOptions(const ConnectOptions& options) {
    char msg[128];
    const hal::SerialOptions& s = options.serial;

    if (s.portPath.empty()) {
        return Result::error(ErrorCode::CONFIGURATION, "Port path is required");
    }
    if (s.baudRate == 0) {
        return Result::error(ErrorCode::CONFIGURATION, "Baud rate must be positive");
    }
    if (s.dataBits < 5 || s.dataBits > 8) {
        snprintf(msg, sizeof(msg), "dataBits %u outside 5-8", (unsigned)s.dataBits);
        return Result::error(ErrorCode::CONFIGURATION, msg);
    }
    if (s.stopBits < 1 || s.stopBits > 2) {
        snprintf(msg, sizeof(msg), "stopBits %u outside 1-2", (unsigned)s.stopBits);
        return Result::error(ErrorCode::CONFIGURATION, msg);
    }
    if (s.breakUs < 88) {
        snprintf(msg, sizeof(msg), "Break %lu us is below the DMX512 minimum of 88 us", (unsigned long)s.breakUs);
        return Result::error(ErrorCode::CONFIGURATION, msg);
    }
    if (s.mabUs < 8) {
        snprintf(msg, sizeof(msg), "MAB %lu us is below the DMX512 minimum of 8 us", (unsigned long)s.mabUs);
        return Result::error(ErrorCode::CONFIGURATION, msg);
    }
    if (!scheduler::isValidFrameRate(options.frameRateHz)) {
        snprintf(msg, sizeof(msg), "Frame rate %lu Hz outside %lu-%lu Hz",
                 (unsigned long)options.frameRateHz,
                 (unsigned long)scheduler::MIN_FRAME_RATE_HZ, (unsigned long)scheduler::MAX_FRAME_RATE_HZ);
        return Result::error(ErrorCode::CONFIGURATION, msg);
    }
    if (options.retry.maxRetries < 1) {
        return Result::error(ErrorCode::CONFIGURATION, "maxRetries must be at least 1");
    }
    if (options.retry.connectTimeoutMs == 0) {
        return Result::error(ErrorCode::CONFIGURATION, "connectTimeoutMs must be positive");
    }
    if (!(options.retry.backoffMultiplier >= 1.0)) {
        return Result::error(ErrorCode::CONFIGURATION, "backoffMultiplier must be >= 1.0");
    }
    return Result::success();
}

Result ConnectionManager::connect(const std::string& portPath, const ConnectOptions& options) {
    ConnectOptions withPath = options;
    withPath.serial.portPath = portPath;
    return connect(withPath);
}

Result ConnectionManager::connect(const ConnectOptions& options) {
    Result valid = validateOptions(options);
    if (!valid.isOk()) {
        m_log.error("Invalid options: %s", valid.message.c_str());
        m_errors.record(valid);
        return valid;
    }

    // Cancel a background reconnect or a connect still backing off
    const uint32_t epoch = beginEpoch();

    Result result;
    bus::EngineEvent event(bus::EngineEventType::CONNECTED);
    bool publishEvent = false;
    bool disconnectedOld = false;
    {
        std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
        if (m_epoch.load() != epoch) {
            return Result::error(ErrorCode::CANCELLED, "connect() superseded by a newer request");
        }

        const ConnectionState current = m_state.load();
        const std::string currentPath = getOptions().serial.portPath;

        if (current == ConnectionState::Connected && m_transport.isOpen()) {
            if (currentPath == options.serial.portPath) {
                m_log.info("Already connected to %s", currentPath.c_str());
                return Result::success();
            }
            m_log.info("Switching from %s to %s", currentPath.c_str(), options.serial.portPath.c_str());
            m_scheduler.stop();
            m_scheduler.setLinkActive(false);
            m_buffer.blackout();
            Result finalFrame = m_transport.sendFrame(m_buffer.snapshot());
            if (!finalFrame.isOk()) {
                m_log.warn("Blackout on %s failed: %s", currentPath.c_str(), finalFrame.message.c_str());
            }
            disconnectedOld = true;
        }

        // Whatever was running (degraded link, stale handle) goes away
        teardownLink();

        {
            std::lock_guard<std::mutex> lock(m_optionsMutex);
            m_options = options;
        }
        m_frameRateHz = options.frameRateHz;
        m_reconnectOnFailure = options.retry.reconnectOnSendFailure;

        setState(ConnectionState::Connecting);
        m_log.info("Connecting to %s (%lu attempt(s), timeout %lu ms)",
                   options.serial.portPath.c_str(), (unsigned long)options.retry.maxRetries,
                   (unsigned long)options.retry.connectTimeoutMs);

        uint32_t attempt = 0;
        result = runAttempts(options, epoch, attempt);

        if (result.code == ErrorCode::CANCELLED) {
            // The request that cancelled us owns the state from here
            m_log.info("Connect to %s cancelled", options.serial.portPath.c_str());
        } else if (!result.isOk()) {
            setState(ConnectionState::Failed);
            m_errors.record(result);
            m_log.error("%s", result.message.c_str());
            if (!result.hint.empty()) {
                m_log.error("Hint: %s", result.hint.c_str());
            }
            event = bus::EngineEvent(bus::EngineEventType::ERROR);
            event.error = result;
            event.fatal = true;
            event.attempt = attempt;
            publishEvent = true;
        } else {
            m_stats.reset();
            startTransmitting();
            event.attempt = attempt;
            publishEvent = true;
            m_log.info("Connected to %s on attempt %lu", options.serial.portPath.c_str(), (unsigned long)attempt);
        }
    }

    if (disconnectedOld) {
        m_bus.publish(bus::EngineEvent(bus::EngineEventType::DISCONNECTED));
    }
    if (publishEvent) {
        m_bus.publish(event);
    }
    return result;
}

Result ConnectionManager::disconnect() {
    beginEpoch();

    Result closed;
    {
        std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

        if (m_state.load() == ConnectionState::Disconnected && !m_transport.isOpen()) {
            return Result::success();
        }

        // No transmission happens after this returns
        m_scheduler.stop();
        m_scheduler.setLinkActive(false);

        // Best effort: leave the fixture dark
        m_buffer.blackout();
        if (openInFlight()) {
            m_log.info("Open still in progress, it will close the port when it completes");
        } else {
            if (m_transport.isOpen()) {
                Result finalFrame = m_transport.sendFrame(m_buffer.snapshot());
                if (!finalFrame.isOk()) {
                    m_log.warn("Final blackout frame failed: %s", finalFrame.message.c_str());
                    m_errors.record(finalFrame);
                }
            }

            closed = m_transport.close();
            if (!closed.isOk()) {
                m_errors.record(closed);
            }
        }
        setState(ConnectionState::Disconnected);
        m_log.info("Disconnected");
    }

    m_bus.publish(bus::EngineEvent(bus::EngineEventType::DISCONNECTED));
    return closed;
}

// ============================================================================
// Channel Control
// ============================================================================

Result ConnectionManager::setChannel(int channel, double value) {
    return m_buffer.setChannel(channel, value);
}

buffer::ChannelBatchResult ConnectionManager::setChannels(const std::map<int, double>& values) {
    return m_buffer.setChannels(values);
}

void ConnectionManager::blackout() {
    m_buffer.blackout();
}

Result ConnectionManager::getChannel(int channel, uint8_t& outValue) const {
    return m_buffer.getChannel(channel, outValue);
}

Frame ConnectionManager::snapshot() const {
    return m_buffer.snapshot();
}

Result ConnectionManager::pulseChannel(int channel, double value, uint32_t holdMs) {
    Result r = m_buffer.setChannel(channel, value);
    if (!r.isOk()) {
        return r;
    }

    Message release(MessageType::RELEASE_CHANNEL,
                    static_cast<uint8_t>((channel >> 8) & 0xFF),
                    static_cast<uint8_t>(channel & 0xFF),
                    0, holdMs);
    if (!m_supervisor.send(release)) {
        // Never leave a pulse latched
        Result cleared = m_buffer.setChannel(channel, 0);
        if (!cleared.isOk()) {
            m_log.warn("Pulse rollback failed: %s", cleared.message.c_str());
        }
        return Result::error(ErrorCode::TIMEOUT, "Pulse release could not be scheduled (supervisor busy)");
    }
    return Result::success();
}

Result ConnectionManager::setFrameRate(uint32_t frameRateHz) {
    Result r = m_scheduler.setFrameRate(frameRateHz);
    if (!r.isOk()) {
        return r;
    }
    m_frameRateHz = frameRateHz;
    std::lock_guard<std::mutex> lock(m_optionsMutex);
    m_options.frameRateHz = frameRateHz;
    return r;
}

// ============================================================================
// Observation
// ============================================================================

stats::Statistics ConnectionManager::getStatistics() const {
    stats::Statistics s = m_stats.snapshot();
    s.connected = isConnected();
    return s;
}

hal::TransportStats ConnectionManager::getTransportStats() const {
    return m_transport.getStats();
}

errors::ErrorStats ConnectionManager::getErrorStats() const {
    return m_errors.getStats();
}

void ConnectionManager::clearErrorHistory() {
    m_errors.clear();
}

ConnectOptions ConnectionManager::getOptions() const {
    std::lock_guard<std::mutex> lock(m_optionsMutex);
    return m_options;
}

bus::Subscription ConnectionManager::subscribe(bus::IEngineListener* listener, uint8_t mask) {
    return m_bus.subscribe(listener, mask);
}

// ============================================================================
// Scheduler Callbacks (scheduler thread)
// ============================================================================

void ConnectionManager::onFrameSent(const Frame& frame) {
    if (!m_reconnectOnFailure.load()) {
        ConnectionState expected = ConnectionState::Degraded;
        if (m_state.compare_exchange_strong(expected, ConnectionState::Connected)) {
            m_log.info("Link recovered");
            bus::EngineEvent up(bus::EngineEventType::CONNECTED);
            m_bus.publish(up);
        }
    }

    bus::EngineEvent event(bus::EngineEventType::FRAME);
    event.frame = &frame;
    event.frameCount = m_stats.snapshot().frameCount;
    m_bus.publish(event);
}

void ConnectionManager::onSendFailed(const Result& error) {
    m_errors.record(error);

    ConnectionState expected = ConnectionState::Connected;
    if (!m_state.compare_exchange_strong(expected, ConnectionState::Degraded)) {
        return; // Already degraded; one reconnect is enough
    }

    m_log.warn("Link degraded: %s", error.message.c_str());

    bus::EngineEvent event(bus::EngineEventType::DEGRADED);
    event.error = error;
    m_bus.publish(event);

    if (!m_reconnectOnFailure.load()) {
        return; // Keep transmitting; the next good frame restores Connected
    }

    m_scheduler.setLinkActive(false);
    if (!m_supervisor.send(Message(MessageType::RECONNECT, 0, 0, 0, m_epoch.load()))) {
        m_log.error("Could not schedule reconnect");
    }
}

// ============================================================================
// Background Reconnect (supervisor thread)
// ============================================================================

void ConnectionManager::handleReconnect(uint32_t epoch) {
    if (m_epoch.load() != epoch) {
        return; // Superseded by connect()/disconnect()
    }

    bus::EngineEvent event(bus::EngineEventType::CONNECTED);
    {
        std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
        if (m_epoch.load() != epoch || m_state.load() != ConnectionState::Degraded) {
            return;
        }

        const ConnectOptions options = getOptions();
        m_log.warn("Reconnecting to %s", options.serial.portPath.c_str());
        teardownLink();

        uint32_t attempt = 0;
        Result result = runAttempts(options, epoch, attempt);

        if (result.code == ErrorCode::CANCELLED) {
            return;
        }

        if (!result.isOk()) {
            setState(ConnectionState::Failed);
            m_errors.record(result);
            m_log.error("Reconnect failed, fixture holds its last frame; call connect() to resume: %s",
                        result.message.c_str());
            event = bus::EngineEvent(bus::EngineEventType::ERROR);
            event.error = result;
            event.fatal = true;
            event.attempt = attempt;
        } else {
            startTransmitting();
            event.attempt = attempt;
            m_log.info("Reconnected to %s on attempt %lu", options.serial.portPath.c_str(), (unsigned long)attempt);
        }
    }
    m_bus.publish(event);
}

// ============================================================================
// Private Helpers
// ============================================================================

Result ConnectionManager::runAttempts(const ConnectOptions& options, uint32_t epoch, uint32_t& outAttempt) {
    Result last;
    const RetryPolicy& policy = options.retry;

    hal::SerialOptions serial = options.serial;
    serial.openTimeoutMs = policy.connectTimeoutMs;

    for (uint32_t attempt = 1; attempt <= policy.maxRetries; ++attempt) {
        outAttempt = attempt;

        if (attempt > 1) {
            uint32_t delay = retryDelayForAttempt(policy, attempt);
            m_log.warn("Retrying connection in %lu ms... (attempt %lu/%lu)",
                       (unsigned long)delay, (unsigned long)attempt, (unsigned long)policy.maxRetries);
            if (!waitForRetry(delay, epoch)) {
                return Result::error(ErrorCode::CANCELLED, "Connection attempt cancelled");
            }
        }
        if (m_epoch.load() != epoch) {
            return Result::error(ErrorCode::CANCELLED, "Connection attempt cancelled");
        }

        Result r = openWithTimeout(serial, policy.connectTimeoutMs, epoch);
        if (r.code == ErrorCode::CANCELLED) {
            return r;
        }

        if (r.isOk() && m_epoch.load() != epoch) {
            // disconnect() or a newer connect() arrived while open() ran
            Result closed = m_transport.close();
            if (!closed.isOk()) {
                m_log.warn("Close of superseded connection failed: %s", closed.message.c_str());
            }
            return Result::error(ErrorCode::CANCELLED, "Connection attempt cancelled");
        }

        if (r.isOk()) {
            return r;
        }

        last = r;
        m_errors.record(r);
        m_log.warn("Connection attempt %lu/%lu failed: %s", (unsigned long)attempt,
                   (unsigned long)policy.maxRetries, r.message.c_str());

        if (r.code == ErrorCode::CONFIGURATION) {
            return r; // Never retried
        }
    }

    char msg[320];
    snprintf(msg, sizeof(msg), "Failed after %lu attempts: %s",
             (unsigned long)policy.maxRetries, last.message.c_str());
    return Result::error(ErrorCode::SERIAL_CONNECTION, msg, last.hint);
}

Result ConnectionManager::openWithTimeout(const hal::SerialOptions& serial, uint32_t timeoutMs, uint32_t epoch) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    auto settled = [&] {
        return m_openDone || m_epoch.load() != epoch || m_shuttingDown.load();
    };

    std::unique_lock<std::mutex> lock(m_cancelMutex);

    // A previously abandoned open still owns the transport
    if (m_openThread.joinable()) {
        m_cancelCv.wait_until(lock, deadline, settled);
        if (!m_openDone) {
            if (m_epoch.load() != epoch || m_shuttingDown.load()) {
                return Result::error(ErrorCode::CANCELLED, "Connection attempt cancelled");
            }
            char msg[160];
            snprintf(msg, sizeof(msg), "Previous open of %s still pending after %lu ms",
                     serial.portPath.c_str(), (unsigned long)timeoutMs);
            return Result::error(ErrorCode::TIMEOUT, msg,
                                 "Device is slow to respond. Check the USB connection and adapter power");
        }
        lock.unlock();
        m_openThread.join();
        lock.lock();
    }

    m_openDone = false;
    m_openAbandoned = false;
    m_openResult = Result();
    m_openThread = std::thread(&ConnectionManager::runOpenWorker, this, serial);

    m_cancelCv.wait_until(lock, deadline, settled);
    if (m_openDone) {
        Result r = m_openResult;
        lock.unlock();
        m_openThread.join();
        return r;
    }

    m_openAbandoned = true;
    if (m_epoch.load() != epoch || m_shuttingDown.load()) {
        return Result::error(ErrorCode::CANCELLED, "Connection attempt cancelled");
    }

    char msg[160];
    snprintf(msg, sizeof(msg), "Opening %s timed out after %lu ms",
             serial.portPath.c_str(), (unsigned long)timeoutMs);
    return Result::error(ErrorCode::TIMEOUT, msg,
                         "Device is slow to respond. Check the USB connection and adapter power");
}

void ConnectionManager::runOpenWorker(hal::SerialOptions serial) {
    Result r = m_transport.open(serial);

    std::lock_guard<std::mutex> lock(m_cancelMutex);
    if (m_openAbandoned && r.isOk()) {
        m_log.warn("Open of %s completed after its attempt gave up, closing", serial.portPath.c_str());
        Result closed = m_transport.close();
        if (!closed.isOk()) {
            m_log.warn("Close of late open failed: %s", closed.message.c_str());
        }
    }
    m_openResult = r;
    m_openDone = true;
    m_cancelCv.notify_all();
}

bool ConnectionManager::openInFlight() {
    std::lock_guard<std::mutex> lock(m_cancelMutex);
    return m_openThread.joinable() && !m_openDone;
}

bool ConnectionManager::waitForRetry(uint32_t delayMs, uint32_t epoch) {
    std::unique_lock<std::mutex> lock(m_cancelMutex);
    bool cancelled = m_cancelCv.wait_for(lock, std::chrono::milliseconds(delayMs), [&] {
        return m_epoch.load() != epoch || m_shuttingDown.load();
    });
    return !cancelled;
}

uint32_t ConnectionManager::beginEpoch() {
    uint32_t epoch;
    {
        std::lock_guard<std::mutex> lock(m_cancelMutex);
        epoch = ++m_epoch;
    }
    m_cancelCv.notify_all();
    return epoch;
}

void ConnectionManager::startTransmitting() {
    setState(ConnectionState::Connected);
    m_scheduler.setLinkActive(true);
    Result started = m_scheduler.start(m_frameRateHz.load());
    if (!started.isOk()) {
        m_log.error("Scheduler start failed: %s", started.message.c_str());
    }
}

void ConnectionManager::teardownLink() {
    m_scheduler.stop();
    m_scheduler.setLinkActive(false);
    if (openInFlight()) {
        return; // The open worker closes a late handle itself
    }
    if (m_transport.isOpen()) {
        Result closed = m_transport.close();
        if (!closed.isOk()) {
            m_log.warn("Close failed: %s", closed.message.c_str());
        }
    }
}

void ConnectionManager::setState(ConnectionState state) {
    ConnectionState previous = m_state.exchange(state);
    if (previous != state) {
        m_log.debug("State %s -> %s", connectionStateName(previous), connectionStateName(state));
    }
}

} // namespace connection
} // namespace dmxlink
