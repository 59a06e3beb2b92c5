// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConnectionManager.h
 * @brief Public face of the DMX engine
 *
 * Owns the channel buffer, the frame scheduler, statistics, error history
 * and the event bus, and drives the connection lifecycle of a transport:
 *
 *   Disconnected --connect()--> Connecting --open ok--> Connected
 *        ^                          |                      |
 *        |                     retries exhausted      sendFrame failed
 *        |                          v                      v
 *        +------disconnect()---- Failed <--exhausted--- Degraded
 *                                                 (background reconnect)
 *
 * Threads:
 * - Caller threads: connect/disconnect (blocking), channel writes (fast)
 * - Scheduler thread: frame transmission, FRAME/DEGRADED events
 * - Supervisor thread: background reconnects, pulse releases
 * - Open worker: one transport open() at a time, bounded by connectTimeoutMs
 *
 * Listeners must not call connect() or disconnect() from inside a callback.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "../actors/Actor.h"
#include "../buffer/ChannelBuffer.h"
#include "../bus/EventBus.h"
#include "../errors/ErrorHistory.h"
#include "../scheduler/FrameScheduler.h"
#include "../stats/StatisticsTracker.h"
#include "../../hal/interface/ISerialTransport.h"
#include "../../utils/Log.h"

namespace dmxlink {
namespace connection {

enum class ConnectionState : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Degraded,       // Open, but the last write failed
    Failed          // Retries exhausted; explicit connect() required
};

const char* connectionStateName(ConnectionState state);

/**
 * @brief Retry/backoff policy shared by connect() and background reconnects
 */
struct RetryPolicy {
    uint32_t maxRetries = 3;            ///< Total open attempts per connect
    uint32_t connectTimeoutMs = 8000;   ///< Cap on a single attempt
    uint32_t retryDelayMs = 1000;       ///< Wait before the second attempt
    double backoffMultiplier = 2.0;     ///< Growth of the wait per attempt
    uint32_t maxRetryDelayMs = 30000;   ///< Ceiling on any single wait
    bool reconnectOnSendFailure = true; ///< Degraded -> background reconnect
};

/**
 * @brief Wait before attempt @p attempt (1-based); 0 for the first attempt
 *
 * retryDelayMs * backoffMultiplier^(attempt-2), capped at maxRetryDelayMs.
 */
uint32_t retryDelayForAttempt(const RetryPolicy& policy, uint32_t attempt);

struct ConnectOptions {
    hal::SerialOptions serial;
    uint32_t frameRateHz = scheduler::DEFAULT_FRAME_RATE_HZ;
    RetryPolicy retry;
};

class ConnectionManager : private scheduler::IFrameListener {
public:
    ConnectionManager(hal::ISerialTransport& transport, utils::LogSink& logSink);
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Open the port (with retry/backoff) and start transmitting
     *
     * Blocks until connected, exhausted, or cancelled by disconnect() or a
     * newer connect(). Already connected to the same port: succeeds without
     * reopening.
     *
     * @return CONFIGURATION for invalid options (no attempt made),
     *         SERIAL_CONNECTION after maxRetries failed attempts,
     *         CANCELLED if superseded
     */
    Result connect(const ConnectOptions& options);
    Result connect(const std::string& portPath, const ConnectOptions& options);

    /**
     * @brief Stop transmitting, send one blackout frame, close the port
     *
     * Cancels any pending retry wait. Idempotent.
     */
    Result disconnect();

    // ========================================================================
    // Channel Control (any thread, never blocks on I/O)
    // ========================================================================

    Result setChannel(int channel, double value);
    buffer::ChannelBatchResult setChannels(const std::map<int, double>& values);
    void blackout();
    Result getChannel(int channel, uint8_t& outValue) const;
    Frame snapshot() const;

    /**
     * @brief Momentary press: set @p value now, return to 0 after @p holdMs
     *
     * A second pulse on the same channel replaces the pending release.
     */
    Result pulseChannel(int channel, double value, uint32_t holdMs);

    /**
     * @brief Change the refresh rate; takes effect immediately if running
     */
    Result setFrameRate(uint32_t frameRateHz);

    // ========================================================================
    // Observation
    // ========================================================================

    stats::Statistics getStatistics() const;

    /**
     * @brief Lifetime counters of the underlying transport (never reset)
     */
    hal::TransportStats getTransportStats() const;
    errors::ErrorStats getErrorStats() const;
    void clearErrorHistory();

    ConnectionState getState() const { return m_state.load(); }
    bool isConnected() const { return m_state.load() == ConnectionState::Connected; }
    uint32_t getFrameRate() const { return m_frameRateHz.load(); }
    ConnectOptions getOptions() const;

    bus::Subscription subscribe(bus::IEngineListener* listener, uint8_t mask = bus::EVENT_MASK_ALL);

    /**
     * @brief Validate options without connecting
     */
    static Result validateOptions(const ConnectOptions& options);

private:
    /**
     * Background worker: reconnects after a send failure and releases
     * pulsed channels when their hold time expires.
     */
    class Supervisor : public actors::Actor {
    public:
        Supervisor(ConnectionManager& owner, utils::LogSink& logSink);
        ~Supervisor() override;

    protected:
        void onMessage(const actors::Message& msg) override;
        void onTick() override;

    private:
        ConnectionManager& m_owner;
        std::map<int, uint32_t> m_pendingReleases;   // channel -> due (actor ms)
    };

    // IFrameListener (scheduler thread)
    void onFrameSent(const Frame& frame) override;
    void onSendFailed(const Result& error) override;

    void handleReconnect(uint32_t epoch);

    Result runAttempts(const ConnectOptions& options, uint32_t epoch, uint32_t& outAttempt);

    /**
     * @brief One open() attempt, abandoned after @p timeoutMs or on cancel
     *
     * An abandoned open keeps running on m_openThread; if it succeeds late the
     * worker closes the port again. The next attempt waits for it first.
     */
    Result openWithTimeout(const hal::SerialOptions& serial, uint32_t timeoutMs, uint32_t epoch);
    void runOpenWorker(hal::SerialOptions serial);
    bool openInFlight();
    bool waitForRetry(uint32_t delayMs, uint32_t epoch);
    uint32_t beginEpoch();
    void startTransmitting();
    void teardownLink();
    void setState(ConnectionState state);

    utils::Logger m_log;
    hal::ISerialTransport& m_transport;

    buffer::ChannelBuffer m_buffer;
    stats::StatisticsTracker m_stats;
    errors::ErrorHistory m_errors;
    bus::EventBus m_bus;
    scheduler::FrameScheduler m_scheduler;

    std::atomic<ConnectionState> m_state;
    std::atomic<uint32_t> m_frameRateHz;
    std::atomic<bool> m_reconnectOnFailure;

    std::mutex m_lifecycleMutex;        // Serializes connect/disconnect/reconnect

    mutable std::mutex m_optionsMutex;
    ConnectOptions m_options;

    // Cancellation: every connect()/disconnect() starts a new epoch; retry
    // loops belonging to an older epoch abandon at their next wait
    std::atomic<uint32_t> m_epoch;
    std::atomic<bool> m_shuttingDown;
    std::mutex m_cancelMutex;
    std::condition_variable m_cancelCv;

    // Open worker. The thread handle is only touched under m_lifecycleMutex
    // (and by the destructor); the flags are guarded by m_cancelMutex
    std::thread m_openThread;
    bool m_openDone;
    bool m_openAbandoned;
    Result m_openResult;

    Supervisor m_supervisor;
};

} // namespace connection
} // namespace dmxlink
