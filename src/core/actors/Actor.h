// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Actor.h
 * @brief Base Actor class for DmxLink background threads
 *
 * Each Actor owns one thread and a bounded message queue. Other threads talk
 * to it exclusively through send(); all callbacks run on the Actor's own
 * thread, so derived classes need no locking for state they alone touch.
 *
 * Threads in the engine:
 *   FrameScheduler  - periodic frame transmission (ticking actor)
 *   ConnectionManager supervisor - background reconnects (event-driven)
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

#include "../../utils/Log.h"

namespace dmxlink {
namespace actors {

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief All message types in the system
 *
 * Message types are categorized:
 * - 0x20-0x3F: Connection commands
 * - 0x60-0x7F: System commands
 */
enum class MessageType : uint8_t {
    // Connection commands (0x20-0x3F)
    RECONNECT           = 0x20,  // param4 = epoch of the link that failed
    RELEASE_CHANNEL     = 0x21,  // param1/param2 = channel (hi/lo), param4 = hold ms

    // System commands (0x60-0x7F)
    SHUTDOWN            = 0x60,
    PING                = 0x65
};

// ============================================================================
// Message Structure
// ============================================================================

/**
 * @brief Fixed-size message structure for queue-based communication
 *
 * Design constraints:
 * - 16 bytes, copied by value through the queue
 * - No pointers (the sender may be gone by the time it is handled)
 * - Timestamp stamped by send() for ordering diagnostics
 */
struct Message {
    MessageType type;       // 1 byte - Message type
    uint8_t param1;         // 1 byte - Primary parameter
    uint8_t param2;         // 1 byte - Secondary parameter
    uint8_t param3;         // 1 byte - Tertiary parameter
    uint32_t param4;        // 4 bytes - Extended parameter (hold time, epoch)
    uint32_t timestamp;     // 4 bytes - Enqueue time (ms since actor creation)
    uint32_t _reserved;     // 4 bytes - Future use / alignment padding

    Message()
        : type(MessageType::PING)
        , param1(0), param2(0), param3(0)
        , param4(0), timestamp(0), _reserved(0) {}

    Message(MessageType t, uint8_t p1 = 0, uint8_t p2 = 0,
            uint8_t p3 = 0, uint32_t p4 = 0)
        : type(t)
        , param1(p1), param2(p2), param3(p3)
        , param4(p4)
        , timestamp(0)
        , _reserved(0) {}
};

static_assert(sizeof(Message) == 16, "Message must be exactly 16 bytes");

// ============================================================================
// Actor Configuration
// ============================================================================

struct ActorConfig {
    const char* name;           // Thread name / log tag
    uint8_t queueSize;          // Message queue depth
    uint32_t tickIntervalMs;    // Period of onTick() (0 = event-driven only)
    uint32_t stopTimeoutMs;     // Grace period before stop() warns about a slow exit

    ActorConfig()
        : name("Actor")
        , queueSize(16)
        , tickIntervalMs(0)
        , stopTimeoutMs(1000) {}

    ActorConfig(const char* n, uint8_t qSize, uint32_t tickMs = 0, uint32_t stopMs = 1000)
        : name(n)
        , queueSize(qSize)
        , tickIntervalMs(tickMs)
        , stopTimeoutMs(stopMs) {}
};

// ============================================================================
// Actor Base Class
// ============================================================================

/**
 * @brief Base class for all Actors in the engine
 *
 * Lifecycle:
 * 1. Constructor - Store config
 * 2. start() - Spawn the thread, which calls onStart()
 * 3. run() loop - Dispatch messages to onMessage(), ticks to onTick()
 * 4. stop() - Post SHUTDOWN, wait for onStop() and thread exit
 *
 * Ticks follow a fixed grid anchored at start(): deadline N is
 * start + N * interval regardless of how long onTick() took. The first tick
 * fires immediately after onStart(). Deadlines that pass while onTick() is
 * still running are not replayed; they are reported once through
 * onMissedTicks().
 *
 * Derived classes must call stop() from their own destructor so callbacks
 * never run against a partially destroyed object.
 */
class Actor {
public:
    Actor(const ActorConfig& config, utils::LogSink& logSink);

    virtual ~Actor();

    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start the Actor's thread
     * @return true if started, false if already running
     */
    bool start();

    /**
     * @brief Stop the Actor gracefully
     *
     * Posts SHUTDOWN and waits for the thread to leave its loop. A callback
     * that is mid-flight (e.g. a blocking write) is allowed to finish; its
     * own timeout bounds the wait. Calling stop() from the Actor's own thread
     * only requests shutdown; the thread is joined by the next start() or
     * by the destructor.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    // ========================================================================
    // Message Passing
    // ========================================================================

    /**
     * @brief Send a message to this Actor's queue
     *
     * Thread-safe, never blocks.
     *
     * @return false if the queue is full or the Actor is not running
     */
    bool send(const Message& msg);

    size_t getQueueLength() const;

    // ========================================================================
    // Tick Control
    // ========================================================================

    /**
     * @brief Change the tick period of a running Actor
     *
     * The grid is re-anchored at the moment the Actor thread observes the
     * change; the next tick fires one new interval later.
     */
    void setTickInterval(uint32_t intervalMs);

    uint32_t getTickInterval() const { return m_tickIntervalMs.load(); }

    /**
     * @brief True when called from this Actor's thread
     */
    bool isActorThread() const;

    const ActorConfig& getConfig() const { return m_config; }

protected:
    // ========================================================================
    // Derived Class Hooks (always called on the Actor's thread)
    // ========================================================================

    virtual void onStart() {}
    virtual void onMessage(const Message& msg) { (void)msg; }
    virtual void onTick() {}

    /**
     * @brief Tick deadlines elapsed while onTick() was still running
     */
    virtual void onMissedTicks(uint32_t count) { (void)count; }

    virtual void onStop() {}

    /**
     * @brief Milliseconds since this Actor was constructed
     */
    uint32_t getTickCount() const;

    bool isShutdownRequested() const { return m_shutdownRequested.load(); }

    const utils::Logger& log() const { return m_log; }

private:
    using Clock = std::chrono::steady_clock;

    void run();
    void joinThread();

    ActorConfig m_config;
    utils::Logger m_log;

    std::thread m_thread;
    std::mutex m_lifecycleMutex;            // Serializes start()/stop()

    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::deque<Message> m_queue;

    std::atomic<bool> m_running;
    std::atomic<bool> m_shutdownRequested;
    std::atomic<bool> m_retimeRequested;
    std::atomic<uint32_t> m_tickIntervalMs;

    Clock::time_point m_epoch;
};

} // namespace actors
} // namespace dmxlink
