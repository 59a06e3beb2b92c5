// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Actor.cpp
 * @brief Implementation of the Actor base class
 *
 * Key implementation details:
 * - One std::thread per Actor, message queue guarded by a mutex + condvar
 * - Tick deadlines on a fixed grid against the monotonic clock
 * - Graceful shutdown: SHUTDOWN message, grace period, then join
 */

#include "Actor.h"

namespace dmxlink {
namespace actors {

// ============================================================================
// Constructor / Destructor
// ============================================================================

Actor::Actor(const ActorConfig& config, utils::LogSink& logSink)
    : m_config(config)
    , m_log(logSink, config.name)
    , m_running(false)
    , m_shutdownRequested(false)
    , m_retimeRequested(false)
    , m_tickIntervalMs(config.tickIntervalMs)
    , m_epoch(Clock::now())
{
}

Actor::~Actor()
{
    // Derived classes have already stopped us; this only reaps the thread
    if (m_thread.joinable()) {
        stop();
    }
    joinThread();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool Actor::start()
{
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    if (m_running.load()) {
        m_log.warn("Already running");
        return false;
    }

    // Reap a thread that stopped itself
    joinThread();

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_queue.clear();
    }
    m_shutdownRequested = false;
    m_retimeRequested = false;
    m_running = true;

    m_thread = std::thread(&Actor::run, this);

    m_log.debug("Started (queue=%u, tick=%lu ms)",
                (unsigned)m_config.queueSize, (unsigned long)m_tickIntervalMs.load());
    return true;
}

void Actor::stop()
{
    if (isActorThread()) {
        // Cannot join ourselves: request shutdown and let run() unwind
        m_shutdownRequested = true;
        m_queueCv.notify_all();
        return;
    }

    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    if (!m_thread.joinable()) {
        return; // Already stopped
    }

    m_log.debug("Stopping...");

    // Signal shutdown; SHUTDOWN bypasses the queue depth limit
    m_shutdownRequested = true;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        Message shutdownMsg(MessageType::SHUTDOWN);
        shutdownMsg.timestamp = getTickCount();
        m_queue.push_front(shutdownMsg);
    }
    m_queueCv.notify_all();

    // Wait for the thread to leave its loop
    const auto deadline = Clock::now() + std::chrono::milliseconds(m_config.stopTimeoutMs);
    while (m_running.load() && Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    if (m_running.load()) {
        m_log.warn("Did not exit within %lu ms, waiting for in-flight work",
                   (unsigned long)m_config.stopTimeoutMs);
    }

    joinThread();

    m_log.debug("Stopped");
}

// ============================================================================
// Message Passing
// ============================================================================

bool Actor::send(const Message& msg)
{
    if (!m_running.load() || m_shutdownRequested.load()) {
        return false;
    }

    size_t currentLength = 0;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        currentLength = m_queue.size();

        if (currentLength >= m_config.queueSize) {
            m_log.warn("Failed to send message (queue full): type=0x%02X, queue=%u/%u",
                       static_cast<uint8_t>(msg.type), (unsigned)currentLength,
                       (unsigned)m_config.queueSize);
            return false;
        }

        Message stamped = msg;
        stamped.timestamp = getTickCount();
        m_queue.push_back(stamped);
    }
    m_queueCv.notify_one();

    // Warn if queue is > 80% full
    if (m_config.queueSize > 0) {
        uint8_t utilizationPercent = static_cast<uint8_t>(((currentLength + 1) * 100) / m_config.queueSize);
        if (utilizationPercent >= 80) {
            m_log.warn("Queue utilization high: %u%% (%u/%u messages)",
                       (unsigned)utilizationPercent, (unsigned)(currentLength + 1),
                       (unsigned)m_config.queueSize);
        }
    }
    return true;
}

size_t Actor::getQueueLength() const
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_queue.size();
}

// ============================================================================
// Tick Control
// ============================================================================

void Actor::setTickInterval(uint32_t intervalMs)
{
    m_tickIntervalMs = intervalMs;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_retimeRequested = true;
    }
    m_queueCv.notify_all();
}

bool Actor::isActorThread() const
{
    return std::this_thread::get_id() == m_thread.get_id();
}

// ============================================================================
// Utilities
// ============================================================================

uint32_t Actor::getTickCount() const
{
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - m_epoch);
    return static_cast<uint32_t>(elapsed.count());
}

// ============================================================================
// Private Implementation
// ============================================================================

void Actor::joinThread()
{
    if (!m_thread.joinable()) {
        return;
    }
    if (isActorThread()) {
        m_thread.detach();
    } else {
        m_thread.join();
    }
}

void Actor::run()
{
    m_log.debug("Thread started, calling onStart()");

    onStart();

    uint32_t interval = m_tickIntervalMs.load();
    Clock::time_point nextTick = Clock::now();

    // Main message loop
    while (!m_shutdownRequested.load()) {
        if (m_retimeRequested.exchange(false)) {
            interval = m_tickIntervalMs.load();
            nextTick = Clock::now() + std::chrono::milliseconds(interval);
        }

        Message msg;
        bool received = false;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            auto ready = [this] {
                return !m_queue.empty() || m_shutdownRequested.load() || m_retimeRequested.load();
            };

            // tickInterval semantics:
            //   > 0: wait until the next grid deadline or a message
            //   = 0: wait for messages only
            if (interval == 0) {
                m_queueCv.wait(lock, ready);
            } else {
                m_queueCv.wait_until(lock, nextTick, ready);
            }

            if (!m_queue.empty()) {
                msg = m_queue.front();
                m_queue.pop_front();
                received = true;
            }
        }

        if (received) {
            if (msg.type == MessageType::SHUTDOWN) {
                m_shutdownRequested = true;
                break;
            }
            onMessage(msg);
        }

        if (m_shutdownRequested.load()) {
            break;
        }
        if (interval == 0 || m_retimeRequested.load()) {
            continue;
        }

        Clock::time_point now = Clock::now();
        if (now < nextTick) {
            continue;
        }

        onTick();

        // Advance the grid; deadlines overrun by onTick() are skipped, not replayed
        const auto period = std::chrono::milliseconds(interval);
        nextTick += period;
        now = Clock::now();
        if (now >= nextTick) {
            auto behind = std::chrono::duration_cast<std::chrono::milliseconds>(now - nextTick);
            uint32_t missed = static_cast<uint32_t>(behind.count() / interval) + 1;
            nextTick += period * missed;
            onMissedTicks(missed);
        }
    }

    m_log.debug("Thread stopping, calling onStop()");

    onStop();

    m_running = false;
}

} // namespace actors
} // namespace dmxlink
