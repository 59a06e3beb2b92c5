// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EventBus.h
 * @brief Listener registry for engine lifecycle and frame events
 *
 * Components publish EngineEvents; application code implements
 * IEngineListener and subscribes with an event mask. subscribe() returns a
 * Subscription handle: destroying (or reset()ing) the handle unsubscribes,
 * and once that returns the listener is never called again.
 *
 * Usage:
 *   class EStop : public IEngineListener {
 *       void onEngineEvent(const EngineEvent& e) override { ... }
 *   };
 *
 *   EStop estop;
 *   Subscription sub = engine.subscribe(&estop, eventMask(EngineEventType::ERROR));
 *
 * Thread Safety:
 * - subscribe/unsubscribe/publish may be called from any thread
 * - Listeners run on the publishing thread (scheduler, supervisor or caller)
 *   and must not block
 * - A listener may drop its own Subscription from inside its callback
 */

#pragma once

#include <cstdint>
#include <mutex>

#include "../Frame.h"
#include "../Result.h"

namespace dmxlink {
namespace bus {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Maximum number of concurrent listeners
 */
constexpr uint8_t MAX_SUBSCRIBERS = 8;

// ============================================================================
// Events
// ============================================================================

enum class EngineEventType : uint8_t {
    CONNECTED    = 0,   // Link up, scheduler running
    DISCONNECTED = 1,   // disconnect() completed
    ERROR        = 2,   // Connection or transport error (see `fatal`)
    DEGRADED     = 3,   // Send failed while connected; reconnect scheduled
    FRAME        = 4    // One frame transmitted
};

const char* engineEventName(EngineEventType type);

inline uint8_t eventMask(EngineEventType type) {
    return static_cast<uint8_t>(1u << static_cast<uint8_t>(type));
}

constexpr uint8_t EVENT_MASK_ALL = 0x1F;

struct EngineEvent {
    EngineEventType type;
    Result error;               ///< ERROR / DEGRADED: what went wrong
    bool fatal;                 ///< ERROR: retries exhausted, explicit connect() required
    uint32_t attempt;           ///< ERROR / CONNECTED: connection attempt number (1-based)
    const Frame* frame;         ///< FRAME: transmitted frame, valid only during the callback
    uint32_t frameCount;        ///< FRAME: frames sent since connect

    explicit EngineEvent(EngineEventType t)
        : type(t), fatal(false), attempt(0), frame(nullptr), frameCount(0) {}
};

class IEngineListener {
public:
    virtual ~IEngineListener() = default;
    virtual void onEngineEvent(const EngineEvent& event) = 0;
};

class EventBus;

// ============================================================================
// Subscription Handle
// ============================================================================

/**
 * @brief Move-only RAII registration
 *
 * The EventBus must outlive every Subscription taken from it.
 */
class Subscription {
public:
    Subscription() : m_bus(nullptr), m_id(0) {}
    Subscription(EventBus* bus, uint32_t id) : m_bus(bus), m_id(id) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    /**
     * @brief Unsubscribe now; no callback runs after this returns
     */
    void reset();

    bool isActive() const { return m_bus != nullptr; }
    uint32_t getId() const { return m_id; }

private:
    EventBus* m_bus;
    uint32_t m_id;
};

// ============================================================================
// EventBus
// ============================================================================

class EventBus {
public:
    EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a listener for the event types in @p mask
     * @return Inactive handle if the table is full or listener is null
     */
    Subscription subscribe(IEngineListener* listener, uint8_t mask = EVENT_MASK_ALL);

    /**
     * @brief Deliver an event to every matching listener
     * @return Number of listeners called
     */
    uint8_t publish(const EngineEvent& event);

    uint8_t getSubscriberCount() const;

private:
    friend class Subscription;

    struct Entry {
        IEngineListener* listener;
        uint8_t mask;
        uint32_t id;        // 0 = free slot
    };

    void unsubscribe(uint32_t id);

    // Recursive: a listener may unsubscribe (itself or others) mid-delivery
    mutable std::recursive_mutex m_mutex;
    Entry m_entries[MAX_SUBSCRIBERS];
    uint32_t m_nextId;
};

} // namespace bus
} // namespace dmxlink
