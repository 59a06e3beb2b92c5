// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#include "EventBus.h"

namespace dmxlink {
namespace bus {

const char* engineEventName(EngineEventType type) {
    switch (type) {
        case EngineEventType::CONNECTED:    return "connected";
        case EngineEventType::DISCONNECTED: return "disconnected";
        case EngineEventType::ERROR:        return "error";
        case EngineEventType::DEGRADED:     return "degraded";
        case EngineEventType::FRAME:        return "frame";
        default:                            return "unknown";
    }
}

// ============================================================================
// Subscription
// ============================================================================

Subscription::Subscription(Subscription&& other) noexcept
    : m_bus(other.m_bus)
    , m_id(other.m_id)
{
    other.m_bus = nullptr;
    other.m_id = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        m_bus = other.m_bus;
        m_id = other.m_id;
        other.m_bus = nullptr;
        other.m_id = 0;
    }
    return *this;
}

void Subscription::reset() {
    if (m_bus != nullptr) {
        m_bus->unsubscribe(m_id);
        m_bus = nullptr;
        m_id = 0;
    }
}

// ============================================================================
// EventBus
// ============================================================================

EventBus::EventBus()
    : m_nextId(1)
{
    for (auto& entry : m_entries) {
        entry.listener = nullptr;
        entry.mask = 0;
        entry.id = 0;
    }
}

Subscription EventBus::subscribe(IEngineListener* listener, uint8_t mask) {
    if (listener == nullptr || mask == 0) {
        return Subscription();
    }

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    for (auto& entry : m_entries) {
        if (entry.id == 0) {
            entry.listener = listener;
            entry.mask = mask;
            entry.id = m_nextId++;
            if (m_nextId == 0) {
                m_nextId = 1;
            }
            return Subscription(this, entry.id);
        }
    }
    return Subscription();
}

void EventBus::unsubscribe(uint32_t id) {
    // Blocks while another thread is delivering, so the listener is
    // guaranteed idle once this returns
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    for (auto& entry : m_entries) {
        if (entry.id == id) {
            entry.listener = nullptr;
            entry.mask = 0;
            entry.id = 0;
            return;
        }
    }
}

uint8_t EventBus::publish(const EngineEvent& event) {
    const uint8_t bit = eventMask(event.type);
    uint8_t delivered = 0;

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    for (auto& entry : m_entries) {
        // Re-check each slot: an earlier listener may have unsubscribed it
        if (entry.id == 0 || (entry.mask & bit) == 0) {
            continue;
        }
        entry.listener->onEngineEvent(event);
        delivered++;
    }

    return delivered;
}

uint8_t EventBus::getSubscriberCount() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    uint8_t count = 0;
    for (const auto& entry : m_entries) {
        if (entry.id != 0) {
            count++;
        }
    }
    return count;
}

} // namespace bus
} // namespace dmxlink
