#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "turn_orchestrator.h"

// One-line description of a turn event. Region names are used when `territory` is given.
std::string describeTurnEvent(const TurnEvent& event, const TerritoryService* territory = nullptr);

// Bounded history of formatted events; the oldest entries are dropped first.
class EventLog {
public:
    explicit EventLog(std::size_t capacity = 64);

    void addEvent(const std::string& event);
    void record(const TurnEvent& event, const TerritoryService* territory = nullptr);
    void clearEvents();
    const std::vector<std::string>& getEvents() const { return m_events; }
    std::size_t capacity() const { return m_capacity; }
    // Total events recorded, including the ones already dropped.
    std::size_t totalRecorded() const { return m_totalRecorded; }

private:
    std::vector<std::string> m_events;
    std::size_t m_capacity;
    std::size_t m_totalRecorded = 0;
};
