#include "event_log.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

std::string regionLabel(RegionId id, const TerritoryService* territory) {
    if (territory && id >= 0 && id < territory->regionCount()) {
        const std::string& name = territory->regionProfile(id).name;
        if (!name.empty()) {
            return name;
        }
    }
    return "#" + std::to_string(id);
}

} // namespace

std::string describeTurnEvent(const TurnEvent& event, const TerritoryService* territory) {
    std::ostringstream out;
    out << "[T" << event.turnNumber << " P" << event.playerId << "] ";
    switch (event.type) {
        case TurnEventType::TurnStarted:
            out << "turn started";
            break;
        case TurnEventType::MovePrepared:
            out << "army " << event.armyId << " targets " << regionLabel(event.to, territory) << " (cost "
                << event.mpCost << ", ";
            if (std::isinf(event.score)) {
                out << "forced";
            } else {
                out << "score " << event.score;
            }
            out << (event.goal == GoalTag::Reinforce ? ", reinforce)" : ")");
            break;
        case TurnEventType::MoveStarted:
            out << "army " << event.armyId << " moves " << regionLabel(event.from, territory) << " -> "
                << regionLabel(event.to, territory) << " spending " << event.mpCost << " MP";
            break;
        case TurnEventType::BattleStarted:
            out << "army " << event.armyId << " attacks " << regionLabel(event.to, territory);
            break;
        case TurnEventType::BattleResolved:
            out << "battle at " << regionLabel(event.to, territory) << ": " << battleVerdictName(event.verdict);
            break;
        case TurnEventType::RegionConquered:
            out << regionLabel(event.to, territory) << " conquered by army " << event.armyId;
            break;
        case TurnEventType::ArmyReinforced:
            out << "army " << event.armyId << " reinforced at " << regionLabel(event.to, territory);
            break;
        case TurnEventType::TurnFinished:
            out << "turn finished";
            break;
    }
    return out.str();
}

EventLog::EventLog(std::size_t capacity) : m_capacity(std::max<std::size_t>(1, capacity)) {}

void EventLog::addEvent(const std::string& event) {
    m_events.push_back(event);
    ++m_totalRecorded;
    if (m_events.size() > m_capacity) {
        m_events.erase(m_events.begin());
    }
}

void EventLog::record(const TurnEvent& event, const TerritoryService* territory) {
    addEvent(describeTurnEvent(event, territory));
}

void EventLog::clearEvents() {
    m_events.clear();
}
