#include "utils/EventLog.h"
#include <algorithm>
#include <ostream>

EventLog::EventLog(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

void EventLog::logAvalanche(std::uint64_t generation, double field, std::uint64_t size) {
    push(Event{EventType::Avalanche, generation, field, size});
}

void EventLog::logRelaxation(std::uint64_t generation, double field, std::uint64_t flips) {
    push(Event{EventType::Relaxation, generation, field, flips});
}

void EventLog::logNonConvergence(std::uint64_t generation, double field, std::uint64_t sweeps) {
    push(Event{EventType::NonConvergence, generation, field, sweeps});
}

std::size_t EventLog::count(EventType type) const {
    return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(),
        [type](const Event& e) { return e.type == type; }));
}

void EventLog::clear() {
    events_.clear();
    dropped_ = 0;
}

void EventLog::push(const Event& e) {
    if (events_.size() >= capacity_) {
        events_.pop_front();
        ++dropped_;
    }
    events_.push_back(e);
}

void EventLog::writeCsv(std::ostream& out) const {
    out << "type,generation,field,value\n";
    for (const auto& e : events_) {
        out << eventTypeName(e.type) << ","
            << e.generation << ","
            << e.field << ","
            << e.value << "\n";
    }
}

const char* eventTypeName(EventType type) {
    switch (type) {
        case EventType::Avalanche: return "avalanche";
        case EventType::Relaxation: return "relaxation";
        case EventType::NonConvergence: return "non_convergence";
    }
    return "unknown";
}
