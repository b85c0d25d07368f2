#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>

enum class EventType : std::uint8_t {
    Avalanche = 0,       // value = flips in the one sweep after a field kick
    Relaxation = 1,      // value = total flips until equilibrium
    NonConvergence = 2   // value = sweeps performed before giving up
};

struct Event {
    EventType type = EventType::Avalanche;
    std::uint64_t generation = 0;  // sweep counter when the event closed
    double field = 0.0;            // external field at that time
    std::uint64_t value = 0;
};

/**
 * Bounded in-memory record of simulation events.
 * Oldest events are dropped once capacity is reached.
 */
class EventLog {
public:
    explicit EventLog(std::size_t capacity = 10000);

    void logAvalanche(std::uint64_t generation, double field, std::uint64_t size);
    void logRelaxation(std::uint64_t generation, double field, std::uint64_t flips);
    void logNonConvergence(std::uint64_t generation, double field, std::uint64_t sweeps);

    const std::deque<Event>& events() const { return events_; }
    std::size_t count(EventType type) const;
    std::uint64_t dropped() const { return dropped_; }
    std::size_t capacity() const { return capacity_; }
    void clear();

    // CSV: type,generation,field,value
    void writeCsv(std::ostream& out) const;

private:
    void push(const Event& e);

    std::size_t capacity_;
    std::deque<Event> events_;
    std::uint64_t dropped_ = 0;
};

const char* eventTypeName(EventType type);

#endif // EVENT_LOG_H
