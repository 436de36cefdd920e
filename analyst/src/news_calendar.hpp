#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>
#include <utility>
#include <nlohmann/json.hpp>

struct NewsEvent {
    std::string title;
    std::string country;
    std::string impact;
    int64_t time_utc;  // epoch seconds
};

// Snapshot of the weekly macro calendar, filtered to high-impact USD events.
// Read-only once built; one snapshot is shared across a run.
class NewsCalendar {
public:
    static constexpr double kNoEventMinutes = 9999.0;
    
    NewsCalendar() = default;
    explicit NewsCalendar(std::vector<NewsEvent> events);
    
    // Weekly-calendar JSON array; unparseable dates are dropped
    static NewsCalendar parse(const nlohmann::json& payload);
    
    // Empty calendar on any download or parse failure
    static NewsCalendar fetch(const std::string& url, int timeout_ms);
    
    // (absolute minutes, title) of the closest event in either direction;
    // (9999, "None") when empty
    std::pair<double, std::string> minutes_to_nearest(std::time_t now) const;
    
    const std::vector<NewsEvent>& events() const { return events_; }
    bool empty() const { return events_.empty(); }
    
private:
    std::vector<NewsEvent> events_;
};
