#include "news_calendar.hpp"
#include "http_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

NewsCalendar::NewsCalendar(std::vector<NewsEvent> events) : events_(std::move(events)) {}

NewsCalendar NewsCalendar::parse(const nlohmann::json& payload) {
    std::vector<NewsEvent> events;
    if (!payload.is_array()) {
        spdlog::warn("News calendar payload is not an array");
        return NewsCalendar(events);
    }
    
    for (const auto& item : payload) {
        if (!item.is_object()) continue;
        
        std::string country = item.value("country", "");
        std::string impact = item.value("impact", "");
        if (country != "USD" || impact != "High") continue;
        
        auto ts = util::parse_iso8601(item.value("date", ""));
        if (!ts) {
            spdlog::debug("Skipping event with unparseable date: {}", item.value("title", ""));
            continue;
        }
        
        events.push_back({item.value("title", ""), country, impact, *ts});
    }
    
    spdlog::info("News calendar: {} high-impact USD events", events.size());
    return NewsCalendar(events);
}

NewsCalendar NewsCalendar::fetch(const std::string& url, int timeout_ms) {
    try {
        HttpClient http(timeout_ms);
        auto payload = http.get_json(url);
        if (payload) {
            return parse(*payload);
        }
    } catch (const std::exception& e) {
        spdlog::error("Calendar fetch failed: {}", e.what());
    }
    spdlog::warn("Calendar unavailable, news gate sees no events");
    return NewsCalendar();
}

std::pair<double, std::string> NewsCalendar::minutes_to_nearest(std::time_t now) const {
    if (events_.empty()) {
        return {kNoEventMinutes, "None"};
    }
    
    const NewsEvent* closest = nullptr;
    double best = 0.0;
    for (const auto& ev : events_) {
        double diff = std::abs(static_cast<double>(ev.time_utc - static_cast<int64_t>(now))) / 60.0;
        if (!closest || diff < best) {
            closest = &ev;
            best = diff;
        }
    }
    return {best, closest->title};
}
