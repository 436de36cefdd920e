#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Blocking JSON GET over libcurl. One handle per client.
class HttpClient {
public:
    explicit HttpClient(int timeout_ms = 10000);
    ~HttpClient();
    
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    
    // Empty optional on transport, status or parse failure (logged)
    std::optional<nlohmann::json> get_json(const std::string& url);
    
private:
    int timeout_ms_;
    CURL* curl_;
    
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
