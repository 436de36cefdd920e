#include "alert_mailer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <curl/curl.h>
#include <algorithm>
#include <cmath>
#include <cstring>

namespace {

struct UploadState {
    const std::string* payload;
    size_t offset;
};

} // namespace

MailSettings MailSettings::from_config(const Config& cfg, const RiskSettings& risk) {
    MailSettings settings;
    settings.user = cfg.email_user;
    settings.password = cfg.email_password;
    settings.recipient = cfg.email_recipient.empty() ? cfg.email_user : cfg.email_recipient;
    settings.smtp_url = cfg.smtp_url;
    settings.account_balance = risk.account_balance;
    return settings;
}

AlertMailer::AlertMailer(MailSettings settings) : settings_(std::move(settings)) {}

PositionSizing AlertMailer::size_position(const TradePlan& plan, double account_balance,
                                          double risk_percent) {
    PositionSizing sizing{};
    sizing.risk_amount = account_balance * (risk_percent / 100.0);
    sizing.sl_distance = std::abs(plan.entry_zone_start - plan.stop_loss);
    sizing.lot_size = sizing.sl_distance > 0
        ? sizing.risk_amount / (sizing.sl_distance * 10.0)
        : 0.0;
    sizing.suggested_leverage = std::min(100, std::max(10, static_cast<int>(sizing.lot_size * 10.0)));
    return sizing;
}

int AlertMailer::price_decimals(double spread) {
    if (!(spread > 0.0) || !std::isfinite(spread)) return 2;
    int decimals = static_cast<int>(std::ceil(-std::log10(spread) - 1e-9)) + 1;
    return std::clamp(decimals, 2, 6);
}

FormattedMail AlertMailer::format_alert(const TradePlan& plan, const TradeSetup& setup,
                                        std::time_t now) const {
    const std::string side = to_string(plan.direction);
    const bool is_short = plan.direction == Direction::Short;
    PositionSizing sizing = size_position(plan, settings_.account_balance, settings_.risk_percent);
    const int dp = price_decimals(setup.spread_value);
    
    FormattedMail mail;
    mail.subject = fmt::format("{} {} ALERT - {}", setup.instrument, side,
                               util::format_utc(now, "%Y-%m-%d %H:%M"));
    
    std::string html;
    html += "<html><body style=\"font-family: Arial, sans-serif;\">\n";
    html += fmt::format("<h1>{} {} SIGNAL</h1>\n", setup.instrument, side);
    
    html += "<h2>Trade Details</h2>\n<table>\n";
    html += fmt::format("<tr><td><b>Direction:</b></td><td>{}</td></tr>\n",
                        is_short ? "SHORT" : "LONG");
    html += fmt::format("<tr><td><b>Entry Zone:</b></td><td>{:.{}f} - {:.{}f}</td></tr>\n",
                        plan.entry_zone_start, dp, plan.entry_zone_end, dp);
    html += fmt::format("<tr><td><b>Stop Loss:</b></td><td>{:.{}f}</td></tr>\n", plan.stop_loss, dp);
    html += fmt::format("<tr><td><b>Take Profit 1:</b></td><td>{:.{}f}</td></tr>\n", plan.tp1, dp);
    html += fmt::format("<tr><td><b>Take Profit 2:</b></td><td>{:.{}f}</td></tr>\n", plan.tp2, dp);
    html += fmt::format("<tr><td><b>Risk:Reward:</b></td><td>1:{:.1f}</td></tr>\n", plan.estimated_rr);
    html += "</table>\n";
    
    html += "<h2>Position Sizing</h2>\n<table>\n";
    html += fmt::format("<tr><td><b>Risk Amount:</b></td><td>{:.2f} ({}%)</td></tr>\n",
                        sizing.risk_amount, settings_.risk_percent);
    html += fmt::format("<tr><td><b>SL Distance:</b></td><td>{:.{}f}</td></tr>\n", sizing.sl_distance, dp);
    html += fmt::format("<tr><td><b>Suggested Lot Size:</b></td><td>{:.2f} lots</td></tr>\n",
                        sizing.lot_size);
    html += fmt::format("<tr><td><b>Suggested Leverage:</b></td><td>1:{}</td></tr>\n",
                        sizing.suggested_leverage);
    html += "</table>\n";
    
    html += "<h2>Market Context</h2>\n<table>\n";
    html += fmt::format("<tr><td><b>Session:</b></td><td>{}</td></tr>\n", setup.session);
    html += fmt::format("<tr><td><b>Trend:</b></td><td>{}</td></tr>\n", setup.htf_trend);
    html += fmt::format("<tr><td><b>Zone:</b></td><td>{}</td></tr>\n", setup.zone);
    html += fmt::format("<tr><td><b>Liquidity Event:</b></td><td>{}</td></tr>\n",
                        setup.liquidity_event_type.empty() ? "N/A" : setup.liquidity_event_type);
    html += fmt::format("<tr><td><b>Probability:</b></td><td>{:.0f}% ({})</td></tr>\n",
                        plan.probability_score, plan.scorer);
    html += "</table>\n";
    
    html += "<p><b>MANUAL EXECUTION REQUIRED</b><br>This is an analysis alert, NOT financial advice.</p>\n";
    html += fmt::format("<p><i>Generated {} UTC</i></p>\n",
                        util::format_utc(now, "%Y-%m-%d %H:%M:%S"));
    html += "</body></html>\n";
    
    mail.html = html;
    return mail;
}

size_t AlertMailer::read_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* state = static_cast<UploadState*>(userp);
    size_t room = size * nitems;
    size_t left = state->payload->size() - state->offset;
    size_t n = std::min(room, left);
    if (n == 0) return 0;
    
    std::memcpy(buffer, state->payload->data() + state->offset, n);
    state->offset += n;
    return n;
}

bool AlertMailer::send(const TradePlan& plan, const TradeSetup& setup) {
    if (!settings_.enabled()) {
        spdlog::info("Email alerts disabled or not configured, skipping");
        return false;
    }
    
    FormattedMail mail = format_alert(plan, setup, std::time(nullptr));
    
    std::string payload;
    payload += "Date: " + util::format_utc(std::time(nullptr), "%a, %d %b %Y %H:%M:%S +0000") + "\r\n";
    payload += "To: <" + settings_.recipient + ">\r\n";
    payload += "From: <" + settings_.user + ">\r\n";
    payload += "Subject: " + mail.subject + "\r\n";
    payload += "MIME-Version: 1.0\r\n";
    payload += "Content-Type: text/html; charset=UTF-8\r\n";
    payload += "\r\n";
    payload += mail.html;
    
    CURL* curl = curl_easy_init();
    if (!curl) {
        spdlog::error("Failed to initialize CURL for SMTP");
        return false;
    }
    
    UploadState state{&payload, 0};
    const std::string from = "<" + settings_.user + ">";
    struct curl_slist* recipients = curl_slist_append(nullptr, ("<" + settings_.recipient + ">").c_str());
    
    curl_easy_setopt(curl, CURLOPT_URL, settings_.smtp_url.c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(curl, CURLOPT_USERNAME, settings_.user.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, settings_.password.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, from.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &state);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
    
    CURLcode res = curl_easy_perform(curl);
    
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);
    
    if (res != CURLE_OK) {
        spdlog::error("Failed to send alert for {}: {}", setup.instrument, curl_easy_strerror(res));
        return false;
    }
    
    spdlog::info("Trade alert sent for {} {}", setup.instrument, to_string(plan.direction));
    return true;
}
