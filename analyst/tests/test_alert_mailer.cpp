#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/alert_mailer.hpp"

using Catch::Approx;

namespace {

TradePlan short_plan() {
    TradePlan plan{};
    plan.direction = Direction::Short;
    plan.entry_zone_start = 107.0;
    plan.entry_zone_end = 108.0;
    plan.stop_loss = 107.7;
    plan.tp1 = 105.6;
    plan.tp2 = 104.9;
    plan.estimated_rr = 2.0;
    plan.probability_score = 35.0;
    plan.scorer = "rule_based";
    return plan;
}

} // namespace

TEST_CASE("Position sizing", "[mailer]") {
    PositionSizing sizing = AlertMailer::size_position(short_plan(), 10000.0, 0.5);
    
    REQUIRE(sizing.risk_amount == Approx(50.0));
    REQUIRE(sizing.sl_distance == Approx(0.7));
    REQUIRE(sizing.lot_size == Approx(50.0 / 7.0));
    REQUIRE(sizing.suggested_leverage == 71);
    
    SECTION("Zero stop distance gives no size") {
        TradePlan flat = short_plan();
        flat.stop_loss = flat.entry_zone_start;
        PositionSizing none = AlertMailer::size_position(flat, 10000.0, 0.5);
        REQUIRE(none.lot_size == 0.0);
        REQUIRE(none.suggested_leverage == 10);
    }
    
    SECTION("Leverage is capped at 100") {
        TradePlan tight = short_plan();
        tight.stop_loss = 107.01;
        REQUIRE(AlertMailer::size_position(tight, 10000.0, 0.5).suggested_leverage == 100);
    }
}

TEST_CASE("Alert formatting", "[mailer]") {
    MailSettings settings;
    settings.user = "analyst@example.com";
    settings.password = "secret";
    settings.recipient = "desk@example.com";
    AlertMailer mailer(settings);
    
    TradeSetup setup;
    setup.instrument = "XAU/USD";
    setup.session = "LONDON";
    setup.htf_trend = "Ranging";
    setup.zone = "Premium";
    setup.liquidity_event_type = "Local High Sweep";
    
    // 2024-01-05 13:30:00 UTC
    FormattedMail mail = mailer.format_alert(short_plan(), setup, 1704461400);
    
    REQUIRE(mail.subject == "XAU/USD SHORT ALERT - 2024-01-05 13:30");
    REQUIRE(mail.html.find("107.00 - 108.00") != std::string::npos);
    REQUIRE(mail.html.find("107.70") != std::string::npos);
    REQUIRE(mail.html.find("7.14 lots") != std::string::npos);
    REQUIRE(mail.html.find("1:71") != std::string::npos);
    REQUIRE(mail.html.find("Local High Sweep") != std::string::npos);
    REQUIRE(mail.html.find("MANUAL EXECUTION REQUIRED") != std::string::npos);
}

TEST_CASE("Prices keep the instrument's precision", "[mailer]") {
    REQUIRE(AlertMailer::price_decimals(0.0) == 2);
    REQUIRE(AlertMailer::price_decimals(0.3) == 2);
    REQUIRE(AlertMailer::price_decimals(0.1) == 2);
    REQUIRE(AlertMailer::price_decimals(0.0001) == 5);
    REQUIRE(AlertMailer::price_decimals(1e-9) == 6);
    
    MailSettings settings;
    settings.user = "analyst@example.com";
    AlertMailer mailer(settings);
    
    TradePlan plan{};
    plan.direction = Direction::Long;
    plan.entry_zone_start = 1.08523;
    plan.entry_zone_end = 1.08541;
    plan.stop_loss = 1.08457;
    plan.tp1 = 1.08655;
    plan.tp2 = 1.08721;
    plan.estimated_rr = 2.0;
    
    TradeSetup setup;
    setup.instrument = "EUR/USD";
    setup.spread_value = 0.0001;
    
    FormattedMail mail = mailer.format_alert(plan, setup, 1704461400);
    REQUIRE(mail.html.find("1.08523 - 1.08541") != std::string::npos);
    REQUIRE(mail.html.find("<td>1.08457</td>") != std::string::npos);
    REQUIRE(mail.html.find("<td>0.00066</td>") != std::string::npos);
}

TEST_CASE("Mailer without credentials is disabled", "[mailer]") {
    AlertMailer mailer{MailSettings{}};
    REQUIRE_FALSE(mailer.send(short_plan(), TradeSetup{}));
}
