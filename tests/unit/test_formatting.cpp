#include <catch2/catch_test_macros.hpp>
#include "sms/formatting.hpp"

using namespace tether;
using namespace tether::sms;

TEST_CASE("format_relative_time buckets", "[sms][format]") {
    const Timestamp now(10'000'000'000);
    auto ago = [&](int64_t seconds) { return Timestamp(now.millis() - seconds * 1000); };

    REQUIRE(format_relative_time(ago(0), now) == QStringLiteral("Just now"));
    REQUIRE(format_relative_time(ago(59), now) == QStringLiteral("Just now"));
    REQUIRE(format_relative_time(ago(60), now) == QStringLiteral("1 min ago"));
    REQUIRE(format_relative_time(ago(3599), now) == QStringLiteral("59 min ago"));
    REQUIRE(format_relative_time(ago(7200), now) == QStringLiteral("2 hours ago"));
    REQUIRE(format_relative_time(ago(3 * 86400), now) == QStringLiteral("3 days ago"));
    REQUIRE(format_relative_time(ago(604800), now) == QStringLiteral("More than a week ago"));
}

TEST_CASE("format_relative_time treats future dates as now", "[sms][format]") {
    REQUIRE(format_relative_time(Timestamp(5000), Timestamp(1000)) == QStringLiteral("Just now"));
}

TEST_CASE("truncate_message", "[sms][format]") {
    REQUIRE(truncate_message(QStringLiteral("short"), 10) == QStringLiteral("short"));
    REQUIRE(truncate_message(QStringLiteral("exactly10!"), 10) == QStringLiteral("exactly10!"));
    REQUIRE(truncate_message(QStringLiteral("a longer message"), 8) == QStringLiteral("a longer..."));
}
