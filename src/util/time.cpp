// VOTELOCK - Time
// Copyright (c) 2024 VOTELOCK Developers
// MIT License

#include "votelock/util/time.h"

#include <atomic>
#include <ctime>
#include <sstream>

namespace votelock {
namespace util {

namespace {

struct MockClock {
    std::atomic<bool> enabled{false};
    std::atomic<bool> seeded{false};
    std::atomic<int64_t> now{0};
};

MockClock& Mock() {
    static MockClock clock;
    return clock;
}

int64_t RealNow() {
    return ToUnixTime(SystemClock::now());
}

} // namespace

int64_t GetTime() {
    MockClock& mock = Mock();
    return mock.enabled.load() ? mock.now.load() : RealNow();
}

SystemTimePoint FromUnixTime(int64_t unixSeconds) {
    return SystemTimePoint(Seconds(unixSeconds));
}

int64_t ToUnixTime(SystemTimePoint tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

std::string FormatISO8601(SystemTimePoint tp) {
    const std::time_t t = SystemClock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

std::string FormatTimestamp(int64_t unixSeconds) {
    return FormatISO8601(FromUnixTime(unixSeconds));
}

std::string FormatDuration(Seconds span) {
    int64_t left = span.count();
    if (left == 0) {
        return "0s";
    }

    std::ostringstream out;
    if (left < 0) {
        out << '-';
        left = -left;
    }

    static const struct {
        int64_t seconds;
        char suffix;
    } kUnits[] = {
        {SECONDS_PER_WEEK, 'w'}, {SECONDS_PER_DAY, 'd'}, {SECONDS_PER_HOUR, 'h'},
        {SECONDS_PER_MINUTE, 'm'}, {1, 's'},
    };

    bool first = true;
    for (const auto& unit : kUnits) {
        const int64_t count = left / unit.seconds;
        left %= unit.seconds;
        if (count == 0) continue;
        if (!first) out << ' ';
        out << count << unit.suffix;
        first = false;
    }
    return out.str();
}

void EnableMockTime() {
    MockClock& mock = Mock();
    if (!mock.seeded.exchange(true)) {
        mock.now.store(RealNow());
    }
    mock.enabled.store(true);
}

void DisableMockTime() {
    Mock().enabled.store(false);
}

bool IsMockTimeEnabled() {
    return Mock().enabled.load();
}

void SetMockTime(int64_t unixSeconds) {
    Mock().seeded.store(true);
    Mock().now.store(unixSeconds);
}

void AdvanceMockTime(Seconds delta) {
    Mock().now.fetch_add(delta.count());
}

int64_t GetMockTime() {
    return Mock().now.load();
}

} // namespace util
} // namespace votelock
