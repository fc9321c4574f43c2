/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WorldClockTests
#include <boost/test/unit_test.hpp>

#include "core/WorldClock.hpp"
#include "core/WorldError.hpp"
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Mythweave;

namespace {

constexpr int64_t MINUTES_PER_DAY = WorldClock::kMinutesPerDay;
constexpr int64_t MINUTES_PER_SEASON = WorldClock::kDaysPerSeason * MINUTES_PER_DAY;

ClockConfig configStartingAt(int64_t minute) {
    ClockConfig config = ClockConfig::createDefault();
    config.startMinute = minute;
    return config;
}

bool throwsWithCode(ErrorCode expected, const std::function<void()>& action) {
    try {
        action();
    } catch (const WorldError& e) {
        return e.code() == expected;
    }
    return false;
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

struct ClockFixture {
    WorldClock clock;  // Year 1, Day 1, 08:00
};

// ============================================================================
// CALENDAR TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(CalendarTests, ClockFixture)

BOOST_AUTO_TEST_CASE(TestDefaultStart) {
    BOOST_CHECK_EQUAL(clock.totalMinutes(), 8 * 60);
    BOOST_CHECK_EQUAL(clock.hour(), 8);
    BOOST_CHECK_EQUAL(clock.minute(), 0);
    BOOST_CHECK_EQUAL(clock.dayOfMonth(), 1);
    BOOST_CHECK_EQUAL(clock.month(), 1);
    BOOST_CHECK_EQUAL(clock.year(), 1);
    BOOST_CHECK_EQUAL(clock.dayNumber(), 1);
    BOOST_CHECK_EQUAL(clock.season(), Season::Spring);
    BOOST_CHECK_EQUAL(clock.timeOfDay(), TimeOfDay::Morning);
}

BOOST_AUTO_TEST_CASE(TestMonthAndYearRollover) {
    // Last minute of the year
    WorldClock late(configStartingAt(WorldClock::kDaysPerYear * MINUTES_PER_DAY - 1));
    BOOST_CHECK_EQUAL(late.year(), 1);
    BOOST_CHECK_EQUAL(late.month(), 12);
    BOOST_CHECK_EQUAL(late.dayOfMonth(), 30);
    BOOST_CHECK_EQUAL(late.hour(), 23);
    BOOST_CHECK_EQUAL(late.minute(), 59);

    AdvanceResult result = late.advance(1);
    BOOST_CHECK_EQUAL(late.year(), 2);
    BOOST_CHECK_EQUAL(late.month(), 1);
    BOOST_CHECK_EQUAL(late.dayOfMonth(), 1);
    BOOST_CHECK_EQUAL(result.daysCrossed, 1);
    BOOST_CHECK_EQUAL(result.monthsCrossed, 1);
    BOOST_CHECK(result.seasonChanged);
    BOOST_CHECK_EQUAL(result.previousSeason, Season::Winter);
    BOOST_CHECK_EQUAL(late.season(), Season::Spring);
}

BOOST_AUTO_TEST_CASE(TestSeasonBoundaries) {
    BOOST_CHECK_EQUAL(WorldClock::seasonAt(0), Season::Spring);
    BOOST_CHECK_EQUAL(WorldClock::seasonAt(MINUTES_PER_SEASON - 1), Season::Spring);
    BOOST_CHECK_EQUAL(WorldClock::seasonAt(MINUTES_PER_SEASON), Season::Summer);
    BOOST_CHECK_EQUAL(WorldClock::seasonAt(2 * MINUTES_PER_SEASON), Season::Fall);
    BOOST_CHECK_EQUAL(WorldClock::seasonAt(3 * MINUTES_PER_SEASON), Season::Winter);
    BOOST_CHECK_EQUAL(WorldClock::seasonAt(4 * MINUTES_PER_SEASON), Season::Spring);
}

BOOST_AUTO_TEST_CASE(TestTimeOfDayBuckets) {
    BOOST_CHECK_EQUAL(WorldClock::timeOfDayAt(0), TimeOfDay::Night);
    BOOST_CHECK_EQUAL(WorldClock::timeOfDayAt(5), TimeOfDay::Night);
    BOOST_CHECK_EQUAL(WorldClock::timeOfDayAt(6), TimeOfDay::Dawn);
    BOOST_CHECK_EQUAL(WorldClock::timeOfDayAt(8), TimeOfDay::Morning);
    BOOST_CHECK_EQUAL(WorldClock::timeOfDayAt(12), TimeOfDay::Afternoon);
    BOOST_CHECK_EQUAL(WorldClock::timeOfDayAt(17), TimeOfDay::Dusk);
    BOOST_CHECK_EQUAL(WorldClock::timeOfDayAt(19), TimeOfDay::Evening);
    BOOST_CHECK_EQUAL(WorldClock::timeOfDayAt(23), TimeOfDay::Evening);
}

BOOST_AUTO_TEST_CASE(TestDaytime) {
    BOOST_CHECK(clock.isDaytime());
    clock.advanceTo(19, 0);
    BOOST_CHECK(!clock.isDaytime());
    clock.advanceTo(6, 0);
    BOOST_CHECK(clock.isDaytime());
}

BOOST_AUTO_TEST_CASE(TestMinutesUntilNextPeriod) {
    // 08:00 Morning ends at 12:00
    BOOST_CHECK_EQUAL(clock.minutesUntilNextPeriod(), 4 * 60);
    clock.advance(30);
    BOOST_CHECK_EQUAL(clock.minutesUntilNextPeriod(), 3 * 60 + 30);

    // Evening runs into midnight
    clock.advanceTo(22, 0);
    BOOST_CHECK_EQUAL(clock.minutesUntilNextPeriod(), 2 * 60);
}

BOOST_AUTO_TEST_CASE(TestFormatted) {
    BOOST_CHECK_EQUAL(clock.formatted(), "Year 1, Seedwake 1 (Spring), 08:00");
    clock.advance(MINUTES_PER_DAY * 31 + 75);
    BOOST_CHECK_EQUAL(clock.formatted(), "Year 1, Bloomtide 2 (Spring), 09:15");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ADVANCE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(AdvanceTests, ClockFixture)

BOOST_AUTO_TEST_CASE(TestAdvanceCountsBoundaries) {
    AdvanceResult result = clock.advance(30);
    BOOST_CHECK_EQUAL(result.fromMinute, 8 * 60);
    BOOST_CHECK_EQUAL(result.toMinute, 8 * 60 + 30);
    BOOST_CHECK_EQUAL(result.hoursCrossed, 0);
    BOOST_CHECK_EQUAL(result.daysCrossed, 0);

    result = clock.advance(30);
    BOOST_CHECK_EQUAL(result.hoursCrossed, 1);
    BOOST_CHECK_EQUAL(clock.hour(), 9);

    result = clock.advance(MINUTES_PER_DAY);
    BOOST_CHECK_EQUAL(result.hoursCrossed, 24);
    BOOST_CHECK_EQUAL(result.daysCrossed, 1);
    BOOST_CHECK(!result.seasonChanged);
    BOOST_CHECK_EQUAL(clock.dayNumber(), 2);
}

BOOST_AUTO_TEST_CASE(TestNonPositiveAdvanceRejected) {
    BOOST_CHECK(throwsWithCode(ErrorCode::InvalidArgument, [&] { clock.advance(0); }));
    BOOST_CHECK(throwsWithCode(ErrorCode::InvalidArgument, [&] { clock.advance(-5); }));
    BOOST_CHECK_EQUAL(clock.totalMinutes(), 8 * 60);
}

BOOST_AUTO_TEST_CASE(TestAdvancePastClockLimitRejected) {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    BOOST_CHECK(throwsWithCode(ErrorCode::InvalidArgument, [&] { clock.advance(kMax - 100); }));
    BOOST_CHECK(throwsWithCode(ErrorCode::InvalidArgument, [&] { clock.advance(kMax); }));
    BOOST_CHECK_EQUAL(clock.totalMinutes(), 8 * 60);

    // The clock stays usable afterwards
    clock.advance(60);
    BOOST_CHECK_EQUAL(clock.hour(), 9);
}

BOOST_AUTO_TEST_CASE(TestAdvanceToNextOccurrence) {
    AdvanceResult result = clock.advanceTo(6, 0);
    BOOST_CHECK_EQUAL(clock.hour(), 6);
    BOOST_CHECK_EQUAL(clock.dayNumber(), 2);
    BOOST_CHECK_EQUAL(result.toMinute - result.fromMinute, 22 * 60);

    // Same wall time means a full day
    result = clock.advanceTo(6, 0);
    BOOST_CHECK_EQUAL(result.toMinute - result.fromMinute, MINUTES_PER_DAY);

    BOOST_CHECK_THROW(clock.advanceTo(24, 0), WorldError);
    BOOST_CHECK_THROW(clock.advanceTo(3, 60), WorldError);
}

BOOST_AUTO_TEST_CASE(TestSetTotalMinutes) {
    clock.setTotalMinutes(12345);
    BOOST_CHECK_EQUAL(clock.totalMinutes(), 12345);
    BOOST_CHECK(throwsWithCode(ErrorCode::CorruptData, [&] { clock.setTotalMinutes(-1); }));
}

BOOST_AUTO_TEST_CASE(TestNegativeStartRejected) {
    BOOST_CHECK(throwsWithCode(ErrorCode::InvalidArgument,
                               [] { WorldClock bad(configStartingAt(-1)); }));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SCHEDULING TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SchedulingTests, ClockFixture)

BOOST_AUTO_TEST_CASE(TestOneShotFiresOnce) {
    std::vector<int64_t> fired;
    clock.schedule(90, [&fired](int64_t minute) { fired.push_back(minute); });
    BOOST_CHECK_EQUAL(clock.pendingCallbacks(), 1u);

    clock.advance(60);
    BOOST_CHECK(fired.empty());

    AdvanceResult result = clock.advance(60);
    BOOST_REQUIRE_EQUAL(fired.size(), 1u);
    BOOST_CHECK_EQUAL(fired[0], 8 * 60 + 90);
    BOOST_CHECK_EQUAL(result.callbacksFired, 1u);
    BOOST_CHECK_EQUAL(clock.pendingCallbacks(), 0u);

    clock.advance(MINUTES_PER_DAY);
    BOOST_CHECK_EQUAL(fired.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestRecurringFiresPerOccurrence) {
    std::vector<int64_t> fired;
    clock.scheduleRecurring(60, 60, [&fired](int64_t minute) { fired.push_back(minute); });

    // One advance across three occurrences
    AdvanceResult result = clock.advance(180);
    BOOST_CHECK_EQUAL(result.callbacksFired, 3u);
    BOOST_REQUIRE_EQUAL(fired.size(), 3u);
    BOOST_CHECK_EQUAL(fired[0], 9 * 60);
    BOOST_CHECK_EQUAL(fired[1], 10 * 60);
    BOOST_CHECK_EQUAL(fired[2], 11 * 60);
    BOOST_CHECK_EQUAL(clock.pendingCallbacks(), 1u);
}

BOOST_AUTO_TEST_CASE(TestCallbacksFireInTriggerOrder) {
    std::vector<std::string> order;
    clock.schedule(30, [&order](int64_t) { order.push_back("b"); });
    clock.schedule(10, [&order](int64_t) { order.push_back("a"); });
    clock.schedule(30, [&order](int64_t) { order.push_back("c"); });

    clock.advance(60);
    BOOST_REQUIRE_EQUAL(order.size(), 3u);
    BOOST_CHECK_EQUAL(order[0], "a");
    BOOST_CHECK_EQUAL(order[1], "b");
    BOOST_CHECK_EQUAL(order[2], "c");
}

BOOST_AUTO_TEST_CASE(TestCancel) {
    int fired = 0;
    const auto id = clock.scheduleRecurring(10, 10, [&fired](int64_t) { ++fired; });
    clock.advance(25);
    BOOST_CHECK_EQUAL(fired, 2);

    BOOST_CHECK(clock.cancel(id));
    BOOST_CHECK(!clock.cancel(id));
    clock.advance(100);
    BOOST_CHECK_EQUAL(fired, 2);
}

BOOST_AUTO_TEST_CASE(TestFailingCallbackDoesNotAbortAdvance) {
    int healthy = 0;
    const auto failingId = clock.schedule(5, [](int64_t) {
        throw std::runtime_error("boom");
    });
    clock.schedule(10, [&healthy](int64_t) { ++healthy; });

    AdvanceResult result = clock.advance(20);
    BOOST_CHECK_EQUAL(healthy, 1);
    BOOST_CHECK_EQUAL(result.callbacksFired, 2u);
    BOOST_REQUIRE_EQUAL(result.failures.size(), 1u);
    BOOST_CHECK_EQUAL(result.failures[0].callbackId, failingId);
    BOOST_CHECK_EQUAL(result.failures[0].message, "boom");
    BOOST_CHECK_EQUAL(clock.totalMinutes(), 8 * 60 + 20);
}

BOOST_AUTO_TEST_CASE(TestAdvanceFromCallbackRejected) {
    clock.schedule(1, [this](int64_t) { clock.advance(5); });
    AdvanceResult result = clock.advance(5);
    BOOST_REQUIRE_EQUAL(result.failures.size(), 1u);
    BOOST_CHECK_EQUAL(clock.totalMinutes(), 8 * 60 + 5);
}

BOOST_AUTO_TEST_CASE(TestInvalidScheduleRejected) {
    BOOST_CHECK_THROW(clock.schedule(-1, [](int64_t) {}), WorldError);
    BOOST_CHECK_THROW(clock.schedule(5, WorldClock::Callback{}), WorldError);
    BOOST_CHECK_THROW(clock.scheduleRecurring(0, 0, [](int64_t) {}), WorldError);

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    BOOST_CHECK(throwsWithCode(ErrorCode::InvalidArgument,
                               [&] { clock.schedule(kMax, [](int64_t) {}); }));
    BOOST_CHECK(throwsWithCode(ErrorCode::InvalidArgument,
                               [&] { clock.scheduleRecurring(kMax - 10, 5, [](int64_t) {}); }));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// WORKING HOURS TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(WorkingHoursTests, ClockFixture)

BOOST_AUTO_TEST_CASE(TestDefaultWindow) {
    // 08:00, default window [8,18)
    BOOST_CHECK(clock.isWorkingHours("blacksmith"));
    clock.advanceTo(18, 0);
    BOOST_CHECK(!clock.isWorkingHours("blacksmith"));
    clock.advanceTo(7, 59);
    BOOST_CHECK(!clock.isWorkingHours("blacksmith"));
}

BOOST_AUTO_TEST_CASE(TestProfessionOverrides) {
    clock.advanceTo(22, 0);
    BOOST_CHECK(clock.isWorkingHours("innkeeper"));
    BOOST_CHECK(!clock.isWorkingHours("guard"));

    clock.advanceTo(6, 30);
    BOOST_CHECK(clock.isWorkingHours("farmer"));
    BOOST_CHECK(clock.isWorkingHours("guard"));
    BOOST_CHECK(!clock.isWorkingHours("miner"));
}

BOOST_AUTO_TEST_CASE(TestWindowWrapsPastMidnight) {
    WorkWindow night{22, 6};
    BOOST_CHECK(night.contains(23));
    BOOST_CHECK(night.contains(0));
    BOOST_CHECK(night.contains(5));
    BOOST_CHECK(!night.contains(6));
    BOOST_CHECK(!night.contains(12));

    WorkWindow allDay{0, 0};
    BOOST_CHECK(allDay.contains(3));
    BOOST_CHECK(allDay.contains(15));
}

BOOST_AUTO_TEST_SUITE_END()
