/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_CLOCK_HPP
#define WORLD_CLOCK_HPP

/**
 * @file WorldClock.hpp
 * @brief Simulated world time: calendar, seasons, time-of-day and scheduling
 *
 * The WorldClock owns a single monotonic minute counter measured from
 * Year 1, Day 1, 00:00. Every calendar field is derived from that counter:
 * - 60 minutes per hour, 24 hours per day
 * - 30-day months, 12 months per year (360 days)
 * - 4 seasons of 90 days each
 *
 * The counter only moves through advance(), which also fires scheduled
 * callbacks in trigger order.
 */

#include <cstdint>
#include <functional>
#include <map>
#include <ostream>
#include <queue>
#include <string>
#include <unordered_set>
#include <vector>

namespace Mythweave
{

/**
 * @brief Type-safe season enumeration
 */
enum class Season : uint8_t
{
    Spring = 0,
    Summer = 1,
    Fall = 2,
    Winter = 3
};

/**
 * @brief Fixed time-of-day buckets
 *
 * Night [0,6), Dawn [6,8), Morning [8,12), Afternoon [12,17),
 * Dusk [17,19), Evening [19,24)
 */
enum class TimeOfDay : uint8_t
{
    Night = 0,
    Dawn = 1,
    Morning = 2,
    Afternoon = 3,
    Dusk = 4,
    Evening = 5
};

const char* seasonName(Season season);
const char* timeOfDayName(TimeOfDay period);

// Stream operators for Boost.Test output
inline std::ostream& operator<<(std::ostream& os, Season season)
{
    return os << seasonName(season);
}

inline std::ostream& operator<<(std::ostream& os, TimeOfDay period)
{
    return os << timeOfDayName(period);
}

/**
 * @brief Daily working window in whole hours
 *
 * endHour is exclusive. A window whose end is before its start wraps past
 * midnight; equal start and end means all day.
 */
struct WorkWindow
{
    int startHour{8};
    int endHour{18};

    bool contains(int hour) const;
};

/**
 * @brief Clock construction parameters
 */
struct ClockConfig
{
    int64_t startMinute{8 * 60};                      // Year 1, Day 1, 08:00
    WorkWindow defaultWorkWindow{8, 18};              // Used for professions without an override
    std::map<std::string, WorkWindow> professionWindows;

    /**
     * @brief Default configuration with the stock profession schedules
     * @return ClockConfig with innkeeper, guard, farmer and miner overrides
     */
    static ClockConfig createDefault();
};

/**
 * @brief A scheduled callback that threw while firing
 */
struct ClockCallbackFailure
{
    uint64_t callbackId{0};
    int64_t triggerMinute{0};
    std::string message;
};

/**
 * @brief What a single advance() crossed
 */
struct AdvanceResult
{
    int64_t fromMinute{0};
    int64_t toMinute{0};
    int64_t hoursCrossed{0};
    int64_t daysCrossed{0};
    int64_t monthsCrossed{0};
    bool seasonChanged{false};
    Season previousSeason{Season::Spring};
    size_t callbacksFired{0};
    std::vector<ClockCallbackFailure> failures;
};

class WorldClock
{
public:
    static constexpr int64_t kMinutesPerHour = 60;
    static constexpr int64_t kHoursPerDay = 24;
    static constexpr int64_t kMinutesPerDay = kMinutesPerHour * kHoursPerDay;
    static constexpr int64_t kDaysPerMonth = 30;
    static constexpr int64_t kMonthsPerYear = 12;
    static constexpr int64_t kDaysPerYear = kDaysPerMonth * kMonthsPerYear;
    static constexpr int64_t kDaysPerSeason = 90;

    using Callback = std::function<void(int64_t triggerMinute)>;
    using CallbackId = uint64_t;

    explicit WorldClock(ClockConfig config = ClockConfig::createDefault());

    /**
     * @brief Advance simulated time and fire every callback that became due
     * @param minutes Number of minutes to advance, must be positive
     * @return Summary of the calendar boundaries crossed
     * @throws WorldError(InvalidArgument) if minutes <= 0 or when called
     *         from inside a scheduled callback
     */
    AdvanceResult advance(int64_t minutes);

    /**
     * @brief Advance to the next occurrence of a wall-clock time
     * @param hour Target hour (0-23)
     * @param minute Target minute (0-59)
     * @note If the clock already shows that time, a full day passes
     */
    AdvanceResult advanceTo(int hour, int minute = 0);

    // ========================================================================
    // Scheduling
    // ========================================================================

    /**
     * @brief Schedule a one-shot callback
     * @param delayMinutes Minutes from now, 0 fires on the next advance
     * @return Id usable with cancel()
     */
    CallbackId schedule(int64_t delayMinutes, Callback callback);

    /**
     * @brief Schedule a callback that repeats every intervalMinutes
     * @note Fires once per occurrence even when one advance crosses several
     */
    CallbackId scheduleRecurring(int64_t delayMinutes, int64_t intervalMinutes,
                                 Callback callback);

    bool cancel(CallbackId id);
    size_t pendingCallbacks() const { return m_pending.size(); }

    // ========================================================================
    // Queries
    // ========================================================================

    int64_t totalMinutes() const { return m_totalMinutes; }
    int minute() const;
    int hour() const;
    int dayOfMonth() const;
    int dayOfYear() const;
    int month() const;
    int year() const;
    int64_t dayNumber() const;
    Season season() const;
    TimeOfDay timeOfDay() const;
    const char* monthName() const;

    /**
     * @brief Check if it's daytime (06:00 to 19:00)
     */
    bool isDaytime() const;

    /**
     * @brief Minutes left until the current time-of-day bucket ends
     */
    int minutesUntilNextPeriod() const;

    /**
     * @brief Working-hours predicate for a profession
     * @param profession Profession name, unknown names use the default window
     */
    bool isWorkingHours(const std::string& profession) const;
    bool isWithin(const WorkWindow& window) const;
    const WorkWindow& workWindowFor(const std::string& profession) const;

    /**
     * @brief Human readable time, e.g. "Year 1, Bloomtide 4 (Spring), 08:30"
     */
    std::string formatted() const;

    const ClockConfig& config() const { return m_config; }

    /**
     * @brief Overwrite the minute counter when restoring a snapshot
     * @note Pending callbacks are runtime hooks and are left untouched
     */
    void setTotalMinutes(int64_t totalMinutes);

    static Season seasonAt(int64_t totalMinutes);
    static TimeOfDay timeOfDayAt(int hour);

private:
    struct ScheduledCallback
    {
        int64_t triggerMinute;
        uint64_t order;
        CallbackId id;
        int64_t intervalMinutes; // 0 for one-shot
        Callback callback;
    };

    // Earliest trigger first, insertion order breaks ties
    struct LaterFirst
    {
        bool operator()(const ScheduledCallback& a, const ScheduledCallback& b) const
        {
            if (a.triggerMinute != b.triggerMinute)
            {
                return a.triggerMinute > b.triggerMinute;
            }
            return a.order > b.order;
        }
    };

    ClockConfig m_config;
    int64_t m_totalMinutes{0};
    bool m_advancing{false};

    std::priority_queue<ScheduledCallback, std::vector<ScheduledCallback>, LaterFirst> m_queue;
    std::unordered_set<CallbackId> m_pending;
    CallbackId m_nextId{1};
    uint64_t m_nextOrder{0};

    void enqueue(int64_t triggerMinute, CallbackId id, int64_t intervalMinutes,
                 Callback callback);
    void fireDue(AdvanceResult& result);
};

} // namespace Mythweave

#endif // WORLD_CLOCK_HPP
