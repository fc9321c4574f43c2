/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/WorldClock.hpp"
#include "core/Logger.hpp"
#include "core/WorldError.hpp"
#include <array>
#include <format>
#include <limits>

namespace Mythweave
{

namespace
{

constexpr std::array<const char*, 12> kMonthNames = {
    "Seedwake", "Bloomtide", "Rainsong",
    "Sunpeak", "Highsun", "Goldfire",
    "Harvestmoon", "Leaffall", "Mistveil",
    "Frosthold", "Deepwinter", "Thawmark"};

// Hours at which a new time-of-day bucket starts
constexpr std::array<int, 6> kPeriodStartHours = {0, 6, 8, 12, 17, 19};

} // namespace

// ============================================================================
// Names and configuration
// ============================================================================

const char* seasonName(Season season)
{
    switch (season)
    {
        case Season::Spring:
            return "Spring";
        case Season::Summer:
            return "Summer";
        case Season::Fall:
            return "Fall";
        case Season::Winter:
            return "Winter";
    }
    return "Unknown";
}

const char* timeOfDayName(TimeOfDay period)
{
    switch (period)
    {
        case TimeOfDay::Night:
            return "Night";
        case TimeOfDay::Dawn:
            return "Dawn";
        case TimeOfDay::Morning:
            return "Morning";
        case TimeOfDay::Afternoon:
            return "Afternoon";
        case TimeOfDay::Dusk:
            return "Dusk";
        case TimeOfDay::Evening:
            return "Evening";
    }
    return "Unknown";
}

bool WorkWindow::contains(int hour) const
{
    if (startHour == endHour)
    {
        return true;
    }
    if (startHour < endHour)
    {
        return hour >= startHour && hour < endHour;
    }
    // Wraps past midnight
    return hour >= startHour || hour < endHour;
}

ClockConfig ClockConfig::createDefault()
{
    ClockConfig config;
    config.professionWindows["innkeeper"] = WorkWindow{10, 23};
    config.professionWindows["guard"] = WorkWindow{6, 18};
    config.professionWindows["farmer"] = WorkWindow{6, 16};
    config.professionWindows["miner"] = WorkWindow{7, 17};
    return config;
}

// ============================================================================
// WorldClock
// ============================================================================

WorldClock::WorldClock(ClockConfig config)
    : m_config(std::move(config))
{
    if (m_config.startMinute < 0)
    {
        throw WorldError(ErrorCode::InvalidArgument,
                         std::format("Clock start minute must not be negative: {}",
                                     m_config.startMinute));
    }
    m_totalMinutes = m_config.startMinute;
}

AdvanceResult WorldClock::advance(int64_t minutes)
{
    if (minutes <= 0)
    {
        throw WorldError(ErrorCode::InvalidArgument,
                         std::format("Time can only move forward, got {} minutes", minutes));
    }
    if (m_advancing)
    {
        throw WorldError(ErrorCode::InvalidArgument,
                         "WorldClock::advance called from a scheduled callback");
    }

    if (minutes > std::numeric_limits<int64_t>::max() - m_totalMinutes)
    {
        throw WorldError(ErrorCode::InvalidArgument,
                         std::format("Advancing {} minutes from minute {} overflows the clock",
                                     minutes, m_totalMinutes));
    }

    AdvanceResult result;
    result.fromMinute = m_totalMinutes;
    result.toMinute = m_totalMinutes + minutes;
    result.previousSeason = season();

    const int64_t minutesPerSeason = kDaysPerSeason * kMinutesPerDay;
    const int64_t minutesPerMonth = kDaysPerMonth * kMinutesPerDay;
    result.hoursCrossed = (result.toMinute / kMinutesPerHour) -
                          (result.fromMinute / kMinutesPerHour);
    result.daysCrossed = (result.toMinute / kMinutesPerDay) -
                         (result.fromMinute / kMinutesPerDay);
    result.monthsCrossed = (result.toMinute / minutesPerMonth) -
                           (result.fromMinute / minutesPerMonth);
    result.seasonChanged = (result.toMinute / minutesPerSeason) !=
                           (result.fromMinute / minutesPerSeason);

    m_totalMinutes = result.toMinute;
    fireDue(result);

    if (result.daysCrossed > 0)
    {
        CLOCK_DEBUG(std::format("Day passed, now {}", formatted()));
    }
    return result;
}

AdvanceResult WorldClock::advanceTo(int hour, int minute)
{
    if (hour < 0 || hour >= kHoursPerDay || minute < 0 || minute >= kMinutesPerHour)
    {
        throw WorldError(ErrorCode::InvalidArgument,
                         std::format("Invalid wall-clock time {:02}:{:02}", hour, minute));
    }

    const int64_t target = hour * kMinutesPerHour + minute;
    const int64_t now = m_totalMinutes % kMinutesPerDay;
    int64_t delta = (target - now + kMinutesPerDay) % kMinutesPerDay;
    if (delta == 0)
    {
        delta = kMinutesPerDay;
    }
    return advance(delta);
}

void WorldClock::fireDue(AdvanceResult& result)
{
    m_advancing = true;

    while (!m_queue.empty() && m_queue.top().triggerMinute <= m_totalMinutes)
    {
        ScheduledCallback entry = m_queue.top();
        m_queue.pop();

        if (m_pending.find(entry.id) == m_pending.end())
        {
            continue; // cancelled
        }

        if (entry.intervalMinutes > 0 &&
            entry.intervalMinutes <= std::numeric_limits<int64_t>::max() - entry.triggerMinute)
        {
            enqueue(entry.triggerMinute + entry.intervalMinutes, entry.id,
                    entry.intervalMinutes, entry.callback);
        }
        else
        {
            m_pending.erase(entry.id);
        }

        try
        {
            entry.callback(entry.triggerMinute);
        }
        catch (const std::exception& e)
        {
            CLOCK_ERROR(std::format("Scheduled callback {} failed at minute {}: {}",
                                    entry.id, entry.triggerMinute, e.what()));
            result.failures.push_back({entry.id, entry.triggerMinute, e.what()});
        }
        ++result.callbacksFired;
    }

    m_advancing = false;
}

void WorldClock::enqueue(int64_t triggerMinute, CallbackId id, int64_t intervalMinutes,
                         Callback callback)
{
    m_queue.push(ScheduledCallback{triggerMinute, m_nextOrder++, id, intervalMinutes,
                                   std::move(callback)});
}

WorldClock::CallbackId WorldClock::schedule(int64_t delayMinutes, Callback callback)
{
    if (delayMinutes < 0 || !callback)
    {
        throw WorldError(ErrorCode::InvalidArgument,
                         std::format("Invalid schedule request (delay {})", delayMinutes));
    }

    if (delayMinutes > std::numeric_limits<int64_t>::max() - m_totalMinutes)
    {
        throw WorldError(ErrorCode::InvalidArgument,
                         std::format("Schedule delay {} overflows the clock", delayMinutes));
    }

    const CallbackId id = m_nextId++;
    m_pending.insert(id);
    enqueue(m_totalMinutes + delayMinutes, id, 0, std::move(callback));
    return id;
}

WorldClock::CallbackId WorldClock::scheduleRecurring(int64_t delayMinutes,
                                                     int64_t intervalMinutes,
                                                     Callback callback)
{
    if (delayMinutes < 0 || intervalMinutes <= 0 || !callback)
    {
        throw WorldError(ErrorCode::InvalidArgument,
                         std::format("Invalid recurring schedule (delay {}, interval {})",
                                     delayMinutes, intervalMinutes));
    }

    if (delayMinutes > std::numeric_limits<int64_t>::max() - m_totalMinutes)
    {
        throw WorldError(ErrorCode::InvalidArgument,
                         std::format("Schedule delay {} overflows the clock", delayMinutes));
    }

    const CallbackId id = m_nextId++;
    m_pending.insert(id);
    enqueue(m_totalMinutes + delayMinutes, id, intervalMinutes, std::move(callback));
    return id;
}

bool WorldClock::cancel(CallbackId id)
{
    // Queue entries are dropped lazily when they reach the top
    return m_pending.erase(id) > 0;
}

// ============================================================================
// Queries
// ============================================================================

int WorldClock::minute() const
{
    return static_cast<int>(m_totalMinutes % kMinutesPerHour);
}

int WorldClock::hour() const
{
    return static_cast<int>((m_totalMinutes / kMinutesPerHour) % kHoursPerDay);
}

int WorldClock::dayOfYear() const
{
    return static_cast<int>((m_totalMinutes / kMinutesPerDay) % kDaysPerYear) + 1;
}

int WorldClock::dayOfMonth() const
{
    return (dayOfYear() - 1) % static_cast<int>(kDaysPerMonth) + 1;
}

int WorldClock::month() const
{
    return (dayOfYear() - 1) / static_cast<int>(kDaysPerMonth) + 1;
}

int WorldClock::year() const
{
    return static_cast<int>(m_totalMinutes / (kDaysPerYear * kMinutesPerDay)) + 1;
}

int64_t WorldClock::dayNumber() const
{
    return m_totalMinutes / kMinutesPerDay + 1;
}

Season WorldClock::seasonAt(int64_t totalMinutes)
{
    const int64_t dayIndex = (totalMinutes / kMinutesPerDay) % kDaysPerYear;
    return static_cast<Season>(dayIndex / kDaysPerSeason);
}

Season WorldClock::season() const
{
    return seasonAt(m_totalMinutes);
}

TimeOfDay WorldClock::timeOfDayAt(int hour)
{
    if (hour < 6)
        return TimeOfDay::Night;
    if (hour < 8)
        return TimeOfDay::Dawn;
    if (hour < 12)
        return TimeOfDay::Morning;
    if (hour < 17)
        return TimeOfDay::Afternoon;
    if (hour < 19)
        return TimeOfDay::Dusk;
    return TimeOfDay::Evening;
}

TimeOfDay WorldClock::timeOfDay() const
{
    return timeOfDayAt(hour());
}

const char* WorldClock::monthName() const
{
    return kMonthNames[static_cast<size_t>(month() - 1)];
}

bool WorldClock::isDaytime() const
{
    const int h = hour();
    return h >= 6 && h < 19;
}

int WorldClock::minutesUntilNextPeriod() const
{
    const int minuteOfDay = static_cast<int>(m_totalMinutes % kMinutesPerDay);
    for (int startHour : kPeriodStartHours)
    {
        const int boundary = startHour * static_cast<int>(kMinutesPerHour);
        if (boundary > minuteOfDay)
        {
            return boundary - minuteOfDay;
        }
    }
    return static_cast<int>(kMinutesPerDay) - minuteOfDay;
}

const WorkWindow& WorldClock::workWindowFor(const std::string& profession) const
{
    auto it = m_config.professionWindows.find(profession);
    if (it != m_config.professionWindows.end())
    {
        return it->second;
    }
    return m_config.defaultWorkWindow;
}

bool WorldClock::isWithin(const WorkWindow& window) const
{
    return window.contains(hour());
}

bool WorldClock::isWorkingHours(const std::string& profession) const
{
    return isWithin(workWindowFor(profession));
}

std::string WorldClock::formatted() const
{
    return std::format("Year {}, {} {} ({}), {:02}:{:02}", year(), monthName(),
                       dayOfMonth(), seasonName(season()), hour(), minute());
}

void WorldClock::setTotalMinutes(int64_t totalMinutes)
{
    if (totalMinutes < 0)
    {
        throw WorldError(ErrorCode::CorruptData,
                         std::format("Negative clock value in snapshot: {}", totalMinutes));
    }
    m_totalMinutes = totalMinutes;
}

} // namespace Mythweave
