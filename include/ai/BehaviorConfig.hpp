/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BEHAVIOR_CONFIG_HPP
#define BEHAVIOR_CONFIG_HPP

#include <cstddef>

namespace Mythweave
{

/**
 * Configuration for the NPC behavior state machine
 *
 * Rates are per simulated minute and scale with the tick length. All
 * thresholds are on the 0-100 needs scale.
 */
struct NPCBehaviorConfig
{
    // State thresholds
    float sleepThreshold = 20.0f;                 // Energy at or below this forces Sleeping
    float wakeThreshold = 80.0f;                  // Sleeping ends once energy reaches this
    float eatThreshold = 70.0f;                   // Hunger at or above this triggers Eating

    // Baseline needs decay, applied every tick regardless of state
    float energyDecayPerMinute = 0.05f;           // k1
    float hungerGainPerMinute = 0.1f;             // k2

    // State effects
    float sleepRecoveryPerMinute = 0.5f;          // Energy regained while Sleeping
    float workEnergyCostPerMinute = 0.1f;         // Extra energy spent while Working
    float mealSize = 40.0f;                       // Minimum hunger removed by one Eating tick
    float eatRatePerMinute = 1.0f;                // Hunger removed per minute while Eating

    // Crafting
    float craftChancePerMinute = 0.01f;           // Base chance at skill level 10
    float craftSkillReference = 10.0f;            // Level at which the base chance applies

    // Socializing
    float socialBaseChance = 0.2f;                // Chance with company at mood 0
    float socialMoodWeight = 0.5f;                // Added chance at mood 100

    // Mood model
    float moodHalfLifeMinutes = 240.0f;           // Age at which a memory counts half
    float lowEnergyMoodLevel = 30.0f;             // Below this energy mood is penalized
    float highHungerMoodLevel = 70.0f;            // Above this hunger mood is penalized
    float needPenalty = 10.0f;                    // Mood penalty per unmet need

    // Mood impact of remembered events
    float mealMoodImpact = 4.0f;
    float restMoodImpact = 6.0f;
    float craftMoodImpact = 8.0f;
    float socialMoodImpact = 5.0f;
    float arrivalMoodImpact = 2.0f;

    size_t memoryCapacity = 20;                   // Memory entries kept per NPC
};

} // namespace Mythweave

#endif // BEHAVIOR_CONFIG_HPP
