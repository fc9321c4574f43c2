/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WEATHER_HPP
#define WEATHER_HPP

#include "core/WorldClock.hpp"
#include "entities/Location.hpp"
#include <random>
#include <string>

namespace Mythweave
{

/**
 * @brief Weather probability configuration for a season
 *
 * Weights need not sum to 1, rolls are taken over the total.
 */
struct WeatherProbabilities
{
    float clear{0.40f};
    float cloudy{0.25f};
    float rainy{0.15f};
    float stormy{0.05f};
    float foggy{0.10f};
    float snowy{0.00f};
    float windy{0.05f};

    float total() const
    {
        return clear + cloudy + rainy + stormy + foggy + snowy + windy;
    }

    /**
     * @brief Get default probabilities for a specific season
     */
    static WeatherProbabilities forSeason(Season season);

    /**
     * @brief Seasonal probabilities reshaped by a location's biome
     * @param biome desert, tundra, mountain, coastal, swamp; others are unchanged
     */
    static WeatherProbabilities forBiome(Season season, const std::string& biome);
};

/**
 * @brief Pick weather for a season and biome
 * @param rng World random generator, advanced by exactly one draw
 */
WeatherType rollWeather(Season season, const std::string& biome, std::mt19937& rng);

} // namespace Mythweave

#endif // WEATHER_HPP
