/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/Weather.hpp"

namespace Mythweave
{

WeatherProbabilities WeatherProbabilities::forSeason(Season season)
{
    WeatherProbabilities probs;

    switch (season)
    {
        case Season::Spring:
            probs.clear = 0.35f;
            probs.cloudy = 0.25f;
            probs.rainy = 0.25f;
            probs.stormy = 0.05f;
            probs.foggy = 0.05f;
            probs.snowy = 0.00f;
            probs.windy = 0.05f;
            break;

        case Season::Summer:
            probs.clear = 0.50f;
            probs.cloudy = 0.20f;
            probs.rainy = 0.15f;
            probs.stormy = 0.10f;
            probs.foggy = 0.00f;
            probs.snowy = 0.00f;
            probs.windy = 0.05f;
            break;

        case Season::Fall:
            probs.clear = 0.30f;
            probs.cloudy = 0.30f;
            probs.rainy = 0.20f;
            probs.stormy = 0.05f;
            probs.foggy = 0.10f;
            probs.snowy = 0.00f;
            probs.windy = 0.05f;
            break;

        case Season::Winter:
            probs.clear = 0.25f;
            probs.cloudy = 0.25f;
            probs.rainy = 0.10f;
            probs.stormy = 0.05f;
            probs.foggy = 0.05f;
            probs.snowy = 0.25f;
            probs.windy = 0.05f;
            break;
    }

    return probs;
}

WeatherProbabilities WeatherProbabilities::forBiome(Season season, const std::string& biome)
{
    WeatherProbabilities probs = forSeason(season);

    if (biome == "desert")
    {
        // Precipitation mostly turns into clear sky and wind
        probs.clear += probs.rainy * 0.7f + probs.snowy + probs.foggy;
        probs.rainy *= 0.3f;
        probs.snowy = 0.0f;
        probs.foggy = 0.0f;
        probs.windy += 0.10f;
    }
    else if (biome == "tundra")
    {
        // Rain falls as snow, and snow is possible outside winter
        probs.snowy += probs.rainy + 0.10f;
        probs.rainy = 0.0f;
    }
    else if (biome == "mountain")
    {
        probs.windy *= 2.0f;
        if (season == Season::Fall || season == Season::Winter)
        {
            probs.snowy += 0.10f;
        }
    }
    else if (biome == "coastal")
    {
        probs.windy *= 2.0f;
        probs.stormy *= 1.5f;
        probs.foggy += 0.05f;
    }
    else if (biome == "swamp")
    {
        probs.foggy = probs.foggy * 3.0f + 0.05f;
        probs.rainy *= 1.5f;
    }

    return probs;
}

WeatherType rollWeather(Season season, const std::string& biome, std::mt19937& rng)
{
    const WeatherProbabilities probs = WeatherProbabilities::forBiome(season, biome);

    std::uniform_real_distribution<float> dist(0.0f, probs.total());
    float roll = dist(rng);

    // Accumulate probabilities and pick weather type
    float accumulated = 0.0f;

    accumulated += probs.clear;
    if (roll < accumulated) return WeatherType::Clear;

    accumulated += probs.cloudy;
    if (roll < accumulated) return WeatherType::Cloudy;

    accumulated += probs.rainy;
    if (roll < accumulated) return WeatherType::Rainy;

    accumulated += probs.stormy;
    if (roll < accumulated) return WeatherType::Stormy;

    accumulated += probs.foggy;
    if (roll < accumulated) return WeatherType::Foggy;

    accumulated += probs.snowy;
    if (roll < accumulated) return WeatherType::Snowy;

    accumulated += probs.windy;
    if (roll < accumulated) return WeatherType::Windy;

    // Rounding can leave the roll at the very top of the range
    return WeatherType::Clear;
}

} // namespace Mythweave
