#ifndef ETAMODEL_H
#define ETAMODEL_H

#include "../../include/ddc_types.hpp"
#include "../../include/ddc_errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

// Travel-time estimate: distance over an assumed speed, scaled by traffic and
// weather. The multipliers are plain tables so they can be checked directly.
class EtaModel
{
public:
    static double traffic_multiplier(TrafficCondition traffic)
    {
        static const double MULTIPLIERS[TRAFFIC_CONDITION_COUNT] = {
            0.9, // LIGHT
            1.1, // MODERATE
            1.3, // HEAVY
            1.6, // SEVERE
            1.0  // UNKNOWN
        };

        size_t index = static_cast<size_t>(traffic);
        if (index >= TRAFFIC_CONDITION_COUNT)
            throw InvalidInputError("Unknown traffic condition value " + std::to_string(index));
        return MULTIPLIERS[index];
    }

    static double weather_multiplier(const std::string &weather)
    {
        std::string lower = weather;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower.find("rain") != std::string::npos || lower.find("snow") != std::string::npos)
            return 1.2;
        return 1.0;
    }

    static double adjusted_minutes(double base_minutes, TrafficCondition traffic,
                                   const std::string &weather)
    {
        if (base_minutes <= 0)
            return 0;
        return base_minutes * traffic_multiplier(traffic) * weather_multiplier(weather);
    }

    static double base_minutes(double distance_km, double speed_kmh)
    {
        if (distance_km <= 0 || speed_kmh <= 0)
            return 0;
        return distance_km / speed_kmh * 60.0;
    }

    static uint64_t eta_timestamp(uint64_t from, double minutes)
    {
        if (minutes <= 0)
            return from;
        return from + static_cast<uint64_t>(std::llround(minutes * 60.0));
    }
};

#endif // ETAMODEL_H
