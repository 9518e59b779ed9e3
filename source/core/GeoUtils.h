#ifndef GEOUTILS_H
#define GEOUTILS_H

#include "../../include/ddc_types.hpp"
#include "../../include/ddc_errors.hpp"
#include <cmath>
#include <sstream>
#include <string>

class GeoUtils
{
public:
    static constexpr double EARTH_RADIUS_KM = 6371.0;

    static bool is_valid(const GeoPoint &p)
    {
        return !std::isnan(p.latitude) && !std::isnan(p.longitude) &&
               p.latitude >= -90.0 && p.latitude <= 90.0 &&
               p.longitude >= -180.0 && p.longitude <= 180.0;
    }

    static void validate(const GeoPoint &p, const char *what = "coordinate")
    {
        if (!is_valid(p))
        {
            std::ostringstream oss;
            oss << "Invalid " << what << " (" << p.latitude << ", " << p.longitude << ")";
            throw InvalidCoordinateError(oss.str());
        }
    }

    // Haversine formula
    static double distance_km(const GeoPoint &a, const GeoPoint &b)
    {
        validate(a);
        validate(b);

        double dLat = to_radians(b.latitude - a.latitude);
        double dLon = to_radians(b.longitude - a.longitude);
        double lat1 = to_radians(a.latitude);
        double lat2 = to_radians(b.latitude);

        double h = sin(dLat / 2) * sin(dLat / 2) +
                   sin(dLon / 2) * sin(dLon / 2) * cos(lat1) * cos(lat2);
        double c = 2 * atan2(sqrt(h), sqrt(1 - h));

        return EARTH_RADIUS_KM * c;
    }

    static double distance_m(const GeoPoint &a, const GeoPoint &b)
    {
        return distance_km(a, b) * 1000.0;
    }

    // Initial compass bearing from a to b, in [0, 360).
    static double bearing_degrees(const GeoPoint &a, const GeoPoint &b)
    {
        validate(a);
        validate(b);

        double dLon = to_radians(b.longitude - a.longitude);
        double lat1 = to_radians(a.latitude);
        double lat2 = to_radians(b.latitude);

        double y = sin(dLon) * cos(lat2);
        double x = cos(lat1) * sin(lat2) - sin(lat1) * cos(lat2) * cos(dLon);

        double bearing = fmod(to_degrees(atan2(y, x)) + 360.0, 360.0);
        return bearing >= 360.0 ? 0.0 : bearing;
    }

    // Distance from p to the great-circle segment from -> to. Falls back to the
    // nearest endpoint when p projects outside the segment.
    static double cross_track_distance_km(const GeoPoint &p, const GeoPoint &from,
                                          const GeoPoint &to)
    {
        double leg = distance_km(from, to);
        double from_p = distance_km(from, p);
        if (leg < 1e-9 || from_p < 1e-9)
            return from_p;

        double d13 = from_p / EARTH_RADIUS_KM;
        double delta = to_radians(bearing_degrees(from, p) - bearing_degrees(from, to));

        if (cos(delta) < 0)
            return from_p;

        double xt = asin(clamp_unit(sin(d13) * sin(delta)));
        double at = acos(clamp_unit(cos(d13) / cos(xt))) * EARTH_RADIUS_KM;
        if (at > leg)
            return distance_km(to, p);

        return fabs(xt) * EARTH_RADIUS_KM;
    }

    static bool is_within_radius(const GeoPoint &p, const GeoPoint &center, double radius_m)
    {
        return distance_m(p, center) <= radius_m;
    }

private:
    static double to_radians(double degrees) { return degrees * M_PI / 180.0; }
    static double to_degrees(double radians) { return radians * 180.0 / M_PI; }

    static double clamp_unit(double v)
    {
        if (v > 1.0)
            return 1.0;
        if (v < -1.0)
            return -1.0;
        return v;
    }
};

#endif // GEOUTILS_H
