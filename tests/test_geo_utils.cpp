#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "core/GeoUtils.h"
#include "test_fixtures.h"

TEST(GeoUtilsTest, DistanceIsSymmetricAndZeroForSamePoint)
{
    EXPECT_DOUBLE_EQ(GeoUtils::distance_km(NYC_DRIVER_NEAR, NYC_PICKUP),
                     GeoUtils::distance_km(NYC_PICKUP, NYC_DRIVER_NEAR));
    EXPECT_DOUBLE_EQ(GeoUtils::distance_km(NYC_PICKUP, NYC_PICKUP), 0.0);
}

TEST(GeoUtilsTest, KnownDistances)
{
    EXPECT_NEAR(GeoUtils::distance_km(NYC_DRIVER_NEAR, NYC_PICKUP), 6.29, 0.05);
    EXPECT_NEAR(GeoUtils::distance_km(NYC_PICKUP, NYC_DROPOFF), 12.01, 0.05);

    GeoPoint london(51.5074, -0.1278);
    GeoPoint paris(48.8566, 2.3522);
    EXPECT_NEAR(GeoUtils::distance_km(london, paris), 343.5, 1.0);
    EXPECT_NEAR(GeoUtils::distance_m(london, paris), 343500.0, 1000.0);
}

TEST(GeoUtilsTest, BearingCardinalDirections)
{
    GeoPoint origin(0, 0);
    EXPECT_NEAR(GeoUtils::bearing_degrees(origin, GeoPoint(1, 0)), 0.0, 1e-6);
    EXPECT_NEAR(GeoUtils::bearing_degrees(origin, GeoPoint(0, 1)), 90.0, 1e-6);
    EXPECT_NEAR(GeoUtils::bearing_degrees(origin, GeoPoint(-1, 0)), 180.0, 1e-6);
    EXPECT_NEAR(GeoUtils::bearing_degrees(origin, GeoPoint(0, -1)), 270.0, 1e-6);
}

TEST(GeoUtilsTest, RejectsInvalidCoordinates)
{
    EXPECT_FALSE(GeoUtils::is_valid(GeoPoint(91, 0)));
    EXPECT_FALSE(GeoUtils::is_valid(GeoPoint(0, -181)));
    EXPECT_FALSE(GeoUtils::is_valid(GeoPoint(std::numeric_limits<double>::quiet_NaN(), 0)));
    EXPECT_TRUE(GeoUtils::is_valid(GeoPoint(-90, 180)));

    EXPECT_THROW(GeoUtils::distance_km(GeoPoint(95, 0), NYC_PICKUP), InvalidCoordinateError);
    EXPECT_THROW(GeoUtils::bearing_degrees(NYC_PICKUP, GeoPoint(0, 200)), InvalidCoordinateError);
}

TEST(GeoUtilsTest, GeofenceRadius)
{
    EXPECT_TRUE(GeoUtils::is_within_radius(GeoPoint(40.7311, -73.9352), NYC_PICKUP, 100));
    EXPECT_FALSE(GeoUtils::is_within_radius(GeoPoint(40.7326, -73.9352), NYC_PICKUP, 100));
    EXPECT_TRUE(GeoUtils::is_within_radius(NYC_PICKUP, NYC_PICKUP, 0));
}

TEST(GeoUtilsTest, CrossTrackDistance)
{
    GeoPoint from(0, 0);
    GeoPoint to(1, 0);

    EXPECT_NEAR(GeoUtils::cross_track_distance_km(GeoPoint(0.5, 0), from, to), 0.0, 1e-6);
    EXPECT_NEAR(GeoUtils::cross_track_distance_km(GeoPoint(0.5, 0.01), from, to), 1.112, 0.01);

    // beyond either end the nearest endpoint is used
    EXPECT_NEAR(GeoUtils::cross_track_distance_km(GeoPoint(2, 0), from, to), 111.19, 0.1);
    EXPECT_NEAR(GeoUtils::cross_track_distance_km(GeoPoint(-1, 0), from, to), 111.19, 0.1);

    // degenerate leg
    EXPECT_NEAR(GeoUtils::cross_track_distance_km(GeoPoint(0, 1), from, from), 111.19, 0.1);
}
