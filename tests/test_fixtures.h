#ifndef TEST_FIXTURES_H
#define TEST_FIXTURES_H

#include <gtest/gtest.h>
#include <atomic>

#include "ddc_types.hpp"
#include "ddc_config.hpp"
#include "core/Clock.h"
#include "core/VehicleSuitability.h"
#include "core/DriverRegistry.h"
#include "core/EventPublisher.h"
#include "core/DeliveryManager.h"
#include "core/TrackingEngine.h"
#include "core/DispatchMatcher.h"

// Clock the tests move by hand.
class ManualClock : public Clock
{
private:
    std::atomic<uint64_t> now_;

public:
    explicit ManualClock(uint64_t start = 1700000000) : now_(start) {}

    uint64_t now() const override { return now_.load(); }

    void set(uint64_t value) { now_ = value; }
    void advance(uint64_t seconds) { now_ += seconds; }
};

// New York reference points used across the suites.
static const GeoPoint NYC_DRIVER_NEAR(40.7128, -74.0060);
static const GeoPoint NYC_DRIVER_FAR(40.6413, -73.7781);
static const GeoPoint NYC_PICKUP(40.7306, -73.9352);
static const GeoPoint NYC_DROPOFF(40.8386, -73.9352);

static const uint64_t ONE_YEAR_S = 365ULL * 86400ULL;

// Full dispatch stack on a manual clock with an in-memory event log.
class DispatchFixture : public ::testing::Test
{
protected:
    DDCConfig config;
    ManualClock clock;
    VehicleSuitabilityEvaluator suitability;
    MemoryEventLog events;
    DriverRegistry registry;
    DeliveryManager deliveries;
    TrackingEngine tracking;
    DispatchMatcher matcher;

    DispatchFixture()
        : suitability(clock),
          registry(clock, suitability),
          deliveries(config, clock, registry, events),
          tracking(config, clock, deliveries, registry),
          matcher(config, suitability, registry, deliveries)
    {
        config.verbose = false;
    }

    uint64_t add_driver(const string &name, const GeoPoint &location,
                        VehicleType type = VehicleType::CAR,
                        AvailabilityStatus availability = AvailabilityStatus::AVAILABLE)
    {
        DriverProfile profile;
        profile.full_name = name;
        profile.license_expiry = clock.now() + ONE_YEAR_S;
        profile.background_check = BackgroundCheckStatus::APPROVED;
        profile.account_status = DriverAccountStatus::ACTIVE;
        profile.availability = availability;
        profile.has_location = 1;
        profile.location = location;
        profile.last_location_update = clock.now();
        uint64_t driver_id = registry.register_driver(profile);

        VehicleInfo vehicle;
        vehicle.owner_driver_id = driver_id;
        vehicle.type = type;
        vehicle.is_verified = 1;
        registry.register_vehicle(vehicle);
        return driver_id;
    }

    static DeliveryRequest make_request(uint64_t order_id,
                                        DeliveryType type = DeliveryType::STANDARD,
                                        DeliveryPriority priority = DeliveryPriority::NORMAL)
    {
        DeliveryRequest request;
        request.order_id = order_id;
        request.pickup_location = NYC_PICKUP;
        request.dropoff_location = NYC_DROPOFF;
        request.pickup_address = "Restaurant";
        request.dropoff_address = "Customer";
        request.type = type;
        request.priority = priority;
        request.delivery_fee = 10.0;
        request.tip_amount = 3.0;
        return request;
    }

    TelemetryReport report_for(uint64_t delivery_id, uint64_t driver_id, const GeoPoint &location,
                               double speed = 20.0, double accuracy = 5.0)
    {
        TelemetryReport report;
        report.delivery_id = delivery_id;
        report.driver_id = driver_id;
        report.location = location;
        report.speed = speed;
        report.accuracy = accuracy;
        report.timestamp = clock.now();
        return report;
    }

    DeliveryRecord delivery(uint64_t delivery_id)
    {
        DeliveryRecord record;
        EXPECT_TRUE(deliveries.get_delivery(delivery_id, record));
        return record;
    }

    DriverProfile driver(uint64_t driver_id)
    {
        DriverProfile profile;
        EXPECT_TRUE(registry.get_driver(driver_id, profile));
        return profile;
    }

    TrackingRecord tracking_record(uint64_t delivery_id)
    {
        TrackingRecord record;
        EXPECT_TRUE(deliveries.get_tracking(delivery_id, record));
        return record;
    }
};

#endif // TEST_FIXTURES_H
