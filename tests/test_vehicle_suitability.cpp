#include <gtest/gtest.h>

#include "test_fixtures.h"

class VehicleSuitabilityTest : public ::testing::Test
{
protected:
    ManualClock clock;
    VehicleSuitabilityEvaluator evaluator;

    VehicleSuitabilityTest() : evaluator(clock) {}

    VehicleInfo usable(VehicleType type)
    {
        VehicleInfo vehicle;
        vehicle.vehicle_id = 1;
        vehicle.type = type;
        vehicle.is_verified = 1;
        vehicle.insurance_expiry = clock.now() + 86400;
        vehicle.registration_expiry = clock.now() + 86400;
        return vehicle;
    }
};

TEST_F(VehicleSuitabilityTest, AlcoholAndPharmacyExcludeBicycleAndWalking)
{
    for (DeliveryType type : {DeliveryType::ALCOHOL, DeliveryType::PHARMACY})
    {
        EXPECT_FALSE(VehicleSuitabilityEvaluator::type_allowed(type, VehicleType::BICYCLE));
        EXPECT_FALSE(VehicleSuitabilityEvaluator::type_allowed(type, VehicleType::WALKING));
        EXPECT_TRUE(VehicleSuitabilityEvaluator::type_allowed(type, VehicleType::SCOOTER));
        EXPECT_TRUE(VehicleSuitabilityEvaluator::type_allowed(type, VehicleType::CAR));
    }
}

TEST_F(VehicleSuitabilityTest, LargeOrdersNeedCarVanOrTruck)
{
    EXPECT_TRUE(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::LARGE_ORDER, VehicleType::CAR));
    EXPECT_TRUE(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::LARGE_ORDER, VehicleType::VAN));
    EXPECT_TRUE(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::LARGE_ORDER, VehicleType::TRUCK));
    EXPECT_FALSE(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::LARGE_ORDER, VehicleType::MOTORCYCLE));
    EXPECT_FALSE(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::LARGE_ORDER, VehicleType::BICYCLE));
}

TEST_F(VehicleSuitabilityTest, ExpressPrefersNimbleVehicles)
{
    EXPECT_TRUE(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::EXPRESS, VehicleType::MOTORCYCLE));
    EXPECT_TRUE(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::EXPRESS, VehicleType::SCOOTER));
    EXPECT_TRUE(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::EXPRESS, VehicleType::BICYCLE));
    EXPECT_FALSE(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::EXPRESS, VehicleType::TRUCK));
}

TEST_F(VehicleSuitabilityTest, StandardAcceptsAnything)
{
    for (int t = 0; t <= static_cast<int>(VehicleType::WALKING); t++)
        EXPECT_TRUE(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::STANDARD, static_cast<VehicleType>(t)));
}

TEST_F(VehicleSuitabilityTest, UnknownEnumValuesThrow)
{
    EXPECT_THROW(VehicleSuitabilityEvaluator::type_allowed(static_cast<DeliveryType>(42), VehicleType::CAR),
                 InvalidInputError);
    EXPECT_THROW(VehicleSuitabilityEvaluator::type_allowed(DeliveryType::STANDARD, static_cast<VehicleType>(42)),
                 InvalidInputError);
}

TEST_F(VehicleSuitabilityTest, CapacityLimits)
{
    VehicleInfo scooter = usable(VehicleType::SCOOTER);
    scooter.capacity_weight_kg = 15;
    scooter.capacity_volume_l = 40;

    EXPECT_TRUE(evaluator.is_suitable(scooter, DeliveryType::STANDARD, 10, 30));
    EXPECT_FALSE(evaluator.is_suitable(scooter, DeliveryType::STANDARD, 20, 30));
    EXPECT_FALSE(evaluator.is_suitable(scooter, DeliveryType::STANDARD, 10, 50));

    // unknown capacity never blocks
    VehicleInfo car = usable(VehicleType::CAR);
    EXPECT_TRUE(evaluator.is_suitable(car, DeliveryType::STANDARD, 500, 900));
}

TEST_F(VehicleSuitabilityTest, ExpiredInsuranceMakesVehicleUnusable)
{
    VehicleInfo car = usable(VehicleType::CAR);
    EXPECT_TRUE(evaluator.is_usable(car));

    car.insurance_expiry = clock.now() - 1;
    EXPECT_EQ(evaluator.derive_status(car), VehicleStatus::INSURANCE_EXPIRED);
    EXPECT_FALSE(evaluator.is_usable(car));
    EXPECT_FALSE(evaluator.is_suitable(car, DeliveryType::STANDARD, 0, 0));
}

TEST_F(VehicleSuitabilityTest, DerivedStatusPrecedence)
{
    VehicleInfo car = usable(VehicleType::CAR);
    car.registration_expiry = clock.now() - 10;
    car.next_inspection_due = clock.now() - 10;
    EXPECT_EQ(evaluator.derive_status(car), VehicleStatus::REGISTRATION_EXPIRED);

    car.registration_expiry = 0;
    EXPECT_EQ(evaluator.derive_status(car), VehicleStatus::INSPECTION_REQUIRED);

    car.next_inspection_due = 0;
    car.next_maintenance_due = clock.now() - 10;
    EXPECT_EQ(evaluator.derive_status(car), VehicleStatus::MAINTENANCE);

    car.next_maintenance_due = 0;
    car.status = VehicleStatus::SUSPENDED;
    EXPECT_EQ(evaluator.derive_status(car), VehicleStatus::SUSPENDED);
}

TEST_F(VehicleSuitabilityTest, ComplianceLapsesAsClockAdvances)
{
    VehicleInfo car = usable(VehicleType::CAR);
    evaluator.refresh_status(car);
    EXPECT_EQ(car.status, VehicleStatus::ACTIVE);

    clock.advance(2 * 86400);
    EXPECT_FALSE(evaluator.is_usable(car));
    evaluator.refresh_status(car);
    EXPECT_EQ(car.status, VehicleStatus::INSURANCE_EXPIRED);
}

TEST_F(VehicleSuitabilityTest, UnverifiedVehicleIsNotUsable)
{
    VehicleInfo car = usable(VehicleType::CAR);
    car.is_verified = 0;
    EXPECT_FALSE(evaluator.is_usable(car));
}
