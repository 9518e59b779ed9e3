#ifndef VEHICLESUITABILITY_H
#define VEHICLESUITABILITY_H

#include "../../include/ddc_types.hpp"
#include "../../include/ddc_errors.hpp"
#include "../../include/ddc_enums.hpp"
#include "Clock.h"

class VehicleSuitabilityEvaluator
{
private:
    const Clock &clock_;

    static bool date_passed(uint64_t date, uint64_t now)
    {
        return date != 0 && date < now;
    }

    static void check_vehicle_type(VehicleType type)
    {
        if (static_cast<size_t>(type) > static_cast<size_t>(VehicleType::WALKING))
        {
            throw InvalidInputError("Unknown vehicle type value " +
                                    std::to_string(static_cast<int>(type)));
        }
    }

public:
    explicit VehicleSuitabilityEvaluator(const Clock &clock) : clock_(clock) {}

    // Status the vehicle should carry given its compliance and maintenance
    // dates. SUSPENDED and RETIRED are set by operators and are never cleared
    // here.
    VehicleStatus derive_status(const VehicleInfo &vehicle) const
    {
        uint64_t now = clock_.now();

        if (date_passed(vehicle.insurance_expiry, now))
            return VehicleStatus::INSURANCE_EXPIRED;
        if (date_passed(vehicle.registration_expiry, now))
            return VehicleStatus::REGISTRATION_EXPIRED;
        if (date_passed(vehicle.next_inspection_due, now))
            return VehicleStatus::INSPECTION_REQUIRED;
        if (date_passed(vehicle.next_maintenance_due, now))
            return VehicleStatus::MAINTENANCE;

        if (vehicle.status == VehicleStatus::SUSPENDED ||
            vehicle.status == VehicleStatus::RETIRED ||
            vehicle.status == VehicleStatus::INACTIVE)
            return vehicle.status;

        return VehicleStatus::ACTIVE;
    }

    void refresh_status(VehicleInfo &vehicle) const
    {
        vehicle.status = derive_status(vehicle);
    }

    bool is_usable(const VehicleInfo &vehicle) const
    {
        uint64_t now = clock_.now();

        if (!vehicle.is_active || !vehicle.is_verified)
            return false;
        if (vehicle.status != VehicleStatus::ACTIVE)
            return false;

        return !date_passed(vehicle.insurance_expiry, now) &&
               !date_passed(vehicle.registration_expiry, now) &&
               !date_passed(vehicle.next_inspection_due, now);
    }

    static bool type_allowed(DeliveryType delivery_type, VehicleType vehicle_type)
    {
        check_vehicle_type(vehicle_type);

        switch (delivery_type)
        {
        case DeliveryType::ALCOHOL:
        case DeliveryType::PHARMACY:
            return vehicle_type != VehicleType::BICYCLE &&
                   vehicle_type != VehicleType::WALKING;
        case DeliveryType::LARGE_ORDER:
            return vehicle_type == VehicleType::CAR ||
                   vehicle_type == VehicleType::VAN ||
                   vehicle_type == VehicleType::TRUCK;
        case DeliveryType::EXPRESS:
            return vehicle_type == VehicleType::MOTORCYCLE ||
                   vehicle_type == VehicleType::SCOOTER ||
                   vehicle_type == VehicleType::BICYCLE;
        case DeliveryType::STANDARD:
            return true;
        }

        throw InvalidInputError("Unknown delivery type value " +
                                std::to_string(static_cast<int>(delivery_type)));
    }

    bool is_suitable(const VehicleInfo &vehicle, DeliveryType delivery_type,
                     double weight_kg, double volume_l) const
    {
        // Validate the categorical inputs before anything can short-circuit.
        bool allowed = type_allowed(delivery_type, vehicle.type);

        if (!is_usable(vehicle))
            return false;

        if (weight_kg > 0 && vehicle.capacity_weight_kg > 0 &&
            weight_kg > vehicle.capacity_weight_kg)
            return false;

        if (volume_l > 0 && vehicle.capacity_volume_l > 0 &&
            volume_l > vehicle.capacity_volume_l)
            return false;

        return allowed;
    }
};

#endif // VEHICLESUITABILITY_H
