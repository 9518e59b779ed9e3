#ifndef DDC_ENUMS_HPP
#define DDC_ENUMS_HPP

#include "ddc_types.hpp"
#include "ddc_errors.hpp"
#include <string>
#include <algorithm>
#include <cctype>
using namespace std;

// String forms used on the JSON contract. Parsing is case-insensitive and
// throws InvalidInputError on anything it does not recognise.

namespace ddc_enums_detail
{
    inline string upper(const string &value)
    {
        string result = value;
        transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return static_cast<char>(toupper(c)); });
        return result;
    }

    template <typename E, size_t N>
    inline const char *name_of(E value, const char *const (&names)[N], const char *what)
    {
        size_t index = static_cast<size_t>(value);
        if (index >= N)
        {
            throw InvalidInputError(string("Unknown ") + what + " value " + to_string(index));
        }
        return names[index];
    }

    template <typename E, size_t N>
    inline E parse(const string &text, const char *const (&names)[N], const char *what)
    {
        string wanted = upper(text);
        for (size_t i = 0; i < N; i++)
        {
            if (wanted == names[i])
                return static_cast<E>(i);
        }
        throw InvalidInputError(string("Unknown ") + what + " '" + text + "'");
    }

    static const char *const AVAILABILITY_NAMES[] = {"OFFLINE", "AVAILABLE", "BUSY", "ON_BREAK"};
    static const char *const ACCOUNT_NAMES[] = {"INACTIVE", "ACTIVE", "SUSPENDED", "BANNED"};
    static const char *const BACKGROUND_NAMES[] = {"PENDING", "APPROVED", "REJECTED", "EXPIRED"};
    static const char *const VEHICLE_TYPE_NAMES[] = {"BICYCLE", "MOTORCYCLE", "SCOOTER", "CAR",
                                                     "VAN", "TRUCK", "WALKING"};
    static const char *const VEHICLE_STATUS_NAMES[] = {"ACTIVE", "INACTIVE", "MAINTENANCE",
                                                       "INSPECTION_REQUIRED", "INSURANCE_EXPIRED",
                                                       "REGISTRATION_EXPIRED", "SUSPENDED", "RETIRED"};
    static const char *const DELIVERY_TYPE_NAMES[] = {"STANDARD", "EXPRESS", "LARGE_ORDER",
                                                      "ALCOHOL", "PHARMACY"};
    static const char *const PRIORITY_NAMES[] = {"LOW", "NORMAL", "HIGH", "URGENT"};
    static const char *const DELIVERY_STATUS_NAMES[] = {"PENDING", "ASSIGNED", "PICKUP_IN_PROGRESS",
                                                        "PICKED_UP", "EN_ROUTE", "ARRIVED",
                                                        "DELIVERED", "CANCELLED", "FAILED"};
    static const char *const ACTOR_NAMES[] = {"DRIVER", "DISPATCHER", "CUSTOMER", "SYSTEM"};
    static const char *const TRACKING_STATUS_NAMES[] = {
        "DRIVER_ASSIGNED", "EN_ROUTE_TO_RESTAURANT", "ARRIVED_AT_RESTAURANT",
        "WAITING_FOR_ORDER", "ORDER_PICKED_UP", "EN_ROUTE_TO_CUSTOMER",
        "ARRIVED_AT_DELIVERY_LOCATION", "DELIVERY_ATTEMPTED", "DELIVERED",
        "DELIVERY_FAILED", "RETURNING_TO_RESTAURANT", "CANCELLED"};
    static const char *const TRAFFIC_NAMES[] = {"LIGHT", "MODERATE", "HEAVY", "SEVERE", "UNKNOWN"};
    static const char *const OUTCOME_NAMES[] = {"APPLIED", "APPLIED_LOW_ACCURACY",
                                                "DROPPED_OUT_OF_ORDER", "DROPPED_INACTIVE",
                                                "DROPPED_UNKNOWN_DELIVERY",
                                                "DROPPED_DRIVER_MISMATCH", "REJECTED_INVALID"};
}

inline string to_string(AvailabilityStatus v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::AVAILABILITY_NAMES, "availability"); }
inline string to_string(DriverAccountStatus v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::ACCOUNT_NAMES, "account status"); }
inline string to_string(BackgroundCheckStatus v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::BACKGROUND_NAMES, "background check"); }
inline string to_string(VehicleType v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::VEHICLE_TYPE_NAMES, "vehicle type"); }
inline string to_string(VehicleStatus v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::VEHICLE_STATUS_NAMES, "vehicle status"); }
inline string to_string(DeliveryType v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::DELIVERY_TYPE_NAMES, "delivery type"); }
inline string to_string(DeliveryPriority v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::PRIORITY_NAMES, "priority"); }
inline string to_string(DeliveryStatus v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::DELIVERY_STATUS_NAMES, "delivery status"); }
inline string to_string(TransitionActor v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::ACTOR_NAMES, "actor"); }
inline string to_string(TrackingStatus v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::TRACKING_STATUS_NAMES, "tracking status"); }
inline string to_string(TrafficCondition v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::TRAFFIC_NAMES, "traffic condition"); }
inline string to_string(TelemetryOutcome v) { return ddc_enums_detail::name_of(v, ddc_enums_detail::OUTCOME_NAMES, "telemetry outcome"); }

// Throws InvalidInputError when a value lies outside its enum, e.g. after a
// cast from an untrusted integer.
inline void validate_enum(AvailabilityStatus v) { to_string(v); }
inline void validate_enum(DriverAccountStatus v) { to_string(v); }
inline void validate_enum(BackgroundCheckStatus v) { to_string(v); }
inline void validate_enum(VehicleType v) { to_string(v); }
inline void validate_enum(VehicleStatus v) { to_string(v); }
inline void validate_enum(DeliveryType v) { to_string(v); }
inline void validate_enum(DeliveryPriority v) { to_string(v); }
inline void validate_enum(DeliveryStatus v) { to_string(v); }
inline void validate_enum(TransitionActor v) { to_string(v); }
inline void validate_enum(TrackingStatus v) { to_string(v); }
inline void validate_enum(TrafficCondition v) { to_string(v); }

inline AvailabilityStatus parse_availability(const string &s) { return ddc_enums_detail::parse<AvailabilityStatus>(s, ddc_enums_detail::AVAILABILITY_NAMES, "availability"); }
inline DriverAccountStatus parse_account_status(const string &s) { return ddc_enums_detail::parse<DriverAccountStatus>(s, ddc_enums_detail::ACCOUNT_NAMES, "account status"); }
inline BackgroundCheckStatus parse_background_check(const string &s) { return ddc_enums_detail::parse<BackgroundCheckStatus>(s, ddc_enums_detail::BACKGROUND_NAMES, "background check"); }
inline VehicleType parse_vehicle_type(const string &s) { return ddc_enums_detail::parse<VehicleType>(s, ddc_enums_detail::VEHICLE_TYPE_NAMES, "vehicle type"); }
inline VehicleStatus parse_vehicle_status(const string &s) { return ddc_enums_detail::parse<VehicleStatus>(s, ddc_enums_detail::VEHICLE_STATUS_NAMES, "vehicle status"); }
inline DeliveryType parse_delivery_type(const string &s) { return ddc_enums_detail::parse<DeliveryType>(s, ddc_enums_detail::DELIVERY_TYPE_NAMES, "delivery type"); }
inline DeliveryPriority parse_priority(const string &s) { return ddc_enums_detail::parse<DeliveryPriority>(s, ddc_enums_detail::PRIORITY_NAMES, "priority"); }
inline DeliveryStatus parse_delivery_status(const string &s) { return ddc_enums_detail::parse<DeliveryStatus>(s, ddc_enums_detail::DELIVERY_STATUS_NAMES, "delivery status"); }
inline TransitionActor parse_actor(const string &s) { return ddc_enums_detail::parse<TransitionActor>(s, ddc_enums_detail::ACTOR_NAMES, "actor"); }
inline TrafficCondition parse_traffic(const string &s) { return ddc_enums_detail::parse<TrafficCondition>(s, ddc_enums_detail::TRAFFIC_NAMES, "traffic condition"); }

#endif
