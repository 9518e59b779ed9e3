#ifndef DDC_TYPES_HPP
#define DDC_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>
using namespace std;

enum class AvailabilityStatus : uint8_t
{
    OFFLINE = 0,
    AVAILABLE = 1,
    BUSY = 2,
    ON_BREAK = 3
};

enum class DriverAccountStatus : uint8_t
{
    INACTIVE = 0,
    ACTIVE = 1,
    SUSPENDED = 2,
    BANNED = 3
};

enum class BackgroundCheckStatus : uint8_t
{
    PENDING = 0,
    APPROVED = 1,
    REJECTED = 2,
    EXPIRED = 3
};

enum class VehicleType : uint8_t
{
    BICYCLE = 0,
    MOTORCYCLE = 1,
    SCOOTER = 2,
    CAR = 3,
    VAN = 4,
    TRUCK = 5,
    WALKING = 6
};

enum class VehicleStatus : uint8_t
{
    ACTIVE = 0,
    INACTIVE = 1,
    MAINTENANCE = 2,
    INSPECTION_REQUIRED = 3,
    INSURANCE_EXPIRED = 4,
    REGISTRATION_EXPIRED = 5,
    SUSPENDED = 6,
    RETIRED = 7
};

enum class DeliveryType : uint8_t
{
    STANDARD = 0,
    EXPRESS = 1,
    LARGE_ORDER = 2,
    ALCOHOL = 3,
    PHARMACY = 4
};

enum class DeliveryPriority : uint8_t
{
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

enum class DeliveryStatus : uint8_t
{
    PENDING = 0,
    ASSIGNED = 1,
    PICKUP_IN_PROGRESS = 2,
    PICKED_UP = 3,
    EN_ROUTE = 4,
    ARRIVED = 5,
    DELIVERED = 6,
    CANCELLED = 7,
    FAILED = 8
};

static const size_t DELIVERY_STATUS_COUNT = 9;

enum class TransitionActor : uint8_t
{
    DRIVER = 0,
    DISPATCHER = 1,
    CUSTOMER = 2,
    SYSTEM = 3
};

enum class TrackingStatus : uint8_t
{
    DRIVER_ASSIGNED = 0,
    EN_ROUTE_TO_RESTAURANT = 1,
    ARRIVED_AT_RESTAURANT = 2,
    WAITING_FOR_ORDER = 3,
    ORDER_PICKED_UP = 4,
    EN_ROUTE_TO_CUSTOMER = 5,
    ARRIVED_AT_DELIVERY_LOCATION = 6,
    DELIVERY_ATTEMPTED = 7,
    DELIVERED = 8,
    DELIVERY_FAILED = 9,
    RETURNING_TO_RESTAURANT = 10,
    CANCELLED = 11
};

static const size_t TRACKING_STATUS_COUNT = 12;

enum class TrafficCondition : uint8_t
{
    LIGHT = 0,
    MODERATE = 1,
    HEAVY = 2,
    SEVERE = 3,
    UNKNOWN = 4
};

static const size_t TRAFFIC_CONDITION_COUNT = 5;

enum class TelemetryOutcome : uint8_t
{
    APPLIED = 0,
    APPLIED_LOW_ACCURACY = 1,
    DROPPED_OUT_OF_ORDER = 2,
    DROPPED_INACTIVE = 3,
    DROPPED_UNKNOWN_DELIVERY = 4,
    DROPPED_DRIVER_MISMATCH = 5,
    REJECTED_INVALID = 6
};

static const size_t TELEMETRY_OUTCOME_COUNT = 7;

struct GeoPoint
{
    double latitude;
    double longitude;

    GeoPoint() : latitude(0), longitude(0) {}
    GeoPoint(double lat, double lon) : latitude(lat), longitude(lon) {}
};

struct DriverProfile
{
    uint64_t driver_id;
    string full_name;
    string phone;
    string license_number;
    uint64_t license_expiry;

    BackgroundCheckStatus background_check;
    DriverAccountStatus account_status;
    AvailabilityStatus availability;
    uint8_t is_active;

    // location is unknown until the first report
    uint8_t has_location;
    GeoPoint location;
    uint64_t last_location_update;

    uint64_t vehicle_id;
    uint64_t active_delivery_id;

    uint32_t total_deliveries;
    uint32_t successful_deliveries;
    double average_rating;
    uint32_t rating_count;
    double total_earnings;

    uint64_t created_time;

    DriverProfile() : driver_id(0), license_expiry(0),
                      background_check(BackgroundCheckStatus::PENDING),
                      account_status(DriverAccountStatus::INACTIVE),
                      availability(AvailabilityStatus::OFFLINE), is_active(1),
                      has_location(0), last_location_update(0), vehicle_id(0),
                      active_delivery_id(0), total_deliveries(0),
                      successful_deliveries(0), average_rating(0),
                      rating_count(0), total_earnings(0), created_time(0)
    {
    }
};

struct VehicleInfo
{
    uint64_t vehicle_id;
    uint64_t owner_driver_id;

    VehicleType type;
    string make;
    string model;
    string license_plate;

    // 0 means unknown capacity
    double capacity_weight_kg;
    double capacity_volume_l;

    uint64_t insurance_expiry;
    uint64_t registration_expiry;
    uint64_t next_inspection_due;
    uint64_t next_maintenance_due;

    VehicleStatus status;
    uint8_t is_active;
    uint8_t is_verified;

    uint64_t created_time;

    VehicleInfo() : vehicle_id(0), owner_driver_id(0), type(VehicleType::CAR),
                    capacity_weight_kg(0), capacity_volume_l(0),
                    insurance_expiry(0), registration_expiry(0),
                    next_inspection_due(0), next_maintenance_due(0),
                    status(VehicleStatus::ACTIVE), is_active(1), is_verified(0),
                    created_time(0)
    {
    }
};

// Point-in-time copy of a driver and its vehicle, used for matching.
struct DriverCandidate
{
    DriverProfile driver;
    uint8_t has_vehicle;
    VehicleInfo vehicle;
    uint8_t eligible;

    DriverCandidate() : has_vehicle(0), eligible(0) {}
};

struct StatusTransition
{
    DeliveryStatus from;
    DeliveryStatus to;
    uint64_t timestamp;
    TransitionActor actor;
    string note;

    StatusTransition() : from(DeliveryStatus::PENDING), to(DeliveryStatus::PENDING),
                         timestamp(0), actor(TransitionActor::SYSTEM) {}
};

struct DeliveryRequest
{
    uint64_t order_id;
    GeoPoint pickup_location;
    GeoPoint dropoff_location;
    string pickup_address;
    string dropoff_address;
    uint64_t requested_pickup_time;
    uint64_t requested_delivery_time;
    DeliveryPriority priority;
    DeliveryType type;
    double weight_kg;
    double volume_l;
    double delivery_fee;
    double tip_amount;

    DeliveryRequest() : order_id(0), requested_pickup_time(0),
                        requested_delivery_time(0),
                        priority(DeliveryPriority::NORMAL),
                        type(DeliveryType::STANDARD), weight_kg(0), volume_l(0),
                        delivery_fee(0), tip_amount(0) {}
};

struct DeliveryRecord
{
    uint64_t delivery_id;
    uint64_t order_id;

    GeoPoint pickup_location;
    GeoPoint dropoff_location;
    string pickup_address;
    string dropoff_address;

    DeliveryPriority priority;
    DeliveryType type;
    double weight_kg;
    double volume_l;

    DeliveryStatus status;
    uint64_t driver_id;
    uint64_t vehicle_id;
    uint64_t last_driver_id;

    uint64_t created_time;
    uint64_t requested_pickup_time;
    uint64_t requested_delivery_time;
    uint64_t estimated_pickup_time;
    uint64_t estimated_delivery_time;
    uint64_t actual_pickup_time;
    uint64_t actual_delivery_time;

    uint64_t driver_assigned_time;
    uint64_t pickup_started_time;
    uint64_t en_route_time;
    uint64_t arrived_time;
    uint64_t cancelled_time;
    uint64_t failed_time;

    string cancel_reason;
    string failure_reason;
    string delivery_proof;

    // set once, after DELIVERED
    uint8_t customer_rating;
    string customer_feedback;

    double delivery_fee;
    double tip_amount;
    double driver_payout;

    uint32_t reassignment_count;
    uint8_t is_archived;

    vector<StatusTransition> history;

    DeliveryRecord() : delivery_id(0), order_id(0),
                       priority(DeliveryPriority::NORMAL),
                       type(DeliveryType::STANDARD), weight_kg(0), volume_l(0),
                       status(DeliveryStatus::PENDING), driver_id(0),
                       vehicle_id(0), last_driver_id(0), created_time(0),
                       requested_pickup_time(0), requested_delivery_time(0),
                       estimated_pickup_time(0), estimated_delivery_time(0),
                       actual_pickup_time(0), actual_delivery_time(0),
                       driver_assigned_time(0), pickup_started_time(0),
                       en_route_time(0), arrived_time(0), cancelled_time(0),
                       failed_time(0), customer_rating(0), delivery_fee(0),
                       tip_amount(0), driver_payout(0), reassignment_count(0),
                       is_archived(0)
    {
    }
};

struct TrackingRecord
{
    uint64_t delivery_id;
    uint64_t driver_id;
    uint8_t is_open;

    uint64_t tracking_timestamp;
    uint8_t has_location;
    GeoPoint location;
    double speed;
    double bearing;
    double accuracy;

    TrackingStatus status;

    double distance_to_pickup;
    double distance_to_delivery;
    double distance_traveled;
    double route_deviation;

    // anchor for distance_traveled, only moved by accurate fixes
    uint8_t has_anchor;
    GeoPoint anchor_location;
    // start of the leg towards the pickup point
    uint8_t has_leg_origin;
    GeoPoint leg_origin;

    uint8_t is_at_restaurant;
    uint64_t restaurant_arrival_time;
    uint8_t is_picked_up;
    uint64_t pickup_completed_time;
    uint8_t is_en_route_to_customer;
    uint64_t en_route_to_customer_time;
    uint8_t is_at_delivery_location;
    uint64_t delivery_location_arrival_time;

    uint64_t restaurant_geofence_entered;
    uint64_t restaurant_geofence_exited;
    uint64_t delivery_geofence_entered;
    uint64_t delivery_geofence_exited;

    uint64_t estimated_pickup_time;
    uint64_t estimated_delivery_time;
    double eta_minutes;

    TrafficCondition traffic;
    string weather;

    // -1 when the device did not report it
    int battery_level;
    int signal_strength;

    uint64_t opened_time;
    uint64_t closed_time;
    uint32_t reports_applied;

    TrackingRecord() : delivery_id(0), driver_id(0), is_open(0),
                       tracking_timestamp(0), has_location(0), speed(0),
                       bearing(0), accuracy(0),
                       status(TrackingStatus::DRIVER_ASSIGNED),
                       distance_to_pickup(0), distance_to_delivery(0),
                       distance_traveled(0), route_deviation(0), has_anchor(0),
                       has_leg_origin(0), is_at_restaurant(0),
                       restaurant_arrival_time(0), is_picked_up(0),
                       pickup_completed_time(0), is_en_route_to_customer(0),
                       en_route_to_customer_time(0), is_at_delivery_location(0),
                       delivery_location_arrival_time(0),
                       restaurant_geofence_entered(0),
                       restaurant_geofence_exited(0),
                       delivery_geofence_entered(0), delivery_geofence_exited(0),
                       estimated_pickup_time(0), estimated_delivery_time(0),
                       eta_minutes(0), traffic(TrafficCondition::UNKNOWN),
                       battery_level(-1), signal_strength(-1), opened_time(0),
                       closed_time(0), reports_applied(0)
    {
    }
};

struct TelemetryReport
{
    uint64_t delivery_id;
    uint64_t driver_id;
    GeoPoint location;
    double speed;
    double bearing;
    double accuracy;
    uint64_t timestamp;
    int battery_level;
    int signal_strength;

    TelemetryReport() : delivery_id(0), driver_id(0), speed(0), bearing(0),
                        accuracy(0), timestamp(0), battery_level(-1),
                        signal_strength(-1) {}
};

struct DeliveryEvent
{
    uint64_t delivery_id;
    uint64_t driver_id;
    DeliveryStatus old_status;
    DeliveryStatus new_status;
    uint64_t timestamp;
    TransitionActor actor;
    string note;

    DeliveryEvent() : delivery_id(0), driver_id(0),
                      old_status(DeliveryStatus::PENDING),
                      new_status(DeliveryStatus::PENDING), timestamp(0),
                      actor(TransitionActor::SYSTEM) {}
};

struct TrackingSnapshot
{
    uint64_t delivery_id;
    uint64_t driver_id;
    uint8_t has_location;
    GeoPoint location;
    uint64_t tracking_timestamp;
    uint64_t estimated_pickup_time;
    uint64_t estimated_delivery_time;
    double eta_minutes;
    double distance_to_pickup;
    double distance_to_delivery;
    double distance_traveled;
    TrackingStatus status;
    uint32_t progress_percentage;
    string customer_status;
    uint8_t is_stale;
    uint8_t requires_attention;
    uint8_t is_open;

    TrackingSnapshot() : delivery_id(0), driver_id(0), has_location(0),
                         tracking_timestamp(0), estimated_pickup_time(0),
                         estimated_delivery_time(0), eta_minutes(0),
                         distance_to_pickup(0), distance_to_delivery(0),
                         distance_traveled(0),
                         status(TrackingStatus::DRIVER_ASSIGNED),
                         progress_percentage(0), is_stale(0),
                         requires_attention(0), is_open(0) {}
};

struct TelemetryStats
{
    uint64_t counts[TELEMETRY_OUTCOME_COUNT];

    TelemetryStats()
    {
        for (size_t i = 0; i < TELEMETRY_OUTCOME_COUNT; i++)
            counts[i] = 0;
    }

    uint64_t count(TelemetryOutcome outcome) const
    {
        return counts[static_cast<size_t>(outcome)];
    }
};

#endif
