#ifndef TRACKINGENGINE_H
#define TRACKINGENGINE_H

#include "../../include/ddc_types.hpp"
#include "../../include/ddc_config.hpp"
#include "../../include/ddc_errors.hpp"
#include "../../include/ddc_enums.hpp"
#include "Clock.h"
#include "GeoUtils.h"
#include "EtaModel.h"
#include "DriverRegistry.h"
#include "DeliveryManager.h"
#include <atomic>
#include <cmath>
#include <mutex>
#include <vector>
#include <iostream>
using namespace std;

// Applies driver telemetry to the tracking record of the delivery it belongs
// to: position, distances, ETA, route deviation and geofence milestones.
// Milestones are only signalled to the DeliveryManager, which decides whether
// the transition is legal.
class TrackingEngine
{
private:
    const DDCConfig &config_;
    const Clock &clock_;
    DeliveryManager &deliveries_;
    DriverRegistry &registry_;

    mutable mutex stats_mutex_;
    TelemetryStats stats_;
    atomic<uint64_t> dropped_since_log_;

    // one log line per this many dropped or rejected reports
    static const uint64_t DROP_LOG_SAMPLE = 50;

    void count(TelemetryOutcome outcome)
    {
        lock_guard<mutex> lock(stats_mutex_);
        stats_.counts[static_cast<size_t>(outcome)]++;
    }

    void log_dropped(const TelemetryReport &report, TelemetryOutcome outcome)
    {
        uint64_t n = dropped_since_log_.fetch_add(1);
        if (n % DROP_LOG_SAMPLE != 0)
            return;

        cerr << "[tracking] " << to_string(outcome) << " report for delivery "
             << report.delivery_id << " from driver " << report.driver_id;
        if (n > 0)
            cerr << " (" << n << " dropped so far)";
        cerr << endl;
    }

    static bool report_is_valid(const TelemetryReport &report)
    {
        if (!GeoUtils::is_valid(report.location))
            return false;
        if (!std::isfinite(report.speed) || report.speed < 0)
            return false;
        if (!std::isfinite(report.accuracy) || report.accuracy < 0)
            return false;
        return std::isfinite(report.bearing);
    }

    // Geofence enter/exit times and the milestone each crossing implies.
    void apply_geofences(const DeliveryRecord &record, TrackingRecord &tracking,
                         uint64_t ts, vector<DeliveryStatus> &signals) const
    {
        bool in_pickup = GeoUtils::is_within_radius(tracking.location, record.pickup_location,
                                                    config_.geofence_radius_m);
        bool in_dropoff = GeoUtils::is_within_radius(tracking.location, record.dropoff_location,
                                                     config_.geofence_radius_m);

        if (in_pickup && tracking.restaurant_geofence_entered == 0)
            tracking.restaurant_geofence_entered = ts;
        if (!in_pickup && tracking.restaurant_geofence_entered != 0 &&
            tracking.restaurant_geofence_exited == 0)
            tracking.restaurant_geofence_exited = ts;

        if (in_dropoff && tracking.delivery_geofence_entered == 0)
            tracking.delivery_geofence_entered = ts;
        if (!in_dropoff && tracking.delivery_geofence_entered != 0 &&
            tracking.delivery_geofence_exited == 0)
            tracking.delivery_geofence_exited = ts;

        bool stationary = tracking.speed < config_.stationary_speed_kmh;

        switch (record.status)
        {
        case DeliveryStatus::ASSIGNED:
            if (in_pickup)
            {
                tracking.is_at_restaurant = 1;
                tracking.restaurant_arrival_time = ts;
                tracking.status = TrackingStatus::ARRIVED_AT_RESTAURANT;
                signals.push_back(DeliveryStatus::PICKUP_IN_PROGRESS);
            }
            else if (!stationary)
            {
                tracking.status = TrackingStatus::EN_ROUTE_TO_RESTAURANT;
            }
            break;

        case DeliveryStatus::PICKUP_IN_PROGRESS:
            tracking.status = stationary ? TrackingStatus::WAITING_FOR_ORDER
                                         : TrackingStatus::ARRIVED_AT_RESTAURANT;
            break;

        case DeliveryStatus::PICKED_UP:
            if (in_dropoff)
            {
                tracking.is_at_delivery_location = 1;
                tracking.delivery_location_arrival_time = ts;
                signals.push_back(DeliveryStatus::EN_ROUTE);
                signals.push_back(DeliveryStatus::ARRIVED);
            }
            else if (!in_pickup)
            {
                tracking.is_en_route_to_customer = 1;
                tracking.en_route_to_customer_time = ts;
                signals.push_back(DeliveryStatus::EN_ROUTE);
            }
            break;

        case DeliveryStatus::EN_ROUTE:
            if (in_dropoff)
            {
                tracking.is_at_delivery_location = 1;
                tracking.delivery_location_arrival_time = ts;
                signals.push_back(DeliveryStatus::ARRIVED);
            }
            break;

        default:
            break;
        }
    }

    void update_estimates(const DeliveryRecord &record, TrackingRecord &tracking, uint64_t ts) const
    {
        double remaining_km;
        if (!tracking.is_picked_up)
        {
            double leg_km = GeoUtils::distance_km(record.pickup_location, record.dropoff_location);
            remaining_km = tracking.distance_to_pickup + leg_km;

            double pickup_minutes = EtaModel::adjusted_minutes(
                EtaModel::base_minutes(tracking.distance_to_pickup, config_.assumed_speed_kmh),
                tracking.traffic, tracking.weather);
            tracking.estimated_pickup_time = EtaModel::eta_timestamp(ts, pickup_minutes);
        }
        else
        {
            remaining_km = tracking.distance_to_delivery;
        }

        tracking.eta_minutes = EtaModel::adjusted_minutes(
            EtaModel::base_minutes(remaining_km, config_.assumed_speed_kmh),
            tracking.traffic, tracking.weather);
        tracking.estimated_delivery_time = EtaModel::eta_timestamp(ts, tracking.eta_minutes);

        if (!tracking.is_picked_up)
        {
            tracking.route_deviation = tracking.has_leg_origin
                                           ? GeoUtils::cross_track_distance_km(tracking.location,
                                                                               tracking.leg_origin,
                                                                               record.pickup_location)
                                           : 0;
        }
        else
        {
            tracking.route_deviation = GeoUtils::cross_track_distance_km(
                tracking.location, record.pickup_location, record.dropoff_location);
        }
    }

    TelemetryOutcome apply_report(const TelemetryReport &report, const DeliveryRecord &record,
                                  TrackingRecord &tracking, vector<DeliveryStatus> &signals) const
    {
        if (report.driver_id != record.driver_id)
            return TelemetryOutcome::DROPPED_DRIVER_MISMATCH;
        if (tracking.tracking_timestamp != 0 && report.timestamp < tracking.tracking_timestamp)
            return TelemetryOutcome::DROPPED_OUT_OF_ORDER;

        bool accurate = report.accuracy <= config_.gps_noise_threshold_m;

        tracking.tracking_timestamp = report.timestamp;
        tracking.has_location = 1;
        tracking.location = report.location;
        tracking.speed = report.speed;
        tracking.bearing = report.bearing;
        tracking.accuracy = report.accuracy;
        if (report.battery_level >= 0)
            tracking.battery_level = report.battery_level;
        if (report.signal_strength >= 0)
            tracking.signal_strength = report.signal_strength;

        if (!tracking.has_leg_origin)
        {
            tracking.has_leg_origin = 1;
            tracking.leg_origin = report.location;
        }

        tracking.distance_to_pickup = GeoUtils::distance_km(report.location, record.pickup_location);
        tracking.distance_to_delivery = GeoUtils::distance_km(report.location, record.dropoff_location);

        if (accurate)
        {
            if (tracking.has_anchor)
                tracking.distance_traveled += GeoUtils::distance_km(tracking.anchor_location, report.location);
            tracking.has_anchor = 1;
            tracking.anchor_location = report.location;
        }

        apply_geofences(record, tracking, report.timestamp, signals);
        update_estimates(record, tracking, report.timestamp);

        tracking.reports_applied++;
        return accurate ? TelemetryOutcome::APPLIED : TelemetryOutcome::APPLIED_LOW_ACCURACY;
    }

public:
    TrackingEngine(const DDCConfig &config, const Clock &clock, DeliveryManager &deliveries,
                   DriverRegistry &registry)
        : config_(config), clock_(clock), deliveries_(deliveries), registry_(registry),
          dropped_since_log_(0) {}

    // ========================================================================
    // INGEST
    // ========================================================================

    TelemetryOutcome ingest(const TelemetryReport &report)
    {
        if (!report_is_valid(report))
        {
            count(TelemetryOutcome::REJECTED_INVALID);
            log_dropped(report, TelemetryOutcome::REJECTED_INVALID);
            return TelemetryOutcome::REJECTED_INVALID;
        }

        vector<DeliveryStatus> signals;
        TelemetryOutcome outcome = deliveries_.update_tracking(
            report.delivery_id,
            [&](const DeliveryRecord &record, TrackingRecord &tracking)
            { return apply_report(report, record, tracking, signals); });

        count(outcome);

        if (outcome != TelemetryOutcome::APPLIED && outcome != TelemetryOutcome::APPLIED_LOW_ACCURACY)
        {
            log_dropped(report, outcome);
            return outcome;
        }

        if (!registry_.update_location(report.driver_id, report.location, report.timestamp))
        {
            cerr << "[tracking] Driver " << report.driver_id
                 << " holds a newer location than report at " << report.timestamp << endl;
        }

        signal_milestones(report.delivery_id, signals);
        return outcome;
    }

    // Requests each geofence milestone in order. A milestone already taken
    // by a manual transition, or refused after a cancel, is skipped and the
    // rest are still tried. Returns how many were applied.
    size_t signal_milestones(uint64_t delivery_id, const vector<DeliveryStatus> &signals)
    {
        size_t applied = 0;
        for (DeliveryStatus target : signals)
        {
            try
            {
                deliveries_.request_transition(delivery_id, target, TransitionActor::SYSTEM, "geofence");
                applied++;
            }
            catch (const InvalidTransitionError &e)
            {
                cerr << "[tracking] Milestone ignored: " << e.what() << endl;
            }
        }
        return applied;
    }

    bool set_conditions(uint64_t delivery_id, TrafficCondition traffic, const string &weather)
    {
        validate_enum(traffic);
        return deliveries_.set_tracking_conditions(delivery_id, traffic, weather);
    }

    // ========================================================================
    // DERIVED FLAGS
    // ========================================================================

    bool is_stale(const TrackingRecord &tracking, uint64_t now) const
    {
        if (!tracking.is_open)
            return false;
        uint64_t last = tracking.tracking_timestamp != 0 ? tracking.tracking_timestamp
                                                         : tracking.opened_time;
        return now > last + config_.stale_after_s;
    }

    bool requires_attention(const TrackingRecord &tracking, uint64_t now) const
    {
        if (tracking.status == TrackingStatus::DELIVERY_FAILED)
            return true;
        if (!tracking.is_open)
            return false;

        return is_stale(tracking, now) ||
               tracking.route_deviation > config_.off_route_threshold_km ||
               (tracking.battery_level >= 0 && tracking.battery_level < config_.low_battery_threshold) ||
               (tracking.signal_strength >= 0 && tracking.signal_strength < config_.weak_signal_threshold);
    }

    static uint32_t progress_percentage(TrackingStatus status)
    {
        static const uint32_t PROGRESS[TRACKING_STATUS_COUNT] = {
            10,  // DRIVER_ASSIGNED
            25,  // EN_ROUTE_TO_RESTAURANT
            40,  // ARRIVED_AT_RESTAURANT
            50,  // WAITING_FOR_ORDER
            60,  // ORDER_PICKED_UP
            80,  // EN_ROUTE_TO_CUSTOMER
            90,  // ARRIVED_AT_DELIVERY_LOCATION
            95,  // DELIVERY_ATTEMPTED
            100, // DELIVERED
            0,   // DELIVERY_FAILED
            30,  // RETURNING_TO_RESTAURANT
            0    // CANCELLED
        };

        size_t index = static_cast<size_t>(status);
        if (index >= TRACKING_STATUS_COUNT)
            throw InvalidInputError("Unknown tracking status value " + std::to_string(index));
        return PROGRESS[index];
    }

    static string customer_friendly_status(TrackingStatus status)
    {
        static const char *const MESSAGES[TRACKING_STATUS_COUNT] = {
            "Driver assigned to your order",
            "Driver is heading to the restaurant",
            "Driver has arrived at the restaurant",
            "Driver is waiting for your order to be prepared",
            "Driver has picked up your order",
            "Driver is on the way to you",
            "Driver has arrived at your location",
            "Driver is attempting delivery",
            "Your order has been delivered",
            "Delivery attempt was unsuccessful",
            "Driver is returning to restaurant",
            "Delivery has been cancelled"};

        size_t index = static_cast<size_t>(status);
        if (index >= TRACKING_STATUS_COUNT)
            throw InvalidInputError("Unknown tracking status value " + std::to_string(index));
        return MESSAGES[index];
    }

    // ========================================================================
    // QUERIES
    // ========================================================================

    TrackingSnapshot make_snapshot(const TrackingRecord &tracking, uint64_t now) const
    {
        TrackingSnapshot snapshot;
        snapshot.delivery_id = tracking.delivery_id;
        snapshot.driver_id = tracking.driver_id;
        snapshot.has_location = tracking.has_location;
        snapshot.location = tracking.location;
        snapshot.tracking_timestamp = tracking.tracking_timestamp;
        snapshot.estimated_pickup_time = tracking.estimated_pickup_time;
        snapshot.estimated_delivery_time = tracking.estimated_delivery_time;
        snapshot.eta_minutes = tracking.eta_minutes;
        snapshot.distance_to_pickup = tracking.distance_to_pickup;
        snapshot.distance_to_delivery = tracking.distance_to_delivery;
        snapshot.distance_traveled = tracking.distance_traveled;
        snapshot.status = tracking.status;
        snapshot.progress_percentage = progress_percentage(tracking.status);
        snapshot.customer_status = customer_friendly_status(tracking.status);
        snapshot.is_stale = is_stale(tracking, now) ? 1 : 0;
        snapshot.requires_attention = requires_attention(tracking, now) ? 1 : 0;
        snapshot.is_open = tracking.is_open;
        return snapshot;
    }

    // Works for open and closed records; false if the delivery was never
    // assigned or does not exist.
    bool get_snapshot(uint64_t delivery_id, TrackingSnapshot &snapshot) const
    {
        TrackingRecord tracking;
        if (!deliveries_.get_tracking(delivery_id, tracking))
            return false;
        snapshot = make_snapshot(tracking, clock_.now());
        return true;
    }

    vector<TrackingSnapshot> get_open_snapshots() const
    {
        uint64_t now = clock_.now();
        vector<TrackingSnapshot> result;
        for (const auto &tracking : deliveries_.get_open_tracking())
            result.push_back(make_snapshot(tracking, now));
        return result;
    }

    vector<TrackingSnapshot> get_attention_required() const
    {
        uint64_t now = clock_.now();
        vector<TrackingSnapshot> result;
        for (const auto &tracking : deliveries_.get_open_tracking())
        {
            if (requires_attention(tracking, now))
                result.push_back(make_snapshot(tracking, now));
        }
        return result;
    }

    TelemetryStats get_stats() const
    {
        lock_guard<mutex> lock(stats_mutex_);
        return stats_;
    }
};

#endif // TRACKINGENGINE_H
