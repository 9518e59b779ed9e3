#ifndef DELIVERYMANAGER_H
#define DELIVERYMANAGER_H

#include "../../include/ddc_types.hpp"
#include "../../include/ddc_config.hpp"
#include "../../include/ddc_errors.hpp"
#include "../../include/ddc_enums.hpp"
#include "Clock.h"
#include "GeoUtils.h"
#include "EtaModel.h"
#include "DriverRegistry.h"
#include "EventPublisher.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <algorithm>
#include <iostream>
using namespace std;

// Owns the lifecycle of every delivery:
//
//   PENDING -> ASSIGNED -> PICKUP_IN_PROGRESS -> PICKED_UP -> EN_ROUTE
//           -> ARRIVED -> DELIVERED
//
// CANCELLED is reachable from any non-terminal state, FAILED from
// PICKUP_IN_PROGRESS onward. Each delivery owns its tracking record, opened
// at ASSIGNED and closed at the terminal transition.
//
// Lock order is delivery entry, then driver entry (inside DriverRegistry).
// Events are published once the delivery lock has been released.
class DeliveryManager
{
public:
    using TrackingUpdate = function<TelemetryOutcome(const DeliveryRecord &, TrackingRecord &)>;

private:
    struct DeliveryEntry
    {
        mutable mutex entry_mutex;
        DeliveryRecord record;
        TrackingRecord tracking;
    };

    const DDCConfig &config_;
    const Clock &clock_;
    DriverRegistry &registry_;
    EventPublisher &publisher_;

    map<uint64_t, unique_ptr<DeliveryEntry>> deliveries_;
    map<uint64_t, uint64_t> order_index_;
    uint64_t next_delivery_id_;
    mutable mutex map_mutex_;

    DeliveryEntry *find_entry(uint64_t delivery_id) const
    {
        lock_guard<mutex> lock(map_mutex_);
        auto it = deliveries_.find(delivery_id);
        return it == deliveries_.end() ? nullptr : it->second.get();
    }

    DeliveryEntry &require_entry(uint64_t delivery_id) const
    {
        DeliveryEntry *entry = find_entry(delivery_id);
        if (!entry)
            throw EntityNotFoundError("Delivery", delivery_id);
        return *entry;
    }

    vector<DeliveryEntry *> all_entries() const
    {
        lock_guard<mutex> lock(map_mutex_);
        vector<DeliveryEntry *> entries;
        entries.reserve(deliveries_.size());
        for (const auto &kv : deliveries_)
            entries.push_back(kv.second.get());
        return entries;
    }

    uint64_t next_timestamp(const DeliveryRecord &record) const
    {
        uint64_t now = clock_.now();
        if (!record.history.empty() && record.history.back().timestamp > now)
            return record.history.back().timestamp;
        return max(now, record.created_time);
    }

    static TrackingStatus tracking_status_for(DeliveryStatus status)
    {
        static const TrackingStatus TABLE[DELIVERY_STATUS_COUNT] = {
            TrackingStatus::DRIVER_ASSIGNED,              // PENDING
            TrackingStatus::DRIVER_ASSIGNED,              // ASSIGNED
            TrackingStatus::ARRIVED_AT_RESTAURANT,        // PICKUP_IN_PROGRESS
            TrackingStatus::ORDER_PICKED_UP,              // PICKED_UP
            TrackingStatus::EN_ROUTE_TO_CUSTOMER,         // EN_ROUTE
            TrackingStatus::ARRIVED_AT_DELIVERY_LOCATION, // ARRIVED
            TrackingStatus::DELIVERED,                    // DELIVERED
            TrackingStatus::CANCELLED,                    // CANCELLED
            TrackingStatus::DELIVERY_FAILED               // FAILED
        };
        return TABLE[static_cast<size_t>(status)];
    }

    void open_tracking_locked(DeliveryEntry &entry, uint64_t timestamp)
    {
        DeliveryRecord &record = entry.record;
        TrackingRecord tracking;
        tracking.delivery_id = record.delivery_id;
        tracking.driver_id = record.driver_id;
        tracking.is_open = 1;
        tracking.opened_time = timestamp;
        tracking.status = TrackingStatus::DRIVER_ASSIGNED;
        tracking.traffic = entry.tracking.traffic;
        tracking.weather = entry.tracking.weather;

        DriverProfile driver;
        if (registry_.get_driver(record.driver_id, driver) && driver.has_location)
        {
            tracking.has_location = 1;
            tracking.location = driver.location;
            tracking.has_leg_origin = 1;
            tracking.leg_origin = driver.location;
            tracking.distance_to_pickup = GeoUtils::distance_km(driver.location, record.pickup_location);
            tracking.distance_to_delivery = GeoUtils::distance_km(driver.location, record.dropoff_location);

            double leg_km = GeoUtils::distance_km(record.pickup_location, record.dropoff_location);
            double pickup_minutes = EtaModel::adjusted_minutes(
                EtaModel::base_minutes(tracking.distance_to_pickup, config_.assumed_speed_kmh),
                tracking.traffic, tracking.weather);
            double total_minutes = EtaModel::adjusted_minutes(
                EtaModel::base_minutes(tracking.distance_to_pickup + leg_km, config_.assumed_speed_kmh),
                tracking.traffic, tracking.weather);

            tracking.eta_minutes = total_minutes;
            tracking.estimated_pickup_time = EtaModel::eta_timestamp(timestamp, pickup_minutes);
            tracking.estimated_delivery_time = EtaModel::eta_timestamp(timestamp, total_minutes);
            record.estimated_pickup_time = tracking.estimated_pickup_time;
            record.estimated_delivery_time = tracking.estimated_delivery_time;
        }

        entry.tracking = tracking;
    }

    void close_tracking_locked(DeliveryEntry &entry, TrackingStatus final_status, uint64_t timestamp)
    {
        TrackingRecord &tracking = entry.tracking;
        if (!tracking.is_open)
            return;
        tracking.status = final_status;
        tracking.is_open = 0;
        tracking.closed_time = timestamp;
    }

    void release_driver_locked(DeliveryRecord &record, bool unassign)
    {
        if (record.driver_id == 0)
            return;

        if (!registry_.release(record.driver_id, record.delivery_id))
        {
            cerr << "[delivery] Driver " << record.driver_id << " was not bound to delivery "
                 << record.delivery_id << " at release" << endl;
        }

        if (unassign)
        {
            record.last_driver_id = record.driver_id;
            record.driver_id = 0;
            record.vehicle_id = 0;
        }
    }

    // Validates and applies one transition. Caller holds entry_mutex and
    // publishes the returned event after unlocking.
    DeliveryEvent transition_locked(DeliveryEntry &entry, DeliveryStatus target,
                                    TransitionActor actor, const string &note)
    {
        DeliveryRecord &record = entry.record;
        TrackingRecord &tracking = entry.tracking;
        DeliveryStatus from = record.status;

        if (!is_legal_transition(from, target))
        {
            throw InvalidTransitionError(record.delivery_id, from, target,
                                         "Delivery " + std::to_string(record.delivery_id) +
                                             ": illegal transition " + to_string(from) +
                                             " -> " + to_string(target));
        }

        uint64_t ts = next_timestamp(record);

        DeliveryEvent event;
        event.delivery_id = record.delivery_id;
        event.driver_id = record.driver_id;
        event.old_status = from;
        event.new_status = target;
        event.timestamp = ts;
        event.actor = actor;
        event.note = note;

        switch (target)
        {
        case DeliveryStatus::PICKUP_IN_PROGRESS:
            record.pickup_started_time = ts;
            if (!tracking.is_at_restaurant)
            {
                tracking.is_at_restaurant = 1;
                tracking.restaurant_arrival_time = ts;
            }
            tracking.status = TrackingStatus::ARRIVED_AT_RESTAURANT;
            break;

        case DeliveryStatus::PICKED_UP:
            record.actual_pickup_time = ts;
            tracking.is_picked_up = 1;
            tracking.pickup_completed_time = ts;
            tracking.status = TrackingStatus::ORDER_PICKED_UP;
            break;

        case DeliveryStatus::EN_ROUTE:
            record.en_route_time = ts;
            if (!tracking.is_en_route_to_customer)
            {
                tracking.is_en_route_to_customer = 1;
                tracking.en_route_to_customer_time = ts;
            }
            tracking.status = TrackingStatus::EN_ROUTE_TO_CUSTOMER;
            break;

        case DeliveryStatus::ARRIVED:
            record.arrived_time = ts;
            if (!tracking.is_at_delivery_location)
            {
                tracking.is_at_delivery_location = 1;
                tracking.delivery_location_arrival_time = ts;
            }
            tracking.status = TrackingStatus::ARRIVED_AT_DELIVERY_LOCATION;
            break;

        case DeliveryStatus::DELIVERED:
            record.actual_delivery_time = ts;
            record.delivery_proof = note;
            record.driver_payout = record.delivery_fee * config_.driver_commission_rate +
                                   record.tip_amount;
            registry_.record_delivery_outcome(record.driver_id, true, record.driver_payout);
            release_driver_locked(record, false);
            close_tracking_locked(entry, TrackingStatus::DELIVERED, ts);
            break;

        case DeliveryStatus::FAILED:
            record.failed_time = ts;
            record.failure_reason = note;
            registry_.record_delivery_outcome(record.driver_id, false, 0);
            release_driver_locked(record, true);
            close_tracking_locked(entry, TrackingStatus::DELIVERY_FAILED, ts);
            break;

        case DeliveryStatus::CANCELLED:
            record.cancelled_time = ts;
            record.cancel_reason = note;
            release_driver_locked(record, true);
            close_tracking_locked(entry, TrackingStatus::CANCELLED, ts);
            break;

        default:
            break;
        }

        record.status = target;

        StatusTransition step;
        step.from = from;
        step.to = target;
        step.timestamp = ts;
        step.actor = actor;
        step.note = note;
        record.history.push_back(step);

        if (config_.verbose)
        {
            cout << "[delivery] " << record.delivery_id << ": " << to_string(from)
                 << " -> " << to_string(target) << " by " << to_string(actor) << endl;
        }

        return event;
    }

    DeliveryEvent apply(uint64_t delivery_id, DeliveryStatus target, TransitionActor actor,
                        const string &note)
    {
        DeliveryEntry &entry = require_entry(delivery_id);
        DeliveryEvent event;
        {
            lock_guard<mutex> lock(entry.entry_mutex);
            event = transition_locked(entry, target, actor, note);
        }
        publisher_.publish(event);
        return event;
    }

    static void validate_request(const DeliveryRequest &request)
    {
        if (request.order_id == 0)
            throw InvalidInputError("order_id is required");
        GeoUtils::validate(request.pickup_location, "pickup location");
        GeoUtils::validate(request.dropoff_location, "drop-off location");
        validate_enum(request.type);
        validate_enum(request.priority);
        if (request.weight_kg < 0 || request.volume_l < 0)
            throw InvalidInputError("Declared weight and volume must not be negative");
        if (request.delivery_fee < 0 || request.tip_amount < 0)
            throw InvalidInputError("Fee and tip must not be negative");
    }

public:
    DeliveryManager(const DDCConfig &config, const Clock &clock, DriverRegistry &registry,
                    EventPublisher &publisher)
        : config_(config), clock_(clock), registry_(registry), publisher_(publisher),
          next_delivery_id_(1) {}

    static bool is_terminal(DeliveryStatus status)
    {
        return status == DeliveryStatus::DELIVERED ||
               status == DeliveryStatus::CANCELLED ||
               status == DeliveryStatus::FAILED;
    }

    static bool is_legal_transition(DeliveryStatus from, DeliveryStatus to)
    {
        // rows: from, columns: to
        // PEN ASG PIP PKU ENR ARR DEL CAN FAI
        static const bool TABLE[DELIVERY_STATUS_COUNT][DELIVERY_STATUS_COUNT] = {
            {0, 1, 0, 0, 0, 0, 0, 1, 0}, // PENDING
            {0, 0, 1, 0, 0, 0, 0, 1, 0}, // ASSIGNED
            {0, 0, 0, 1, 0, 0, 0, 1, 1}, // PICKUP_IN_PROGRESS
            {0, 0, 0, 0, 1, 0, 0, 1, 1}, // PICKED_UP
            {0, 0, 0, 0, 0, 1, 0, 1, 1}, // EN_ROUTE
            {0, 0, 0, 0, 0, 0, 1, 1, 1}, // ARRIVED
            {0, 0, 0, 0, 0, 0, 0, 0, 0}, // DELIVERED
            {0, 0, 0, 0, 0, 0, 0, 0, 0}, // CANCELLED
            {0, 0, 0, 0, 0, 0, 0, 0, 0}  // FAILED
        };

        size_t f = static_cast<size_t>(from);
        size_t t = static_cast<size_t>(to);
        if (f >= DELIVERY_STATUS_COUNT || t >= DELIVERY_STATUS_COUNT)
            return false;
        return TABLE[f][t];
    }

    // ========================================================================
    // CREATION
    // ========================================================================

    uint64_t create_delivery(const DeliveryRequest &request)
    {
        validate_request(request);

        unique_ptr<DeliveryEntry> entry(new DeliveryEntry());
        DeliveryRecord &record = entry->record;
        record.order_id = request.order_id;
        record.pickup_location = request.pickup_location;
        record.dropoff_location = request.dropoff_location;
        record.pickup_address = request.pickup_address;
        record.dropoff_address = request.dropoff_address;
        record.requested_pickup_time = request.requested_pickup_time;
        record.requested_delivery_time = request.requested_delivery_time;
        record.priority = request.priority;
        record.type = request.type;
        record.weight_kg = request.weight_kg;
        record.volume_l = request.volume_l;
        record.delivery_fee = request.delivery_fee;
        record.tip_amount = request.tip_amount;
        record.status = DeliveryStatus::PENDING;
        record.created_time = clock_.now();

        uint64_t delivery_id;
        {
            lock_guard<mutex> lock(map_mutex_);
            if (order_index_.count(request.order_id))
            {
                throw InvalidInputError("Order " + std::to_string(request.order_id) +
                                        " already has a delivery");
            }
            delivery_id = next_delivery_id_++;
            record.delivery_id = delivery_id;
            order_index_[request.order_id] = delivery_id;
            deliveries_[delivery_id] = move(entry);
        }

        if (config_.verbose)
        {
            cout << "[delivery] Created " << delivery_id << " for order " << request.order_id
                 << " (" << to_string(request.type) << ")" << endl;
        }
        return delivery_id;
    }

    // ========================================================================
    // TRANSITIONS
    // ========================================================================

    // Binds `driver_id` to a PENDING delivery. Returns false when the driver
    // is no longer available (lost the compare-and-swap); the delivery stays
    // PENDING and the caller may try another candidate.
    bool assign(uint64_t delivery_id, uint64_t driver_id,
                TransitionActor actor = TransitionActor::DISPATCHER)
    {
        DeliveryEntry &entry = require_entry(delivery_id);
        DeliveryEvent event;
        {
            lock_guard<mutex> lock(entry.entry_mutex);
            DeliveryRecord &record = entry.record;
            if (record.status != DeliveryStatus::PENDING)
            {
                throw InvalidTransitionError(delivery_id, record.status, DeliveryStatus::ASSIGNED,
                                             "Delivery " + std::to_string(delivery_id) +
                                                 " cannot be assigned from " + to_string(record.status));
            }

            uint64_t vehicle_id = 0;
            if (!registry_.try_reserve(driver_id, delivery_id, vehicle_id))
                return false;

            record.driver_id = driver_id;
            record.vehicle_id = vehicle_id;
            event = transition_locked(entry, DeliveryStatus::ASSIGNED, actor, "");
            record.driver_assigned_time = event.timestamp;
            event.driver_id = driver_id;
            open_tracking_locked(entry, event.timestamp);
        }
        publisher_.publish(event);
        return true;
    }

    // Moves an ASSIGNED delivery to another driver. The new driver is reserved
    // before the old one is released; a lost reservation leaves everything as
    // it was and returns false.
    bool reassign(uint64_t delivery_id, uint64_t new_driver_id, const string &reason,
                  TransitionActor actor = TransitionActor::DISPATCHER)
    {
        DeliveryEntry &entry = require_entry(delivery_id);
        DeliveryEvent event;
        {
            lock_guard<mutex> lock(entry.entry_mutex);
            DeliveryRecord &record = entry.record;
            if (record.status != DeliveryStatus::ASSIGNED)
            {
                throw InvalidTransitionError(delivery_id, record.status, DeliveryStatus::ASSIGNED,
                                             "Delivery " + std::to_string(delivery_id) +
                                                 " can only be reassigned while ASSIGNED, not " +
                                                 to_string(record.status));
            }
            if (record.driver_id == new_driver_id)
                throw InvalidInputError("Delivery is already assigned to driver " +
                                        std::to_string(new_driver_id));

            uint64_t vehicle_id = 0;
            if (!registry_.try_reserve(new_driver_id, delivery_id, vehicle_id))
                return false;

            uint64_t previous = record.driver_id;
            release_driver_locked(record, true);

            uint64_t ts = next_timestamp(record);
            record.driver_id = new_driver_id;
            record.vehicle_id = vehicle_id;
            record.driver_assigned_time = ts;
            record.reassignment_count++;

            string note = "reassigned from driver " + std::to_string(previous);
            if (!reason.empty())
                note += ": " + reason;

            StatusTransition step;
            step.from = DeliveryStatus::ASSIGNED;
            step.to = DeliveryStatus::ASSIGNED;
            step.timestamp = ts;
            step.actor = actor;
            step.note = note;
            record.history.push_back(step);

            open_tracking_locked(entry, ts);

            event.delivery_id = delivery_id;
            event.driver_id = new_driver_id;
            event.old_status = DeliveryStatus::ASSIGNED;
            event.new_status = DeliveryStatus::ASSIGNED;
            event.timestamp = ts;
            event.actor = actor;
            event.note = note;

            if (config_.verbose)
                cout << "[delivery] " << delivery_id << ": " << note << endl;
        }
        publisher_.publish(event);
        return true;
    }

    void start_pickup(uint64_t delivery_id, TransitionActor actor = TransitionActor::DRIVER)
    {
        apply(delivery_id, DeliveryStatus::PICKUP_IN_PROGRESS, actor, "");
    }

    void complete_pickup(uint64_t delivery_id, TransitionActor actor = TransitionActor::DRIVER)
    {
        apply(delivery_id, DeliveryStatus::PICKED_UP, actor, "");
    }

    void start_delivery(uint64_t delivery_id, TransitionActor actor = TransitionActor::DRIVER)
    {
        apply(delivery_id, DeliveryStatus::EN_ROUTE, actor, "");
    }

    void mark_arrived(uint64_t delivery_id, TransitionActor actor = TransitionActor::DRIVER)
    {
        apply(delivery_id, DeliveryStatus::ARRIVED, actor, "");
    }

    void complete_delivery(uint64_t delivery_id, const string &proof = "",
                           TransitionActor actor = TransitionActor::DRIVER)
    {
        apply(delivery_id, DeliveryStatus::DELIVERED, actor, proof);
    }

    void mark_failed(uint64_t delivery_id, const string &reason,
                     TransitionActor actor = TransitionActor::DRIVER)
    {
        apply(delivery_id, DeliveryStatus::FAILED, actor, reason);
    }

    void cancel(uint64_t delivery_id, const string &reason,
                TransitionActor actor = TransitionActor::CUSTOMER)
    {
        apply(delivery_id, DeliveryStatus::CANCELLED, actor, reason);
    }

    // Generic validated transition; ASSIGNED must go through assign().
    void request_transition(uint64_t delivery_id, DeliveryStatus target, TransitionActor actor,
                            const string &note = "")
    {
        if (target == DeliveryStatus::ASSIGNED)
        {
            DeliveryRecord record;
            if (!get_delivery(delivery_id, record))
                throw EntityNotFoundError("Delivery", delivery_id);
            throw InvalidTransitionError(delivery_id, record.status, target,
                                         "ASSIGNED requires a driver; use assign()");
        }
        apply(delivery_id, target, actor, note);
    }

    void rate(uint64_t delivery_id, int score, const string &feedback)
    {
        if (score < 1 || score > 5)
            throw InvalidInputError("Rating must be between 1 and 5, got " + std::to_string(score));

        DeliveryEntry &entry = require_entry(delivery_id);
        lock_guard<mutex> lock(entry.entry_mutex);
        DeliveryRecord &record = entry.record;

        if (record.status != DeliveryStatus::DELIVERED)
        {
            throw InvalidTransitionError(delivery_id, record.status, DeliveryStatus::DELIVERED,
                                         "Delivery " + std::to_string(delivery_id) +
                                             " can only be rated after DELIVERED");
        }
        if (record.customer_rating != 0)
        {
            throw InvalidTransitionError(delivery_id, record.status, DeliveryStatus::DELIVERED,
                                         "Delivery " + std::to_string(delivery_id) +
                                             " has already been rated");
        }

        record.customer_rating = static_cast<uint8_t>(score);
        record.customer_feedback = feedback;
        registry_.apply_rating(record.driver_id, score);
    }

    // Driver reached the door but could not hand over yet.
    void record_delivery_attempt(uint64_t delivery_id)
    {
        DeliveryEntry &entry = require_entry(delivery_id);
        lock_guard<mutex> lock(entry.entry_mutex);
        if (entry.record.status != DeliveryStatus::ARRIVED)
        {
            throw InvalidTransitionError(delivery_id, entry.record.status, DeliveryStatus::ARRIVED,
                                         "Delivery attempts are only recorded after arrival");
        }
        entry.tracking.status = TrackingStatus::DELIVERY_ATTEMPTED;
    }

    bool archive_delivery(uint64_t delivery_id)
    {
        DeliveryEntry *entry = find_entry(delivery_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        if (!is_terminal(entry->record.status))
            return false;
        entry->record.is_archived = 1;
        return true;
    }

    // ========================================================================
    // REASSIGNMENT POLICY
    // ========================================================================

    bool needs_reassignment(const DeliveryRecord &record) const
    {
        return record.status == DeliveryStatus::ASSIGNED &&
               clock_.now() > record.driver_assigned_time + config_.reassignment_threshold_s;
    }

    bool needs_reassignment(uint64_t delivery_id) const
    {
        DeliveryRecord record;
        if (!get_delivery(delivery_id, record))
            return false;
        return needs_reassignment(record);
    }

    vector<DeliveryRecord> get_reassignment_candidates() const
    {
        vector<DeliveryRecord> result;
        for (const auto &record : get_all_deliveries())
        {
            if (needs_reassignment(record))
                result.push_back(record);
        }
        sort(result.begin(), result.end(), [](const DeliveryRecord &a, const DeliveryRecord &b)
             { return a.driver_assigned_time < b.driver_assigned_time; });
        return result;
    }

    // ========================================================================
    // TRACKING ACCESS
    // ========================================================================

    // Runs `update` against the open tracking record under the delivery lock.
    // A terminal delivery never reaches `update`, so cancellation stops
    // telemetry synchronously.
    TelemetryOutcome update_tracking(uint64_t delivery_id, const TrackingUpdate &update)
    {
        DeliveryEntry *entry = find_entry(delivery_id);
        if (!entry)
            return TelemetryOutcome::DROPPED_UNKNOWN_DELIVERY;

        lock_guard<mutex> lock(entry->entry_mutex);
        if (is_terminal(entry->record.status) || !entry->tracking.is_open)
            return TelemetryOutcome::DROPPED_INACTIVE;

        TelemetryOutcome outcome = update(entry->record, entry->tracking);

        if (outcome == TelemetryOutcome::APPLIED || outcome == TelemetryOutcome::APPLIED_LOW_ACCURACY)
        {
            if (!entry->tracking.is_picked_up && entry->tracking.estimated_pickup_time != 0)
                entry->record.estimated_pickup_time = entry->tracking.estimated_pickup_time;
            if (entry->tracking.estimated_delivery_time != 0)
                entry->record.estimated_delivery_time = entry->tracking.estimated_delivery_time;
        }
        return outcome;
    }

    bool set_tracking_conditions(uint64_t delivery_id, TrafficCondition traffic, const string &weather)
    {
        DeliveryEntry *entry = find_entry(delivery_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        if (is_terminal(entry->record.status))
            return false;
        entry->tracking.traffic = traffic;
        entry->tracking.weather = weather;
        return true;
    }

    // Open or archived record; false if the delivery was never assigned.
    bool get_tracking(uint64_t delivery_id, TrackingRecord &tracking) const
    {
        DeliveryEntry *entry = find_entry(delivery_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        if (entry->tracking.opened_time == 0)
            return false;
        tracking = entry->tracking;
        return true;
    }

    vector<TrackingRecord> get_open_tracking() const
    {
        vector<TrackingRecord> result;
        for (DeliveryEntry *entry : all_entries())
        {
            lock_guard<mutex> lock(entry->entry_mutex);
            if (entry->tracking.is_open)
                result.push_back(entry->tracking);
        }
        return result;
    }

    // ========================================================================
    // QUERIES
    // ========================================================================

    bool get_delivery(uint64_t delivery_id, DeliveryRecord &record) const
    {
        DeliveryEntry *entry = find_entry(delivery_id);
        if (!entry)
            return false;

        lock_guard<mutex> lock(entry->entry_mutex);
        record = entry->record;
        return true;
    }

    bool get_delivery_by_order(uint64_t order_id, DeliveryRecord &record) const
    {
        uint64_t delivery_id = 0;
        {
            lock_guard<mutex> lock(map_mutex_);
            auto it = order_index_.find(order_id);
            if (it == order_index_.end())
                return false;
            delivery_id = it->second;
        }
        return get_delivery(delivery_id, record);
    }

    vector<DeliveryRecord> get_all_deliveries() const
    {
        vector<DeliveryRecord> result;
        for (DeliveryEntry *entry : all_entries())
        {
            lock_guard<mutex> lock(entry->entry_mutex);
            result.push_back(entry->record);
        }
        return result;
    }

    // Highest priority first, then oldest first.
    vector<DeliveryRecord> get_pending_deliveries() const
    {
        vector<DeliveryRecord> result;
        for (const auto &record : get_all_deliveries())
        {
            if (record.status == DeliveryStatus::PENDING)
                result.push_back(record);
        }
        stable_sort(result.begin(), result.end(), [](const DeliveryRecord &a, const DeliveryRecord &b)
                    {
                        if (a.priority != b.priority)
                            return a.priority > b.priority;
                        return a.created_time < b.created_time; });
        return result;
    }

    vector<DeliveryRecord> get_deliveries_in_progress() const
    {
        vector<DeliveryRecord> result;
        for (const auto &record : get_all_deliveries())
        {
            if (record.status != DeliveryStatus::PENDING && !is_terminal(record.status))
                result.push_back(record);
        }
        return result;
    }

    vector<DeliveryRecord> get_deliveries_by_driver(uint64_t driver_id) const
    {
        vector<DeliveryRecord> result;
        for (const auto &record : get_all_deliveries())
        {
            if (record.driver_id == driver_id || record.last_driver_id == driver_id)
                result.push_back(record);
        }
        return result;
    }

    bool get_active_delivery_for_driver(uint64_t driver_id, DeliveryRecord &record) const
    {
        for (const auto &candidate : get_all_deliveries())
        {
            if (candidate.driver_id == driver_id && !is_terminal(candidate.status))
            {
                record = candidate;
                return true;
            }
        }
        return false;
    }

    vector<DeliveryRecord> get_overdue_deliveries() const
    {
        uint64_t now = clock_.now();
        vector<DeliveryRecord> result;
        for (const auto &record : get_all_deliveries())
        {
            if (record.estimated_delivery_time != 0 && now > record.estimated_delivery_time &&
                !is_terminal(record.status))
                result.push_back(record);
        }
        return result;
    }

    // -1 without an estimate, 0 when overdue.
    int64_t minutes_until_delivery(uint64_t delivery_id) const
    {
        DeliveryRecord record;
        if (!get_delivery(delivery_id, record) || record.estimated_delivery_time == 0)
            return -1;

        uint64_t now = clock_.now();
        if (now >= record.estimated_delivery_time)
            return 0;
        return static_cast<int64_t>((record.estimated_delivery_time - now) / 60);
    }
};

#endif // DELIVERYMANAGER_H
