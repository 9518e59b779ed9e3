#ifndef REQUESTHANDLER_H
#define REQUESTHANDLER_H

#include "../../include/ddc_types.hpp"
#include "../../include/ddc_errors.hpp"
#include "../../include/ddc_enums.hpp"
#include "../../source/core/Clock.h"
#include "../../source/core/DriverRegistry.h"
#include "../../source/core/DeliveryManager.h"
#include "../../source/core/TrackingEngine.h"
#include "../../source/core/DispatchMatcher.h"

#include "ResponseBuilder.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <iostream>
using namespace std;
using json = nlohmann::json;

// JSON operation contract shared by the WebSocket bridge and the tests.
// Every request carries an "operation" field; every response is built by
// ResponseBuilder. Exceptions from the core are mapped to error codes here
// and never escape handle().
class RequestHandler
{
private:
    const Clock &clock_;
    DriverRegistry &registry_;
    DeliveryManager &deliveries_;
    TrackingEngine &tracking_;
    DispatchMatcher &matcher_;

    ResponseBuilder response_builder_;

    // ========================================================================
    // PARAMETER HELPERS
    // ========================================================================

    static const json &require(const json &params, const char *key)
    {
        auto it = params.find(key);
        if (it == params.end() || it->is_null())
            throw InvalidInputError(string("Missing field '") + key + "'");
        return *it;
    }

    template <typename T>
    static T require_value(const json &params, const char *key)
    {
        return require(params, key).get<T>();
    }

    // Ids, timestamps and expiry dates: a non-negative integer, never a
    // fraction or a negative number cast to uint64_t.
    static uint64_t as_unsigned(const json &value, const char *key)
    {
        if (!value.is_number_integer() ||
            (!value.is_number_unsigned() && value.get<int64_t>() < 0))
            throw InvalidInputError(string("Field '") + key + "' must be a non-negative integer");
        return value.get<uint64_t>();
    }

    static uint64_t require_unsigned(const json &params, const char *key)
    {
        return as_unsigned(require(params, key), key);
    }

    static uint64_t optional_unsigned(const json &params, const char *key, uint64_t fallback)
    {
        auto it = params.find(key);
        if (it == params.end() || it->is_null())
            return fallback;
        return as_unsigned(*it, key);
    }

    static int as_int_in_range(const json &value, const char *key, int low, int high)
    {
        if (!value.is_number_integer())
            throw InvalidInputError(string("Field '") + key + "' must be an integer");
        double number = value.get<double>();
        if (number < low || number > high)
        {
            throw InvalidInputError(string("Field '") + key + "' must be between " +
                                    std::to_string(low) + " and " + std::to_string(high));
        }
        return static_cast<int>(number);
    }

    static int optional_int_in_range(const json &params, const char *key, int fallback, int low, int high)
    {
        auto it = params.find(key);
        if (it == params.end() || it->is_null())
            return fallback;
        return as_int_in_range(*it, key, low, high);
    }

    static GeoPoint require_point(const json &params, const char *key)
    {
        const json &point = require(params, key);
        if (!point.is_object())
            throw InvalidInputError(string("Field '") + key + "' must be an object with latitude and longitude");
        return GeoPoint(require_value<double>(point, "latitude"), require_value<double>(point, "longitude"));
    }

    static TransitionActor actor_or(const json &params, TransitionActor fallback)
    {
        if (!params.contains("actor"))
            return fallback;
        return parse_actor(params["actor"].get<string>());
    }

    uint64_t require_delivery(const json &params) const
    {
        return require_unsigned(params, "delivery_id");
    }

    json delivery_response(uint64_t delivery_id) const
    {
        DeliveryRecord record;
        if (!deliveries_.get_delivery(delivery_id, record))
            throw EntityNotFoundError("Delivery", delivery_id);
        return response_builder_.success(delivery_to_json(record));
    }

    // ========================================================================
    // DRIVER OPERATIONS
    // ========================================================================

    json handle_register_driver(const json &params)
    {
        DriverProfile profile;
        profile.driver_id = optional_unsigned(params, "driver_id", 0);
        profile.full_name = require_value<string>(params, "full_name");
        profile.phone = params.value("phone", string());
        profile.license_number = params.value("license_number", string());
        profile.license_expiry = optional_unsigned(params, "license_expiry", 0);
        profile.background_check = parse_background_check(params.value("background_check", string("PENDING")));
        profile.account_status = parse_account_status(params.value("account_status", string("ACTIVE")));
        profile.availability = parse_availability(params.value("availability", string("OFFLINE")));

        if (params.contains("location"))
        {
            profile.has_location = 1;
            profile.location = require_point(params, "location");
            profile.last_location_update = clock_.now();
        }

        uint64_t driver_id = registry_.register_driver(profile);
        cout << "[handler] Registered driver " << driver_id << " (" << profile.full_name << ")" << endl;
        return response_builder_.success({{"driver_id", driver_id}});
    }

    json handle_register_vehicle(const json &params)
    {
        VehicleInfo vehicle;
        vehicle.vehicle_id = optional_unsigned(params, "vehicle_id", 0);
        vehicle.owner_driver_id = require_unsigned(params, "owner_driver_id");
        vehicle.type = parse_vehicle_type(require_value<string>(params, "type"));
        vehicle.make = params.value("make", string());
        vehicle.model = params.value("model", string());
        vehicle.license_plate = params.value("license_plate", string());
        vehicle.capacity_weight_kg = params.value("capacity_weight_kg", 0.0);
        vehicle.capacity_volume_l = params.value("capacity_volume_l", 0.0);
        vehicle.insurance_expiry = optional_unsigned(params, "insurance_expiry", 0);
        vehicle.registration_expiry = optional_unsigned(params, "registration_expiry", 0);
        vehicle.next_inspection_due = optional_unsigned(params, "next_inspection_due", 0);
        vehicle.next_maintenance_due = optional_unsigned(params, "next_maintenance_due", 0);
        vehicle.is_verified = params.value("is_verified", false) ? 1 : 0;

        uint64_t vehicle_id = registry_.register_vehicle(vehicle);

        VehicleInfo stored;
        if (!registry_.get_vehicle(vehicle_id, stored))
            throw EntityNotFoundError("Vehicle", vehicle_id);
        return response_builder_.success(vehicle_to_json(stored));
    }

    json handle_get_driver(const json &params)
    {
        uint64_t driver_id = require_unsigned(params, "driver_id");
        DriverProfile driver;
        if (!registry_.get_driver(driver_id, driver))
            throw EntityNotFoundError("Driver", driver_id);
        return response_builder_.success(driver_to_json(driver));
    }

    json handle_set_availability(const json &params)
    {
        uint64_t driver_id = require_unsigned(params, "driver_id");
        AvailabilityStatus status = parse_availability(require_value<string>(params, "availability"));

        bool changed = registry_.set_availability(driver_id, status);
        return response_builder_.success({{"driver_id", driver_id}, {"changed", changed}});
    }

    // Position of an idle driver; delivery-bound drivers are also moved by
    // telemetry. An older fix than the one held is ignored.
    json handle_update_driver_location(const json &params)
    {
        uint64_t driver_id = require_unsigned(params, "driver_id");
        GeoPoint location = require_point(params, "location");
        uint64_t timestamp = optional_unsigned(params, "timestamp", clock_.now());

        DriverProfile driver;
        if (!registry_.get_driver(driver_id, driver))
            throw EntityNotFoundError("Driver", driver_id);

        bool updated = registry_.update_location(driver_id, location, timestamp);
        return response_builder_.success({{"driver_id", driver_id}, {"updated", updated}});
    }

    // Verification and suspension. Fields left out keep their current value.
    json handle_update_driver_eligibility(const json &params)
    {
        uint64_t driver_id = require_unsigned(params, "driver_id");
        DriverProfile driver;
        if (!registry_.get_driver(driver_id, driver))
            throw EntityNotFoundError("Driver", driver_id);

        BackgroundCheckStatus background = params.contains("background_check")
                                               ? parse_background_check(params["background_check"].get<string>())
                                               : driver.background_check;
        DriverAccountStatus account = params.contains("account_status")
                                          ? parse_account_status(params["account_status"].get<string>())
                                          : driver.account_status;
        uint64_t license_expiry = optional_unsigned(params, "license_expiry", driver.license_expiry);

        if (!registry_.update_eligibility(driver_id, background, account, license_expiry) ||
            !registry_.get_driver(driver_id, driver))
            throw EntityNotFoundError("Driver", driver_id);

        cout << "[handler] Driver " << driver_id << " eligibility: " << to_string(background)
             << ", " << to_string(account) << endl;
        return response_builder_.success(driver_to_json(driver));
    }

    json handle_update_vehicle_compliance(const json &params)
    {
        uint64_t vehicle_id = require_unsigned(params, "vehicle_id");
        VehicleInfo vehicle;
        if (!registry_.get_vehicle(vehicle_id, vehicle))
            throw EntityNotFoundError("Vehicle", vehicle_id);

        if (!registry_.update_vehicle_compliance(
                vehicle_id,
                optional_unsigned(params, "insurance_expiry", vehicle.insurance_expiry),
                optional_unsigned(params, "registration_expiry", vehicle.registration_expiry),
                optional_unsigned(params, "next_inspection_due", vehicle.next_inspection_due),
                optional_unsigned(params, "next_maintenance_due", vehicle.next_maintenance_due)))
            throw EntityNotFoundError("Vehicle", vehicle_id);

        if (params.contains("status") || params.contains("is_verified"))
        {
            if (!registry_.get_vehicle(vehicle_id, vehicle))
                throw EntityNotFoundError("Vehicle", vehicle_id);
            VehicleStatus status = params.contains("status")
                                       ? parse_vehicle_status(params["status"].get<string>())
                                       : vehicle.status;
            bool verified = params.value("is_verified", vehicle.is_verified != 0);
            if (!registry_.set_vehicle_status(vehicle_id, status, verified))
                throw EntityNotFoundError("Vehicle", vehicle_id);
        }

        if (!registry_.get_vehicle(vehicle_id, vehicle))
            throw EntityNotFoundError("Vehicle", vehicle_id);
        return response_builder_.success(vehicle_to_json(vehicle));
    }

    json handle_deactivate_driver(const json &params)
    {
        uint64_t driver_id = require_unsigned(params, "driver_id");
        DriverProfile driver;
        if (!registry_.get_driver(driver_id, driver))
            throw EntityNotFoundError("Driver", driver_id);

        if (!registry_.deactivate_driver(driver_id))
        {
            return response_builder_.error("invalid_transition",
                                           "Driver " + std::to_string(driver_id) +
                                               " is bound to delivery " +
                                               std::to_string(driver.active_delivery_id));
        }
        return response_builder_.success({{"driver_id", driver_id}, {"is_active", false}});
    }

    // ========================================================================
    // DELIVERY OPERATIONS
    // ========================================================================

    json handle_create_delivery(const json &params)
    {
        DeliveryRequest request;
        request.order_id = require_unsigned(params, "order_id");
        request.pickup_location = require_point(params, "pickup");
        request.dropoff_location = require_point(params, "dropoff");
        request.pickup_address = params.value("pickup_address", string());
        request.dropoff_address = params.value("dropoff_address", string());
        request.requested_pickup_time = optional_unsigned(params, "requested_pickup_time", 0);
        request.requested_delivery_time = optional_unsigned(params, "requested_delivery_time", 0);
        request.priority = parse_priority(params.value("priority", string("NORMAL")));
        request.type = parse_delivery_type(params.value("type", string("STANDARD")));
        request.weight_kg = params.value("weight_kg", 0.0);
        request.volume_l = params.value("volume_l", 0.0);
        request.delivery_fee = params.value("delivery_fee", 0.0);
        request.tip_amount = params.value("tip_amount", 0.0);

        uint64_t delivery_id = deliveries_.create_delivery(request);
        return delivery_response(delivery_id);
    }

    json handle_assign_driver(const json &params)
    {
        uint64_t delivery_id = require_delivery(params);
        uint64_t driver_id = require_unsigned(params, "driver_id");

        bool assigned = deliveries_.assign(delivery_id, driver_id,
                                           actor_or(params, TransitionActor::DISPATCHER));
        if (!assigned)
        {
            return response_builder_.success({{"delivery_id", delivery_id},
                                              {"assigned", false},
                                              {"message", "Driver is not available"}});
        }
        return delivery_response(delivery_id);
    }

    json handle_auto_assign(const json &params)
    {
        uint64_t delivery_id = require_delivery(params);
        uint64_t driver_id = matcher_.dispatch(delivery_id);
        return response_builder_.success({{"delivery_id", delivery_id},
                                          {"assigned", driver_id != 0},
                                          {"driver_id", driver_id}});
    }

    json handle_lifecycle(const string &operation, const json &params)
    {
        uint64_t delivery_id = require_delivery(params);

        if (operation == "start_pickup")
            deliveries_.start_pickup(delivery_id, actor_or(params, TransitionActor::DRIVER));
        else if (operation == "complete_pickup")
            deliveries_.complete_pickup(delivery_id, actor_or(params, TransitionActor::DRIVER));
        else if (operation == "start_delivery")
            deliveries_.start_delivery(delivery_id, actor_or(params, TransitionActor::DRIVER));
        else if (operation == "mark_arrived")
            deliveries_.mark_arrived(delivery_id, actor_or(params, TransitionActor::DRIVER));
        else if (operation == "complete_delivery")
            deliveries_.complete_delivery(delivery_id, params.value("proof", string()),
                                          actor_or(params, TransitionActor::DRIVER));
        else if (operation == "mark_failed")
            deliveries_.mark_failed(delivery_id, require_value<string>(params, "reason"),
                                    actor_or(params, TransitionActor::DRIVER));
        else if (operation == "cancel_delivery")
            deliveries_.cancel(delivery_id, params.value("reason", string()),
                               actor_or(params, TransitionActor::CUSTOMER));

        return delivery_response(delivery_id);
    }

    json handle_rate_delivery(const json &params)
    {
        uint64_t delivery_id = require_delivery(params);
        deliveries_.rate(delivery_id, as_int_in_range(require(params, "rating"), "rating", 1, 5),
                         params.value("feedback", string()));
        return delivery_response(delivery_id);
    }

    // ========================================================================
    // TRACKING OPERATIONS
    // ========================================================================

    json handle_telemetry(const json &params)
    {
        TelemetryReport report;
        report.delivery_id = require_delivery(params);
        report.driver_id = require_unsigned(params, "driver_id");
        report.location = GeoPoint(require_value<double>(params, "latitude"),
                                   require_value<double>(params, "longitude"));
        report.speed = params.value("speed", 0.0);
        report.bearing = params.value("bearing", 0.0);
        report.accuracy = params.value("accuracy", 0.0);
        report.timestamp = optional_unsigned(params, "timestamp", clock_.now());
        report.battery_level = optional_int_in_range(params, "battery_level", -1, 0, 100);
        report.signal_strength = optional_int_in_range(params, "signal_strength", -1, 0, 100);

        TelemetryOutcome outcome = tracking_.ingest(report);
        return response_builder_.success({{"delivery_id", report.delivery_id},
                                          {"outcome", to_string(outcome)}});
    }

    json handle_set_conditions(const json &params)
    {
        uint64_t delivery_id = require_delivery(params);
        TrafficCondition traffic = parse_traffic(params.value("traffic", string("UNKNOWN")));
        string weather = params.value("weather", string());

        DeliveryRecord record;
        if (!deliveries_.get_delivery(delivery_id, record))
            throw EntityNotFoundError("Delivery", delivery_id);

        bool updated = tracking_.set_conditions(delivery_id, traffic, weather);
        return response_builder_.success({{"delivery_id", delivery_id}, {"updated", updated}});
    }

    json handle_tracking_snapshot(const json &params)
    {
        uint64_t delivery_id = require_delivery(params);
        TrackingSnapshot snapshot;
        if (!tracking_.get_snapshot(delivery_id, snapshot))
            throw EntityNotFoundError("Tracking record for delivery", delivery_id);
        return response_builder_.success(snapshot_to_json(snapshot));
    }

    json handle_attention_required()
    {
        json list = json::array();
        for (const auto &snapshot : tracking_.get_attention_required())
            list.push_back(snapshot_to_json(snapshot));
        return response_builder_.success({{"count", list.size()}, {"deliveries", list}});
    }

    // ========================================================================
    // DISPATCH OPERATIONS
    // ========================================================================

    json handle_reassignment_candidates()
    {
        json list = json::array();
        for (const auto &record : deliveries_.get_reassignment_candidates())
            list.push_back(delivery_to_json(record));
        return response_builder_.success({{"count", list.size()}, {"deliveries", list}});
    }

    json dispatch(const string &operation, const json &params)
    {
        if (operation == "register_driver")
            return handle_register_driver(params);
        else if (operation == "register_vehicle")
            return handle_register_vehicle(params);
        else if (operation == "get_driver")
            return handle_get_driver(params);
        else if (operation == "update_driver_location")
            return handle_update_driver_location(params);
        else if (operation == "update_driver_eligibility")
            return handle_update_driver_eligibility(params);
        else if (operation == "set_availability")
            return handle_set_availability(params);
        else if (operation == "update_vehicle_compliance")
            return handle_update_vehicle_compliance(params);
        else if (operation == "deactivate_driver")
            return handle_deactivate_driver(params);
        else if (operation == "create_delivery")
            return handle_create_delivery(params);
        else if (operation == "get_delivery")
            return delivery_response(require_delivery(params));
        else if (operation == "assign_driver")
            return handle_assign_driver(params);
        else if (operation == "auto_assign")
            return handle_auto_assign(params);
        else if (operation == "start_pickup" || operation == "complete_pickup" ||
                 operation == "start_delivery" || operation == "mark_arrived" ||
                 operation == "complete_delivery" || operation == "mark_failed" ||
                 operation == "cancel_delivery")
            return handle_lifecycle(operation, params);
        else if (operation == "rate_delivery")
            return handle_rate_delivery(params);
        else if (operation == "telemetry")
            return handle_telemetry(params);
        else if (operation == "set_conditions")
            return handle_set_conditions(params);
        else if (operation == "tracking_snapshot")
            return handle_tracking_snapshot(params);
        else if (operation == "attention_required")
            return handle_attention_required();
        else if (operation == "reassignment_candidates")
            return handle_reassignment_candidates();
        else if (operation == "run_matching_pass")
            return response_builder_.success({{"assigned", matcher_.run_matching_pass()}});
        else if (operation == "run_reassignment_pass")
            return response_builder_.success({{"reassigned", matcher_.run_reassignment_pass()}});

        return response_builder_.error("invalid_input", "Unknown operation: " + operation);
    }

public:
    RequestHandler(const Clock &clock, DriverRegistry &registry, DeliveryManager &deliveries,
                   TrackingEngine &tracking, DispatchMatcher &matcher)
        : clock_(clock), registry_(registry), deliveries_(deliveries),
          tracking_(tracking), matcher_(matcher) {}

    json handle(const json &request)
    {
        string operation;
        try
        {
            if (!request.is_object())
                return response_builder_.error("invalid_input", "Request must be a JSON object");

            operation = request.value("operation", string());
            if (operation.empty())
                return response_builder_.error("invalid_input", "Missing field 'operation'");

            return dispatch(operation, request);
        }
        catch (const InvalidCoordinateError &e)
        {
            return response_builder_.error("invalid_coordinate", e.what());
        }
        catch (const InvalidInputError &e)
        {
            return response_builder_.error("invalid_input", e.what());
        }
        catch (const InvalidTransitionError &e)
        {
            return response_builder_.error("invalid_transition", e.what(),
                                           {{"delivery_id", e.delivery_id()},
                                            {"current", to_string(e.current())},
                                            {"attempted", to_string(e.attempted())}});
        }
        catch (const EntityNotFoundError &e)
        {
            return response_builder_.error("not_found", e.what());
        }
        catch (const json::exception &e)
        {
            return response_builder_.error("invalid_input", string("Bad field value: ") + e.what());
        }
        catch (const exception &e)
        {
            cerr << "[handler] " << operation << " failed: " << e.what() << endl;
            return response_builder_.error("internal_error",
                                           string("Error processing request: ") + e.what());
        }
    }

    string handle_request(const string &request_data)
    {
        json request;
        try
        {
            request = json::parse(request_data);
        }
        catch (const json::parse_error &e)
        {
            return response_builder_.error("invalid_input", string("Malformed JSON: ") + e.what()).dump();
        }
        return handle(request).dump();
    }

    // ========================================================================
    // SERIALIZATION
    // ========================================================================

    static json point_to_json(const GeoPoint &point)
    {
        return {{"latitude", point.latitude}, {"longitude", point.longitude}};
    }

    static json driver_to_json(const DriverProfile &driver)
    {
        json data = {
            {"driver_id", driver.driver_id},
            {"full_name", driver.full_name},
            {"availability", to_string(driver.availability)},
            {"account_status", to_string(driver.account_status)},
            {"background_check", to_string(driver.background_check)},
            {"license_expiry", driver.license_expiry},
            {"is_active", driver.is_active != 0},
            {"vehicle_id", driver.vehicle_id},
            {"active_delivery_id", driver.active_delivery_id},
            {"total_deliveries", driver.total_deliveries},
            {"successful_deliveries", driver.successful_deliveries},
            {"average_rating", driver.average_rating},
            {"total_earnings", driver.total_earnings}};
        if (driver.has_location)
            data["location"] = point_to_json(driver.location);
        return data;
    }

    static json vehicle_to_json(const VehicleInfo &vehicle)
    {
        return {
            {"vehicle_id", vehicle.vehicle_id},
            {"owner_driver_id", vehicle.owner_driver_id},
            {"type", to_string(vehicle.type)},
            {"make", vehicle.make},
            {"model", vehicle.model},
            {"license_plate", vehicle.license_plate},
            {"capacity_weight_kg", vehicle.capacity_weight_kg},
            {"capacity_volume_l", vehicle.capacity_volume_l},
            {"status", to_string(vehicle.status)},
            {"is_verified", vehicle.is_verified != 0}};
    }

    static json delivery_to_json(const DeliveryRecord &record)
    {
        json history = json::array();
        for (const auto &step : record.history)
        {
            json item = {
                {"from", to_string(step.from)},
                {"to", to_string(step.to)},
                {"timestamp", step.timestamp},
                {"actor", to_string(step.actor)}};
            if (!step.note.empty())
                item["note"] = step.note;
            history.push_back(item);
        }

        json data = {
            {"delivery_id", record.delivery_id},
            {"order_id", record.order_id},
            {"status", to_string(record.status)},
            {"type", to_string(record.type)},
            {"priority", to_string(record.priority)},
            {"pickup", point_to_json(record.pickup_location)},
            {"dropoff", point_to_json(record.dropoff_location)},
            {"pickup_address", record.pickup_address},
            {"dropoff_address", record.dropoff_address},
            {"driver_id", record.driver_id},
            {"vehicle_id", record.vehicle_id},
            {"created_time", record.created_time},
            {"driver_assigned_time", record.driver_assigned_time},
            {"estimated_pickup_time", record.estimated_pickup_time},
            {"estimated_delivery_time", record.estimated_delivery_time},
            {"actual_pickup_time", record.actual_pickup_time},
            {"actual_delivery_time", record.actual_delivery_time},
            {"delivery_fee", record.delivery_fee},
            {"tip_amount", record.tip_amount},
            {"driver_payout", record.driver_payout},
            {"reassignment_count", record.reassignment_count},
            {"history", history}};

        if (!record.cancel_reason.empty())
            data["cancel_reason"] = record.cancel_reason;
        if (!record.failure_reason.empty())
            data["failure_reason"] = record.failure_reason;
        if (record.customer_rating != 0)
        {
            data["customer_rating"] = record.customer_rating;
            data["customer_feedback"] = record.customer_feedback;
        }
        return data;
    }

    static json snapshot_to_json(const TrackingSnapshot &snapshot)
    {
        json data = {
            {"delivery_id", snapshot.delivery_id},
            {"driver_id", snapshot.driver_id},
            {"tracking_timestamp", snapshot.tracking_timestamp},
            {"estimated_pickup_time", snapshot.estimated_pickup_time},
            {"estimated_delivery_time", snapshot.estimated_delivery_time},
            {"eta_minutes", snapshot.eta_minutes},
            {"distance_to_pickup", snapshot.distance_to_pickup},
            {"distance_to_delivery", snapshot.distance_to_delivery},
            {"distance_traveled", snapshot.distance_traveled},
            {"status", to_string(snapshot.status)},
            {"progress_percentage", snapshot.progress_percentage},
            {"customer_status", snapshot.customer_status},
            {"is_stale", snapshot.is_stale != 0},
            {"requires_attention", snapshot.requires_attention != 0},
            {"is_open", snapshot.is_open != 0}};
        if (snapshot.has_location)
            data["location"] = point_to_json(snapshot.location);
        return data;
    }
};

#endif // REQUESTHANDLER_H
