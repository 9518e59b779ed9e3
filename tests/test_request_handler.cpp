#include <gtest/gtest.h>
#include <string>

#include "server/RequestHandler.h"
#include "test_fixtures.h"

class RequestHandlerTest : public DispatchFixture
{
protected:
    RequestHandler handler;

    RequestHandlerTest() : handler(clock, registry, deliveries, tracking, matcher) {}

    json call(const json &request)
    {
        return handler.handle(request);
    }

    static json point(const GeoPoint &p)
    {
        return {{"latitude", p.latitude}, {"longitude", p.longitude}};
    }

    uint64_t register_courier(const string &name, const GeoPoint &location)
    {
        json driver = call({{"operation", "register_driver"},
                            {"full_name", name},
                            {"license_expiry", clock.now() + ONE_YEAR_S},
                            {"background_check", "APPROVED"},
                            {"availability", "AVAILABLE"},
                            {"location", point(location)}});
        EXPECT_EQ(driver["status"], "success");
        uint64_t driver_id = driver["data"]["driver_id"].get<uint64_t>();

        json vehicle = call({{"operation", "register_vehicle"},
                             {"owner_driver_id", driver_id},
                             {"type", "CAR"},
                             {"is_verified", true}});
        EXPECT_EQ(vehicle["status"], "success");
        return driver_id;
    }

    uint64_t create_order(uint64_t order_id)
    {
        json response = call({{"operation", "create_delivery"},
                              {"order_id", order_id},
                              {"pickup", point(NYC_PICKUP)},
                              {"dropoff", point(NYC_DROPOFF)},
                              {"delivery_fee", 10.0},
                              {"tip_amount", 3.0}});
        EXPECT_EQ(response["status"], "success");
        return response["data"]["delivery_id"].get<uint64_t>();
    }
};

TEST_F(RequestHandlerTest, FullDeliveryOverJson)
{
    uint64_t driver_id = register_courier("Json Courier", NYC_DRIVER_NEAR);
    uint64_t delivery_id = create_order(500);

    json assigned = call({{"operation", "auto_assign"}, {"delivery_id", delivery_id}});
    ASSERT_EQ(assigned["status"], "success");
    EXPECT_TRUE(assigned["data"]["assigned"].get<bool>());
    EXPECT_EQ(assigned["data"]["driver_id"].get<uint64_t>(), driver_id);

    clock.advance(10);
    json fix = call({{"operation", "telemetry"},
                     {"delivery_id", delivery_id},
                     {"driver_id", driver_id},
                     {"latitude", 40.7311},
                     {"longitude", -73.9352},
                     {"speed", 12.0},
                     {"accuracy", 4.0}});
    ASSERT_EQ(fix["status"], "success");
    EXPECT_EQ(fix["data"]["outcome"], "APPLIED");

    json current = call({{"operation", "get_delivery"}, {"delivery_id", delivery_id}});
    EXPECT_EQ(current["data"]["status"], "PICKUP_IN_PROGRESS");

    for (const char *op : {"complete_pickup", "start_delivery", "mark_arrived"})
    {
        clock.advance(60);
        json step = call({{"operation", op}, {"delivery_id", delivery_id}});
        ASSERT_EQ(step["status"], "success") << op;
    }

    clock.advance(30);
    json done = call({{"operation", "complete_delivery"},
                      {"delivery_id", delivery_id},
                      {"proof", "photo-123"}});
    ASSERT_EQ(done["status"], "success");
    EXPECT_EQ(done["data"]["status"], "DELIVERED");
    EXPECT_DOUBLE_EQ(done["data"]["driver_payout"].get<double>(), 11.0);
    EXPECT_EQ(done["data"]["history"].size(), 6u);

    json rated = call({{"operation", "rate_delivery"},
                       {"delivery_id", delivery_id},
                       {"rating", 5},
                       {"feedback", "fast"}});
    ASSERT_EQ(rated["status"], "success");
    EXPECT_EQ(rated["data"]["customer_rating"].get<int>(), 5);

    json snapshot = call({{"operation", "tracking_snapshot"}, {"delivery_id", delivery_id}});
    ASSERT_EQ(snapshot["status"], "success");
    EXPECT_EQ(snapshot["data"]["status"], "DELIVERED");
    EXPECT_EQ(snapshot["data"]["progress_percentage"].get<int>(), 100);
    EXPECT_FALSE(snapshot["data"]["is_open"].get<bool>());

    json courier = call({{"operation", "get_driver"}, {"driver_id", driver_id}});
    ASSERT_EQ(courier["status"], "success");
    EXPECT_EQ(courier["data"]["availability"], "AVAILABLE");
    EXPECT_EQ(courier["data"]["successful_deliveries"].get<int>(), 1);
}

TEST_F(RequestHandlerTest, IllegalTransitionCarriesDetails)
{
    uint64_t delivery_id = create_order(501);

    json response = call({{"operation", "complete_pickup"}, {"delivery_id", delivery_id}});
    ASSERT_EQ(response["status"], "error");
    EXPECT_EQ(response["code"], "invalid_transition");
    EXPECT_EQ(response["details"]["delivery_id"].get<uint64_t>(), delivery_id);
    EXPECT_EQ(response["details"]["current"], "PENDING");
    EXPECT_EQ(response["details"]["attempted"], "PICKED_UP");
}

TEST_F(RequestHandlerTest, ErrorCodes)
{
    json unknown_op = call({{"operation", "teleport"}});
    EXPECT_EQ(unknown_op["code"], "invalid_input");

    json no_op = call({{"delivery_id", 1}});
    EXPECT_EQ(no_op["code"], "invalid_input");

    json not_object = call(json::array({1, 2, 3}));
    EXPECT_EQ(not_object["code"], "invalid_input");

    json missing = call({{"operation", "get_delivery"}, {"delivery_id", 9999}});
    EXPECT_EQ(missing["status"], "error");
    EXPECT_EQ(missing["code"], "not_found");

    json bad_point = call({{"operation", "create_delivery"},
                           {"order_id", 7},
                           {"pickup", {{"latitude", 123.0}, {"longitude", 0.0}}},
                           {"dropoff", point(NYC_DROPOFF)}});
    EXPECT_EQ(bad_point["code"], "invalid_coordinate");

    json bad_enum = call({{"operation", "create_delivery"},
                          {"order_id", 8},
                          {"pickup", point(NYC_PICKUP)},
                          {"dropoff", point(NYC_DROPOFF)},
                          {"type", "HOVERCRAFT"}});
    EXPECT_EQ(bad_enum["code"], "invalid_input");

    json wrong_type = call({{"operation", "get_delivery"}, {"delivery_id", "seven"}});
    EXPECT_EQ(wrong_type["code"], "invalid_input");

    json missing_field = call({{"operation", "create_delivery"}, {"order_id", 9}});
    EXPECT_EQ(missing_field["code"], "invalid_input");
}

TEST_F(RequestHandlerTest, MalformedJsonText)
{
    json response = json::parse(handler.handle_request("{\"operation\": \"get_delivery\", "));
    EXPECT_EQ(response["status"], "error");
    EXPECT_EQ(response["code"], "invalid_input");

    json ok = json::parse(handler.handle_request("{\"operation\": \"attention_required\"}"));
    EXPECT_EQ(ok["status"], "success");
    EXPECT_EQ(ok["data"]["count"].get<int>(), 0);
}

TEST_F(RequestHandlerTest, AssignToBusyDriverReportsNotAssigned)
{
    uint64_t driver_id = register_courier("Busy Courier", NYC_DRIVER_NEAR);
    uint64_t first = create_order(510);
    uint64_t second = create_order(511);

    json ok = call({{"operation", "assign_driver"}, {"delivery_id", first}, {"driver_id", driver_id}});
    ASSERT_EQ(ok["status"], "success");
    EXPECT_EQ(ok["data"]["status"], "ASSIGNED");

    json lost = call({{"operation", "assign_driver"}, {"delivery_id", second}, {"driver_id", driver_id}});
    ASSERT_EQ(lost["status"], "success");
    EXPECT_FALSE(lost["data"]["assigned"].get<bool>());

    json deactivate = call({{"operation", "deactivate_driver"}, {"driver_id", driver_id}});
    EXPECT_EQ(deactivate["code"], "invalid_transition");

    json busy = call({{"operation", "set_availability"}, {"driver_id", driver_id}, {"availability", "BUSY"}});
    EXPECT_EQ(busy["code"], "invalid_input");
}

TEST_F(RequestHandlerTest, CancelReleasesDriverAndStopsTelemetry)
{
    uint64_t driver_id = register_courier("Cancel Courier", NYC_DRIVER_NEAR);
    uint64_t delivery_id = create_order(520);
    ASSERT_EQ(call({{"operation", "auto_assign"}, {"delivery_id", delivery_id}})["status"], "success");

    json cancelled = call({{"operation", "cancel_delivery"},
                           {"delivery_id", delivery_id},
                           {"reason", "changed my mind"}});
    ASSERT_EQ(cancelled["status"], "success");
    EXPECT_EQ(cancelled["data"]["status"], "CANCELLED");
    EXPECT_EQ(cancelled["data"]["cancel_reason"], "changed my mind");
    EXPECT_EQ(cancelled["data"]["history"].back()["actor"], "CUSTOMER");

    json fix = call({{"operation", "telemetry"},
                     {"delivery_id", delivery_id},
                     {"driver_id", driver_id},
                     {"latitude", NYC_DRIVER_NEAR.latitude},
                     {"longitude", NYC_DRIVER_NEAR.longitude}});
    EXPECT_EQ(fix["data"]["outcome"], "DROPPED_INACTIVE");

    json courier = call({{"operation", "get_driver"}, {"driver_id", driver_id}});
    EXPECT_EQ(courier["data"]["availability"], "AVAILABLE");
    EXPECT_EQ(courier["data"]["active_delivery_id"].get<uint64_t>(), 0u);

    json failed = call({{"operation", "mark_failed"}, {"delivery_id", delivery_id}});
    EXPECT_EQ(failed["code"], "invalid_input");
}

TEST_F(RequestHandlerTest, VehicleComplianceAndConditions)
{
    uint64_t driver_id = register_courier("Compliance Courier", NYC_DRIVER_NEAR);
    DriverProfile profile = driver(driver_id);

    json expired = call({{"operation", "update_vehicle_compliance"},
                         {"vehicle_id", profile.vehicle_id},
                         {"insurance_expiry", clock.now() - 1}});
    ASSERT_EQ(expired["status"], "success");
    EXPECT_EQ(expired["data"]["status"], "INSURANCE_EXPIRED");

    uint64_t delivery_id = create_order(530);
    json none = call({{"operation", "auto_assign"}, {"delivery_id", delivery_id}});
    ASSERT_EQ(none["status"], "success");
    EXPECT_FALSE(none["data"]["assigned"].get<bool>());

    json conditions = call({{"operation", "set_conditions"},
                            {"delivery_id", delivery_id},
                            {"traffic", "HEAVY"},
                            {"weather", "snow"}});
    ASSERT_EQ(conditions["status"], "success");
    EXPECT_TRUE(conditions["data"]["updated"].get<bool>());

    json passes = call({{"operation", "run_matching_pass"}});
    EXPECT_EQ(passes["data"]["assigned"].get<int>(), 0);
}

TEST_F(RequestHandlerTest, NumbersAreNeverCoerced)
{
    json negative_order = call({{"operation", "create_delivery"},
                                {"order_id", -5},
                                {"pickup", point(NYC_PICKUP)},
                                {"dropoff", point(NYC_DROPOFF)}});
    EXPECT_EQ(negative_order["code"], "invalid_input");

    json fractional_order = call({{"operation", "create_delivery"},
                                  {"order_id", 5.5},
                                  {"pickup", point(NYC_PICKUP)},
                                  {"dropoff", point(NYC_DROPOFF)}});
    EXPECT_EQ(fractional_order["code"], "invalid_input");
    EXPECT_TRUE(deliveries.get_all_deliveries().empty());

    json negative_id = call({{"operation", "get_delivery"}, {"delivery_id", -1}});
    EXPECT_EQ(negative_id["code"], "invalid_input");

    uint64_t driver_id = register_courier("Strict Courier", NYC_DRIVER_NEAR);
    uint64_t delivery_id = create_order(540);
    ASSERT_EQ(call({{"operation", "auto_assign"}, {"delivery_id", delivery_id}})["status"], "success");

    json report = {{"operation", "telemetry"},
                   {"delivery_id", delivery_id},
                   {"driver_id", driver_id},
                   {"latitude", NYC_DRIVER_NEAR.latitude},
                   {"longitude", NYC_DRIVER_NEAR.longitude},
                   {"accuracy", 5.0}};

    json wrapped = report;
    wrapped["timestamp"] = -1;
    EXPECT_EQ(call(wrapped)["code"], "invalid_input");

    json fractional = report;
    fractional["timestamp"] = static_cast<double>(clock.now()) + 0.5;
    EXPECT_EQ(call(fractional)["code"], "invalid_input");

    json battery = report;
    battery["battery_level"] = 150;
    EXPECT_EQ(call(battery)["code"], "invalid_input");

    // the rejected fields left tracking untouched
    json valid = report;
    valid["timestamp"] = clock.now();
    EXPECT_EQ(call(valid)["data"]["outcome"], "APPLIED");
    EXPECT_EQ(tracking_record(delivery_id).tracking_timestamp, clock.now());

    deliveries.start_pickup(delivery_id);
    deliveries.complete_pickup(delivery_id);
    deliveries.start_delivery(delivery_id);
    deliveries.mark_arrived(delivery_id);
    deliveries.complete_delivery(delivery_id);

    json fractional_rating = call({{"operation", "rate_delivery"}, {"delivery_id", delivery_id}, {"rating", 4.9}});
    EXPECT_EQ(fractional_rating["code"], "invalid_input");
    EXPECT_EQ(delivery(delivery_id).customer_rating, 0);

    json out_of_range = call({{"operation", "rate_delivery"}, {"delivery_id", delivery_id}, {"rating", 6}});
    EXPECT_EQ(out_of_range["code"], "invalid_input");
}

TEST_F(RequestHandlerTest, IdleDriverBecomesMatchableAfterLocationUpdate)
{
    json registered = call({{"operation", "register_driver"},
                            {"full_name", "No Fix Yet"},
                            {"license_expiry", clock.now() + ONE_YEAR_S},
                            {"background_check", "APPROVED"},
                            {"availability", "AVAILABLE"}});
    ASSERT_EQ(registered["status"], "success");
    uint64_t driver_id = registered["data"]["driver_id"].get<uint64_t>();
    ASSERT_EQ(call({{"operation", "register_vehicle"},
                    {"owner_driver_id", driver_id},
                    {"type", "CAR"},
                    {"is_verified", true}})["status"],
              "success");

    uint64_t delivery_id = create_order(550);
    json unmatched = call({{"operation", "auto_assign"}, {"delivery_id", delivery_id}});
    EXPECT_FALSE(unmatched["data"]["assigned"].get<bool>());

    json moved = call({{"operation", "update_driver_location"},
                       {"driver_id", driver_id},
                       {"location", point(NYC_DRIVER_NEAR)}});
    ASSERT_EQ(moved["status"], "success");
    EXPECT_TRUE(moved["data"]["updated"].get<bool>());

    json older = call({{"operation", "update_driver_location"},
                       {"driver_id", driver_id},
                       {"location", point(NYC_DRIVER_FAR)},
                       {"timestamp", clock.now() - 60}});
    ASSERT_EQ(older["status"], "success");
    EXPECT_FALSE(older["data"]["updated"].get<bool>());
    EXPECT_DOUBLE_EQ(driver(driver_id).location.latitude, NYC_DRIVER_NEAR.latitude);

    json matched = call({{"operation", "auto_assign"}, {"delivery_id", delivery_id}});
    ASSERT_EQ(matched["status"], "success");
    EXPECT_TRUE(matched["data"]["assigned"].get<bool>());
    EXPECT_EQ(matched["data"]["driver_id"].get<uint64_t>(), driver_id);

    json unknown = call({{"operation", "update_driver_location"},
                         {"driver_id", driver_id + 50},
                         {"location", point(NYC_DRIVER_NEAR)}});
    EXPECT_EQ(unknown["code"], "not_found");

    json off_map = call({{"operation", "update_driver_location"},
                         {"driver_id", driver_id},
                         {"location", {{"latitude", 95.0}, {"longitude", 0.0}}}});
    EXPECT_EQ(off_map["code"], "invalid_coordinate");
}

TEST_F(RequestHandlerTest, SuspensionAndVerificationChangeMatching)
{
    uint64_t driver_id = register_courier("Reviewed Courier", NYC_DRIVER_NEAR);
    uint64_t delivery_id = create_order(560);

    json suspended = call({{"operation", "update_driver_eligibility"},
                           {"driver_id", driver_id},
                           {"account_status", "SUSPENDED"}});
    ASSERT_EQ(suspended["status"], "success");
    EXPECT_EQ(suspended["data"]["account_status"], "SUSPENDED");
    EXPECT_EQ(suspended["data"]["background_check"], "APPROVED");

    json blocked = call({{"operation", "auto_assign"}, {"delivery_id", delivery_id}});
    EXPECT_FALSE(blocked["data"]["assigned"].get<bool>());

    json restored = call({{"operation", "update_driver_eligibility"},
                          {"driver_id", driver_id},
                          {"account_status", "ACTIVE"},
                          {"license_expiry", clock.now() + ONE_YEAR_S}});
    ASSERT_EQ(restored["status"], "success");

    json matched = call({{"operation", "auto_assign"}, {"delivery_id", delivery_id}});
    EXPECT_TRUE(matched["data"]["assigned"].get<bool>());

    json bad_status = call({{"operation", "update_driver_eligibility"},
                            {"driver_id", driver_id},
                            {"account_status", "ON_HOLIDAY"}});
    EXPECT_EQ(bad_status["code"], "invalid_input");

    json bad_expiry = call({{"operation", "update_driver_eligibility"},
                            {"driver_id", driver_id},
                            {"license_expiry", -10}});
    EXPECT_EQ(bad_expiry["code"], "invalid_input");
}
