#ifndef DDC_CONFIG_HPP
#define DDC_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
using namespace std;

struct DDCConfig
{
    // Tracking
    double geofence_radius_m;
    double gps_noise_threshold_m;
    uint64_t stale_after_s;
    double off_route_threshold_km;
    int low_battery_threshold;
    int weak_signal_threshold;
    double stationary_speed_kmh;
    double assumed_speed_kmh;

    // Dispatch
    uint64_t reassignment_threshold_s;
    double driver_commission_rate;
    uint32_t dispatch_interval_s;

    // Bridge
    uint16_t ws_port;
    string webhook_url;
    uint32_t snapshot_interval_s;

    bool verbose;

    DDCConfig() : geofence_radius_m(100.0), gps_noise_threshold_m(50.0),
                  stale_after_s(300), off_route_threshold_km(0.5),
                  low_battery_threshold(20), weak_signal_threshold(30),
                  stationary_speed_kmh(2.0), assumed_speed_kmh(30.0),
                  reassignment_threshold_s(600), driver_commission_rate(0.8),
                  dispatch_interval_s(5), ws_port(8081), snapshot_interval_s(2),
                  verbose(true)
    {
    }
};

// Overlays the keys present in `j` on top of `config`. Returns false and fills
// `error` when a value has the wrong type or is out of range; `config` is
// left untouched in that case.
inline bool config_from_json(const nlohmann::json &j, DDCConfig &config, string &error)
{
    if (!j.is_object())
    {
        error = "configuration root must be an object";
        return false;
    }

    DDCConfig result = config;
    try
    {
        result.geofence_radius_m = j.value("geofence_radius_m", result.geofence_radius_m);
        result.gps_noise_threshold_m = j.value("gps_noise_threshold_m", result.gps_noise_threshold_m);
        result.stale_after_s = j.value("stale_after_s", result.stale_after_s);
        result.off_route_threshold_km = j.value("off_route_threshold_km", result.off_route_threshold_km);
        result.low_battery_threshold = j.value("low_battery_threshold", result.low_battery_threshold);
        result.weak_signal_threshold = j.value("weak_signal_threshold", result.weak_signal_threshold);
        result.stationary_speed_kmh = j.value("stationary_speed_kmh", result.stationary_speed_kmh);
        result.assumed_speed_kmh = j.value("assumed_speed_kmh", result.assumed_speed_kmh);
        result.reassignment_threshold_s = j.value("reassignment_threshold_s", result.reassignment_threshold_s);
        result.driver_commission_rate = j.value("driver_commission_rate", result.driver_commission_rate);
        result.dispatch_interval_s = j.value("dispatch_interval_s", result.dispatch_interval_s);
        result.ws_port = j.value("ws_port", result.ws_port);
        result.webhook_url = j.value("webhook_url", result.webhook_url);
        result.snapshot_interval_s = j.value("snapshot_interval_s", result.snapshot_interval_s);
        result.verbose = j.value("verbose", result.verbose);
    }
    catch (const nlohmann::json::exception &e)
    {
        error = string("bad value type: ") + e.what();
        return false;
    }

    if (result.geofence_radius_m <= 0)
        error = "geofence_radius_m must be positive";
    else if (result.gps_noise_threshold_m <= 0)
        error = "gps_noise_threshold_m must be positive";
    else if (result.stale_after_s == 0)
        error = "stale_after_s must be positive";
    else if (result.off_route_threshold_km <= 0)
        error = "off_route_threshold_km must be positive";
    else if (result.assumed_speed_kmh <= 0)
        error = "assumed_speed_kmh must be positive";
    else if (result.stationary_speed_kmh < 0)
        error = "stationary_speed_kmh must not be negative";
    else if (result.reassignment_threshold_s == 0)
        error = "reassignment_threshold_s must be positive";
    else if (result.driver_commission_rate < 0 || result.driver_commission_rate > 1)
        error = "driver_commission_rate must be within [0, 1]";
    else if (result.dispatch_interval_s == 0)
        error = "dispatch_interval_s must be positive";

    if (!error.empty())
        return false;

    config = result;
    return true;
}

inline bool load_config(const string &path, DDCConfig &config)
{
    ifstream file(path);
    if (!file.is_open())
    {
        cerr << "[config] Cannot open configuration file: " << path << endl;
        return false;
    }

    nlohmann::json j;
    try
    {
        file >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        cerr << "[config] Failed to parse " << path << ": " << e.what() << endl;
        return false;
    }

    string error;
    if (!config_from_json(j, config, error))
    {
        cerr << "[config] Invalid configuration in " << path << ": " << error << endl;
        return false;
    }

    if (config.verbose)
        cout << "[config] Loaded " << path << endl;
    return true;
}

#endif
