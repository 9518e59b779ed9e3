#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <thread>
#include <mutex>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>
#include <map>
#include <cstdint>
#include <string>
#include <ctime>

#include "../../include/ddc_config.hpp"
#include "../../include/ddc_enums.hpp"
#include "../core/Clock.h"
#include "../core/VehicleSuitability.h"
#include "../core/DriverRegistry.h"
#include "../core/EventPublisher.h"
#include "../core/DeliveryManager.h"
#include "../core/TrackingEngine.h"
#include "../core/DispatchMatcher.h"
#include "../server/RequestHandler.h"
#include "../server/HttpEventPublisher.h"

using namespace std;
using json = nlohmann::json;
using server = websocketpp::server<websocketpp::config::asio>;

// Hands each event to a callback; the bridge uses it to push state changes
// to every connected WebSocket client.
class CallbackPublisher : public EventPublisher {
private:
    function<void(const DeliveryEvent&)> callback;

public:
    explicit CallbackPublisher(function<void(const DeliveryEvent&)> cb) : callback(move(cb)) {}

    void publish(const DeliveryEvent& event) override {
        callback(event);
    }
};

class DispatchBridge {
private:
    DDCConfig config;
    SystemClock clock;
    VehicleSuitabilityEvaluator suitability;
    FanoutPublisher publisher;
    DriverRegistry registry;
    DeliveryManager deliveries;
    TrackingEngine tracking;
    DispatchMatcher matcher;
    RequestHandler handler;

    shared_ptr<MemoryEventLog> event_log;
    shared_ptr<HttpEventPublisher> webhook;

    server ws_server;
    thread server_thread;
    thread dispatcher_thread;
    thread snapshot_thread;
    atomic<bool> running;

    using connection_hdl = websocketpp::connection_hdl;
    struct connection_data {
        time_t connected_at;
        uint64_t messages;
    };

    map<connection_hdl, connection_data, owner_less<connection_hdl>> clients;
    mutex clients_mutex;

    atomic<uint64_t> total_messages{0};
    atomic<uint64_t> total_events{0};

public:
    explicit DispatchBridge(const DDCConfig& cfg) :
        config(cfg),
        suitability(clock),
        registry(clock, suitability),
        deliveries(config, clock, registry, publisher),
        tracking(config, clock, deliveries, registry),
        matcher(config, suitability, registry, deliveries),
        handler(clock, registry, deliveries, tracking, matcher),
        running(false) {

        ws_server.init_asio();
        ws_server.set_reuse_addr(true);
        ws_server.clear_access_channels(websocketpp::log::alevel::frame_header |
                                        websocketpp::log::alevel::frame_payload);

        ws_server.set_open_handler(bind(&DispatchBridge::on_open, this, placeholders::_1));
        ws_server.set_close_handler(bind(&DispatchBridge::on_close, this, placeholders::_1));
        ws_server.set_message_handler(bind(&DispatchBridge::on_message, this, placeholders::_1, placeholders::_2));
    }

    ~DispatchBridge() {
        stop();
    }

    bool initialize() {
        cout << "=== Dispatch Bridge Initialization ===" << endl;

        try {
            event_log = make_shared<MemoryEventLog>();
            publisher.add(event_log);

            publisher.add(make_shared<CallbackPublisher>([this](const DeliveryEvent& event) {
                total_events++;
                json msg = {
                    {"type", "delivery_event"},
                    {"data", event_to_json(event)}
                };
                broadcast_message(msg.dump());
            }));

            if (!config.webhook_url.empty()) {
                webhook = make_shared<HttpEventPublisher>(config.webhook_url);
                webhook->start();
                publisher.add(webhook);
            } else {
                cout << "[bridge] No webhook_url configured, events stay local" << endl;
            }

            cout << "[bridge] Geofence radius: " << config.geofence_radius_m << " m" << endl;
            cout << "[bridge] Reassignment after: " << config.reassignment_threshold_s << " s" << endl;
            cout << "[bridge] Dispatch interval: " << config.dispatch_interval_s << " s" << endl;
            return true;

        } catch (const exception& e) {
            cerr << "[bridge] Initialization error: " << e.what() << endl;
            return false;
        }
    }

    void start() {
        if (running) return;

        try {
            running = true;

            ws_server.listen(config.ws_port);
            ws_server.start_accept();

            server_thread = thread([this]() {
                cout << "[bridge] WebSocket server starting on port " << config.ws_port << endl;
                try {
                    ws_server.run();
                } catch (const exception& e) {
                    cerr << "[bridge] WebSocket server error: " << e.what() << endl;
                }
            });

            dispatcher_thread = thread(&DispatchBridge::dispatcher_loop, this);
            snapshot_thread = thread(&DispatchBridge::snapshot_loop, this);

            cout << endl << "[bridge] Dispatch bridge started" << endl;
            cout << "   Clients: ws://localhost:" << config.ws_port << endl;
            cout << "   Webhook: " << (config.webhook_url.empty() ? "disabled" : config.webhook_url) << endl;
            cout << endl;

        } catch (const exception& e) {
            cerr << "[bridge] Failed to start: " << e.what() << endl;
            running = false;
        }
    }

    void stop() {
        if (!running) return;

        running = false;

        if (dispatcher_thread.joinable()) {
            dispatcher_thread.join();
        }
        if (snapshot_thread.joinable()) {
            snapshot_thread.join();
        }

        try {
            ws_server.stop_listening();

            {
                lock_guard<mutex> lock(clients_mutex);
                for (auto& client : clients) {
                    websocketpp::lib::error_code ec;
                    ws_server.close(client.first, websocketpp::close::status::going_away, "Server shutdown", ec);
                    if (ec) {
                        cerr << "[bridge] Close failed: " << ec.message() << endl;
                    }
                }
                clients.clear();
            }

            ws_server.stop();

            if (server_thread.joinable()) {
                server_thread.join();
            }
        } catch (const exception& e) {
            cerr << "[bridge] Error stopping WebSocket server: " << e.what() << endl;
        }

        if (webhook) {
            webhook->stop();
        }

        cout << "[bridge] Stopped" << endl;
    }

    bool is_running() const { return running; }

    void print_status() {
        size_t connected;
        {
            lock_guard<mutex> lock(clients_mutex);
            connected = clients.size();
        }

        TelemetryStats stats = tracking.get_stats();
        cout << "Clients connected:    " << connected << endl;
        cout << "Drivers registered:   " << registry.driver_count() << endl;
        cout << "Pending deliveries:   " << deliveries.get_pending_deliveries().size() << endl;
        cout << "In progress:          " << deliveries.get_deliveries_in_progress().size() << endl;
        cout << "Needs reassignment:   " << deliveries.get_reassignment_candidates().size() << endl;
        cout << "Events published:     " << total_events << endl;
        cout << "Messages handled:     " << total_messages << endl;
        cout << "Telemetry applied:    " << stats.count(TelemetryOutcome::APPLIED) +
                                                stats.count(TelemetryOutcome::APPLIED_LOW_ACCURACY) << endl;
        cout << "Telemetry dropped:    " << stats.count(TelemetryOutcome::DROPPED_OUT_OF_ORDER) +
                                                stats.count(TelemetryOutcome::DROPPED_INACTIVE) +
                                                stats.count(TelemetryOutcome::DROPPED_UNKNOWN_DELIVERY) +
                                                stats.count(TelemetryOutcome::DROPPED_DRIVER_MISMATCH) << endl;
        cout << "Telemetry rejected:   " << stats.count(TelemetryOutcome::REJECTED_INVALID) << endl;
        if (webhook) {
            cout << "Webhook sent/failed:  " << webhook->sent_count() << "/" << webhook->failed_count() << endl;
        }
    }

    void print_events(size_t limit) {
        vector<DeliveryEvent> events = event_log->events();
        size_t start = events.size() > limit ? events.size() - limit : 0;
        for (size_t i = start; i < events.size(); i++) {
            cout << event_to_json(events[i]).dump() << endl;
        }
    }

private:

    // Sleeps in short slices so stop() is never held up for a full interval.
    bool wait_interval(uint32_t seconds) {
        auto deadline = chrono::steady_clock::now() + chrono::seconds(seconds);
        while (running && chrono::steady_clock::now() < deadline) {
            this_thread::sleep_for(chrono::milliseconds(100));
        }
        return running;
    }

    void dispatcher_loop() {
        while (wait_interval(config.dispatch_interval_s)) {
            try {
                matcher.run_matching_pass();
                matcher.run_reassignment_pass();
            } catch (const exception& e) {
                cerr << "[bridge] Dispatcher error: " << e.what() << endl;
            }
        }
    }

    void snapshot_loop() {
        while (wait_interval(config.snapshot_interval_s)) {
            try {
                broadcast_snapshots();
            } catch (const exception& e) {
                cerr << "[bridge] Snapshot broadcast error: " << e.what() << endl;
            }
        }
    }

    void broadcast_snapshots() {
        {
            lock_guard<mutex> lock(clients_mutex);
            if (clients.empty()) return;
        }

        json list = json::array();
        size_t attention = 0;
        for (const auto& snapshot : tracking.get_open_snapshots()) {
            if (snapshot.requires_attention) attention++;
            list.push_back(RequestHandler::snapshot_to_json(snapshot));
        }
        if (list.empty()) return;

        json msg = {
            {"type", "tracking_snapshot"},
            {"data", {
                {"deliveries", list},
                {"attention_required", attention},
                {"timestamp", clock.now()}
            }}
        };

        broadcast_message(msg.dump());
    }

    void on_open(connection_hdl hdl) {
        size_t total;
        {
            lock_guard<mutex> lock(clients_mutex);
            connection_data data;
            data.connected_at = time(nullptr);
            data.messages = 0;
            clients[hdl] = data;
            total = clients.size();
        }

        cout << "[bridge] Client connected. Total: " << total << endl;

        json welcome = {
            {"type", "welcome"},
            {"data", {
                {"pending_deliveries", deliveries.get_pending_deliveries().size()},
                {"in_progress", deliveries.get_deliveries_in_progress().size()},
                {"timestamp", clock.now()}
            }}
        };
        send_message(hdl, welcome.dump());
    }

    void on_close(connection_hdl hdl) {
        lock_guard<mutex> lock(clients_mutex);
        clients.erase(hdl);
        cout << "[bridge] Client disconnected. Remaining: " << clients.size() << endl;
    }

    void on_message(connection_hdl hdl, server::message_ptr msg) {
        total_messages++;
        {
            lock_guard<mutex> lock(clients_mutex);
            auto it = clients.find(hdl);
            if (it != clients.end()) it->second.messages++;
        }

        string payload = msg->get_payload();
        if (payload.empty()) return;

        json data;
        try {
            data = json::parse(payload);
        } catch (const json::parse_error& e) {
            send_error(hdl, string("Malformed JSON: ") + e.what());
            return;
        }

        string cmd = string_field(data, "command");
        if (cmd == "ping") {
            json pong = {
                {"type", "pong"},
                {"timestamp", clock.now()}
            };
            send_message(hdl, pong.dump());
            return;
        }

        json response = handler.handle(data);
        json reply = {
            {"type", "response"},
            {"operation", string_field(data, "operation")},
            {"response", response}
        };
        if (data.is_object() && data.contains("request_id")) {
            reply["request_id"] = data["request_id"];
        }

        send_message(hdl, reply.dump());
    }

    static string string_field(const json& data, const char* key) {
        if (!data.is_object()) return "";
        auto it = data.find(key);
        if (it == data.end() || !it->is_string()) return "";
        return it->get<string>();
    }

    void send_error(connection_hdl hdl, const string& message) {
        json response = {
            {"type", "error"},
            {"message", message},
            {"timestamp", clock.now()}
        };

        send_message(hdl, response.dump());
    }

    void send_message(connection_hdl hdl, const string& msg) {
        websocketpp::lib::error_code ec;
        ws_server.send(hdl, msg, websocketpp::frame::opcode::text, ec);
        if (ec) {
            cerr << "[bridge] Error sending message: " << ec.message() << endl;
            lock_guard<mutex> lock(clients_mutex);
            clients.erase(hdl);
        }
    }

    void broadcast_message(const string& msg) {
        lock_guard<mutex> lock(clients_mutex);
        vector<connection_hdl> to_remove;

        for (const auto& client : clients) {
            websocketpp::lib::error_code ec;
            ws_server.send(client.first, msg, websocketpp::frame::opcode::text, ec);
            if (ec) {
                to_remove.push_back(client.first);
            }
        }

        for (const auto& hdl : to_remove) {
            clients.erase(hdl);
        }
    }
};

int main(int argc, char** argv) {
    cout << "========================================" << endl;
    cout << "  Delivery Dispatch Bridge" << endl;
    cout << "  WebSocket + Dispatcher + Tracking" << endl;
    cout << "========================================" << endl;

    DDCConfig config;
    if (argc > 1) {
        if (!load_config(argv[1], config)) {
            cerr << "Invalid configuration. Exiting..." << endl;
            return 1;
        }
    } else {
        cout << "[config] No configuration file given, using defaults" << endl;
    }

    DispatchBridge bridge(config);

    if (!bridge.initialize()) {
        cerr << "Failed to initialize bridge. Exiting..." << endl;
        return 1;
    }

    bridge.start();

    string command;
    while (bridge.is_running()) {
        cout << "> ";
        if (!getline(cin, command)) {
            // stdin closed: keep serving until the process is signalled
            while (bridge.is_running()) {
                this_thread::sleep_for(chrono::seconds(1));
            }
            break;
        }

        if (command == "stop" || command == "exit") {
            break;
        } else if (command == "status") {
            bridge.print_status();
        } else if (command == "events") {
            bridge.print_events(20);
        } else if (command == "help") {
            cout << "Commands: stop, exit, status, events, help" << endl;
        } else if (!command.empty()) {
            cout << "Unknown command. Type 'help' for available commands." << endl;
        }
    }

    cout << "Stopping bridge..." << endl;
    bridge.stop();

    cout << "Bridge stopped successfully." << endl;
    return 0;
}
