#ifndef EVENTPUBLISHER_H
#define EVENTPUBLISHER_H

#include "../../include/ddc_types.hpp"
#include "../../include/ddc_enums.hpp"
#include <nlohmann/json.hpp>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>
using namespace std;
using json = nlohmann::json;

// Sink for delivery state-change events. publish() is called after the
// delivery's lock has been released and must not block on I/O.
class EventPublisher
{
public:
    virtual ~EventPublisher() {}
    virtual void publish(const DeliveryEvent &event) = 0;
};

inline json event_to_json(const DeliveryEvent &event)
{
    json data = {
        {"delivery_id", event.delivery_id},
        {"old_status", to_string(event.old_status)},
        {"new_status", to_string(event.new_status)},
        {"timestamp", event.timestamp},
        {"actor", to_string(event.actor)}};

    if (event.driver_id != 0)
        data["driver_id"] = event.driver_id;
    if (!event.note.empty())
        data["note"] = event.note;

    return data;
}

class NullEventPublisher : public EventPublisher
{
public:
    void publish(const DeliveryEvent &) override {}
};

// Keeps every event in memory; used by tests and by the bridge's event query.
class MemoryEventLog : public EventPublisher
{
private:
    mutable mutex mutex_;
    vector<DeliveryEvent> events_;
    size_t max_events_;

public:
    explicit MemoryEventLog(size_t max_events = 10000) : max_events_(max_events) {}

    void publish(const DeliveryEvent &event) override
    {
        lock_guard<mutex> lock(mutex_);
        if (events_.size() >= max_events_)
            events_.erase(events_.begin());
        events_.push_back(event);
    }

    vector<DeliveryEvent> events() const
    {
        lock_guard<mutex> lock(mutex_);
        return events_;
    }

    vector<DeliveryEvent> events_for(uint64_t delivery_id) const
    {
        lock_guard<mutex> lock(mutex_);
        vector<DeliveryEvent> result;
        for (const auto &event : events_)
        {
            if (event.delivery_id == delivery_id)
                result.push_back(event);
        }
        return result;
    }

    size_t size() const
    {
        lock_guard<mutex> lock(mutex_);
        return events_.size();
    }

    void clear()
    {
        lock_guard<mutex> lock(mutex_);
        events_.clear();
    }
};

// Forwards to several sinks. A failing sink is logged and skipped so that one
// subscriber cannot break delivery for the others.
class FanoutPublisher : public EventPublisher
{
private:
    mutable mutex mutex_;
    vector<shared_ptr<EventPublisher>> sinks_;

public:
    void add(const shared_ptr<EventPublisher> &sink)
    {
        lock_guard<mutex> lock(mutex_);
        sinks_.push_back(sink);
    }

    void publish(const DeliveryEvent &event) override
    {
        vector<shared_ptr<EventPublisher>> sinks;
        {
            lock_guard<mutex> lock(mutex_);
            sinks = sinks_;
        }

        for (const auto &sink : sinks)
        {
            try
            {
                sink->publish(event);
            }
            catch (const exception &e)
            {
                cerr << "[events] Subscriber failed for delivery " << event.delivery_id
                     << ": " << e.what() << endl;
            }
        }
    }
};

#endif // EVENTPUBLISHER_H
