#ifndef HTTPEVENTPUBLISHER_H
#define HTTPEVENTPUBLISHER_H

#include "../../include/ddc_types.hpp"
#include "../../source/core/EventPublisher.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <iostream>
using namespace std;
using json = nlohmann::json;

// Posts each delivery event as JSON to a webhook. publish() only queues;
// a single worker thread owns the curl handle, so a slow endpoint never
// stalls dispatch or telemetry. When the queue is full the oldest event is
// dropped.
class HttpEventPublisher : public EventPublisher
{
private:
    string url_;
    size_t max_queue_;
    long timeout_s_;

    deque<DeliveryEvent> queue_;
    mutex queue_mutex_;
    condition_variable queue_cv_;
    atomic<bool> running_;
    atomic<uint64_t> sent_;
    atomic<uint64_t> failed_;
    atomic<uint64_t> dropped_;
    thread worker_;

    static size_t WriteCallback(void *contents, size_t size, size_t nmemb, string *userp)
    {
        size_t total = size * nmemb;
        userp->append(static_cast<char *>(contents), total);
        return total;
    }

    bool post(CURL *curl, const string &body)
    {
        string response;
        struct curl_slist *headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        curl_easy_reset(curl);
        curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        curl_slist_free_all(headers);

        if (res != CURLE_OK)
        {
            cerr << "[webhook] POST to " << url_ << " failed: " << curl_easy_strerror(res) << endl;
            return false;
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (status < 200 || status >= 300)
        {
            cerr << "[webhook] " << url_ << " answered HTTP " << status << endl;
            return false;
        }
        return true;
    }

    void worker_loop()
    {
        CURL *curl = curl_easy_init();
        if (!curl)
        {
            cerr << "[webhook] Failed to initialize CURL, events will not be forwarded" << endl;
            return;
        }

        while (true)
        {
            DeliveryEvent event;
            {
                unique_lock<mutex> lock(queue_mutex_);
                queue_cv_.wait(lock, [this]()
                               { return !queue_.empty() || !running_; });
                if (queue_.empty())
                    break;
                event = queue_.front();
                queue_.pop_front();
            }

            json body = {{"type", "delivery_event"}, {"data", event_to_json(event)}};
            if (post(curl, body.dump()))
                sent_++;
            else
                failed_++;
        }

        curl_easy_cleanup(curl);
    }

public:
    explicit HttpEventPublisher(const string &url, size_t max_queue = 1000, long timeout_s = 5)
        : url_(url), max_queue_(max_queue), timeout_s_(timeout_s), running_(false),
          sent_(0), failed_(0), dropped_(0)
    {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~HttpEventPublisher()
    {
        stop();
        curl_global_cleanup();
    }

    void start()
    {
        if (running_)
            return;
        running_ = true;
        worker_ = thread(&HttpEventPublisher::worker_loop, this);
        cout << "[webhook] Forwarding events to " << url_ << endl;
    }

    // Drains what is already queued, then joins the worker.
    void stop()
    {
        {
            lock_guard<mutex> lock(queue_mutex_);
            if (!running_)
                return;
            running_ = false;
        }
        queue_cv_.notify_all();
        if (worker_.joinable())
            worker_.join();
        cout << "[webhook] Stopped (" << sent_ << " sent, " << failed_ << " failed, "
             << dropped_ << " dropped)" << endl;
    }

    void publish(const DeliveryEvent &event) override
    {
        {
            lock_guard<mutex> lock(queue_mutex_);
            if (!running_)
                return;
            if (queue_.size() >= max_queue_)
            {
                queue_.pop_front();
                dropped_++;
            }
            queue_.push_back(event);
        }
        queue_cv_.notify_one();
    }

    uint64_t sent_count() const { return sent_; }
    uint64_t failed_count() const { return failed_; }
    uint64_t dropped_count() const { return dropped_; }
};

#endif // HTTPEVENTPUBLISHER_H
