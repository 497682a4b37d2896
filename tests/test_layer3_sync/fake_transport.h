#pragma once
/**
 * @file fake_transport.h
 * @brief Scriptable RemoteTransport for the scheduler and cache tests.
 *
 * Every request is recorded with its send time; the response comes from a handler the test
 * installs. A Gate lets a test hold a request in flight until it decides to release it.
 */
#include "sd_sync.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace syncdesk::tests::helper
{

/// One-shot latch: wait() blocks until open() (or the timeout).
class Gate
{
  public:
    void open()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_open = true;
        }
        m_cv.notify_all();
    }

    bool wait(std::chrono::milliseconds timeout = std::chrono::seconds(10))
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this] { return m_open; });
    }

  private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open{false};
};

inline sync::HttpResponse http(int status, nlohmann::json body = {})
{
    sync::HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    return r;
}

inline sync::HttpResponse transport_error(std::string what = "connection refused")
{
    sync::HttpResponse r;
    r.error = std::move(what);
    return r;
}

class FakeTransport final : public sync::RemoteTransport
{
  public:
    using Handler = std::function<sync::HttpResponse(const sync::HttpRequest &)>;

    struct Call
    {
        sync::HttpRequest request;
        std::chrono::steady_clock::time_point at;
    };

    explicit FakeTransport(Handler handler = {}) : m_handler(std::move(handler)) {}

    void set_handler(Handler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handler = std::move(handler);
    }

    sync::HttpResponse send(const sync::HttpRequest &request) override
    {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.push_back({request, std::chrono::steady_clock::now()});
            handler = m_handler;
        }
        if (!handler)
            return http(200, nlohmann::json::array());
        return handler(request);
    }

    std::vector<Call> calls() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    /// Number of requests whose route key is `route_key` ("GET /projects").
    size_t count(const std::string &route_key) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(
            std::count_if(m_calls.begin(), m_calls.end(), [&](const Call &c)
                          { return c.request.route_key() == route_key; }));
    }

    size_t total() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls.size();
    }

  private:
    mutable std::mutex m_mutex;
    Handler m_handler;
    std::vector<Call> m_calls;
};

} // namespace syncdesk::tests::helper
