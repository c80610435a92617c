#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <roomassign/format.hpp>
#include <roomassign/model.hpp>

namespace roomassign
{

struct HttpResponse
{
    int         status = 0;
    std::string body;
};

// ─── HttpTransport ───────────────────────────────────────────────────────────
// POSTs a JSON body to a path on the scheduler host. Implementations throw
// TransportError (status 0) when no response is received.

class HttpTransport
{
   public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse post_json(const std::string& path, const std::string& body) = 0;
};

// cpp-httplib backed transport. `base_url` is scheme://host[:port] with an
// optional path prefix that is prepended to every request path.
class HttplibTransport : public HttpTransport
{
   public:
    HttplibTransport(std::string base_url, std::chrono::seconds timeout);

    HttpResponse post_json(const std::string& path, const std::string& body) override;

    const std::string& base_url() const { return base_url_; }

   private:
    std::string          base_url_;
    std::string          host_;     // scheme://host[:port]
    std::string          prefix_;   // path prefix without trailing '/'
    std::chrono::seconds timeout_;
};

// ─── SchedulerClient ─────────────────────────────────────────────────────────

class SchedulerClient
{
   public:
    explicit SchedulerClient(std::shared_ptr<HttpTransport> transport);

    /// Send the participants to the endpoint for `format` and decode the rooms.
    /// Throws TransportError on a non-2xx status, no response or a malformed
    /// body. Never retries.
    ScheduleResult submit(Format format, const DebateRequest& request);

   private:
    std::shared_ptr<HttpTransport> transport_;
};

}   // namespace roomassign
