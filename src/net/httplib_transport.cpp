#include <httplib.h>
#include <roomassign/scheduler.hpp>

#include <roomassign/errors.hpp>
#include <roomassign/logger.hpp>

namespace roomassign
{

HttplibTransport::HttplibTransport(std::string base_url, std::chrono::seconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout)
{
    // Split "http://host:port/prefix" into host part and path prefix.
    auto scheme_end = base_url_.find("://");
    auto path_start = base_url_.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    host_           = base_url_.substr(0, path_start);
    if (path_start != std::string::npos)
    {
        prefix_ = base_url_.substr(path_start);
        while (!prefix_.empty() && prefix_.back() == '/')
            prefix_.pop_back();
    }
}

HttpResponse HttplibTransport::post_json(const std::string& path, const std::string& body)
{
    httplib::Client cli(host_);
    if (!cli.is_valid())
        throw TransportError(0, "Unsupported scheduler URL: " + base_url_);

    cli.set_connection_timeout(timeout_);
    cli.set_read_timeout(timeout_);
    cli.set_write_timeout(timeout_);

    const std::string target = prefix_ + path;
    ROOMASSIGN_LOG_DEBUG("http", "POST {}{}", host_, target);

    auto res = cli.Post(target, body, "application/json");
    if (!res)
    {
        throw TransportError(0,
                             "Could not reach scheduler at " + base_url_ + ": "
                                 + httplib::to_string(res.error()));
    }

    return HttpResponse{res->status, res->body};
}

}   // namespace roomassign
