#include <roomassign/scheduler.hpp>

#include <roomassign/errors.hpp>
#include <roomassign/logger.hpp>

#include "json_codec.hpp"

namespace roomassign
{

SchedulerClient::SchedulerClient(std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport))
{
}

ScheduleResult SchedulerClient::submit(Format format, const DebateRequest& request)
{
    const std::string path = std::string(endpoint_path(format));
    const std::string body = net::encode_request(request);

    ROOMASSIGN_LOG_INFO("scheduler",
                        "POST {} with {} participants ({} bytes)",
                        path,
                        request.participants.size(),
                        body.size());

    HttpResponse response = transport_->post_json(path, body);

    if (response.status < 200 || response.status >= 300)
    {
        std::string detail = net::decode_error_detail(response.body);
        ROOMASSIGN_LOG_ERROR("scheduler", "{} failed with HTTP {}: {}", path, response.status, detail);
        throw TransportError(response.status, std::move(detail));
    }

    ScheduleResult result = net::decode_response(response.body, response.status);
    ROOMASSIGN_LOG_INFO("scheduler",
                        "Received {} rooms (total preference {})",
                        result.rooms.size(),
                        result.total_preference);
    return result;
}

}   // namespace roomassign
