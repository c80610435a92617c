#include <roomassign/session.hpp>

#include <algorithm>
#include <chrono>

#include <roomassign/logger.hpp>

namespace roomassign
{

namespace
{

bool is_ready(const std::shared_future<ScheduleResult>& f)
{
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

}   // namespace

SubmissionSession::SubmissionSession(std::shared_ptr<SchedulerClient> client)
    : client_(std::move(client))
{
}

SubmissionSession::Ticket SubmissionSession::submit(Format format, DebateRequest request)
{
    std::lock_guard<std::mutex> lock(mutex_);
    reap_abandoned_locked();

    if (current_)
    {
        ROOMASSIGN_LOG_DEBUG("session", "Submission {} superseded", current_->ticket);
        abandoned_.push_back(std::move(current_->future));
        current_.reset();
    }

    result_.reset();
    result_format_.reset();

    const Ticket ticket = next_ticket_++;
    auto         client = client_;
    auto         future = std::async(std::launch::async,
                             [client, format, req = std::move(request)]()
                             { return client->submit(format, req); });

    current_ = Pending{ticket, format, future.share()};
    ROOMASSIGN_LOG_DEBUG("session", "Submission {} started ({})", ticket, format_tag(format));
    return ticket;
}

std::optional<ScheduleResult> SubmissionSession::wait(Ticket ticket)
{
    std::shared_future<ScheduleResult> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_ || current_->ticket != ticket)
            return std::nullopt;
        future = current_->future;
    }

    future.wait();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_ || current_->ticket != ticket)
    {
        ROOMASSIGN_LOG_DEBUG("session", "Ignoring outcome of superseded submission {}", ticket);
        return std::nullopt;
    }

    const Format format = current_->format;
    current_.reset();

    // get() rethrows the call's error; the stored result stays cleared.
    ScheduleResult result = future.get();
    result_               = result;
    result_format_        = format;
    return result;
}

bool SubmissionSession::is_current(Ticket ticket) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ && current_->ticket == ticket;
}

std::optional<ScheduleResult> SubmissionSession::result() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

std::optional<Format> SubmissionSession::result_format() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return result_format_;
}

size_t SubmissionSession::abandoned_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(abandoned_.begin(), abandoned_.end(),
                      [](const auto& f) { return !is_ready(f); }));
}

void SubmissionSession::reap_abandoned_locked()
{
    std::erase_if(abandoned_, [](const auto& f) { return is_ready(f); });
}

}   // namespace roomassign
