#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <roomassign/format.hpp>
#include <roomassign/model.hpp>
#include <roomassign/scheduler.hpp>

namespace roomassign
{

// ─── SubmissionSession ───────────────────────────────────────────────────────
// Runs one asynchronous scheduler call per submission. The newest submission
// wins: starting a new one clears the stored result, and the outcome of any
// superseded call is dropped when it arrives. No cancellation is sent to the
// server.
//
// Thread-safe: all public methods are safe to call from any thread.

class SubmissionSession
{
   public:
    using Ticket = uint64_t;

    explicit SubmissionSession(std::shared_ptr<SchedulerClient> client);

    // Blocks until every outstanding call has finished.
    ~SubmissionSession() = default;

    SubmissionSession(const SubmissionSession&)            = delete;
    SubmissionSession& operator=(const SubmissionSession&) = delete;

    // Start a call. The request is owned by the call and released with it.
    Ticket submit(Format format, DebateRequest request);

    /// Block until `ticket`'s call completes.
    /// Returns the result if the ticket is still current (it also becomes the
    /// stored result), or std::nullopt if a newer submission superseded it.
    /// Rethrows the call's error if it failed while current.
    std::optional<ScheduleResult> wait(Ticket ticket);

    bool is_current(Ticket ticket) const;

    // Latest accepted result, if any.
    std::optional<ScheduleResult> result() const;
    std::optional<Format>         result_format() const;

    // Superseded calls that have not finished yet.
    size_t abandoned_count() const;

   private:
    struct Pending
    {
        Ticket                             ticket = 0;
        Format                             format = Format::Traditional;
        std::shared_future<ScheduleResult> future;
    };

    std::shared_ptr<SchedulerClient> client_;

    mutable std::mutex                         mutex_;
    Ticket                                     next_ticket_ = 1;
    std::optional<Pending>                     current_;
    std::vector<std::shared_future<ScheduleResult>> abandoned_;
    std::optional<ScheduleResult>              result_;
    std::optional<Format>                      result_format_;

    void reap_abandoned_locked();
};

}   // namespace roomassign
