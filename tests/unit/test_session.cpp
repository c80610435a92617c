#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <roomassign/errors.hpp>
#include <roomassign/session.hpp>

#include "net/json_codec.hpp"

using namespace roomassign;

namespace
{

// Each call blocks until released, then answers with a single room named
// after the first participant of its request.
class GatedTransport : public HttpTransport
{
   public:
    HttpResponse post_json(const std::string& /*path*/, const std::string& body) override
    {
        auto doc  = net::parse_json(body);
        auto name = doc->find("participants")->items[0].find("name")->string;

        std::unique_lock<std::mutex> lock(mutex_);
        ++started_;
        cv_.notify_all();
        cv_.wait(lock, [&] { return released_.count(name) > 0; });

        if (name == "fail")
            return {500, R"({"detail":"scheduler exploded"})"};

        ScheduleResult result;
        result.rooms = {{name, {{name, "PM", 1, ""}}}};
        return {200, net::encode_response(result)};
    }

    void release(const std::string& name)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_.insert(name);
        cv_.notify_all();
    }

    void wait_started(int n)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return started_ >= n; });
    }

   private:
    std::mutex              mutex_;
    std::condition_variable cv_;
    std::set<std::string>   released_;
    int                     started_ = 0;
};

DebateRequest request_named(const std::string& name)
{
    DebateRequest request;
    request.participants.push_back({name, {1, 2, 3, 4, 5, 6, 7, 8}, {}});
    return request;
}

}   // namespace

TEST(SubmissionSession, CurrentResultIsStored)
{
    auto transport = std::make_shared<GatedTransport>();
    SubmissionSession session(std::make_shared<SchedulerClient>(transport));

    auto ticket = session.submit(Format::BritishParliamentary, request_named("first"));
    EXPECT_TRUE(session.is_current(ticket));
    transport->release("first");

    auto result = session.wait(ticket);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->rooms[0].name, "first");

    ASSERT_TRUE(session.result().has_value());
    EXPECT_EQ(session.result()->rooms[0].name, "first");
    EXPECT_EQ(session.result_format(), Format::BritishParliamentary);
    EXPECT_FALSE(session.is_current(ticket));
}

TEST(SubmissionSession, SupersededCallIsIgnored)
{
    auto transport = std::make_shared<GatedTransport>();
    SubmissionSession session(std::make_shared<SchedulerClient>(transport));

    auto old_ticket = session.submit(Format::BritishParliamentary, request_named("old"));
    transport->wait_started(1);
    auto new_ticket = session.submit(Format::BritishParliamentary, request_named("new"));

    EXPECT_NE(old_ticket, new_ticket);
    EXPECT_FALSE(session.is_current(old_ticket));
    EXPECT_FALSE(session.wait(old_ticket).has_value());

    // The late answer of the old call must not surface.
    transport->release("old");
    transport->release("new");

    auto result = session.wait(new_ticket);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->rooms[0].name, "new");
    EXPECT_EQ(session.result()->rooms[0].name, "new");
}

TEST(SubmissionSession, NewSubmissionClearsStoredResult)
{
    auto transport = std::make_shared<GatedTransport>();
    SubmissionSession session(std::make_shared<SchedulerClient>(transport));

    transport->release("a");
    auto first = session.submit(Format::BritishParliamentary, request_named("a"));
    ASSERT_TRUE(session.wait(first).has_value());
    ASSERT_TRUE(session.result().has_value());

    auto second = session.submit(Format::BritishParliamentary, request_named("b"));
    EXPECT_FALSE(session.result().has_value());
    EXPECT_FALSE(session.result_format().has_value());

    transport->release("b");
    ASSERT_TRUE(session.wait(second).has_value());
}

TEST(SubmissionSession, FailureRethrowsAndLeavesNoResult)
{
    auto transport = std::make_shared<GatedTransport>();
    SubmissionSession session(std::make_shared<SchedulerClient>(transport));

    transport->release("fail");
    auto ticket = session.submit(Format::BritishParliamentary, request_named("fail"));

    try
    {
        session.wait(ticket);
        FAIL() << "expected TransportError";
    }
    catch (const TransportError& e)
    {
        EXPECT_EQ(e.status(), 500);
        EXPECT_EQ(e.detail(), "scheduler exploded");
    }
    EXPECT_FALSE(session.result().has_value());
}

TEST(SubmissionSession, AbandonedCallsAreReaped)
{
    auto transport = std::make_shared<GatedTransport>();
    SubmissionSession session(std::make_shared<SchedulerClient>(transport));

    session.submit(Format::BritishParliamentary, request_named("x"));
    transport->wait_started(1);
    auto last = session.submit(Format::BritishParliamentary, request_named("y"));
    EXPECT_EQ(session.abandoned_count(), 1u);

    transport->release("x");
    transport->release("y");
    ASSERT_TRUE(session.wait(last).has_value());
}

TEST(SubmissionSession, UnknownTicketIsEmpty)
{
    auto transport = std::make_shared<GatedTransport>();
    SubmissionSession session(std::make_shared<SchedulerClient>(transport));
    EXPECT_FALSE(session.wait(42).has_value());
}
