#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include <set>
#include "test/fakes.hpp"
#include "worker.hpp"

using namespace std;
using namespace std::filesystem;
using namespace arbiter;
using namespace arbiter::server;
using namespace arbiter::test;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::HasSubstr;
using ::testing::NiceMock;

static const chrono::milliseconds VISIBILITY_TIMEOUT(30000);

class DispatcherTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        languages = language_table::defaults();
    }

    void SetUp() override {
        judge_options judge;
        judge.work_dir = temp_directory_path() / "arbiter-dispatcher-test";
        judger = make_unique<programming_judger>(box, languages, judge);

        policy.max_attempts = 3;
        auto no_sleep = [](chrono::milliseconds) {};
        sink = make_unique<result_sink>(store, events, scorer, policy, no_sleep);

        options.workers = 2;
        options.poll_interval = chrono::milliseconds(10);
        options.retry = policy;
        options.sleeper = no_sleep;

        for (int i = 1; i <= 3; ++i) {
            test_case tc;
            tc.id = i;
            tc.input = tc.expected_output = to_string(i);
            store.add_test_case(10, tc);
        }
    }

    judge_job submit(int64_t submission_id) {
        auto job = make_job(submission_id, 10, {1, 2, 3});
        store.add_submission(job);
        queue.publish(nlohmann::json(job).dump());
        return job;
    }

    unique_ptr<dispatcher> make_dispatcher() {
        return make_unique<dispatcher>(queue, store, *judger, *sink, mon, options);
    }

    /**
     * @brief 运行调度器直到 pred 为真，然后正常停止
     */
    void run_until(const function<bool()> &pred) {
        auto d = make_dispatcher();
        d->start();
        bool satisfied = wait_until(pred);
        d->stop();
        d->join();
        ASSERT_TRUE(satisfied);
    }

    static language_table languages;
    fake_sandbox box;
    memory_store store;
    memory_job_queue queue{VISIBILITY_TIMEOUT};
    recording_event_channel events;
    contest_scorer scorer{20};
    NiceMock<mock_monitor> mon;
    retry_policy policy;
    dispatcher_options options;
    unique_ptr<programming_judger> judger;
    unique_ptr<result_sink> sink;
};

language_table DispatcherTest::languages;

TEST_F(DispatcherTest, JudgesAndAcksAfterPersisting) {
    submit(1);
    EXPECT_CALL(mon, start_submission(_, _)).Times(1);
    EXPECT_CALL(mon, end_submission(_, _)).Times(1);

    run_until([&] { return queue.acked() == 1; });

    auto record = store.get(1);
    EXPECT_EQ(record.state, status::ACCEPTED);
    EXPECT_EQ(record.test_cases_passed, 3);
    EXPECT_EQ(events.events().size(), 1u);
    EXPECT_EQ(store.transitions, (vector<pair<int64_t, status>>{{1, status::COMPILING}, {1, status::JUDGING}}));
}

TEST_F(DispatcherTest, CrashBeforePersistIsRejudged) {
    auto job = submit(1);

    // 第一个评测机取走消息后崩溃，没有写入结果也没有确认
    queued_job message;
    ASSERT_TRUE(queue.fetch(message, chrono::milliseconds(10)));
    EXPECT_FALSE(message.redelivered);
    queue.advance(VISIBILITY_TIMEOUT + chrono::seconds(1));

    run_until([&] { return queue.acked() == 1; });

    EXPECT_EQ(queue.deliveries(0), 2);
    EXPECT_EQ(store.get(1).state, status::ACCEPTED);
    EXPECT_EQ(events.events().size(), 1u);
}

TEST_F(DispatcherTest, CrashAfterPersistYieldsOneVerdict) {
    auto job = submit(1);

    // 第一个评测机写入了结果，但在确认消息前崩溃
    queued_job message;
    ASSERT_TRUE(queue.fetch(message, chrono::milliseconds(10)));
    auto report = judger->judge(job, store.load_test_cases(10, job.test_case_refs));
    ASSERT_TRUE(sink->record(job, report));
    queue.advance(VISIBILITY_TIMEOUT + chrono::seconds(1));
    EXPECT_CALL(mon, start_submission(_, _)).Times(1);
    EXPECT_CALL(mon, end_submission(_, _)).Times(0);

    run_until([&] { return queue.acked() == 1; });

    EXPECT_EQ(queue.deliveries(0), 2);
    EXPECT_EQ(store.record_calls.load(), 1);
    EXPECT_EQ(box.runs().size(), 3u);
    EXPECT_EQ(events.events().size(), 1u);
}

TEST_F(DispatcherTest, AckFailureLeadsToRedeliveryWithoutRejudging) {
    submit(1);
    queue.fail_ack = true;
    EXPECT_CALL(mon, report_error(HasSubstr("ack"))).Times(AtLeast(1));

    run_until([&] { return events.events().size() == 1; });
    EXPECT_EQ(queue.unacked(), 1u);
    EXPECT_EQ(store.get(1).state, status::ACCEPTED);

    queue.fail_ack = false;
    queue.advance(VISIBILITY_TIMEOUT + chrono::seconds(1));
    run_until([&] { return queue.acked() == 1; });

    EXPECT_EQ(events.events().size(), 1u);
    EXPECT_EQ(box.runs().size(), 3u);
}

TEST_F(DispatcherTest, ConcurrentSubmissions) {
    const int SUBMISSIONS = 12;
    options.workers = 4;
    box.delay = chrono::milliseconds(5);
    for (int i = 1; i <= SUBMISSIONS; ++i) submit(i);

    run_until([&] { return queue.acked() == SUBMISSIONS; });

    EXPECT_LE(box.max_concurrency(), 4);
    set<int64_t> ids;
    for (auto &event : events.events()) ids.insert(event.submission_id);
    EXPECT_EQ(ids.size(), (size_t)SUBMISSIONS);
    EXPECT_EQ(events.events().size(), (size_t)SUBMISSIONS);
    for (int i = 1; i <= SUBMISSIONS; ++i)
        EXPECT_EQ(store.get(i).state, status::ACCEPTED);
}

TEST_F(DispatcherTest, MalformedJobsAreRejectedAtDequeue) {
    auto cobol = make_job(42, 10, {1});
    cobol.language = "cobol";
    store.add_submission(cobol);
    store.add_submission(make_job(43, 10, {1}));
    queue.publish("this is not json");
    queue.publish(nlohmann::json(cobol).dump());
    queue.publish(R"({"submission_id": 43, "language": "cpp"})");
    EXPECT_CALL(mon, start_submission(_, _)).Times(0);

    run_until([&] { return queue.acked() == 3; });

    EXPECT_EQ(store.get(42).state, status::INTERNAL_ERROR);
    EXPECT_EQ(store.get(43).state, status::INTERNAL_ERROR);
    ASSERT_TRUE(store.get(42).error_message);
    EXPECT_THAT(*store.get(42).error_message, HasSubstr("cobol"));
    EXPECT_TRUE(box.compiles().empty());
    EXPECT_TRUE(box.runs().empty());
    EXPECT_EQ(events.events().size(), 2u);
}

TEST_F(DispatcherTest, InfrastructureFailureBecomesInternalError) {
    submit(5);
    store.failing_loads = 100;
    EXPECT_CALL(mon, report_error(HasSubstr("submission [5]"))).Times(AtLeast(1));

    run_until([&] { return queue.acked() == 1; });

    EXPECT_EQ(store.load_calls.load(), 3);
    auto record = store.get(5);
    EXPECT_EQ(record.state, status::INTERNAL_ERROR);
    ASSERT_TRUE(record.error_message);
    EXPECT_THAT(*record.error_message, HasSubstr("Internal error"));
    EXPECT_THAT(*record.error_message, ::testing::Not(HasSubstr("storage")));
    EXPECT_EQ(events.events().size(), 1u);
}

TEST_F(DispatcherTest, TransientFailureIsRetried) {
    submit(5);
    store.failing_loads = 2;
    EXPECT_CALL(mon, report_error(_)).Times(0);

    run_until([&] { return queue.acked() == 1; });

    EXPECT_EQ(store.load_calls.load(), 3);
    EXPECT_EQ(store.get(5).state, status::ACCEPTED);
}

TEST_F(DispatcherTest, UnrecordableResultIsNotAcked) {
    submit(5);
    store.failing_records = 100;

    run_until([&] { return store.record_calls.load() >= 3; });

    EXPECT_EQ(queue.acked(), 0u);
    EXPECT_EQ(queue.unacked(), 1u);
    EXPECT_GE(queue.rejections(), 1);
    EXPECT_TRUE(events.events().empty());
}

TEST_F(DispatcherTest, UnrecordableResultIsRequeuedImmediately) {
    // 可见超时为 30 秒，只有显式放回队列消息才会在测试期间再次投递
    submit(5);
    store.failing_records = 2 * policy.max_attempts;

    run_until([&] { return queue.acked() == 1; });

    EXPECT_EQ(queue.deliveries(0), 3);
    EXPECT_EQ(queue.rejections(), 2);
    EXPECT_EQ(store.get(5).state, status::ACCEPTED);
    EXPECT_EQ(events.events().size(), 1u);
}

TEST_F(DispatcherTest, MissingSubmitTimeUsesDequeueTime) {
    const time_t contest_start = 1700000000;
    const time_t dequeued_at = contest_start + 25 * 60;
    store.ledger.add_contest(3, contest_start, contest_start + 3600);
    store.ledger.add_problem(3, 10, 100);
    options.clock = [dequeued_at] { return dequeued_at; };

    auto job = make_job(6, 10, {1, 2, 3});
    job.contest_id = 3;
    job.submitted_at = 0;
    queue.publish(nlohmann::json(job).dump());

    run_until([&] { return queue.acked() == 1; });

    EXPECT_EQ(store.get(6).submitted_at, dequeued_at);
    auto participants = store.load_participants(3);
    ASSERT_EQ(participants.size(), 1u);
    EXPECT_EQ(participants[0].score, 100);
    EXPECT_EQ(participants[0].penalty, 25);
}

TEST(CpuListTest, ParseCpuList) {
    EXPECT_EQ(parse_cpu_list("0-3"), (vector<size_t>{0, 1, 2, 3}));
    EXPECT_EQ(parse_cpu_list("1,4-5, 7"), (vector<size_t>{1, 4, 5, 7}));
    EXPECT_TRUE(parse_cpu_list("").empty());
    EXPECT_THROW(parse_cpu_list("3-1"), invalid_argument);
    EXPECT_THROW(parse_cpu_list("a"), invalid_argument);
}
