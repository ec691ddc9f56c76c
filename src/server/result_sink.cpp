#include "server/result_sink.hpp"
#include <glog/logging.h>

namespace arbiter::server {
using namespace std;

result_sink::result_sink(submission_store &store, event_channel &events, contest_scorer &scorer,
                         retry_policy retry, function<void(chrono::milliseconds)> sleeper, clock_function now)
    : store(store), events(events), scorer(scorer), retry(retry), sleeper(move(sleeper)), now(move(now)) {
    if (!this->now) this->now = [] { return time(nullptr); };
}

bool result_sink::record(const judge_job &job, const judge_report &report) {
    time_t judged_at = now();
    terminal_update update = make_terminal_update(report, judged_at);

    function<void(contest_ledger &)> scoring;
    unique_lock<mutex> contest_lock;
    if (job.contest_id) {
        scoring_event event;
        event.contest_id = *job.contest_id;
        event.user_id = job.user_id;
        event.problem_id = job.problem_id;
        event.submission_id = job.submission_id;
        event.verdict = report.verdict;
        event.submitted_at = job.submitted_at ? job.submitted_at : judged_at;
        scoring = [this, event](contest_ledger &ledger) { scorer.score(ledger, event); };
        contest_lock = scorer.lock(event.contest_id);
    }

    bool written = retry_with_backoff(
        retry, "Recording result of submission [" + to_string(job.submission_id) + "]",
        [&] { return store.record_result(job, update, scoring); }, sleeper);
    if (contest_lock) contest_lock.unlock();

    if (!written) {
        LOG(INFO) << "Submission [" << job.submission_id << "] already has a verdict, result discarded";
        return false;
    }

    try {
        events.publish(make_status_event(report));
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to publish status event of submission [" << job.submission_id << "]: " << ex.what();
    }
    return true;
}

vector<contest_participant> load_leaderboard(submission_store &store, int64_t contest_id) {
    auto participants = store.load_participants(contest_id);
    assign_ranks(participants);
    return participants;
}

}  // namespace arbiter::server
