#include "judge/contest_scorer.hpp"
#include <glog/logging.h>
#include <algorithm>

namespace arbiter {
using namespace std;

contest_ledger::~contest_ledger() {}

bool contest_window::contains(time_t t) const {
    return start_time <= t && t <= end_time;
}

void assign_ranks(vector<contest_participant> &participants) {
    sort(participants.begin(), participants.end(), [](const contest_participant &a, const contest_participant &b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.penalty != b.penalty) return a.penalty < b.penalty;
        return a.user_id < b.user_id;
    });
    int rank = 0;
    for (size_t i = 0; i < participants.size(); ++i) {
        if (i == 0 || participants[i].score != participants[i - 1].score ||
            participants[i].penalty != participants[i - 1].penalty)
            ++rank;
        participants[i].rank = rank;
    }
}

contest_scorer::contest_scorer(int penalty_per_wrong_minutes)
    : penalty_per_wrong_minutes(penalty_per_wrong_minutes) {}

unique_lock<mutex> contest_scorer::lock(int64_t contest_id) {
    mutex *contest_mut;
    {
        lock_guard<mutex> guard(locks_mut);
        auto &ptr = contest_locks[contest_id];
        if (!ptr) ptr = make_unique<mutex>();
        contest_mut = ptr.get();
    }
    return unique_lock<mutex>(*contest_mut);
}

/**
 * @brief 按提交时间重放全部提交，得到第一次通过的时间和之前的错误次数
 */
static problem_attempts replay(problem_attempts attempts, vector<scored_attempt> history) {
    sort(history.begin(), history.end(), [](const scored_attempt &a, const scored_attempt &b) {
        if (a.submitted_at != b.submitted_at) return a.submitted_at < b.submitted_at;
        return a.submission_id < b.submission_id;
    });
    attempts.wrong_attempts = 0;
    attempts.solved = false;
    attempts.solved_at.reset();
    for (auto &attempt : history) {
        if (attempt.verdict == status::ACCEPTED) {
            attempts.solved = true;
            attempts.solved_at = attempt.submitted_at;
            break;
        }
        ++attempts.wrong_attempts;
    }
    return attempts;
}

pair<int, int> contest_scorer::contribution(const problem_attempts &attempts, int points, time_t start_time) const {
    if (!attempts.solved || !attempts.solved_at) return {0, 0};
    int elapsed = (int)((*attempts.solved_at - start_time) / 60);
    return {points, elapsed + attempts.wrong_attempts * penalty_per_wrong_minutes};
}

bool contest_scorer::score(contest_ledger &ledger, const scoring_event &event) const {
    auto window = ledger.lock_contest(event.contest_id);
    if (!window) {
        LOG(WARNING) << "Submission [" << event.submission_id << "] refers to unknown contest " << event.contest_id;
        return false;
    }
    if (!window->contains(event.submitted_at)) {
        DLOG(INFO) << "Submission [" << event.submission_id << "] is outside contest " << event.contest_id;
        return false;
    }
    if (event.verdict != status::ACCEPTED && !(is_user_caused(event.verdict) && event.verdict != status::COMPILATION_ERROR))
        return false;

    auto points = ledger.problem_points(event.contest_id, event.problem_id);
    if (!points) {
        LOG(WARNING) << "Problem " << event.problem_id << " does not belong to contest " << event.contest_id;
        return false;
    }

    auto history = ledger.load_history(event.contest_id, event.user_id, event.problem_id);
    for (auto &attempt : history)
        if (attempt.submission_id == event.submission_id) return false;

    scored_attempt current;
    current.submission_id = event.submission_id;
    current.verdict = event.verdict;
    current.submitted_at = event.submitted_at;
    ledger.add_history(event.contest_id, event.user_id, event.problem_id, current);
    history.push_back(current);

    // 评测完成的顺序与提交顺序无关，每次都按提交时间重新计算这道题的成绩
    problem_attempts before = ledger.load_attempts(event.contest_id, event.user_id, event.problem_id);
    problem_attempts after = replay(before, history);
    if (after.solved == before.solved && after.solved_at == before.solved_at &&
        after.wrong_attempts == before.wrong_attempts)
        return false;

    auto old_result = contribution(before, *points, window->start_time);
    auto new_result = contribution(after, *points, window->start_time);
    contest_participant participant = ledger.load_participant(event.contest_id, event.user_id);
    participant.score += new_result.first - old_result.first;
    participant.penalty += new_result.second - old_result.second;

    ledger.save_attempts(after);
    ledger.save_participant(participant);

    auto participants = ledger.participants(event.contest_id);
    assign_ranks(participants);
    ledger.save_ranks(participants);
    return true;
}

}  // namespace arbiter
