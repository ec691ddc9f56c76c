#include "worker.hpp"
#include <glog/logging.h>
#include <pthread.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace arbiter {
using namespace std;
using namespace arbiter::server;

static const char *INTERNAL_ERROR_MESSAGE = "Internal error occurred while judging, please contact the administrator";

static judge_report internal_error_report(const judge_job &job, const string &message) {
    judge_report report;
    report.submission_id = job.submission_id;
    report.verdict = status::INTERNAL_ERROR;
    report.tests_total = (int)job.test_case_refs.size();
    report.error_message = message;
    return report;
}

dispatcher::dispatcher(job_queue &queue, submission_store &store, const programming_judger &judger,
                       result_sink &sink, monitor &mon, dispatcher_options options)
    : queue(queue), store(store), judger(judger), sink(sink), mon(mon), options(move(options)) {
    if (this->options.workers == 0) this->options.workers = 1;
}

dispatcher::~dispatcher() {
    stop();
    join();
}

vector<thread *> dispatcher::start() {
    vector<thread *> result;
    for (size_t i = 0; i < options.workers; ++i)
        workers.emplace_back([this, i] { worker_loop((int)i); });
    for (auto &thd : workers) result.push_back(&thd);
    fetcher = thread([this] { fetch_loop(); });
    LOG(INFO) << "Dispatcher started with " << options.workers << " workers";
    return result;
}

void dispatcher::stop() {
    if (stopping.exchange(true)) return;
    LOG(INFO) << "Stopping dispatcher, waiting for running submissions";
    {
        lock_guard<mutex> guard(slot_mut);
    }
    slot_cv.notify_all();
}

void dispatcher::join() {
    if (fetcher.joinable()) fetcher.join();
    for (auto &thd : workers)
        if (thd.joinable()) thd.join();
}

void dispatcher::release_slot() {
    {
        lock_guard<mutex> guard(slot_mut);
        --busy;
    }
    slot_cv.notify_all();
}

void dispatcher::ack(queued_job &message, int64_t submission_id) {
    try {
        queue.ack(message);
    } catch (std::exception &ex) {
        // 消息会被重新投递，届时提交已有终止状态，将被直接确认
        LOG(WARNING) << "Unable to ack submission [" << submission_id << "]: " << ex.what();
        mon.report_error(string("Unable to ack message: ") + ex.what());
    }
}

optional<judge_job> dispatcher::admit(queued_job &message) {
    optional<judge_job> job;
    string error;
    try {
        job = parse_judge_job(message.body);
        if (!job->submitted_at) job->submitted_at = options.clock ? options.clock() : time(nullptr);
        if (judger.supports(job->language)) return job;
        error = "unsupported language " + job->language;
    } catch (malformed_job_error &ex) {
        error = ex.what();
    }

    optional<int64_t> submission_id = job ? make_optional(job->submission_id) : peek_submission_id(message.body);
    LOG(WARNING) << "Rejecting malformed job of submission [" << submission_id.value_or(0) << "]: " << error;
    if (submission_id) {
        judge_job stub;
        if (job) stub = *job;
        stub.submission_id = *submission_id;
        try {
            sink.record(stub, internal_error_report(stub, "Malformed judge job: " + error));
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to record malformed submission [" << *submission_id << "]: " << ex.what();
            mon.report_error(string("Unable to record malformed job: ") + ex.what());
        }
    }
    ack(message, submission_id.value_or(0));
    return nullopt;
}

bool dispatcher::process(int worker_id, queued_job &message, const judge_job &queued) {
    judge_job job = queued;
    string what = "submission [" + to_string(job.submission_id) + "]";
    string cpuset = (size_t)worker_id < options.cpusets.size() ? options.cpusets[worker_id] : "";
    mon.start_submission(worker_id, job);
    elapsed_time timer;

    judge_report report;
    try {
        auto record = retry_with_backoff(
            options.retry, "Looking up " + what,
            [&] { return store.find_submission(job.submission_id); }, options.sleeper);
        if (record && is_terminal(record->state)) {
            LOG(INFO) << "Submission [" << job.submission_id << "] already judged as "
                      << get_display_message(record->state) << ", acking redelivered job";
            ack(message, job.submission_id);
            return true;
        }
        // 数据库中的提交时间为准，重新投递时不会被新的出队时间覆盖
        if (record && record->submitted_at) job.submitted_at = record->submitted_at;

        report = retry_with_backoff(
            options.retry, "Judging " + what,
            [&] {
                auto test_cases = store.load_test_cases(job.problem_id, job.test_case_refs);
                return judger.judge(job, move(test_cases),
                                    [&](status state) { store.mark_in_flight(job, state); }, cpuset);
            },
            options.sleeper);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Failed to judge " << what << ": " << ex.what();
        mon.report_error("Failed to judge " + what + ": " + ex.what());
        report = internal_error_report(job, INTERNAL_ERROR_MESSAGE);
    }

    try {
        sink.record(job, report);
    } catch (std::exception &ex) {
        // 放回队列重新评测；prefetch 等于 worker 数，不放回的消息会占住消费者
        LOG(ERROR) << "Unable to record result of " << what << ": " << ex.what();
        mon.report_error("Unable to record result of " + what + ": " + ex.what());
        try {
            queue.reject(message, true);
        } catch (std::exception &reject_ex) {
            LOG(WARNING) << "Unable to requeue submission [" << job.submission_id << "]: " << reject_ex.what();
            mon.report_error(string("Unable to requeue message: ") + reject_ex.what());
        }
        return false;
    }

    LOG(INFO) << "Submission [" << job.submission_id << "] finished as " << get_display_message(report.verdict)
              << " in " << timer.duration<chrono::milliseconds>().count() << "ms";
    mon.end_submission(worker_id, report);
    ack(message, job.submission_id);
    return true;
}

void dispatcher::fetch_loop() {
    while (!stopping) {
        {
            unique_lock<mutex> lock(slot_mut);
            slot_cv.wait(lock, [this] { return busy < options.workers || stopping; });
            if (stopping) break;
        }

        queued_job message;
        try {
            if (!queue.fetch(message, options.poll_interval)) continue;
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to fetch job: " << ex.what();
            mon.report_error(string("Unable to fetch job: ") + ex.what());
            if (options.sleeper)
                options.sleeper(options.poll_interval);
            else
                this_thread::sleep_for(options.poll_interval);
            continue;
        }

        auto job = admit(message);
        if (!job) continue;

        {
            lock_guard<mutex> guard(slot_mut);
            ++busy;
        }
        tasks.push({move(message), move(*job)});
    }
    tasks.close();
}

void dispatcher::worker_loop(int worker_id) {
    mon.worker_state_changed(worker_id, worker_state::START, "");
    while (true) {
        pending_job task;
        if (!tasks.pop_for(task, options.poll_interval)) {
            if (tasks.is_closed() && tasks.size() == 0) break;
            continue;
        }

        mon.worker_state_changed(worker_id, worker_state::JUDGING, "");
        try {
            process(worker_id, task.message, task.job);
            mon.worker_state_changed(worker_id, worker_state::IDLE, "");
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " failed on submission [" << task.job.submission_id << "]: " << ex.what();
            mon.worker_state_changed(worker_id, worker_state::CRASHED, ex.what());
        }
        release_slot();
    }
    mon.worker_state_changed(worker_id, worker_state::STOPPED, "");
}

vector<size_t> parse_cpu_list(const string &list) {
    vector<size_t> cores;
    vector<string> parts;
    boost::split(parts, list, boost::is_any_of(","));
    try {
        for (auto &part : parts) {
            boost::trim(part);
            if (part.empty()) continue;
            auto dash = part.find('-');
            if (dash == string::npos) {
                cores.push_back(boost::lexical_cast<size_t>(part));
            } else {
                size_t l = boost::lexical_cast<size_t>(part.substr(0, dash));
                size_t r = boost::lexical_cast<size_t>(part.substr(dash + 1));
                if (l > r) throw invalid_argument("invalid cpu range " + part);
                for (size_t i = l; i <= r; ++i) cores.push_back(i);
            }
        }
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument("invalid cpu list " + list);
    }
    return cores;
}

void pin_thread(thread &thd, size_t core_id) {
    // 设置线程的 CPU 亲和性，要求操作系统将 thd 线程放在指定的核心上运行
    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(core_id, &set);
    int ret = pthread_setaffinity_np(thd.native_handle(), sizeof(cpu_set_t), &set);
    if (ret != 0) throw system_error(ret, generic_category(), "pthread_setaffinity_np");
}

}  // namespace arbiter
