#include "judge/programming.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "judge/comparator.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

void from_json(const nlohmann::json &j, judge_options &options) {
    if (j.count("max_message_length")) j.at("max_message_length").get_to(options.max_message_length);
    if (j.count("output_limit_kb")) j.at("output_limit_kb").get_to(options.output_limit_kb);
    if (j.count("file_limit_kb")) j.at("file_limit_kb").get_to(options.file_limit_kb);
    if (j.count("proc_limit")) j.at("proc_limit").get_to(options.proc_limit);
    if (j.count("compile_time_limit_ms")) j.at("compile_time_limit_ms").get_to(options.compile_time_limit_ms);
    if (j.count("compile_memory_limit_mb")) j.at("compile_memory_limit_mb").get_to(options.compile_memory_limit_mb);
}

programming_judger::programming_judger(sandbox &box, const language_table &languages, judge_options options)
    : box(box), languages(languages), options(move(options)) {}

optional<string> programming_judger::compile(const language &lang, const fs::path &src_dir,
                                             const fs::path &bin_dir, const string &cpuset) const {
    run_request request;
    request.source_dir = src_dir;
    request.command = lang.compile_command;
    request.time_limit_ms = options.compile_time_limit_ms;
    request.memory_limit_kb = options.compile_memory_limit_mb * 1024;
    request.output_limit_kb = max<int>(1, (int)(options.max_message_length / 1024) + 1);
    request.file_limit_kb = options.file_limit_kb;
    request.proc_limit = options.proc_limit;
    request.cpuset = cpuset;
    request.collect = lang.artifacts;
    request.collect_dir = bin_dir;

    run_outcome outcome = box.run(request);
    switch (outcome.kind) {
        case run_outcome::termination::TIME_LIMIT_EXCEEDED:
            return "Compilation time limit exceeded";
        case run_outcome::termination::MEMORY_LIMIT_EXCEEDED:
            return "Compilation memory limit exceeded";
        default:
            break;
    }
    if (outcome.kind == run_outcome::termination::SIGNALED || outcome.exit_code != 0) {
        string message = outcome.stderr_data + outcome.stdout_data;
        if (message.empty()) message = fmt::format("Compiler exited with code {}", outcome.exit_code);
        return truncate_message(message, options.max_message_length);
    }
    for (auto &artifact : lang.artifacts)
        if (!fs::exists(bin_dir / artifact))
            return "Compiler did not produce " + artifact;
    return nullopt;
}

bool programming_judger::supports(const string &language) const {
    return languages.find(language) != nullptr;
}

judge_report programming_judger::judge(const judge_job &job, vector<test_case> test_cases,
                                       const transition_listener &on_transition, const string &cpuset) const {
    const language *lang = languages.find(job.language);
    if (!lang) throw malformed_job_error("unsupported language " + job.language);

    auto notify = [&](status stat) {
        if (on_transition) on_transition(stat);
    };

    sort(test_cases.begin(), test_cases.end(), [](const test_case &a, const test_case &b) {
        return a.id < b.id;
    });

    judge_report report;
    report.submission_id = job.submission_id;
    report.tests_total = (int)test_cases.size();

    LOG(INFO) << "Judging submission [" << job.submission_id << "] problem " << job.problem_id
              << ", language " << job.language << ", " << test_cases.size() << " test cases";

    notify(status::COMPILING);

    scoped_directory workdir(options.work_dir, options.keep_work_dir);
    fs::path src_dir = workdir.path() / "src";
    fs::path bin_dir = workdir.path() / "bin";
    fs::create_directories(src_dir);
    fs::create_directories(bin_dir);
    write_file_content(src_dir / lang->source_file, job.source_code);

    if (lang->compiled()) {
        if (auto error = compile(*lang, src_dir, bin_dir, cpuset)) {
            LOG(INFO) << "Submission [" << job.submission_id << "] compilation error";
            report.verdict = status::COMPILATION_ERROR;
            report.error_message = *error;
            return report;
        }
    } else {
        fs::copy(src_dir, bin_dir, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    }

    notify(status::JUDGING);

    auto cmp = make_comparator(job.comparison, job.tolerance);
    optional<status> first_failure;
    int total_points = 0;
    for (auto &tc : test_cases) total_points += tc.points;

    for (auto &tc : test_cases) {
        run_request request;
        request.source_dir = bin_dir;
        request.command = lang->run_command;
        request.input = tc.input;
        request.time_limit_ms = job.time_limit_ms;
        request.memory_limit_kb = job.memory_limit_mb * 1024;
        request.output_limit_kb = options.output_limit_kb;
        request.file_limit_kb = options.file_limit_kb;
        request.proc_limit = options.proc_limit;
        request.cpuset = cpuset;

        run_outcome outcome = box.run(request);

        test_outcome result;
        result.test_case_id = tc.id;
        result.verdict = judge_output(outcome, tc.expected_output, *cmp, job.allow_nonzero_exit);
        result.exit_code = outcome.exit_code;
        result.signal = outcome.signal;
        result.time_ms = outcome.wall_time_ms;
        result.memory_kb = outcome.peak_memory_kb;
        result.stderr_data = truncate_message(outcome.stderr_data, options.max_message_length);

        report.execution_time_ms = max(report.execution_time_ms, result.time_ms);
        report.memory_kb = max(report.memory_kb, result.memory_kb);

        DLOG(INFO) << "Submission [" << job.submission_id << "] test case " << tc.id << ": "
                   << get_display_message(result.verdict) << ", " << result.time_ms << "ms, " << result.memory_kb << "KB";

        if (result.verdict == status::ACCEPTED) {
            ++report.tests_passed;
            if (job.grading == grading_mode::PARTIAL) report.score += tc.points;
        } else if (!first_failure) {
            first_failure = result.verdict;
            if (result.verdict == status::RUNTIME_ERROR && !result.stderr_data.empty())
                report.error_message = result.stderr_data;
        }
        report.outcomes.push_back(move(result));

        if (first_failure && job.grading == grading_mode::BINARY)
            break;
    }

    report.verdict = first_failure.value_or(status::ACCEPTED);
    if (job.grading == grading_mode::BINARY && report.verdict == status::ACCEPTED)
        report.score = total_points;

    LOG(INFO) << "Submission [" << job.submission_id << "] judged: " << get_display_message(report.verdict)
              << ", " << report.tests_passed << "/" << report.tests_total << " passed, score " << report.score;
    return report;
}

}  // namespace arbiter
