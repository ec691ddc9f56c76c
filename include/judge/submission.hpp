#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace arbiter {

/**
 * @brief 评分方式
 */
enum class grading_mode {
    /**
     * @brief 只有通过与否，遇到第一个失败的数据点立即停止评测
     */
    BINARY,

    /**
     * @brief 每个数据点单独给分，所有数据点都会被评测
     */
    PARTIAL
};

/**
 * @brief 输出比较方式
 */
enum class comparison_mode {
    /**
     * @brief 忽略行末空白字符、文末空行和换行符差异后精确比较
     */
    EXACT,

    /**
     * @brief 按空白字符分词，数字在容差内视为相等
     */
    NUMERIC
};

/**
 * @brief 一个测试数据点，只读
 */
struct test_case {
    int64_t id = 0;
    std::string input;
    std::string expected_output;
    bool is_sample = false;
    int points = 1;
};

/**
 * @brief 消息队列中的评测任务
 * 评测机取走该任务后，只有在评测结果被持久化后才会确认消息
 */
struct judge_job {
    int64_t submission_id = 0;
    int64_t problem_id = 0;
    int64_t user_id = 0;
    std::optional<int64_t> contest_id;
    std::string language;
    std::string source_code;

    /**
     * @brief 时间限制，单位为毫秒
     */
    int time_limit_ms = 2000;

    /**
     * @brief 内存限制，单位为 MB
     */
    int memory_limit_mb = 128;

    /**
     * @brief 需要评测的数据点编号，评测时按编号升序进行
     */
    std::vector<int64_t> test_case_refs;

    grading_mode grading = grading_mode::BINARY;
    comparison_mode comparison = comparison_mode::EXACT;
    double tolerance = 1e-6;
    bool allow_nonzero_exit = false;

    /**
     * @brief 提交时间，比赛计分时用来判断是否在比赛时间内
     */
    std::time_t submitted_at = 0;
};

/**
 * @brief 评测任务允许的最大时间限制和内存限制，超过的任务视为格式错误
 */
constexpr int MAX_TIME_LIMIT_MS = 60000;
constexpr int MAX_MEMORY_LIMIT_MB = 65536;

/**
 * @brief 将消息队列中的消息解析为评测任务
 * @throw malformed_job_error 消息不是合法的 JSON、缺少必要字段或者限制超出范围
 */
judge_job parse_judge_job(const std::string &body);

/**
 * @brief 尽力从一个损坏的消息中取出提交编号，用于将提交标记为 Internal Error
 */
std::optional<int64_t> peek_submission_id(const std::string &body);

void from_json(const nlohmann::json &j, judge_job &job);
void to_json(nlohmann::json &j, const judge_job &job);

/**
 * @brief 单个数据点的评测结果，不持久化
 */
struct test_outcome {
    int64_t test_case_id = 0;
    status verdict = status::PENDING;
    int exit_code = 0;
    int signal = 0;
    int time_ms = 0;
    int memory_kb = 0;
    std::string stdout_data;
    std::string stderr_data;
};

/**
 * @brief 整个提交的评测结果，由评测流程产生，交给 result_sink 持久化
 */
struct judge_report {
    int64_t submission_id = 0;

    /**
     * @brief 终止状态，同时也是 verdict
     */
    status verdict = status::INTERNAL_ERROR;

    /**
     * @brief 所有已运行数据点的最大运行时间，单位为毫秒
     */
    int execution_time_ms = 0;

    /**
     * @brief 所有已运行数据点的最大内存，单位为 KB
     */
    int memory_kb = 0;
    int score = 0;
    int tests_passed = 0;
    int tests_total = 0;

    /**
     * @brief 编译错误信息或内部错误提示，长度有限
     */
    std::optional<std::string> error_message;

    std::vector<test_outcome> outcomes;
};

/**
 * @brief submissions 表中的一条记录
 */
struct submission_record {
    int64_t id = 0;
    int64_t user_id = 0;
    int64_t problem_id = 0;
    std::optional<int64_t> contest_id;
    std::string language;
    std::string code;
    status state = status::PENDING;
    std::optional<status> verdict;
    int execution_time = 0;
    int memory_used = 0;
    int score = 0;
    int test_cases_passed = 0;
    int total_test_cases = 0;
    std::optional<std::string> error_message;
    std::time_t submitted_at = 0;
    std::optional<std::time_t> judged_at;
};

/**
 * @brief submission_record 字段
 */
enum class submission_field {
    ID,
    USER_ID,
    PROBLEM_ID,
    CONTEST_ID,
    LANGUAGE,
    CODE,
    STATUS,
    VERDICT,
    EXECUTION_TIME,
    MEMORY_USED,
    SCORE,
    TEST_CASES_PASSED,
    TOTAL_TEST_CASES,
    ERROR_MESSAGE,
    SUBMITTED_AT,
    JUDGED_AT
};

/**
 * @brief 字段在 submissions 表中的列名
 */
const char *column_name(submission_field field);

/**
 * @brief 状态变更事件，推送给通知服务
 */
struct status_event {
    int64_t submission_id = 0;
    status state = status::PENDING;
    std::optional<status> verdict;
    int execution_time_ms = 0;
    int memory_kb = 0;
    int score = 0;
    int tests_passed = 0;
    int tests_total = 0;
    std::optional<std::string> error_message;
};

status_event make_status_event(const judge_report &report);

void to_json(nlohmann::json &j, const status_event &event);
void from_json(const nlohmann::json &j, status_event &event);

}  // namespace arbiter
