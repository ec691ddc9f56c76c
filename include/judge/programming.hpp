#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <functional>
#include <vector>
#include "common/status.hpp"
#include "judge/language.hpp"
#include "judge/submission.hpp"
#include "sandbox/sandbox.hpp"

/**
 * 这个头文件包含编程题的评测流程
 * 状态变化为 Pending → Compiling → Judging → 终止状态
 */
namespace arbiter {

/**
 * @brief 评测流程的设置，与具体题目无关
 */
struct judge_options {
    /**
     * @brief 编译错误信息、运行时错误信息的最大长度（字节）
     */
    size_t max_message_length = 4096;

    int output_limit_kb = 65536;
    int file_limit_kb = 65536;
    int proc_limit = 16;
    int compile_time_limit_ms = 10000;
    int compile_memory_limit_mb = 512;

    /**
     * @brief 编译目录的父目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 是否保留编译目录，DEBUG 模式下为真
     */
    bool keep_work_dir = false;
};

void from_json(const nlohmann::json &j, judge_options &options);

/**
 * @brief 编程题评测器，负责一个提交从编译到给出结果的全过程
 * 评测器本身无状态，多个工作线程可以共享同一个实例
 */
struct programming_judger {
    using transition_listener = std::function<void(status)>;

    programming_judger(sandbox &box, const language_table &languages, judge_options options);

    /**
     * @brief 是否支持该语言
     */
    bool supports(const std::string &language) const;

    /**
     * @brief 评测一个提交
     * 数据点按编号升序评测；只有通过与否的题目在第一个失败的数据点处停止，
     * 按数据点给分的题目会评测所有数据点。
     * @param job 评测任务
     * @param test_cases 评测任务引用的所有数据点
     * @param on_transition 进入 COMPILING、JUDGING 状态时被调用
     * @param cpuset 限制选手程序只能在这些 CPU 核心上运行
     * @return 终止状态的评测结果，不会是 INTERNAL_ERROR
     * @throw malformed_job_error 语言不受支持
     * @throw internal_error 沙箱故障等与选手程序无关的错误，可以重试
     */
    judge_report judge(const judge_job &job, std::vector<test_case> test_cases,
                       const transition_listener &on_transition = {},
                       const std::string &cpuset = "") const;

private:
    sandbox &box;
    const language_table &languages;
    judge_options options;

    /**
     * @brief 编译选手代码，编译产物放在 bin_dir
     * @return 编译失败时返回错误信息
     */
    std::optional<std::string> compile(const language &lang, const std::filesystem::path &src_dir,
                                       const std::filesystem::path &bin_dir, const std::string &cpuset) const;
};

}  // namespace arbiter
