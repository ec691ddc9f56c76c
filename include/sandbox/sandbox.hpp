#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/runguard.hpp"

namespace arbiter {

/**
 * @brief 一次沙箱运行的请求
 */
struct run_request {
    /**
     * @brief 该目录下的所有文件会被复制到本次运行的全新目录中
     * 通常是编译产物或者解释型语言的源代码
     */
    std::filesystem::path source_dir;

    /**
     * @brief 在沙箱目录中执行的命令
     */
    std::vector<std::string> command;

    /**
     * @brief 标准输入，为空表示不提供输入
     */
    std::optional<std::string> input;

    int time_limit_ms = 1000;
    int memory_limit_kb = 262144;

    /**
     * @brief stdout 和 stderr 的最大保留长度
     */
    int output_limit_kb = 65536;

    /**
     * @brief 受控程序写出的单个文件的最大大小
     */
    int file_limit_kb = 65536;

    int proc_limit = 16;

    /**
     * @brief 允许受控程序使用的 CPU 核心，为空表示不限制
     */
    std::string cpuset;

    /**
     * @brief 运行结束后需要从沙箱目录中取出的文件，复制到 collect_dir
     */
    std::vector<std::string> collect;
    std::filesystem::path collect_dir;
};

/**
 * @brief 一次沙箱运行的原始结果
 */
struct run_outcome {
    enum class termination {
        /**
         * @brief 正常退出，返回值见 exit_code
         */
        EXITED,

        /**
         * @brief 因信号终止，信号见 signal
         */
        SIGNALED,

        /**
         * @brief 超过时间限制，被强制终止
         */
        TIME_LIMIT_EXCEEDED,

        /**
         * @brief 超过内存限制，被 cgroup 终止
         */
        MEMORY_LIMIT_EXCEEDED
    };

    termination kind = termination::EXITED;
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
    int signal = 0;
    int wall_time_ms = 0;
    int cpu_time_ms = 0;
    int peak_memory_kb = 0;
    bool output_truncated = false;
};

/**
 * @brief 沙箱执行器
 * 每次 run 都必须在全新的环境中进行，运行结束后不保留任何状态
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 在隔离环境中运行一次程序
     * @throw sandbox_error 沙箱无法启动或者运行结果不可信
     */
    virtual run_outcome run(const run_request &request) = 0;
};

struct sandbox_options {
    std::filesystem::path runguard;
    std::filesystem::path run_dir;

    /**
     * @brief chroot 根目录，为空时不切换根目录（仅用于开发调试）
     */
    std::filesystem::path chroot_dir;
    std::string run_user;
    std::string run_group;

    /**
     * @brief 硬时间限制比时间限制多出的部分
     */
    int kill_grace_ms = 500;

    /**
     * @brief 是否保留运行目录以便调试
     */
    bool keep_scratch = false;
};

/**
 * @brief 通过 runguard 实现的沙箱
 * 每次运行创建以 uuid 命名的新目录，只有其中的 box 子目录会挂载进 chroot，
 * 输入输出和 meta 文件放在 box 之外，受控程序无法篡改
 */
struct runguard_sandbox : public sandbox {
    explicit runguard_sandbox(sandbox_options options);

    run_outcome run(const run_request &request) override;

    /**
     * @brief 构造 runguard 的命令行
     */
    std::vector<std::string> command_line(const run_request &request, const std::filesystem::path &scratch) const;

private:
    sandbox_options options;
};

/**
 * @brief 根据 runguard 的 meta 文件判断运行结果
 * @throw sandbox_error runguard 报告内部错误或者没有正常结束
 */
run_outcome classify_run(const runguard_result &result);

}  // namespace arbiter
