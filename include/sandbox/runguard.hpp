#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief runguard 写出的 meta 文件内容
 */
struct runguard_result {
    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = -1;

    /**
     * @brief CPU 时间，单位为秒，所有进程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    int signal = -1;

    /**
     * @brief 内存峰值，单位为字节
     */
    int64_t memory = -1;

    /**
     * @brief "soft-timelimit"、"hard-timelimit" 或为空
     */
    std::string time_result;

    /**
     * @brief "oom"、"limit-hit" 或为空
     */
    std::string memory_result;

    /**
     * @brief 被截断的输出流，如 "stdout,stderr"
     */
    std::string output_truncated;

    /**
     * @brief runguard 自身出错的信息，非空表示本次运行结果不可信
     */
    std::string internal_error;

    /**
     * @brief meta 文件中是否有 exitcode，没有则说明 runguard 没有正常结束
     */
    bool finished = false;
};

runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace arbiter
