#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

/**
 * @brief 执行外部命令
 * @param env additional environment variables
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 */
int exec_program(const std::map<std::string, std::string> &env, const char **argv);

/**
 * @brief 调用外部程序
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param args 程序路径和参数
 */
int call_process(const std::vector<std::string> &args, const std::map<std::string, std::string> &env = {});

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 */
std::string get_env(const std::string &key, const std::string &def_value);

void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 将文本截断到 limit 字节以内，被截断时在末尾标注
 */
std::string truncate_message(const std::string &message, size_t limit);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
