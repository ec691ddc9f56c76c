#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的前 limit 个字节
 * @param truncated 若文件超过 limit 字节，被置为 true
 */
std::string read_file_prefix(const std::filesystem::path &path, size_t limit, bool &truncated);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 评测系统以 root 权限运行，语言配置中的文件名如果包含 "../"
 * 会导致写出沙箱目录。
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 以 uuid 命名的临时文件夹，析构时递归删除
 */
struct scoped_directory {
    scoped_directory();
    explicit scoped_directory(const std::filesystem::path &parent, bool keep = false);
    scoped_directory(scoped_directory &&) noexcept;
    ~scoped_directory();

    scoped_directory &operator=(scoped_directory &&) noexcept;

    const std::filesystem::path &path() const;

    void release();

private:
    std::filesystem::path dir;
    bool keep = false;
};

}  // namespace arbiter
