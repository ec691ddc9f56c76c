#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace arbiter {

/**
 * @brief 一种编程语言的编译和运行方式
 * 命令均在沙箱目录中执行，路径相对于 chroot
 */
struct language {
    /**
     * @brief 语言标记，与评测任务中的 language 字段对应，如 "cpp"
     */
    std::string name;

    /**
     * @brief 选手代码保存的文件名，如 "main.cpp"
     */
    std::string source_file;

    /**
     * @brief 编译命令，为空表示解释型语言，跳过编译
     */
    std::vector<std::string> compile_command;

    std::vector<std::string> run_command;

    /**
     * @brief 编译完成后需要保留的文件，如 "main"；"." 表示保留整个目录
     */
    std::vector<std::string> artifacts;

    bool compiled() const;
};

void from_json(const nlohmann::json &j, language &lang);

/**
 * @brief 支持的语言表
 */
struct language_table {
    /**
     * @brief 内置的语言配置：c、cpp、java、python、javascript
     */
    static language_table defaults();

    /**
     * @brief 添加或覆盖一种语言
     */
    void add(const language &lang);

    /**
     * @return 不支持的语言返回 nullptr
     */
    const language *find(const std::string &name) const;

private:
    std::map<std::string, language> languages;
};

}  // namespace arbiter
