#pragma once

#include <fstream>
#include <string>

/**
 * @brief runguard 的结果文件，每行一个 "key: value"
 * 由评测进程读取，见 arbiter::read_runguard_result
 */
struct meta_writer {
    void open(const std::string &path);

    template <typename T>
    void append(const char *key, const T &value) {
        if (!file) return;
        file << key << ": " << value << std::endl;
    }

private:
    std::ofstream file;
};

extern meta_writer meta;
