#pragma once

#include <memory>
#include <string>
#include "common/status.hpp"
#include "judge/submission.hpp"
#include "sandbox/sandbox.hpp"

namespace arbiter {

/**
 * @brief 比较选手程序的输出和标准输出
 */
struct comparator {
    virtual ~comparator();

    /**
     * @return 输出是否可以视为与标准输出一致
     */
    virtual bool equal(const std::string &expected, const std::string &actual) const = 0;
};

/**
 * @brief 忽略行末空白字符、文末空行和 CRLF/LF 差异的精确比较
 */
struct exact_comparator : public comparator {
    bool equal(const std::string &expected, const std::string &actual) const override;
};

/**
 * @brief 按空白字符分词，两边均为数字的词在容差内视为相等，其余的词必须完全一致
 */
struct numeric_comparator : public comparator {
    explicit numeric_comparator(double tolerance);

    bool equal(const std::string &expected, const std::string &actual) const override;

private:
    double tolerance;
};

std::unique_ptr<comparator> make_comparator(comparison_mode mode, double tolerance);

/**
 * @brief 将文本规范化：换行统一为 LF，去掉每行末尾的空白字符以及文末的空行
 */
std::string normalize_output(const std::string &text);

/**
 * @brief 根据沙箱运行结果和标准输出给出单个数据点的评测结果
 * @param allow_nonzero_exit 为真时，返回值非 0 不视为运行时错误
 */
status judge_output(const run_outcome &outcome, const std::string &expected,
                    const comparator &cmp, bool allow_nonzero_exit);

}  // namespace arbiter
