#include "gtest/gtest.h"
#include "judge/comparator.hpp"
#include "test/fakes.hpp"

using namespace std;
using namespace arbiter;
using arbiter::test::exited;
using arbiter::test::terminated;

TEST(ComparatorTest, ExactIgnoresTrailingWhitespaceAndLineEndings) {
    exact_comparator cmp;
    EXPECT_TRUE(cmp.equal("1 2\n3\n", "1 2   \r\n3\r\n\r\n\n"));
    EXPECT_TRUE(cmp.equal("hello", "hello\n"));
    EXPECT_TRUE(cmp.equal("a\nb", "a\rb"));
    EXPECT_FALSE(cmp.equal("1 2", "1  2"));
    EXPECT_FALSE(cmp.equal("a\n\nb", "a\nb"));
    EXPECT_FALSE(cmp.equal(" a", "a"));
}

TEST(ComparatorTest, NormalizeOutput) {
    EXPECT_EQ(normalize_output("a \t\r\nb\r\r\n\n"), "a\nb");
    EXPECT_EQ(normalize_output(""), "");
    EXPECT_EQ(normalize_output("\n\n\n"), "");
}

TEST(ComparatorTest, NumericTolerance) {
    numeric_comparator cmp(1e-6);
    EXPECT_TRUE(cmp.equal("3.1415926", "3.14159260001"));
    EXPECT_TRUE(cmp.equal("1 2 3", "1.0\n2.0000000001\n3"));
    EXPECT_TRUE(cmp.equal("1000000000", "1000000000.5"));  // 相对误差
    EXPECT_FALSE(cmp.equal("0.5", "0.51"));
    EXPECT_FALSE(cmp.equal("1 2", "1 2 3"));
    EXPECT_TRUE(cmp.equal("YES 1.5", "YES 1.5000000001"));
    EXPECT_FALSE(cmp.equal("YES", "yes"));
    EXPECT_FALSE(cmp.equal("nan", "nan0"));
}

TEST(ComparatorTest, MakeComparator) {
    auto exact = make_comparator(comparison_mode::EXACT, 0.1);
    EXPECT_FALSE(exact->equal("1.0", "1.05"));
    auto numeric = make_comparator(comparison_mode::NUMERIC, 0.1);
    EXPECT_TRUE(numeric->equal("1.0", "1.05"));
}

TEST(ComparatorTest, JudgeOutputVerdicts) {
    exact_comparator cmp;
    EXPECT_EQ(judge_output(exited("42\n"), "42", cmp, false), status::ACCEPTED);
    EXPECT_EQ(judge_output(exited("43\n"), "42", cmp, false), status::WRONG_ANSWER);
    EXPECT_EQ(judge_output(exited("42\n", 1), "42", cmp, false), status::RUNTIME_ERROR);
    EXPECT_EQ(judge_output(exited("42\n", 1), "42", cmp, true), status::ACCEPTED);
    EXPECT_EQ(judge_output(terminated(run_outcome::termination::SIGNALED), "42", cmp, true), status::RUNTIME_ERROR);
    EXPECT_EQ(judge_output(terminated(run_outcome::termination::TIME_LIMIT_EXCEEDED), "42", cmp, false),
              status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(judge_output(terminated(run_outcome::termination::MEMORY_LIMIT_EXCEEDED), "42", cmp, false),
              status::MEMORY_LIMIT_EXCEEDED);
}
