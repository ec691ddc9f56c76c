#include "judge/comparator.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace arbiter {
using namespace std;

comparator::~comparator() {}

string normalize_output(const string &text) {
    string result;
    result.reserve(text.size());
    size_t line_start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') continue;
            c = '\n';
        }
        if (c == '\n') {
            while (result.size() > line_start && isspace((unsigned char)result.back()))
                result.pop_back();
            result.push_back('\n');
            line_start = result.size();
        } else {
            result.push_back(c);
        }
    }
    while (!result.empty() && isspace((unsigned char)result.back()))
        result.pop_back();
    return result;
}

bool exact_comparator::equal(const string &expected, const string &actual) const {
    return normalize_output(expected) == normalize_output(actual);
}

numeric_comparator::numeric_comparator(double tolerance)
    : tolerance(tolerance) {}

static vector<string> tokenize(const string &text) {
    vector<string> tokens;
    istringstream in(text);
    string token;
    while (in >> token) tokens.push_back(token);
    return tokens;
}

static bool parse_number(const string &token, double &value) {
    const char *begin = token.c_str();
    char *end = nullptr;
    errno = 0;
    value = strtod(begin, &end);
    return end != begin && *end == '\0' && errno != ERANGE && isfinite(value);
}

bool numeric_comparator::equal(const string &expected, const string &actual) const {
    vector<string> lhs = tokenize(expected), rhs = tokenize(actual);
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        double a, b;
        if (parse_number(lhs[i], a) && parse_number(rhs[i], b)) {
            double diff = fabs(a - b);
            if (diff > tolerance && diff > tolerance * fabs(a))
                return false;
        } else if (lhs[i] != rhs[i]) {
            return false;
        }
    }
    return true;
}

unique_ptr<comparator> make_comparator(comparison_mode mode, double tolerance) {
    switch (mode) {
        case comparison_mode::NUMERIC:
            return make_unique<numeric_comparator>(tolerance);
        case comparison_mode::EXACT:
        default:
            return make_unique<exact_comparator>();
    }
}

status judge_output(const run_outcome &outcome, const string &expected,
                    const comparator &cmp, bool allow_nonzero_exit) {
    switch (outcome.kind) {
        case run_outcome::termination::TIME_LIMIT_EXCEEDED:
            return status::TIME_LIMIT_EXCEEDED;
        case run_outcome::termination::MEMORY_LIMIT_EXCEEDED:
            return status::MEMORY_LIMIT_EXCEEDED;
        case run_outcome::termination::SIGNALED:
            return status::RUNTIME_ERROR;
        case run_outcome::termination::EXITED:
            break;
    }
    if (outcome.exit_code != 0 && !allow_nonzero_exit)
        return status::RUNTIME_ERROR;
    return cmp.equal(expected, outcome.stdout_data) ? status::ACCEPTED : status::WRONG_ANSWER;
}

}  // namespace arbiter
