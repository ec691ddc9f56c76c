#include "common/retry.hpp"

namespace arbiter {
using namespace std;

chrono::milliseconds retry_policy::backoff(int attempt) const {
    auto delay = initial_backoff;
    for (int i = 1; i < attempt && delay < max_backoff; ++i)
        delay *= 2;
    return min(delay, max_backoff);
}

}  // namespace arbiter
