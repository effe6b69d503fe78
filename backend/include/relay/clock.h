#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

/// Milliseconds since the Unix epoch. Injected so tests can pin time.
using Clock = std::function<int64_t()>;

inline int64_t system_now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
