// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_UTIL_TIME_H
#define ANTIQUITY_UTIL_TIME_H

#include <cstdint>
#include <ctime>
#include <functional>

inline int64_t GetTime() {
    return static_cast<int64_t>(time(nullptr));
}

/**
 * Wall-clock source in Unix seconds.
 *
 * Components that read the clock take one of these so tests can drive
 * time explicitly. An empty TimeSource means GetTime().
 */
using TimeSource = std::function<int64_t()>;

inline int64_t ReadTime(const TimeSource& source) {
    return source ? source() : GetTime();
}

#endif // ANTIQUITY_UTIL_TIME_H
