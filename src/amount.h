// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_AMOUNT_H
#define ANTIQUITY_AMOUNT_H

#include <cstdint>

/** Amount in smallest token units (1 RTC = 100,000,000 units) */
typedef int64_t CAmount;

static const CAmount COIN = 100000000;
static const CAmount CENT = 1000000;

// Fixed total supply: 2^23 RTC
static const CAmount MAX_MONEY = 8388608 * COIN;

// Inline validation function for monetary amounts
inline bool MoneyRange(CAmount nValue) {
    return (nValue >= 0 && nValue <= MAX_MONEY);
}

#endif // ANTIQUITY_AMOUNT_H
