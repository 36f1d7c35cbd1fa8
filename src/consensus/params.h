// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_CONSENSUS_PARAMS_H
#define ANTIQUITY_CONSENSUS_PARAMS_H

#include <amount.h>
#include <cstdint>

/**
 * Consensus Parameters
 *
 * This file contains all consensus-critical constants for the Proof of
 * Antiquity chain: the block window, reward, hardware plausibility limits
 * and multiplier bounds.
 *
 * CRITICAL: Changing these values creates incompatible consensus rules.
 * All nodes must use identical values for network consensus.
 */

namespace Consensus {

//==============================================================================
// Chain Identity
//==============================================================================

/** Total token supply in whole RTC (2^23) */
static const uint64_t TOTAL_SUPPLY = 8388608;

//==============================================================================
// Block Window Parameters
//==============================================================================

/** Length of the proof collection window in seconds */
static const int64_t BLOCK_WINDOW_SECONDS = 120;

/** Maximum number of validated proofs per block */
static const uint32_t MAX_MINERS_PER_BLOCK = 100;

/** Fixed reward distributed per sealed block (1 RTC) */
static const CAmount BLOCK_REWARD = 1 * COIN;

//==============================================================================
// Hardware Plausibility Limits
//==============================================================================

/** Declared hardware ages above this are rejected as implausible */
static const uint32_t MAX_HARDWARE_AGE_YEARS = 50;

/** Accepted multiplier range for a submitted proof */
static const double MIN_MULTIPLIER = 0.1;
static const double MAX_MULTIPLIER = 4.0;

/** Maximum deviation of a declared multiplier from its tier's multiplier */
static const double MULTIPLIER_TOLERANCE = 0.2;

/** Ceiling applied to accepted multipliers (Ancient tier) */
static const double MULTIPLIER_CAP = 3.5;

/** Founder bonus applied by HardwareInfo::WithFounderBonus() */
static const double FOUNDER_BONUS = 1.1;

//==============================================================================
// Antiquity Score
//==============================================================================

/** Reference year for hardware age in the Antiquity Score */
static const int CURRENT_YEAR = 2025;

/** Score at which the full reward is earned */
static const double AS_MAX = 100.0;

/** Minimum score considered meaningful by consumers */
static const double AS_MIN = 1.0;

} // namespace Consensus

#endif // ANTIQUITY_CONSENSUS_PARAMS_H
