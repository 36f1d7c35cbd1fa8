// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_ENTROPY_DEEP_ENTROPY_H
#define ANTIQUITY_ENTROPY_DEEP_ENTROPY_H

/**
 * Deep Entropy Verifier
 *
 * Scores an EntropyProof against a claimed hardware profile. Each of the
 * five layers yields a score in [0, 1]:
 *
 *   Layer         Weight  Floor
 *   instruction   0.25    0.15
 *   memory        0.20    0.10
 *   bus           0.20    0.15
 *   thermal       0.15    0.05
 *   quirks        0.20    0.20
 *
 * A proof is valid when the weighted total reaches 0.65 and no layer falls
 * below its floor. The emulation probability is
 * max(0, 1 - total * emulation_difficulty), so hardware that is hard to
 * emulate reaches a low probability sooner for the same score.
 *
 * The verifier never fails: an unknown profile yields valid = false with
 * emulation probability 1.0. verify() is const and may run concurrently.
 */

#include "entropy_proof.h"
#include "hardware_profiles.h"

#include <util/time.h>

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace entropy {

struct EntropyThresholds {
    double min_instruction_entropy = 0.15;
    double min_memory_entropy = 0.10;
    double min_bus_entropy = 0.15;
    double min_thermal_entropy = 0.05;
    double min_quirk_entropy = 0.20;
    double total_min_entropy = 0.65;
};

struct EntropyScores {
    double instruction = 0.0;
    double memory = 0.0;
    double bus = 0.0;
    double thermal = 0.0;
    double quirks = 0.0;
    double total = 0.0;
};

struct VerificationResult {
    bool valid = false;
    double total_score = 0.0;
    EntropyScores scores;
    std::vector<std::string> issues;
    double emulation_probability = 1.0;  // 0.0 = real hardware, 1.0 = emulator
};

// Layer weights
static constexpr double WEIGHT_INSTRUCTION = 0.25;
static constexpr double WEIGHT_MEMORY = 0.20;
static constexpr double WEIGHT_BUS = 0.20;
static constexpr double WEIGHT_THERMAL = 0.15;
static constexpr double WEIGHT_QUIRKS = 0.20;

// ============================================================================
// Challenges
// ============================================================================

enum class ChallengeOpKind {
    INTEGER_MUL,
    INTEGER_DIV,
    FLOAT_ADD,
    MEMORY_ACCESS,
    BRANCH_TEST
};

// One operation of a live challenge. Only the field matching `kind` is set.
struct ChallengeOperation {
    ChallengeOpKind kind = ChallengeOpKind::INTEGER_MUL;
    uint64_t int_operand = 0;       // INTEGER_MUL, INTEGER_DIV (1-999), MEMORY_ACCESS (0-1023)
    double float_operand = 0.0;     // FLOAT_ADD
    bool branch_taken = false;      // BRANCH_TEST
};

struct Challenge {
    std::array<uint8_t, 32> nonce{};
    std::vector<ChallengeOperation> operations;
    uint64_t expected_min_us = 0;
    uint64_t expected_max_us = 0;
    int64_t timestamp = 0;
};

static constexpr size_t CHALLENGE_OPERATIONS = 100;
static constexpr uint64_t CHALLENGE_MIN_TIME_US = 1000;
static constexpr uint64_t CHALLENGE_MAX_TIME_US = 100000;

/**
 * Random source for challenge generation.
 */
class IChallengeRng {
public:
    virtual ~IChallengeRng() = default;

    virtual void fill(uint8_t* out, size_t len) = 0;
    virtual uint64_t next_u64() = 0;
};

// OpenSSL RAND_bytes. Throws std::runtime_error if the CSPRNG fails.
class SecureChallengeRng : public IChallengeRng {
public:
    void fill(uint8_t* out, size_t len) override;
    uint64_t next_u64() override;
};

// Deterministic mt19937_64, for reproducible challenge sequences
class SeededChallengeRng : public IChallengeRng {
public:
    explicit SeededChallengeRng(uint64_t seed);

    void fill(uint8_t* out, size_t len) override;
    uint64_t next_u64() override;

private:
    std::mt19937_64 engine_;
};

// ============================================================================
// Economics
// ============================================================================

struct EmulationCostAnalysis {
    std::string hardware;
    double emulation_difficulty = 0.0;
    double estimated_gpu_hours = 0.0;
    double emulation_cost_usd = 0.0;
    double real_hardware_cost_usd = 0.0;
    double yearly_power_cost_usd = 0.0;
    double breakeven_days = 0.0;
    std::string recommendation;         // "BUY REAL HARDWARE" or "EMULATE"
    std::string economic_conclusion;
};

// ============================================================================
// Verifier
// ============================================================================

class DeepEntropyVerifier {
public:
    explicit DeepEntropyVerifier(std::shared_ptr<const HardwareProfileRegistry> registry,
                                 const EntropyThresholds& thresholds = EntropyThresholds(),
                                 std::unique_ptr<IChallengeRng> rng = nullptr,
                                 TimeSource clock = TimeSource());

    VerificationResult verify(const EntropyProof& proof, const std::string& claimed_hardware) const;

    // 100 operations cycling through the five kinds, 32-byte nonce
    Challenge generate_challenge();

    // Emulating vs buying the claimed hardware. nullopt for unknown ids.
    std::optional<EmulationCostAnalysis> analyze_emulation_cost(const std::string& profile_id) const;

    const EntropyThresholds& thresholds() const { return thresholds_; }
    const HardwareProfileRegistry& registry() const { return *registry_; }

    // Per-layer scoring, exposed for tests
    static double score_instruction_layer(const InstructionTimingLayer& layer, const HardwareProfile& profile);
    static double score_memory_layer(const MemoryPatternLayer& layer);
    static double score_bus_layer(const BusTimingLayer& layer, const HardwareProfile& profile);
    static double score_thermal_layer(const ThermalEntropyLayer& layer);
    static double score_quirk_layer(const QuirkEntropyLayer& layer, const HardwareProfile& profile);

private:
    std::shared_ptr<const HardwareProfileRegistry> registry_;
    EntropyThresholds thresholds_;
    std::unique_ptr<IChallengeRng> rng_;
    TimeSource clock_;
    std::mutex rng_mutex_;

    uint64_t uniform(uint64_t lo, uint64_t hi);  // [lo, hi), caller holds rng_mutex_
};

} // namespace entropy

#endif // ANTIQUITY_ENTROPY_DEEP_ENTROPY_H
