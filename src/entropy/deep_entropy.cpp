// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#include "deep_entropy.h"

#include <util/logging.h>
#include <util/strencodings.h>

#include <openssl/rand.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <map>
#include <stdexcept>

namespace entropy {

// ============================================================================
// Random sources
// ============================================================================

void SecureChallengeRng::fill(uint8_t* out, size_t len) {
    if (len == 0) return;
    if (len > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        RAND_bytes(out, static_cast<int>(len)) != 1) {
        throw std::runtime_error("SecureChallengeRng: RAND_bytes failed");
    }
}

uint64_t SecureChallengeRng::next_u64() {
    uint8_t buf[8];
    fill(buf, sizeof(buf));
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | buf[i];
    }
    return value;
}

SeededChallengeRng::SeededChallengeRng(uint64_t seed) : engine_(seed) {}

void SeededChallengeRng::fill(uint8_t* out, size_t len) {
    size_t i = 0;
    while (i < len) {
        uint64_t word = engine_();
        for (int b = 0; b < 8 && i < len; b++, i++) {
            out[i] = static_cast<uint8_t>(word >> (8 * b));
        }
    }
}

uint64_t SeededChallengeRng::next_u64() {
    return engine_();
}

// ============================================================================
// DeepEntropyVerifier
// ============================================================================

DeepEntropyVerifier::DeepEntropyVerifier(std::shared_ptr<const HardwareProfileRegistry> registry,
                                         const EntropyThresholds& thresholds,
                                         std::unique_ptr<IChallengeRng> rng,
                                         TimeSource clock)
    : registry_(registry ? std::move(registry) : std::make_shared<const HardwareProfileRegistry>()),
      thresholds_(thresholds),
      rng_(std::move(rng)),
      clock_(std::move(clock)) {
    if (!rng_) {
        rng_ = std::make_unique<SecureChallengeRng>();
    }
}

VerificationResult DeepEntropyVerifier::verify(const EntropyProof& proof,
                                               const std::string& claimed_hardware) const {
    VerificationResult result;

    const HardwareProfile* profile = registry_->find_profile(claimed_hardware);
    if (!profile) {
        result.issues.push_back("Unknown hardware profile");
        LogPrintEntropy(DEBUG, "Unknown hardware profile '%s'", claimed_hardware.c_str());
        return result;
    }

    EntropyScores& scores = result.scores;

    // Layer 1: instruction timing
    scores.instruction = score_instruction_layer(proof.instruction_layer, *profile);
    if (scores.instruction < thresholds_.min_instruction_entropy) {
        result.issues.push_back(strprintf("Instruction timing entropy too low: %.2f < %.2f",
                                          scores.instruction, thresholds_.min_instruction_entropy));
    }

    // Layer 2: memory patterns
    scores.memory = score_memory_layer(proof.memory_layer);
    if (scores.memory < thresholds_.min_memory_entropy) {
        result.issues.push_back(strprintf("Memory pattern entropy too low: %.2f < %.2f",
                                          scores.memory, thresholds_.min_memory_entropy));
    }

    // Layer 3: bus timing
    scores.bus = score_bus_layer(proof.bus_layer, *profile);
    if (scores.bus < thresholds_.min_bus_entropy) {
        result.issues.push_back(strprintf("Bus timing entropy too low: %.2f < %.2f",
                                          scores.bus, thresholds_.min_bus_entropy));
    }

    // Layer 4: thermal
    scores.thermal = score_thermal_layer(proof.thermal_layer);
    if (scores.thermal < thresholds_.min_thermal_entropy) {
        result.issues.push_back(strprintf("Thermal entropy suspicious: %.2f", scores.thermal));
    }

    // Layer 5: architectural quirks
    scores.quirks = score_quirk_layer(proof.quirk_layer, *profile);
    if (scores.quirks < thresholds_.min_quirk_entropy) {
        result.issues.push_back(strprintf("Expected hardware quirks not detected: %.2f", scores.quirks));
    }

    scores.total = scores.instruction * WEIGHT_INSTRUCTION +
                   scores.memory * WEIGHT_MEMORY +
                   scores.bus * WEIGHT_BUS +
                   scores.thermal * WEIGHT_THERMAL +
                   scores.quirks * WEIGHT_QUIRKS;

    if (scores.total < thresholds_.total_min_entropy) {
        result.issues.push_back(strprintf("Total entropy score too low: %.2f < %.2f",
                                          scores.total, thresholds_.total_min_entropy));
    }

    result.total_score = scores.total;
    result.valid = result.issues.empty();
    result.emulation_probability = std::max(0.0, 1.0 - scores.total * profile->emulation_difficulty);

    LogPrintEntropy(DEBUG, "%s: total=%.3f instr=%.2f mem=%.2f bus=%.2f thermal=%.2f quirks=%.2f emu_p=%.3f",
                    claimed_hardware.c_str(), scores.total, scores.instruction, scores.memory,
                    scores.bus, scores.thermal, scores.quirks, result.emulation_probability);

    return result;
}

double DeepEntropyVerifier::score_instruction_layer(const InstructionTimingLayer& layer,
                                                    const HardwareProfile& profile) {
    double score = 0.0;
    size_t checks = 0;

    for (const auto& expected : profile.expected_instruction_timing) {
        auto it = layer.instruction_timings.find(expected.first);
        if (it == layer.instruction_timings.end()) {
            continue;
        }
        checks++;
        const TimingMeasurement& measured = it->second;

        if (expected.second.contains(measured.mean)) {
            score += 0.5;
        }

        // A perfectly flat timing signal is an emulator signature
        if (measured.std_dev > 0.0 && measured.std_dev < measured.mean * 0.5) {
            score += 0.5;
        }
    }

    return checks > 0 ? score / static_cast<double>(checks) : 0.0;
}

double DeepEntropyVerifier::score_memory_layer(const MemoryPatternLayer& layer) {
    double score = 0.0;

    const AccessPattern& seq = layer.sequential_read;
    if (seq.stride_64 > 0.0 && seq.stride_64 >= 1.5 * seq.stride_1) {
        score += 0.3;
    }

    if (layer.page_crossing_penalty > 10.0) {
        score += 0.3;
    }

    // Refresh interference is a strong signal of real DRAM
    if (layer.refresh_interference.detectable) {
        score += 0.4;
    }

    return score;
}

double DeepEntropyVerifier::score_bus_layer(const BusTimingLayer& layer, const HardwareProfile& profile) {
    double score = 0.0;

    if (layer.bus_type == profile.expected_bus_type) {
        score += 0.5;
    }

    if (expected_io_timing_ns(profile.expected_bus_type).contains(layer.io_timing.port_read_ns)) {
        score += 0.3;
    }

    if (layer.interrupt_latency.hw_latency_us > 1.0) {
        score += 0.2;
    }

    return score;
}

double DeepEntropyVerifier::score_thermal_layer(const ThermalEntropyLayer& layer) {
    double score = 0.0;

    if (!layer.clock_stability.frequency_changed) {
        score += 0.4;
    }
    if (layer.power_states.c_states.empty()) {
        score += 0.3;
    }
    if (layer.power_states.p_states.empty()) {
        score += 0.3;
    }

    return score;
}

double DeepEntropyVerifier::score_quirk_layer(const QuirkEntropyLayer& layer, const HardwareProfile& profile) {
    const size_t expected_count = profile.expected_quirks.size();
    if (expected_count == 0) {
        return 1.0;
    }

    double score = 0.0;
    for (const auto& quirk : profile.expected_quirks) {
        auto it = layer.quirk_test_results.find(quirk);
        if (it != layer.quirk_test_results.end() && it->second.detected && it->second.confidence > 0.8) {
            score += 1.0 / static_cast<double>(expected_count);
        }
    }

    return std::min(score, 1.0);
}

uint64_t DeepEntropyVerifier::uniform(uint64_t lo, uint64_t hi) {
    const uint64_t span = hi - lo;
    // Rejection sampling removes modulo bias
    const uint64_t limit = std::numeric_limits<uint64_t>::max() - (std::numeric_limits<uint64_t>::max() % span);
    uint64_t value;
    do {
        value = rng_->next_u64();
    } while (value >= limit);
    return lo + value % span;
}

Challenge DeepEntropyVerifier::generate_challenge() {
    std::lock_guard<std::mutex> lock(rng_mutex_);

    Challenge challenge;
    rng_->fill(challenge.nonce.data(), challenge.nonce.size());

    challenge.operations.reserve(CHALLENGE_OPERATIONS);
    for (size_t i = 0; i < CHALLENGE_OPERATIONS; i++) {
        ChallengeOperation op;
        switch (i % 5) {
            case 0:
                op.kind = ChallengeOpKind::INTEGER_MUL;
                op.int_operand = rng_->next_u64();
                break;
            case 1:
                op.kind = ChallengeOpKind::INTEGER_DIV;
                op.int_operand = uniform(1, 1000);
                break;
            case 2:
                op.kind = ChallengeOpKind::FLOAT_ADD;
                op.float_operand = static_cast<double>(rng_->next_u64() >> 11) * (1.0 / 9007199254740992.0);
                break;
            case 3:
                op.kind = ChallengeOpKind::MEMORY_ACCESS;
                op.int_operand = uniform(0, 1024);
                break;
            default:
                op.kind = ChallengeOpKind::BRANCH_TEST;
                op.branch_taken = (rng_->next_u64() & 1) != 0;
                break;
        }
        challenge.operations.push_back(op);
    }

    challenge.expected_min_us = CHALLENGE_MIN_TIME_US;
    challenge.expected_max_us = CHALLENGE_MAX_TIME_US;
    challenge.timestamp = ReadTime(clock_);

    return challenge;
}

std::optional<EmulationCostAnalysis> DeepEntropyVerifier::analyze_emulation_cost(
    const std::string& profile_id) const {
    const HardwareProfile* profile = registry_->find_profile(profile_id);
    if (!profile) {
        return std::nullopt;
    }

    // Approximate second-hand prices (USD) and power draw (W)
    static const std::map<std::string, double> hardware_prices = {
        {"486DX2", 50.0}, {"Pentium", 40.0}, {"PentiumII", 30.0},
        {"G4", 80.0}, {"G5", 150.0}, {"Alpha", 200.0},
    };
    static const std::map<std::string, double> power_watts = {
        {"486DX2", 15.0}, {"Pentium", 25.0}, {"G4", 50.0}, {"G5", 100.0},
    };
    static const double GPU_COST_PER_HOUR = 0.50;
    static const double POWER_COST_PER_KWH = 0.10;

    EmulationCostAnalysis analysis;
    analysis.hardware = profile->name;
    analysis.emulation_difficulty = profile->emulation_difficulty;
    analysis.estimated_gpu_hours = 50.0 + profile->emulation_difficulty * 100.0;
    analysis.emulation_cost_usd = analysis.estimated_gpu_hours * GPU_COST_PER_HOUR;

    auto price = hardware_prices.find(profile_id);
    analysis.real_hardware_cost_usd = price != hardware_prices.end() ? price->second : 100.0;

    auto watts = power_watts.find(profile_id);
    double w = watts != power_watts.end() ? watts->second : 50.0;
    analysis.yearly_power_cost_usd = w * 24.0 * 365.0 * POWER_COST_PER_KWH / 1000.0;

    analysis.breakeven_days = (analysis.emulation_cost_usd - analysis.real_hardware_cost_usd) /
                              (analysis.yearly_power_cost_usd / 365.0);

    bool buy = analysis.emulation_cost_usd > analysis.real_hardware_cost_usd;
    analysis.recommendation = buy ? "BUY REAL HARDWARE" : "EMULATE";
    analysis.economic_conclusion = strprintf("Buying a real %s for $%.0f is %s than emulating ($%.2f)",
                                             profile->name.c_str(), analysis.real_hardware_cost_usd,
                                             analysis.real_hardware_cost_usd < analysis.emulation_cost_usd
                                                 ? "cheaper" : "more expensive",
                                             analysis.emulation_cost_usd);

    return analysis;
}

} // namespace entropy
