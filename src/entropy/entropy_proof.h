// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_ENTROPY_ENTROPY_PROOF_H
#define ANTIQUITY_ENTROPY_ENTROPY_PROOF_H

/**
 * Deep Entropy Proof
 *
 * Five independent measurement layers reported by a miner:
 *
 *   1. Instruction timing  - per-instruction cycle statistics
 *   2. Memory pattern      - stride throughput, page crossing, DRAM refresh
 *   3. Bus timing          - bus type, I/O port and interrupt latency
 *   4. Thermal             - clock stability and power states (DVFS)
 *   5. Architectural quirk - detected CPU bugs and features
 *
 * plus the response to a live challenge. A proof is scored once by the
 * DeepEntropyVerifier and carries no state afterwards.
 */

#include "hardware_profiles.h"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace entropy {

// ============================================================================
// Layer 1: Instruction timing
// ============================================================================

struct TimingMeasurement {
    double mean = 0.0;          // Mean cycles
    double std_dev = 0.0;       // Vintage hardware shows natural jitter
    uint64_t min = 0;
    uint64_t max = 0;
    uint64_t samples = 0;
};

struct CacheMissPenalty {
    double l1_miss = 0.0;
    std::optional<double> l2_miss;
    double memory_latency = 0.0;
};

struct BranchMisprediction {
    double penalty_cycles = 0.0;
    double accuracy = 0.0;
};

struct FpuTimings {
    double fadd = 0.0;
    double fmul = 0.0;
    double fdiv = 0.0;
    std::optional<double> fsqrt;
};

struct InstructionTimingLayer {
    std::map<std::string, TimingMeasurement> instruction_timings;
    CacheMissPenalty cache_miss_penalty;
    BranchMisprediction branch_misprediction;
    FpuTimings fpu_timings;
};

// ============================================================================
// Layer 2: Memory access pattern
// ============================================================================

// Throughput (bytes/s) at different strides
struct AccessPattern {
    double stride_1 = 0.0;
    double stride_4 = 0.0;
    double stride_16 = 0.0;
    double stride_64 = 0.0;
    double stride_256 = 0.0;
    double variance = 0.0;
};

struct RefreshPattern {
    double interval_us = 0.0;
    double jitter = 0.0;
    bool detectable = false;
};

struct MemoryPatternLayer {
    AccessPattern sequential_read;
    AccessPattern random_read;
    AccessPattern write_pattern;
    double page_crossing_penalty = 0.0;
    std::optional<double> bank_conflict;
    RefreshPattern refresh_interference;
};

// ============================================================================
// Layer 3: Bus timing
// ============================================================================

struct IoTiming {
    double port_read_ns = 0.0;
    double port_write_ns = 0.0;
    double variance = 0.0;
};

struct DmaCharacteristics {
    double transfer_rate = 0.0;     // bytes/s
    double setup_latency_us = 0.0;
};

struct InterruptLatency {
    double hw_latency_us = 0.0;
    double sw_latency_us = 0.0;
};

struct BusTimingLayer {
    BusType bus_type = BusType::Unknown;
    IoTiming io_timing;
    std::optional<DmaCharacteristics> dma_characteristics;
    InterruptLatency interrupt_latency;
};

// ============================================================================
// Layer 4: Thermal
// ============================================================================

struct ClockStability {
    double mean_frequency_mhz = 0.0;
    double variance = 0.0;
    bool frequency_changed = false;
};

struct ThermalVariance {
    double timing_variance = 0.0;
    double expected_variance = 0.0;
};

// C-states and P-states do not exist on vintage silicon
struct PowerStateInfo {
    uint32_t state_count = 0;
    std::vector<std::string> c_states;
    std::vector<std::string> p_states;
};

struct ThermalEntropyLayer {
    ClockStability clock_stability;
    ThermalVariance thermal_variance;
    PowerStateInfo power_states;
};

// ============================================================================
// Layer 5: Architectural quirks
// ============================================================================

struct HardwareQuirk {
    std::string id;
    std::string description;
    uint32_t cpu_family = 0;
    std::pair<uint32_t, uint32_t> year_range{0, 0};
};

struct QuirkTestResult {
    bool detected = false;
    double confidence = 0.0;    // 0.0 - 1.0
    std::vector<uint8_t> raw_data;
};

struct QuirkEntropyLayer {
    std::vector<HardwareQuirk> detected_quirks;
    std::map<std::string, QuirkTestResult> quirk_test_results;
};

// ============================================================================
// Proof
// ============================================================================

struct ChallengeResponse {
    std::array<uint8_t, 32> challenge_nonce{};
    std::array<uint8_t, 32> response{};
    uint64_t computation_time_us = 0;
    std::vector<uint8_t> entropy_samples;
};

struct EntropyProof {
    InstructionTimingLayer instruction_layer;
    MemoryPatternLayer memory_layer;
    BusTimingLayer bus_layer;
    ThermalEntropyLayer thermal_layer;
    QuirkEntropyLayer quirk_layer;
    ChallengeResponse challenge_response;
    uint64_t timestamp = 0;
    std::array<uint8_t, 32> signature_hash{};
};

} // namespace entropy

#endif // ANTIQUITY_ENTROPY_ENTROPY_PROOF_H
