// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_ENTROPY_HARDWARE_PROFILES_H
#define ANTIQUITY_ENTROPY_HARDWARE_PROFILES_H

/**
 * Hardware Profile Registry
 *
 * Reference data for the two anti-emulation verifiers:
 *
 *   - Hardware profiles keyed by a short id ("486DX2", "G4", ...) with
 *     expected instruction timings, bus type, quirks and an emulation
 *     difficulty coefficient. Used by the deep entropy verifier.
 *   - CPU family signatures (expected flags, cache ranges) and per-family
 *     instruction timing baselines. Used by the shallow anti-emulation
 *     verifier. The built-in catalog carries no timing baselines; operators
 *     add them per family.
 *
 * A registry is populated once and then shared read-only, typically as a
 * std::shared_ptr<const HardwareProfileRegistry>.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace entropy {

enum class BusType {
    ISA,        // 8 MHz
    EISA,       // 8.33 MHz
    VLB,        // 33 MHz
    PCI,        // 33/66 MHz
    PCIX,       // 66-133 MHz
    AGP,
    PCIe,
    Unknown
};

const char* bus_type_name(BusType bus);

// Inclusive [min, max] range
struct TimingRange {
    double min = 0.0;
    double max = 0.0;

    bool contains(double value) const { return value >= min && value <= max; }
};

/**
 * Expected I/O port read latency in nanoseconds for a bus type.
 * Ranges shrink monotonically from ISA to PCIe. Unknown accepts anything.
 */
TimingRange expected_io_timing_ns(BusType bus);

struct HardwareProfile {
    std::string id;                 // Registry key, e.g. "486DX2"
    std::string name;               // e.g. "Intel 486 DX2-66"
    uint32_t cpu_family = 0;
    uint32_t year_introduced = 0;
    std::map<std::string, TimingRange> expected_instruction_timing;  // cycles
    BusType expected_bus_type = BusType::Unknown;
    std::vector<std::string> expected_quirks;
    double emulation_difficulty = 0.0;  // 0.0-1.0, how hard to emulate
};

// Expected cache size ranges (KB) for a CPU family
struct CacheRanges {
    uint32_t l1_min = 0;
    uint32_t l1_max = 0;
    uint32_t l2_min = 0;
    uint32_t l2_max = 0;
};

struct CpuFamilySignature {
    uint32_t family = 0;
    std::vector<std::string> expected_flags;
    CacheRanges cache_ranges;
};

struct TimingBaseline {
    uint64_t min_cycles = 0;
    uint64_t max_cycles = 0;
};

class HardwareProfileRegistry {
public:
    HardwareProfileRegistry() = default;

    // Registry populated with the built-in catalog
    static HardwareProfileRegistry with_defaults();
    static std::shared_ptr<const HardwareProfileRegistry> create_default();

    // Returns false if the id is empty, already present, or the emulation
    // difficulty lies outside [0, 1]
    bool add_profile(const HardwareProfile& profile);

    // Replaces any existing signature for the same family
    void add_family_signature(const CpuFamilySignature& signature);
    // Replaces any existing baseline for the same family and instruction
    void add_timing_baseline(uint32_t family, const std::string& instruction, const TimingBaseline& baseline);

    const HardwareProfile* find_profile(const std::string& id) const;
    const CpuFamilySignature* find_family_signature(uint32_t family) const;
    const TimingBaseline* find_timing_baseline(uint32_t family, const std::string& instruction) const;

    std::vector<std::string> profile_ids() const;
    size_t profile_count() const { return profiles_.size(); }
    size_t family_count() const { return signatures_.size(); }
    size_t baseline_count() const { return baselines_.size(); }

private:
    std::map<std::string, HardwareProfile> profiles_;
    std::map<uint32_t, CpuFamilySignature> signatures_;
    std::map<std::pair<uint32_t, std::string>, TimingBaseline> baselines_;  // (family, instruction)

    void load_default_profiles();
    void load_default_signatures();
};

} // namespace entropy

#endif // ANTIQUITY_ENTROPY_HARDWARE_PROFILES_H
