// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#include "hardware_profiles.h"

#include <limits>

namespace entropy {

const char* bus_type_name(BusType bus) {
    switch (bus) {
        case BusType::ISA: return "ISA";
        case BusType::EISA: return "EISA";
        case BusType::VLB: return "VLB";
        case BusType::PCI: return "PCI";
        case BusType::PCIX: return "PCI-X";
        case BusType::AGP: return "AGP";
        case BusType::PCIe: return "PCIe";
        case BusType::Unknown: return "Unknown";
    }
    return "Unknown";
}

TimingRange expected_io_timing_ns(BusType bus) {
    switch (bus) {
        case BusType::ISA: return {1000.0, 2500.0};
        case BusType::EISA: return {500.0, 1500.0};
        case BusType::VLB: return {100.0, 500.0};
        case BusType::PCI: return {50.0, 200.0};
        case BusType::PCIX: return {40.0, 180.0};
        case BusType::AGP: return {30.0, 150.0};
        case BusType::PCIe: return {5.0, 50.0};
        case BusType::Unknown: break;
    }
    return {0.0, std::numeric_limits<double>::max()};
}

HardwareProfileRegistry HardwareProfileRegistry::with_defaults() {
    HardwareProfileRegistry registry;
    registry.load_default_profiles();
    registry.load_default_signatures();
    return registry;
}

std::shared_ptr<const HardwareProfileRegistry> HardwareProfileRegistry::create_default() {
    return std::make_shared<const HardwareProfileRegistry>(with_defaults());
}

bool HardwareProfileRegistry::add_profile(const HardwareProfile& profile) {
    if (profile.id.empty()) return false;
    if (profile.emulation_difficulty < 0.0 || profile.emulation_difficulty > 1.0) return false;
    return profiles_.emplace(profile.id, profile).second;
}

void HardwareProfileRegistry::add_family_signature(const CpuFamilySignature& signature) {
    signatures_[signature.family] = signature;
}

void HardwareProfileRegistry::add_timing_baseline(uint32_t family, const std::string& instruction,
                                                  const TimingBaseline& baseline) {
    baselines_[std::make_pair(family, instruction)] = baseline;
}

const HardwareProfile* HardwareProfileRegistry::find_profile(const std::string& id) const {
    auto it = profiles_.find(id);
    return it != profiles_.end() ? &it->second : nullptr;
}

const CpuFamilySignature* HardwareProfileRegistry::find_family_signature(uint32_t family) const {
    auto it = signatures_.find(family);
    return it != signatures_.end() ? &it->second : nullptr;
}

const TimingBaseline* HardwareProfileRegistry::find_timing_baseline(uint32_t family,
                                                                    const std::string& instruction) const {
    auto it = baselines_.find(std::make_pair(family, instruction));
    return it != baselines_.end() ? &it->second : nullptr;
}

std::vector<std::string> HardwareProfileRegistry::profile_ids() const {
    std::vector<std::string> ids;
    ids.reserve(profiles_.size());
    for (const auto& entry : profiles_) {
        ids.push_back(entry.first);
    }
    return ids;
}

// ============================================================================
// Built-in catalog
// ============================================================================

void HardwareProfileRegistry::load_default_profiles() {
    HardwareProfile p486;
    p486.id = "486DX2";
    p486.name = "Intel 486 DX2-66";
    p486.cpu_family = 4;
    p486.year_introduced = 1992;
    p486.expected_instruction_timing = {
        {"mul", {13.0, 42.0}},
        {"div", {40.0, 44.0}},
        {"fadd", {8.0, 20.0}},
        {"fmul", {16.0, 27.0}},
    };
    p486.expected_bus_type = BusType::ISA;
    p486.expected_quirks = {"no_rdtsc", "a20_gate"};
    p486.emulation_difficulty = 0.95;
    add_profile(p486);

    HardwareProfile pentium;
    pentium.id = "Pentium";
    pentium.name = "Intel Pentium 100";
    pentium.cpu_family = 5;
    pentium.year_introduced = 1994;
    pentium.expected_instruction_timing = {
        {"mul", {10.0, 11.0}},
        {"div", {17.0, 41.0}},
        {"fadd", {3.0, 3.0}},
        {"fmul", {3.0, 3.0}},
    };
    pentium.expected_bus_type = BusType::PCI;
    pentium.expected_quirks = {"fdiv_bug"};
    pentium.emulation_difficulty = 0.90;
    add_profile(pentium);

    HardwareProfile pentium2;
    pentium2.id = "PentiumII";
    pentium2.name = "Intel Pentium II";
    pentium2.cpu_family = 6;
    pentium2.year_introduced = 1997;
    pentium2.expected_instruction_timing = {
        {"mul", {4.0, 5.0}},
        {"div", {17.0, 41.0}},
        {"fadd", {3.0, 3.0}},
        {"fmul", {5.0, 5.0}},
    };
    pentium2.expected_bus_type = BusType::PCI;
    pentium2.expected_quirks = {"f00f_bug"};
    pentium2.emulation_difficulty = 0.85;
    add_profile(pentium2);

    HardwareProfile g4;
    g4.id = "G4";
    g4.name = "PowerPC G4";
    g4.cpu_family = 74;
    g4.year_introduced = 1999;
    g4.expected_instruction_timing = {
        {"mul", {3.0, 4.0}},
        {"div", {20.0, 35.0}},
        {"fadd", {5.0, 5.0}},
        {"fmul", {5.0, 5.0}},
    };
    g4.expected_bus_type = BusType::PCI;
    g4.expected_quirks = {"altivec", "big_endian"};
    g4.emulation_difficulty = 0.85;
    add_profile(g4);

    HardwareProfile g5;
    g5.id = "G5";
    g5.name = "PowerPC G5";
    g5.cpu_family = 75;
    g5.year_introduced = 2003;
    g5.expected_instruction_timing = {
        {"mul", {2.0, 4.0}},
        {"div", {15.0, 33.0}},
        {"fadd", {4.0, 4.0}},
        {"fmul", {4.0, 4.0}},
    };
    g5.expected_bus_type = BusType::PCIX;
    g5.expected_quirks = {"altivec", "big_endian", "970fx"};
    g5.emulation_difficulty = 0.80;
    add_profile(g5);

    HardwareProfile alpha;
    alpha.id = "Alpha";
    alpha.name = "DEC Alpha 21264";
    alpha.cpu_family = 21;
    alpha.year_introduced = 1998;
    alpha.expected_instruction_timing = {
        {"mul", {4.0, 7.0}},
        {"div", {12.0, 16.0}},
        {"fadd", {4.0, 4.0}},
        {"fmul", {4.0, 4.0}},
    };
    alpha.expected_bus_type = BusType::PCI;
    alpha.expected_quirks = {"alpha_pal", "64bit_native"};
    alpha.emulation_difficulty = 0.95;
    add_profile(alpha);
}

void HardwareProfileRegistry::load_default_signatures() {
    // PowerPC G4 (family 74 = 0x4A)
    add_family_signature({74, {"altivec", "ppc"}, {32, 64, 256, 2048}});

    // Intel 486 (family 4)
    add_family_signature({4, {"fpu"}, {8, 16, 0, 512}});

    // Intel Pentium (family 5)
    add_family_signature({5, {"fpu", "vme", "de"}, {16, 32, 256, 512}});

    // Intel P6 (Pentium Pro/II/III, family 6)
    add_family_signature({6, {"fpu", "vme", "de", "pse"}, {16, 32, 256, 2048}});
}

} // namespace entropy
