// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_ENTROPY_ANTI_EMULATION_H
#define ANTIQUITY_ENTROPY_ANTI_EMULATION_H

/**
 * Shallow anti-emulation check run inline during proof submission.
 *
 * Compares the reported cache sizes and CPU flags with the family signature
 * from the registry, and every reported instruction timing with the
 * registry's cycle baselines for that family. Families without a signature
 * pass the cache and flag checks, and instructions without a baseline pass
 * the timing check; the deep entropy verifier covers them instead.
 */

#include "hardware_profiles.h"

#include <primitives/hardware.h>

#include <memory>
#include <string>

namespace entropy {

enum class AntiEmulationStatus {
    OK,
    SUSPICIOUS_HARDWARE,
    EMULATION_DETECTED
};

struct AntiEmulationResult {
    AntiEmulationStatus status = AntiEmulationStatus::OK;
    std::string reason;

    bool ok() const { return status == AntiEmulationStatus::OK; }
};

class AntiEmulationVerifier {
public:
    explicit AntiEmulationVerifier(std::shared_ptr<const HardwareProfileRegistry> registry);

    AntiEmulationResult verify(const antiquity::HardwareCharacteristics& characteristics) const;

private:
    std::shared_ptr<const HardwareProfileRegistry> registry_;
};

} // namespace entropy

#endif // ANTIQUITY_ENTROPY_ANTI_EMULATION_H
