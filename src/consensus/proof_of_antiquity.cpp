// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#include <consensus/proof_of_antiquity.h>
#include <consensus/hardware_tier.h>
#include <util/config.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace antiquity {

const char* ProofErrorToString(ProofError error) {
    switch (error) {
        case ProofError::NONE: return "Accepted";
        case ProofError::BLOCK_WINDOW_CLOSED: return "Block window has closed";
        case ProofError::DUPLICATE_SUBMISSION: return "Already submitted proof for this block";
        case ProofError::BLOCK_FULL: return "Block has reached maximum miners";
        case ProofError::INVALID_MULTIPLIER: return "Invalid multiplier value";
        case ProofError::TIER_MISMATCH: return "Tier does not match hardware age";
        case ProofError::SUSPICIOUS_AGE: return "Hardware age is suspicious";
        case ProofError::HARDWARE_ALREADY_REGISTERED: return "Hardware already registered to another wallet";
        case ProofError::SUSPICIOUS_HARDWARE: return "Suspicious hardware";
        case ProofError::EMULATION_DETECTED: return "Emulation detected";
        case ProofError::DRIFT_LOCK_VIOLATION: return "Wallet is quarantined";
        case ProofError::INVALID_SIGNATURE: return "Invalid signature";
        default: return "Unknown error";
    }
}

EngineOptions LoadEngineOptions(const CConfigParser& config) {
    EngineOptions options;
    const EngineOptions defaults;

    int64_t window = config.GetInt64("blockwindow", defaults.block_window_seconds);
    if (window <= 0) {
        LogPrintConfig(WARN, "blockwindow=%lld is not positive (using default: %lld)",
                       static_cast<long long>(window),
                       static_cast<long long>(defaults.block_window_seconds));
        window = defaults.block_window_seconds;
    }
    options.block_window_seconds = window;

    int64_t miners = config.GetInt64("maxminers", defaults.max_miners);
    if (miners <= 0 || miners > UINT32_MAX) {
        LogPrintConfig(WARN, "maxminers=%lld is out of range (using default: %u)",
                       static_cast<long long>(miners), defaults.max_miners);
        miners = defaults.max_miners;
    }
    options.max_miners = static_cast<uint32_t>(miners);

    int64_t reward = config.GetInt64("blockreward", defaults.block_reward);
    if (reward <= 0 || !MoneyRange(reward)) {
        LogPrintConfig(WARN, "blockreward=%lld is out of range (using default: %lld)",
                       static_cast<long long>(reward),
                       static_cast<long long>(defaults.block_reward));
        reward = defaults.block_reward;
    }
    options.block_reward = reward;

    int64_t max_age = config.GetInt64("maxhardwareage", defaults.max_hardware_age);
    if (max_age < 0 || max_age > UINT32_MAX) {
        LogPrintConfig(WARN, "maxhardwareage=%lld is out of range (using default: %u)",
                       static_cast<long long>(max_age), defaults.max_hardware_age);
        max_age = defaults.max_hardware_age;
    }
    options.max_hardware_age = static_cast<uint32_t>(max_age);

    options.require_entropy_proof = config.GetBool("requireentropyproof", defaults.require_entropy_proof);
    options.quarantined_wallets = config.GetList("quarantine");

    return options;
}

// ============================================================================
// CProofOfAntiquity
// ============================================================================

CProofOfAntiquity::CProofOfAntiquity(std::shared_ptr<const entropy::HardwareProfileRegistry> registry,
                                     std::shared_ptr<IHardwareBindingStore> bindings,
                                     const EngineOptions& options,
                                     TimeSource clock,
                                     std::shared_ptr<entropy::DeepEntropyVerifier> deep_verifier)
    : m_options(options),
      m_clock(std::move(clock)),
      m_registry(registry ? std::move(registry) : entropy::HardwareProfileRegistry::create_default()),
      m_bindings(bindings ? std::move(bindings) : std::make_shared<CMemoryHardwareBindingStore>()),
      m_antiEmulation(m_registry),
      m_deepEntropy(deep_verifier ? std::move(deep_verifier)
                                  : std::make_shared<entropy::DeepEntropyVerifier>(m_registry)),
      m_windowStart(ReadTime(m_clock)) {
    for (const auto& wallet : m_options.quarantined_wallets) {
        m_quarantine[wallet] = "configured";
    }
}

int64_t CProofOfAntiquity::ElapsedLocked(int64_t now) const {
    return std::max<int64_t>(0, now - m_windowStart);
}

void CProofOfAntiquity::ResetWindowLocked(int64_t now) {
    m_pending.clear();
    m_windowHardware.clear();
    m_windowStart = now;
}

ProofError CProofOfAntiquity::ValidateHardware(const HardwareInfo& hardware, std::string& error) const {
    if (hardware.age_years > m_options.max_hardware_age) {
        error = strprintf("%s: %u years exceeds %u", ProofErrorToString(ProofError::SUSPICIOUS_AGE),
                          hardware.age_years, m_options.max_hardware_age);
        return ProofError::SUSPICIOUS_AGE;
    }

    HardwareTier expected = TierFromAge(hardware.age_years);
    if (hardware.tier != expected) {
        error = strprintf("%s: %u years is %s, declared %s",
                          ProofErrorToString(ProofError::TIER_MISMATCH), hardware.age_years,
                          TierName(expected), TierName(hardware.tier));
        return ProofError::TIER_MISMATCH;
    }

    if (!(hardware.multiplier >= m_options.min_multiplier &&
          hardware.multiplier <= m_options.max_multiplier)) {
        error = strprintf("%s: %.4f outside %.1f-%.1f",
                          ProofErrorToString(ProofError::INVALID_MULTIPLIER), hardware.multiplier,
                          m_options.min_multiplier, m_options.max_multiplier);
        return ProofError::INVALID_MULTIPLIER;
    }

    return ProofError::NONE;
}

ProofError CProofOfAntiquity::SubmitProof(const MiningProof& proof, SubmitResult& result, std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);

    result = SubmitResult();
    error.clear();

    auto reject = [&](ProofError code, const std::string& detail) {
        error = detail.empty() ? std::string(ProofErrorToString(code)) : detail;
        LogPrintMining(INFO, "Rejected proof from %s: %s", proof.wallet.c_str(), error.c_str());
        return code;
    };

    const int64_t now = Now();
    const int64_t elapsed = ElapsedLocked(now);

    // 1. Window still open
    if (elapsed >= m_options.block_window_seconds) {
        return reject(ProofError::BLOCK_WINDOW_CLOSED, "");
    }

    // 1a. Drift-lock quarantine
    auto quarantined = m_quarantine.find(proof.wallet);
    if (quarantined != m_quarantine.end()) {
        return reject(ProofError::DRIFT_LOCK_VIOLATION,
                      std::string(ProofErrorToString(ProofError::DRIFT_LOCK_VIOLATION)) + ": " +
                          quarantined->second);
    }

    // 2. One proof per wallet per window
    for (const auto& pending : m_pending) {
        if (pending.wallet == proof.wallet) {
            return reject(ProofError::DUPLICATE_SUBMISSION, "");
        }
    }

    // 3. Capacity
    if (m_pending.size() >= m_options.max_miners) {
        return reject(ProofError::BLOCK_FULL, "");
    }

    // 4. Hardware sanity
    std::string detail;
    ProofError sanity = ValidateHardware(proof.hardware, detail);
    if (sanity != ProofError::NONE) {
        return reject(sanity, detail);
    }

    // 5. Shallow anti-emulation
    if (proof.hardware.characteristics) {
        entropy::AntiEmulationResult check = m_antiEmulation.verify(*proof.hardware.characteristics);
        if (check.status == entropy::AntiEmulationStatus::SUSPICIOUS_HARDWARE) {
            return reject(ProofError::SUSPICIOUS_HARDWARE,
                          std::string(ProofErrorToString(ProofError::SUSPICIOUS_HARDWARE)) + ": " + check.reason);
        }
        if (check.status == entropy::AntiEmulationStatus::EMULATION_DETECTED) {
            return reject(ProofError::EMULATION_DETECTED,
                          std::string(ProofErrorToString(ProofError::EMULATION_DETECTED)) + ": " + check.reason);
        }
    }

    // 5a. Deep entropy attestation
    if (proof.entropy_attestation) {
        const EntropyAttestation& attestation = *proof.entropy_attestation;
        entropy::VerificationResult verdict = m_deepEntropy->verify(attestation.proof, attestation.profile_id);
        if (!verdict.valid) {
            std::string issues;
            for (const auto& issue : verdict.issues) {
                if (!issues.empty()) issues += "; ";
                issues += issue;
            }
            return reject(ProofError::EMULATION_DETECTED,
                          strprintf("%s: %s (emulation probability %.2f)",
                                    ProofErrorToString(ProofError::EMULATION_DETECTED),
                                    issues.c_str(), verdict.emulation_probability));
        }
    } else if (m_options.require_entropy_proof) {
        return reject(ProofError::EMULATION_DETECTED,
                      std::string(ProofErrorToString(ProofError::EMULATION_DETECTED)) +
                          ": entropy proof required");
    }

    // 6. Hardware fingerprint must not back another wallet
    const uint256 fingerprint = ComputeHardwareFingerprint(proof.hardware);
    std::optional<std::string> bound;
    auto windowIt = m_windowHardware.find(fingerprint);
    if (windowIt != m_windowHardware.end()) {
        bound = windowIt->second;
    } else if (!m_bindings->GetBinding(fingerprint, bound)) {
        return reject(ProofError::HARDWARE_ALREADY_REGISTERED,
                      std::string(ProofErrorToString(ProofError::HARDWARE_ALREADY_REGISTERED)) +
                          ": binding store unavailable");
    }
    if (bound && *bound != proof.wallet) {
        return reject(ProofError::HARDWARE_ALREADY_REGISTERED,
                      "Hardware already registered to wallet " + *bound);
    }

    // 7. Multiplier must agree with the tier
    const double expected_multiplier = TierMultiplier(proof.hardware.tier);
    if (std::fabs(proof.hardware.multiplier - expected_multiplier) > m_options.multiplier_tolerance) {
        return reject(ProofError::INVALID_MULTIPLIER,
                      strprintf("%s: %.4f deviates from tier multiplier %.1f",
                                ProofErrorToString(ProofError::INVALID_MULTIPLIER),
                                proof.hardware.multiplier, expected_multiplier));
    }

    // Bind before queueing so a store failure never leaves an unbound proof
    if (!bound && !m_bindings->Bind(fingerprint, proof.wallet)) {
        std::optional<std::string> owner;
        if (m_bindings->GetBinding(fingerprint, owner) && owner && *owner != proof.wallet) {
            return reject(ProofError::HARDWARE_ALREADY_REGISTERED,
                          "Hardware already registered to wallet " + *owner);
        }
        return reject(ProofError::HARDWARE_ALREADY_REGISTERED,
                      std::string(ProofErrorToString(ProofError::HARDWARE_ALREADY_REGISTERED)) +
                          ": binding store unavailable");
    }
    m_windowHardware[fingerprint] = proof.wallet;

    ValidatedProof validated;
    validated.wallet = proof.wallet;
    validated.hardware = proof.hardware;
    validated.multiplier = std::min(proof.hardware.multiplier, m_options.multiplier_cap);
    validated.anti_emulation_hash = proof.anti_emulation_hash;
    validated.validated_at = now;
    m_pending.push_back(validated);

    result.accepted = true;
    result.pending_miners = m_pending.size();
    result.your_multiplier = validated.multiplier;
    result.block_completes_in = m_options.block_window_seconds - elapsed;

    LogPrintMining(INFO, "Accepted proof from %s: %s, %s, %.2fx (%zu pending)",
                   proof.wallet.c_str(), proof.hardware.GetLabel().c_str(),
                   TierName(proof.hardware.tier), validated.multiplier, m_pending.size());

    return ProofError::NONE;
}

std::optional<CBlock> CProofOfAntiquity::ProcessBlock(const uint256& previous_hash, uint64_t height) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const int64_t now = Now();

    if (m_pending.empty()) {
        LogPrintConsensus(DEBUG, "Empty window at height %llu, resetting",
                          static_cast<unsigned long long>(height));
        ResetWindowLocked(now);
        return std::nullopt;
    }

    double total_multipliers = 0.0;
    for (const auto& proof : m_pending) {
        total_multipliers += proof.multiplier;
    }

    CBlock block;
    block.nHeight = height;
    block.hashPrevBlock = previous_hash;
    block.nTime = now;
    block.vMiners.reserve(m_pending.size());

    // Shares are truncated, the remainder is not redistributed
    CAmount total_distributed = 0;
    for (const auto& proof : m_pending) {
        double share = proof.multiplier / total_multipliers;
        CAmount reward = static_cast<CAmount>(static_cast<double>(m_options.block_reward) * share);

        BlockMiner miner;
        miner.wallet = proof.wallet;
        miner.hardware = proof.hardware.GetLabel();
        miner.multiplier = proof.multiplier;
        miner.reward = reward;
        block.vMiners.push_back(miner);

        total_distributed += reward;
    }

    block.nTotalReward = total_distributed;
    block.hashMerkleRoot = ComputeMinerMerkleRoot(block.vMiners);
    block.hash = block.ComputeHash();

    LogPrintConsensus(INFO, "Sealed block %llu: %zu miners, %lld distributed (%lld dust), hash=%s",
                      static_cast<unsigned long long>(height), block.vMiners.size(),
                      static_cast<long long>(total_distributed),
                      static_cast<long long>(m_options.block_reward - total_distributed),
                      block.hash.GetHex().c_str());

    ResetWindowLocked(now);
    return block;
}

BlockStatus CProofOfAntiquity::GetStatus() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    BlockStatus status;
    status.pending_proofs = m_pending.size();
    for (const auto& proof : m_pending) {
        status.total_multipliers += proof.multiplier;
    }
    status.block_age = ElapsedLocked(Now());
    status.time_remaining = std::max<int64_t>(0, m_options.block_window_seconds - status.block_age);
    status.accepting_proofs = status.block_age < m_options.block_window_seconds;
    return status;
}

void CProofOfAntiquity::QuarantineWallet(const std::string& wallet, const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_quarantine[wallet] = reason;
    LogPrintConsensus(WARN, "Quarantined wallet %s: %s", wallet.c_str(), reason.c_str());
}

bool CProofOfAntiquity::ReleaseWallet(const std::string& wallet) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_quarantine.erase(wallet) == 0) {
        return false;
    }
    LogPrintConsensus(INFO, "Released wallet %s from quarantine", wallet.c_str());
    return true;
}

bool CProofOfAntiquity::IsQuarantined(const std::string& wallet) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_quarantine.count(wallet) > 0;
}

std::vector<ValidatedProof> CProofOfAntiquity::GetPendingProofs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending;
}

// ============================================================================
// Validator lottery
// ============================================================================

std::optional<ValidatedProof> SelectBlockValidator(const std::vector<ValidatedProof>& proofs,
                                                   std::mt19937_64& rng) {
    if (proofs.empty()) {
        return std::nullopt;
    }

    double total = 0.0;
    for (const auto& proof : proofs) {
        total += std::max(0.0, proof.multiplier);
    }

    if (total <= 0.0) {
        std::uniform_int_distribution<size_t> pick(0, proofs.size() - 1);
        return proofs[pick(rng)];
    }

    std::uniform_real_distribution<double> dist(0.0, total);
    double target = dist(rng);
    double cumulative = 0.0;
    for (const auto& proof : proofs) {
        cumulative += std::max(0.0, proof.multiplier);
        if (target < cumulative) {
            return proof;
        }
    }

    // Rounding can leave target at the very top of the range
    return proofs.back();
}

} // namespace antiquity
