// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_CONSENSUS_PROOF_OF_ANTIQUITY_H
#define ANTIQUITY_CONSENSUS_PROOF_OF_ANTIQUITY_H

/**
 * Proof of Antiquity Engine
 *
 * Collects hardware attestations during a fixed block window and seals a
 * block that splits the block reward in proportion to each accepted
 * proof's multiplier.
 *
 * Window lifecycle:
 *   - Open at construction (window start = clock()).
 *   - SubmitProof() accepts proofs while elapsed < block window. Expiry is
 *     checked lazily on each submission.
 *   - ProcessBlock() seals the pending proofs into a CBlock (or returns
 *     nullopt for an empty window) and opens the next window.
 *
 * Lifetime hardware bindings live in the injected IHardwareBindingStore and
 * persist across windows. Quarantined wallets stay quarantined until
 * released.
 *
 * Thread-safe: all state is guarded by one mutex. SubmitProof() holds it
 * for the whole check sequence so two proofs from one wallet can never both
 * be accepted.
 */

#include <amount.h>
#include <consensus/hardware_binding.h>
#include <consensus/mining_proof.h>
#include <consensus/params.h>
#include <entropy/anti_emulation.h>
#include <entropy/deep_entropy.h>
#include <entropy/hardware_profiles.h>
#include <primitives/block.h>
#include <util/time.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

class CConfigParser;

namespace antiquity {

/**
 * Proof submission outcome. NONE means accepted.
 */
enum class ProofError {
    NONE,
    BLOCK_WINDOW_CLOSED,
    DUPLICATE_SUBMISSION,
    BLOCK_FULL,
    INVALID_MULTIPLIER,
    TIER_MISMATCH,
    SUSPICIOUS_AGE,
    HARDWARE_ALREADY_REGISTERED,
    SUSPICIOUS_HARDWARE,
    EMULATION_DETECTED,
    DRIFT_LOCK_VIOLATION,   // Wallet is quarantined
    INVALID_SIGNATURE       // Reported by the network layer, passed through
};

/** Human-readable message for a ProofError */
const char* ProofErrorToString(ProofError error);

struct SubmitResult {
    bool accepted = false;
    size_t pending_miners = 0;
    double your_multiplier = 0.0;
    int64_t block_completes_in = 0;   // Seconds left in the window
};

struct BlockStatus {
    size_t pending_proofs = 0;
    double total_multipliers = 0.0;
    int64_t block_age = 0;
    int64_t time_remaining = 0;
    bool accepting_proofs = false;
};

/**
 * Engine tunables. Defaults are the consensus constants.
 */
struct EngineOptions {
    int64_t block_window_seconds = Consensus::BLOCK_WINDOW_SECONDS;
    uint32_t max_miners = Consensus::MAX_MINERS_PER_BLOCK;
    CAmount block_reward = Consensus::BLOCK_REWARD;
    uint32_t max_hardware_age = Consensus::MAX_HARDWARE_AGE_YEARS;
    double min_multiplier = Consensus::MIN_MULTIPLIER;
    double max_multiplier = Consensus::MAX_MULTIPLIER;
    double multiplier_tolerance = Consensus::MULTIPLIER_TOLERANCE;
    double multiplier_cap = Consensus::MULTIPLIER_CAP;
    bool require_entropy_proof = false;
    std::vector<std::string> quarantined_wallets;   // Quarantined at startup
};

/**
 * Read engine options from configuration.
 *
 * Keys: blockwindow, maxminers, blockreward, maxhardwareage,
 * requireentropyproof, quarantine (repeatable). Out-of-range values fall
 * back to the defaults with a warning.
 */
EngineOptions LoadEngineOptions(const CConfigParser& config);

class CProofOfAntiquity {
public:
    /**
     * @param registry      Shared hardware profiles (nullptr = built-in catalog)
     * @param bindings      Lifetime fingerprint store (nullptr = in-memory)
     * @param options       Engine tunables
     * @param clock         Unix seconds source (empty = GetTime)
     * @param deep_verifier Deep entropy verifier (nullptr = built from registry)
     */
    CProofOfAntiquity(std::shared_ptr<const entropy::HardwareProfileRegistry> registry = nullptr,
                      std::shared_ptr<IHardwareBindingStore> bindings = nullptr,
                      const EngineOptions& options = EngineOptions(),
                      TimeSource clock = TimeSource(),
                      std::shared_ptr<entropy::DeepEntropyVerifier> deep_verifier = nullptr);

    // Prevent copying
    CProofOfAntiquity(const CProofOfAntiquity&) = delete;
    CProofOfAntiquity& operator=(const CProofOfAntiquity&) = delete;

    /**
     * Validate and queue a proof for the current window.
     *
     * @param proof  Deserialized mining proof
     * @param result Filled on acceptance
     * @param error  Filled with a message on rejection
     * @return ProofError::NONE if accepted
     */
    ProofError SubmitProof(const MiningProof& proof, SubmitResult& result, std::string& error);

    /**
     * Seal the pending proofs into a block and open a new window.
     *
     * @return nullopt if no proofs were pending (the window is still reset)
     */
    std::optional<CBlock> ProcessBlock(const uint256& previous_hash, uint64_t height);

    BlockStatus GetStatus() const;

    // Drift-lock quarantine
    void QuarantineWallet(const std::string& wallet, const std::string& reason);
    bool ReleaseWallet(const std::string& wallet);
    bool IsQuarantined(const std::string& wallet) const;

    std::vector<ValidatedProof> GetPendingProofs() const;

    const EngineOptions& GetOptions() const { return m_options; }

private:
    EngineOptions m_options;
    TimeSource m_clock;
    std::shared_ptr<const entropy::HardwareProfileRegistry> m_registry;
    std::shared_ptr<IHardwareBindingStore> m_bindings;
    entropy::AntiEmulationVerifier m_antiEmulation;
    std::shared_ptr<entropy::DeepEntropyVerifier> m_deepEntropy;

    mutable std::mutex m_mutex;
    std::vector<ValidatedProof> m_pending;
    std::map<uint256, std::string> m_windowHardware;    // fingerprint -> wallet, this window
    std::map<std::string, std::string> m_quarantine;    // wallet -> reason
    int64_t m_windowStart;

    int64_t Now() const { return ReadTime(m_clock); }

    // Elapsed seconds in the current window, never negative. Caller holds m_mutex.
    int64_t ElapsedLocked(int64_t now) const;

    // Age, tier and multiplier bounds
    ProofError ValidateHardware(const HardwareInfo& hardware, std::string& error) const;

    // Clears the pending list and window table. Caller holds m_mutex.
    void ResetWindowLocked(int64_t now);
};

/**
 * Pick one proof with probability proportional to its multiplier.
 *
 * Falls back to a uniform pick when every multiplier is zero.
 * @return nullopt for an empty list
 */
std::optional<ValidatedProof> SelectBlockValidator(const std::vector<ValidatedProof>& proofs,
                                                   std::mt19937_64& rng);

} // namespace antiquity

#endif // ANTIQUITY_CONSENSUS_PROOF_OF_ANTIQUITY_H
