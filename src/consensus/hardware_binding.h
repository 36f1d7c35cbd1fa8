// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_CONSENSUS_HARDWARE_BINDING_H
#define ANTIQUITY_CONSENSUS_HARDWARE_BINDING_H

/**
 * Hardware Binding
 *
 * Lifetime "hardware fingerprint -> wallet" bindings. Once a physical
 * device has backed a proof for one wallet it may never back a proof for
 * another wallet, across every block window and across restarts.
 *
 * Fingerprint = SHA3-256("model:generation:unique_id"), with an empty
 * unique_id when the proof carries no detailed characteristics.
 */

#include <primitives/block.h>
#include <primitives/hardware.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace antiquity {

/** Fingerprint of the declared hardware */
uint256 ComputeHardwareFingerprint(const HardwareInfo& hardware);

/**
 * Store of lifetime fingerprint bindings, injected into the engine.
 *
 * Implementations are internally synchronized.
 */
class IHardwareBindingStore {
public:
    virtual ~IHardwareBindingStore() = default;

    /**
     * Look up the wallet bound to a fingerprint.
     *
     * @param fingerprint Hardware fingerprint
     * @param wallet      Set to the bound wallet, or nullopt if unbound
     * @return false if the store could not be read; wallet is then undefined
     */
    virtual bool GetBinding(const uint256& fingerprint, std::optional<std::string>& wallet) const = 0;

    /**
     * Bind a fingerprint to a wallet.
     *
     * @return true if the fingerprint is now bound to this wallet (new
     *         binding or already bound to the same wallet); false if it is
     *         bound to a different wallet, the existing binding could not
     *         be read, or the write failed
     */
    virtual bool Bind(const uint256& fingerprint, const std::string& wallet) = 0;

    /** Number of bound fingerprints */
    virtual size_t Count() const = 0;
};

/**
 * In-memory binding store for tests and single-process nodes.
 */
class CMemoryHardwareBindingStore : public IHardwareBindingStore {
public:
    bool GetBinding(const uint256& fingerprint, std::optional<std::string>& wallet) const override;
    bool Bind(const uint256& fingerprint, const std::string& wallet) override;
    size_t Count() const override;

private:
    mutable std::mutex m_mutex;
    std::map<uint256, std::string> m_bindings;
};

} // namespace antiquity

#endif // ANTIQUITY_CONSENSUS_HARDWARE_BINDING_H
