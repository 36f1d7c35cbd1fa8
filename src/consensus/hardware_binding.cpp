// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#include <consensus/hardware_binding.h>

namespace antiquity {

uint256 ComputeHardwareFingerprint(const HardwareInfo& hardware) {
    std::string unique_id = hardware.characteristics ? hardware.characteristics->unique_id : std::string();
    return HashString(hardware.model + ":" + hardware.generation + ":" + unique_id);
}

bool CMemoryHardwareBindingStore::GetBinding(const uint256& fingerprint,
                                             std::optional<std::string>& wallet) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_bindings.find(fingerprint);
    if (it == m_bindings.end()) {
        wallet = std::nullopt;
    } else {
        wallet = it->second;
    }
    return true;
}

bool CMemoryHardwareBindingStore::Bind(const uint256& fingerprint, const std::string& wallet) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto result = m_bindings.emplace(fingerprint, wallet);
    return result.second || result.first->second == wallet;
}

size_t CMemoryHardwareBindingStore::Count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bindings.size();
}

} // namespace antiquity
