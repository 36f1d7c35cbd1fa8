// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_CONSENSUS_HARDWARE_BINDING_DB_H
#define ANTIQUITY_CONSENSUS_HARDWARE_BINDING_DB_H

/**
 * Hardware Binding Database
 *
 * LevelDB-backed IHardwareBindingStore so fingerprint bindings survive
 * node restarts.
 *
 * Key format:
 *   "hwbind:" + fingerprint hex (71 bytes) -> wallet address
 */

#include <consensus/hardware_binding.h>
#include <leveldb/db.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace antiquity {

/**
 * Thread-safe: Protected by internal mutex.
 * Cached: Recently used bindings kept in memory.
 */
class CHardwareBindingDB : public IHardwareBindingStore {
private:
    /** LevelDB database handle */
    std::unique_ptr<leveldb::DB> m_db;

    /** Mutex for thread safety */
    mutable std::mutex m_mutex;

    /** In-memory cache: fingerprint -> wallet */
    mutable std::map<uint256, std::string> m_cache;

    /** Maximum cache size */
    static const size_t MAX_CACHE_SIZE = 10000;

    /** Database path */
    std::string m_path;

    /** Key prefix for binding entries */
    static const std::string KEY_PREFIX;

    std::string MakeKey(const uint256& fingerprint) const;

    /** Evict entries from cache if over limit */
    void EvictCacheIfNeeded() const;

    /**
     * Lookup without taking the mutex.
     * NotFound sets wallet to nullopt and succeeds; any other LevelDB error
     * (or a closed database) returns false.
     */
    bool ReadBinding(const uint256& fingerprint, std::optional<std::string>& wallet) const;

public:
    CHardwareBindingDB();
    ~CHardwareBindingDB() override;

    // Prevent copying
    CHardwareBindingDB(const CHardwareBindingDB&) = delete;
    CHardwareBindingDB& operator=(const CHardwareBindingDB&) = delete;

    /**
     * Open the binding database
     *
     * @param path Directory path for database files
     * @return true if opened successfully
     */
    bool Open(const std::string& path);

    /**
     * Close the database
     */
    void Close();

    bool IsOpen() const;

    bool GetBinding(const uint256& fingerprint, std::optional<std::string>& wallet) const override;
    bool Bind(const uint256& fingerprint, const std::string& wallet) override;

    /**
     * Count of stored bindings
     *
     * Note: This iterates all entries.
     */
    size_t Count() const override;

    /**
     * Clear all bindings (for testing)
     */
    void Clear();
};

} // namespace antiquity

#endif // ANTIQUITY_CONSENSUS_HARDWARE_BINDING_DB_H
