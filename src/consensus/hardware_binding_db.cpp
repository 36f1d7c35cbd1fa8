// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#include <consensus/hardware_binding_db.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <leveldb/write_batch.h>

namespace antiquity {

const std::string CHardwareBindingDB::KEY_PREFIX = "hwbind:";

CHardwareBindingDB::CHardwareBindingDB() : m_db(nullptr) {}

CHardwareBindingDB::~CHardwareBindingDB() {
    Close();
}

std::string CHardwareBindingDB::MakeKey(const uint256& fingerprint) const {
    return KEY_PREFIX + HexStr(fingerprint.begin(), 32);
}

void CHardwareBindingDB::EvictCacheIfNeeded() const {
    // Simple eviction: clear half the cache when full
    if (m_cache.size() > MAX_CACHE_SIZE) {
        size_t toRemove = m_cache.size() / 2;
        auto it = m_cache.begin();
        while (toRemove > 0 && it != m_cache.end()) {
            it = m_cache.erase(it);
            toRemove--;
        }
    }
}

bool CHardwareBindingDB::Open(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        return true;  // Already open
    }

    m_path = path;

    leveldb::Options options;
    options.create_if_missing = true;
    options.write_buffer_size = 4 * 1024 * 1024;  // 4MB write buffer
    options.max_open_files = 100;

    leveldb::DB* db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &db);

    if (!status.ok()) {
        LogPrintStorage(ERROR, "Failed to open hardware binding database %s: %s",
                        path.c_str(), status.ToString().c_str());
        return false;
    }

    m_db.reset(db);
    m_cache.clear();

    LogPrintStorage(INFO, "Hardware binding database opened: %s", path.c_str());
    return true;
}

void CHardwareBindingDB::Close() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        m_db.reset();
        m_cache.clear();
        LogPrintStorage(INFO, "Hardware binding database closed");
    }
}

bool CHardwareBindingDB::IsOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_db != nullptr;
}

bool CHardwareBindingDB::ReadBinding(const uint256& fingerprint, std::optional<std::string>& wallet) const {
    if (!m_db) {
        return false;
    }

    // Check cache first
    auto cacheIt = m_cache.find(fingerprint);
    if (cacheIt != m_cache.end()) {
        wallet = cacheIt->second;
        return true;
    }

    std::string value;
    leveldb::Status status = m_db->Get(leveldb::ReadOptions(), MakeKey(fingerprint), &value);

    if (status.IsNotFound()) {
        wallet = std::nullopt;
        return true;
    }
    if (!status.ok()) {
        LogPrintStorage(ERROR, "Failed to read hardware binding: %s", status.ToString().c_str());
        return false;
    }

    EvictCacheIfNeeded();
    m_cache[fingerprint] = value;
    wallet = value;
    return true;
}

bool CHardwareBindingDB::GetBinding(const uint256& fingerprint, std::optional<std::string>& wallet) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return ReadBinding(fingerprint, wallet);
}

bool CHardwareBindingDB::Bind(const uint256& fingerprint, const std::string& wallet) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        return false;
    }

    // An unreadable binding must never be overwritten
    std::optional<std::string> existing;
    if (!ReadBinding(fingerprint, existing)) {
        return false;
    }
    if (existing) {
        return *existing == wallet;  // Bindings are immutable
    }

    leveldb::WriteOptions writeOpts;
    writeOpts.sync = true;  // Ensure durability

    leveldb::Status status = m_db->Put(writeOpts, MakeKey(fingerprint), wallet);
    if (!status.ok()) {
        LogPrintStorage(ERROR, "Failed to write hardware binding: %s", status.ToString().c_str());
        return false;
    }

    EvictCacheIfNeeded();
    m_cache[fingerprint] = wallet;

    LogPrintStorage(DEBUG, "Bound hardware %s to %s",
                    fingerprint.GetHex().substr(0, 16).c_str(), wallet.c_str());
    return true;
}

size_t CHardwareBindingDB::Count() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        return 0;
    }

    size_t count = 0;
    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));

    for (it->Seek(KEY_PREFIX); it->Valid(); it->Next()) {
        if (!it->key().starts_with(KEY_PREFIX)) {
            break;
        }
        count++;
    }

    return count;
}

void CHardwareBindingDB::Clear() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        return;
    }

    leveldb::WriteBatch batch;
    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));

    for (it->Seek(KEY_PREFIX); it->Valid(); it->Next()) {
        if (!it->key().starts_with(KEY_PREFIX)) {
            break;
        }
        batch.Delete(it->key());
    }

    leveldb::WriteOptions writeOpts;
    writeOpts.sync = true;
    leveldb::Status status = m_db->Write(writeOpts, &batch);
    if (!status.ok()) {
        LogPrintStorage(ERROR, "Failed to clear hardware bindings: %s", status.ToString().c_str());
    }
    m_cache.clear();
}

} // namespace antiquity
