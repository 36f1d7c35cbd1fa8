// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_PRIMITIVES_BLOCK_H
#define ANTIQUITY_PRIMITIVES_BLOCK_H

#include <amount.h>

#include <cstring>
#include <cstdint>
#include <vector>
#include <string>
#include <iosfwd>

/** 256-bit hash */
class uint256 {
public:
    uint8_t data[32];

    uint256() { memset(data, 0, 32); }

    bool IsNull() const {
        for (int i = 0; i < 32; i++)
            if (data[i] != 0) return false;
        return true;
    }

    // Raw byte order (memcmp), for STL containers only
    bool operator<(const uint256& other) const {
        return memcmp(data, other.data, 32) < 0;
    }

    bool operator==(const uint256& other) const {
        return memcmp(data, other.data, 32) == 0;
    }

    bool operator!=(const uint256& other) const {
        return memcmp(data, other.data, 32) != 0;
    }

    uint8_t* begin() { return data; }
    const uint8_t* begin() const { return data; }
    uint8_t* end() { return data + 32; }
    const uint8_t* end() const { return data + 32; }

    std::string GetHex() const;
    void SetHex(const std::string& str);
};

// Stream output operator for Boost.Test (defined in block.cpp)
std::ostream& operator<<(std::ostream& os, const uint256& h);

/** SHA3-256 of a byte range */
uint256 HashBytes(const uint8_t* data, size_t len);

/** SHA3-256 of a string's bytes */
uint256 HashString(const std::string& str);

namespace antiquity {

/**
 * One rewarded participant of a sealed block.
 */
struct BlockMiner {
    std::string wallet;
    std::string hardware;   // Display label, "<model> (<generation>)"
    double multiplier = 0.0;
    CAmount reward = 0;
};

/**
 * Sealed Proof of Antiquity block.
 *
 * Created once by CProofOfAntiquity::ProcessBlock() and never modified
 * afterwards. Consumers (badges, governance, the bridge) read it only.
 */
class CBlock {
public:
    uint64_t nHeight;
    uint256 hash;
    uint256 hashPrevBlock;
    int64_t nTime;
    std::vector<BlockMiner> vMiners;
    CAmount nTotalReward;
    uint256 hashMerkleRoot;
    uint256 hashStateRoot;  // Placeholder, always null

    CBlock() { SetNull(); }

    void SetNull() {
        nHeight = 0;
        hash = uint256();
        hashPrevBlock = uint256();
        nTime = 0;
        vMiners.clear();
        nTotalReward = 0;
        hashMerkleRoot = uint256();
        hashStateRoot = uint256();
    }

    /**
     * Hash over (height, previous hash, total reward, timestamp).
     * Miner entries are committed through hashMerkleRoot instead.
     */
    uint256 ComputeHash() const;
};

/**
 * Format a multiplier for hashing.
 *
 * Emits the shortest decimal that round-trips to the same double, so
 * 0.55 hashes as "0.55" and distinct doubles never share a preimage.
 */
std::string FormatMultiplier(double multiplier);

/** Merkle leaf for one miner: SHA3-256("wallet:multiplier:reward") */
uint256 HashMinerLeaf(const BlockMiner& miner);

/**
 * Binary merkle root over the ordered miner list.
 *
 * Odd levels duplicate their last node. An empty list yields the null hash.
 * The root is order-sensitive.
 */
uint256 ComputeMinerMerkleRoot(const std::vector<BlockMiner>& miners);

} // namespace antiquity

#endif // ANTIQUITY_PRIMITIVES_BLOCK_H
