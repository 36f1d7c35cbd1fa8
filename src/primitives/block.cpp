// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#include <primitives/block.h>
#include <crypto/sha3.h>
#include <util/strencodings.h>

#include <sstream>
#include <iomanip>
#include <limits>
#include <cstdlib>
#include <cstring>
#include <ostream>

std::string uint256::GetHex() const {
    std::stringstream ss;
    for (int i = 31; i >= 0; i--) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

void uint256::SetHex(const std::string& str) {
    memset(data, 0, 32);

    if (str.empty() || !IsHex(str.size() % 2 ? "0" + str : str)) {
        return;
    }

    // Hex string should be 64 characters (32 bytes * 2 hex chars)
    size_t len = str.length();
    if (len > 64) {
        len = 64;
    }

    // GetHex() outputs in reverse order (data[31] first), so SetHex() matches
    for (size_t i = 0; i < len / 2; i++) {
        size_t strPos = len - 2 - (i * 2);  // Start from end of string
        data[i] = static_cast<uint8_t>((HexDigit(str[strPos]) << 4) | HexDigit(str[strPos + 1]));
    }

    // Odd-length input: leading nibble
    if (len % 2 == 1) {
        data[len / 2] = static_cast<uint8_t>(HexDigit(str[0]));
    }
}

// Stream output operator for Boost.Test
std::ostream& operator<<(std::ostream& os, const uint256& h) {
    return os << h.GetHex();
}

uint256 HashBytes(const uint8_t* data, size_t len) {
    uint256 result;
    SHA3_256(data, len, result.data);
    return result;
}

uint256 HashString(const std::string& str) {
    return HashBytes(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

namespace antiquity {

uint256 CBlock::ComputeHash() const {
    std::ostringstream preimage;
    preimage << nHeight << ":" << hashPrevBlock.GetHex() << ":"
             << nTotalReward << ":" << nTime;
    return HashString(preimage.str());
}

std::string FormatMultiplier(double multiplier) {
    // Shortest %g form that parses back to the same double
    for (int precision = 1; precision < std::numeric_limits<double>::max_digits10; precision++) {
        std::ostringstream ss;
        ss << std::setprecision(precision) << multiplier;
        if (std::strtod(ss.str().c_str(), nullptr) == multiplier) {
            return ss.str();
        }
    }
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << multiplier;
    return ss.str();
}

uint256 HashMinerLeaf(const BlockMiner& miner) {
    std::string leaf = miner.wallet + ":" + FormatMultiplier(miner.multiplier) + ":" +
                       std::to_string(miner.reward);
    return HashString(leaf);
}

uint256 ComputeMinerMerkleRoot(const std::vector<BlockMiner>& miners) {
    if (miners.empty()) {
        return uint256();
    }

    std::vector<uint256> level;
    level.reserve(miners.size());
    for (const auto& miner : miners) {
        level.push_back(HashMinerLeaf(miner));
    }

    while (level.size() > 1) {
        if (level.size() % 2 == 1) {
            level.push_back(level.back());
        }

        std::vector<uint256> next;
        next.reserve(level.size() / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            uint8_t concat[64];
            memcpy(concat, level[i].data, 32);
            memcpy(concat + 32, level[i + 1].data, 32);
            next.push_back(HashBytes(concat, sizeof(concat)));
        }
        level.swap(next);
    }

    return level[0];
}

} // namespace antiquity
