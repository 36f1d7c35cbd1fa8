// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

/**
 * Proof of Antiquity Engine Tests
 *
 * Submission checks, block sealing and reward split, hardware binding,
 * quarantine and the validator lottery. The engine runs on a mock clock.
 */

#include <boost/test/unit_test.hpp>

#include <consensus/hardware_binding.h>
#include <consensus/hardware_tier.h>
#include <consensus/proof_of_antiquity.h>
#include <test/entropy_fixtures.h>

#include <atomic>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace antiquity;

namespace {

const int64_t GENESIS_TIME = 1735689600;

std::string Wallet(const std::string& tag) {
    std::string wallet = "RTC" + tag;
    wallet.resize(40, '0');
    return wallet;
}

MiningProof MakeProof(const std::string& wallet, const std::string& model, uint32_t age) {
    MiningProof proof;
    proof.wallet = wallet;
    proof.hardware = HardwareInfo::Create(model, "gen-" + std::to_string(age), age);
    proof.anti_emulation_hash = HashString(wallet + model);
    proof.timestamp = GENESIS_TIME;
    return proof;
}

// Binding store whose writes always fail
class CFailingBindingStore : public IHardwareBindingStore {
public:
    bool GetBinding(const uint256&, std::optional<std::string>& wallet) const override {
        wallet = std::nullopt;
        return true;
    }
    bool Bind(const uint256&, const std::string&) override { return false; }
    size_t Count() const override { return 0; }
};

// Binding store that holds bindings but cannot currently read them
class CUnreadableBindingStore : public CMemoryHardwareBindingStore {
public:
    std::atomic<bool> readable{true};
    std::atomic<int> bind_calls{0};

    bool GetBinding(const uint256& fingerprint, std::optional<std::string>& wallet) const override {
        if (!readable) return false;
        return CMemoryHardwareBindingStore::GetBinding(fingerprint, wallet);
    }
    bool Bind(const uint256& fingerprint, const std::string& wallet) override {
        bind_calls++;
        return CMemoryHardwareBindingStore::Bind(fingerprint, wallet);
    }
};

struct EngineFixture {
    std::shared_ptr<int64_t> now = std::make_shared<int64_t>(GENESIS_TIME);
    std::shared_ptr<CMemoryHardwareBindingStore> bindings = std::make_shared<CMemoryHardwareBindingStore>();
    EngineOptions options;

    TimeSource Clock() const {
        std::shared_ptr<int64_t> t = now;
        return [t]() { return *t; };
    }

    std::unique_ptr<CProofOfAntiquity> MakeEngine(
        std::shared_ptr<const entropy::HardwareProfileRegistry> registry = nullptr) {
        return std::make_unique<CProofOfAntiquity>(registry, bindings, options, Clock());
    }

    ProofError Submit(CProofOfAntiquity& engine, const MiningProof& proof) {
        SubmitResult result;
        std::string error;
        return engine.SubmitProof(proof, result, error);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(proof_of_antiquity_tests, EngineFixture)

BOOST_AUTO_TEST_CASE(error_messages) {
    BOOST_CHECK_EQUAL(std::string(ProofErrorToString(ProofError::BLOCK_WINDOW_CLOSED)), "Block window has closed");
    BOOST_CHECK_EQUAL(std::string(ProofErrorToString(ProofError::DUPLICATE_SUBMISSION)),
                      "Already submitted proof for this block");
    BOOST_CHECK_EQUAL(std::string(ProofErrorToString(ProofError::BLOCK_FULL)), "Block has reached maximum miners");
    BOOST_CHECK_EQUAL(std::string(ProofErrorToString(ProofError::NONE)), "Accepted");
}

BOOST_AUTO_TEST_CASE(accept_and_report) {
    auto engine = MakeEngine();
    *now += 20;

    SubmitResult result;
    std::string error;
    ProofError err = engine->SubmitProof(MakeProof(Wallet("a"), "PowerPC G4", 22), result, error);
    BOOST_CHECK(err == ProofError::NONE);
    BOOST_CHECK(error.empty());
    BOOST_CHECK(result.accepted);
    BOOST_CHECK_EQUAL(result.pending_miners, 1u);
    BOOST_CHECK_EQUAL(result.your_multiplier, 2.5);
    BOOST_CHECK_EQUAL(result.block_completes_in, 100);

    std::vector<ValidatedProof> pending = engine->GetPendingProofs();
    BOOST_REQUIRE_EQUAL(pending.size(), 1u);
    BOOST_CHECK_EQUAL(pending[0].wallet, Wallet("a"));
    BOOST_CHECK_EQUAL(pending[0].validated_at, GENESIS_TIME + 20);
    BOOST_CHECK(pending[0].anti_emulation_hash == HashString(Wallet("a") + "PowerPC G4"));
}

BOOST_AUTO_TEST_CASE(two_miner_reward_split) {
    auto engine = MakeEngine();

    BOOST_REQUIRE(Submit(*engine, MakeProof(Wallet("a"), "PowerPC G4", 22)) == ProofError::NONE);
    BOOST_REQUIRE(Submit(*engine, MakeProof(Wallet("b"), "Intel 486", 35)) == ProofError::NONE);

    *now += 120;
    uint256 prev = HashString("genesis");
    std::optional<CBlock> block = engine->ProcessBlock(prev, 1);
    BOOST_REQUIRE(block);

    BOOST_CHECK_EQUAL(block->nHeight, 1u);
    BOOST_CHECK(block->hashPrevBlock == prev);
    BOOST_CHECK_EQUAL(block->nTime, GENESIS_TIME + 120);
    BOOST_REQUIRE_EQUAL(block->vMiners.size(), 2u);

    BOOST_CHECK_EQUAL(block->vMiners[0].wallet, Wallet("a"));
    BOOST_CHECK_EQUAL(block->vMiners[0].multiplier, 2.5);
    BOOST_CHECK_EQUAL(block->vMiners[0].reward, 41666666);
    BOOST_CHECK_EQUAL(block->vMiners[0].hardware, "PowerPC G4 (gen-22)");

    BOOST_CHECK_EQUAL(block->vMiners[1].multiplier, 3.5);
    BOOST_CHECK_EQUAL(block->vMiners[1].reward, 58333333);

    BOOST_CHECK_EQUAL(block->nTotalReward, 99999999);
    BOOST_CHECK(block->hashMerkleRoot == ComputeMinerMerkleRoot(block->vMiners));
    BOOST_CHECK(block->hash == block->ComputeHash());
    BOOST_CHECK(!block->hash.IsNull());

    // Window reset
    BOOST_CHECK(engine->GetPendingProofs().empty());
    BOOST_CHECK(engine->GetStatus().accepting_proofs);
}

BOOST_AUTO_TEST_CASE(rewards_never_exceed_block_reward) {
    options.max_miners = 10;
    auto engine = MakeEngine();

    const uint32_t ages[] = {1, 7, 12, 17, 21, 26, 31, 40, 3, 19};
    for (size_t i = 0; i < 10; i++) {
        MiningProof proof = MakeProof(Wallet(std::to_string(i)), "machine-" + std::to_string(i), ages[i]);
        BOOST_REQUIRE(Submit(*engine, proof) == ProofError::NONE);
    }

    std::optional<CBlock> block = engine->ProcessBlock(uint256(), 7);
    BOOST_REQUIRE(block);

    CAmount sum = 0;
    for (const auto& miner : block->vMiners) {
        BOOST_CHECK(miner.reward >= 0);
        sum += miner.reward;
    }
    BOOST_CHECK_EQUAL(sum, block->nTotalReward);
    BOOST_CHECK(block->nTotalReward <= options.block_reward);
    BOOST_CHECK(options.block_reward - block->nTotalReward < static_cast<CAmount>(block->vMiners.size()));
}

BOOST_AUTO_TEST_CASE(window_closes) {
    auto engine = MakeEngine();

    *now += 119;
    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine->SubmitProof(MakeProof(Wallet("a"), "G4", 22), result, error) == ProofError::NONE);
    BOOST_CHECK_EQUAL(result.block_completes_in, 1);

    *now += 1;
    BOOST_CHECK(engine->SubmitProof(MakeProof(Wallet("b"), "G5", 20), result, error) ==
                ProofError::BLOCK_WINDOW_CLOSED);
    BOOST_CHECK_EQUAL(error, "Block window has closed");
    BOOST_CHECK(!result.accepted);

    *now += 1;
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("c"), "Alpha", 28)) == ProofError::BLOCK_WINDOW_CLOSED);

    BlockStatus status = engine->GetStatus();
    BOOST_CHECK(!status.accepting_proofs);
    BOOST_CHECK_EQUAL(status.time_remaining, 0);
    BOOST_CHECK_EQUAL(status.block_age, 121);

    // Sealing opens a fresh window
    BOOST_REQUIRE(engine->ProcessBlock(uint256(), 1));
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("c"), "Alpha", 28)) == ProofError::NONE);
}

BOOST_AUTO_TEST_CASE(clock_going_backwards) {
    auto engine = MakeEngine();
    *now -= 30;
    BOOST_CHECK_EQUAL(engine->GetStatus().block_age, 0);
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("a"), "G4", 22)) == ProofError::NONE);
}

BOOST_AUTO_TEST_CASE(duplicate_wallet) {
    auto engine = MakeEngine();
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("a"), "G4", 22)) == ProofError::NONE);
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("a"), "G5", 20)) == ProofError::DUPLICATE_SUBMISSION);
    BOOST_CHECK_EQUAL(engine->GetPendingProofs().size(), 1u);

    // A wallet may submit again in the next window
    BOOST_REQUIRE(engine->ProcessBlock(uint256(), 1));
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("a"), "G4", 22)) == ProofError::NONE);
}

BOOST_AUTO_TEST_CASE(block_full) {
    options.max_miners = 2;
    auto engine = MakeEngine();

    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("a"), "m1", 22)) == ProofError::NONE);
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("b"), "m2", 22)) == ProofError::NONE);
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("c"), "m3", 22)) == ProofError::BLOCK_FULL);
    BOOST_CHECK_EQUAL(engine->GetStatus().pending_proofs, 2u);
}

BOOST_AUTO_TEST_CASE(hardware_sanity_checks) {
    auto engine = MakeEngine();

    MiningProof too_old = MakeProof(Wallet("a"), "ENIAC", 60);
    BOOST_CHECK(Submit(*engine, too_old) == ProofError::SUSPICIOUS_AGE);

    // Age 50 is the inclusive limit
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("b"), "PDP-11", 50)) == ProofError::NONE);

    MiningProof wrong_tier = MakeProof(Wallet("c"), "G4", 22);
    wrong_tier.hardware.tier = HardwareTier::Ancient;
    wrong_tier.hardware.multiplier = 3.5;
    BOOST_CHECK(Submit(*engine, wrong_tier) == ProofError::TIER_MISMATCH);

    MiningProof out_of_bounds = MakeProof(Wallet("d"), "G4", 22);
    out_of_bounds.hardware.multiplier = 4.5;
    BOOST_CHECK(Submit(*engine, out_of_bounds) == ProofError::INVALID_MULTIPLIER);

    MiningProof off_tier = MakeProof(Wallet("e"), "G4", 22);
    off_tier.hardware.multiplier = 2.0;
    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine->SubmitProof(off_tier, result, error) == ProofError::INVALID_MULTIPLIER);
    BOOST_CHECK(error.find("deviates") != std::string::npos);

    // Within tolerance
    MiningProof close = MakeProof(Wallet("f"), "G4", 22);
    close.hardware.multiplier = 2.6;
    BOOST_CHECK(Submit(*engine, close) == ProofError::NONE);
}

BOOST_AUTO_TEST_CASE(founder_bonus_and_cap) {
    auto engine = MakeEngine();

    // 0.5 * 1.1 stays inside the tolerance
    MiningProof recent = MakeProof(Wallet("a"), "Ryzen", 2);
    recent.hardware = recent.hardware.WithFounderBonus();
    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine->SubmitProof(recent, result, error) == ProofError::NONE);
    BOOST_CHECK_CLOSE(result.your_multiplier, 0.55, 1e-9);

    // 3.5 * 1.1 deviates from the Ancient multiplier by more than 0.2
    MiningProof ancient = MakeProof(Wallet("b"), "Intel 386", 38);
    ancient.hardware = ancient.hardware.WithFounderBonus();
    BOOST_CHECK(Submit(*engine, ancient) == ProofError::INVALID_MULTIPLIER);

    // Accepted multipliers are capped
    options.multiplier_tolerance = 0.5;
    auto lenient = MakeEngine();
    BOOST_CHECK(lenient->SubmitProof(ancient, result, error) == ProofError::NONE);
    BOOST_CHECK_EQUAL(result.your_multiplier, Consensus::MULTIPLIER_CAP);
}

BOOST_AUTO_TEST_CASE(shallow_verifier_rejections) {
    auto registry = std::make_shared<entropy::HardwareProfileRegistry>(
        entropy::HardwareProfileRegistry::with_defaults());
    registry->add_timing_baseline(74, "div", {10, 100});
    auto engine = MakeEngine(registry);

    HardwareCharacteristics chars;
    chars.cpu_model = "PowerPC 7450";
    chars.cpu_family = 74;
    chars.cpu_flags = {"altivec", "ppc"};
    chars.cache_sizes.l1_data = 32;
    chars.instruction_timings = {{"mul", 4}};
    chars.unique_id = "G4-0001";

    MiningProof genuine = MakeProof(Wallet("a"), "G4", 22);
    genuine.hardware.characteristics = chars;
    BOOST_CHECK(Submit(*engine, genuine) == ProofError::NONE);

    MiningProof big_cache = MakeProof(Wallet("b"), "G4", 22);
    big_cache.hardware.characteristics = chars;
    big_cache.hardware.characteristics->cache_sizes.l1_data = 512;
    big_cache.hardware.characteristics->unique_id = "G4-0002";
    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine->SubmitProof(big_cache, result, error) == ProofError::SUSPICIOUS_HARDWARE);
    BOOST_CHECK(error.find("L1 cache size mismatch") != std::string::npos);

    MiningProof fast = MakeProof(Wallet("c"), "G4", 22);
    fast.hardware.characteristics = chars;
    fast.hardware.characteristics->instruction_timings["div"] = 2;
    fast.hardware.characteristics->unique_id = "G4-0003";
    BOOST_CHECK(Submit(*engine, fast) == ProofError::EMULATION_DETECTED);
}

BOOST_AUTO_TEST_CASE(genuine_68000_accepted) {
    auto engine = MakeEngine();

    // No family signature and no cycle baselines for the 68k family
    HardwareCharacteristics chars;
    chars.cpu_model = "Motorola 68000";
    chars.cpu_family = 68;
    chars.instruction_timings = {{"mul", 70}, {"div", 140}};
    chars.unique_id = "MAC-PLUS-0001";

    MiningProof proof = MakeProof(Wallet("a"), "Motorola 68000", 45);
    proof.hardware.characteristics = chars;

    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine->SubmitProof(proof, result, error) == ProofError::NONE);
    BOOST_CHECK_MESSAGE(error.empty(), error);
    BOOST_CHECK_EQUAL(result.your_multiplier, 3.5);
}

BOOST_AUTO_TEST_CASE(hardware_binding_within_window) {
    auto engine = MakeEngine();

    MiningProof first = MakeProof(Wallet("a"), "G4", 22);
    BOOST_CHECK(Submit(*engine, first) == ProofError::NONE);
    BOOST_CHECK_EQUAL(bindings->Count(), 1u);

    MiningProof same_box = first;
    same_box.wallet = Wallet("b");
    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine->SubmitProof(same_box, result, error) == ProofError::HARDWARE_ALREADY_REGISTERED);
    BOOST_CHECK_EQUAL(error, "Hardware already registered to wallet " + Wallet("a"));
}

BOOST_AUTO_TEST_CASE(hardware_binding_survives_windows) {
    auto engine = MakeEngine();
    MiningProof first = MakeProof(Wallet("a"), "G4", 22);
    BOOST_CHECK(Submit(*engine, first) == ProofError::NONE);
    BOOST_REQUIRE(engine->ProcessBlock(uint256(), 1));

    MiningProof stolen = first;
    stolen.wallet = Wallet("b");
    BOOST_CHECK(Submit(*engine, stolen) == ProofError::HARDWARE_ALREADY_REGISTERED);

    // The owner keeps mining with it
    BOOST_CHECK(Submit(*engine, first) == ProofError::NONE);

    // A second engine sharing the store sees the binding too
    auto restarted = MakeEngine();
    BOOST_CHECK(Submit(*restarted, stolen) == ProofError::HARDWARE_ALREADY_REGISTERED);
}

BOOST_AUTO_TEST_CASE(binding_store_failure_rejects) {
    CProofOfAntiquity engine(nullptr, std::make_shared<CFailingBindingStore>(), options, Clock());
    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine.SubmitProof(MakeProof(Wallet("a"), "G4", 22), result, error) ==
                ProofError::HARDWARE_ALREADY_REGISTERED);
    BOOST_CHECK(error.find("binding store unavailable") != std::string::npos);
    BOOST_CHECK(engine.GetPendingProofs().empty());
}

BOOST_AUTO_TEST_CASE(unreadable_binding_store_rejects_without_rebinding) {
    auto store = std::make_shared<CUnreadableBindingStore>();
    CProofOfAntiquity engine(nullptr, store, options, Clock());

    MiningProof first = MakeProof(Wallet("a"), "G4", 22);
    BOOST_REQUIRE(Submit(engine, first) == ProofError::NONE);
    BOOST_REQUIRE(engine.ProcessBlock(uint256(), 1));
    BOOST_CHECK_EQUAL(store->bind_calls.load(), 1);

    store->readable = false;
    MiningProof stolen = first;
    stolen.wallet = Wallet("b");
    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine.SubmitProof(stolen, result, error) == ProofError::HARDWARE_ALREADY_REGISTERED);
    BOOST_CHECK(error.find("binding store unavailable") != std::string::npos);
    BOOST_CHECK_EQUAL(store->bind_calls.load(), 1);
    BOOST_CHECK(engine.GetPendingProofs().empty());

    store->readable = true;
    std::optional<std::string> owner;
    BOOST_REQUIRE(store->GetBinding(ComputeHardwareFingerprint(first.hardware), owner));
    BOOST_REQUIRE(owner);
    BOOST_CHECK_EQUAL(*owner, Wallet("a"));
}

BOOST_AUTO_TEST_CASE(concurrent_submissions_from_one_wallet) {
    options.max_miners = 1000;
    auto engine = MakeEngine();

    const int ROUNDS = 50;
    const int THREADS = 8;
    for (int round = 0; round < ROUNDS; round++) {
        std::atomic<int> accepted{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < THREADS; t++) {
            threads.emplace_back([&engine, &accepted, t]() {
                // Distinct hardware per thread so only the wallet check can collide
                MiningProof proof = MakeProof(Wallet("racer"), "G4 #" + std::to_string(t), 22);
                SubmitResult result;
                std::string error;
                if (engine->SubmitProof(proof, result, error) == ProofError::NONE) {
                    accepted++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        BOOST_CHECK_EQUAL(accepted.load(), 1);
        BOOST_CHECK_EQUAL(engine->GetPendingProofs().size(), 1u);
        BOOST_REQUIRE(engine->ProcessBlock(uint256(), round + 1));
    }
}

BOOST_AUTO_TEST_CASE(quarantine_and_release) {
    auto engine = MakeEngine();

    engine->QuarantineWallet(Wallet("a"), "clock drift");
    BOOST_CHECK(engine->IsQuarantined(Wallet("a")));

    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine->SubmitProof(MakeProof(Wallet("a"), "G4", 22), result, error) ==
                ProofError::DRIFT_LOCK_VIOLATION);
    BOOST_CHECK(error.find("clock drift") != std::string::npos);

    // Quarantine outlives the window
    engine->ProcessBlock(uint256(), 1);
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("a"), "G4", 22)) == ProofError::DRIFT_LOCK_VIOLATION);

    BOOST_CHECK(engine->ReleaseWallet(Wallet("a")));
    BOOST_CHECK(!engine->ReleaseWallet(Wallet("a")));
    BOOST_CHECK(!engine->IsQuarantined(Wallet("a")));
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("a"), "G4", 22)) == ProofError::NONE);
}

BOOST_AUTO_TEST_CASE(configured_quarantine) {
    options.quarantined_wallets = {Wallet("x")};
    auto engine = MakeEngine();
    BOOST_CHECK_EQUAL(engine->GetOptions().quarantined_wallets.size(), 1u);
    BOOST_CHECK(engine->IsQuarantined(Wallet("x")));
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("x"), "G4", 22)) == ProofError::DRIFT_LOCK_VIOLATION);
}

BOOST_AUTO_TEST_CASE(entropy_attestation) {
    auto engine = MakeEngine();
    auto registry = entropy::HardwareProfileRegistry::create_default();

    MiningProof genuine = MakeProof(Wallet("a"), "PowerPC G4", 22);
    genuine.entropy_attestation = EntropyAttestation{"G4", entropy::test::MakeGenuineProof(*registry->find_profile("G4"))};
    BOOST_CHECK(Submit(*engine, genuine) == ProofError::NONE);

    MiningProof emulated = MakeProof(Wallet("b"), "PowerPC G4", 23);
    emulated.entropy_attestation = EntropyAttestation{"G4", entropy::test::MakeEmulatedProof()};
    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine->SubmitProof(emulated, result, error) == ProofError::EMULATION_DETECTED);
    BOOST_CHECK(error.find("Total entropy score too low") != std::string::npos);

    MiningProof unknown = MakeProof(Wallet("c"), "VAX 11/780", 45);
    unknown.entropy_attestation = EntropyAttestation{"VAX", entropy::test::MakeEmulatedProof()};
    BOOST_CHECK(Submit(*engine, unknown) == ProofError::EMULATION_DETECTED);

    // Rejected proofs leave no binding behind
    BOOST_CHECK_EQUAL(bindings->Count(), 1u);
}

BOOST_AUTO_TEST_CASE(entropy_proof_required) {
    options.require_entropy_proof = true;
    auto engine = MakeEngine();
    auto registry = entropy::HardwareProfileRegistry::create_default();

    SubmitResult result;
    std::string error;
    BOOST_CHECK(engine->SubmitProof(MakeProof(Wallet("a"), "G4", 22), result, error) ==
                ProofError::EMULATION_DETECTED);
    BOOST_CHECK(error.find("entropy proof required") != std::string::npos);

    MiningProof attested = MakeProof(Wallet("a"), "G4", 22);
    attested.entropy_attestation = EntropyAttestation{"G4", entropy::test::MakeGenuineProof(*registry->find_profile("G4"))};
    BOOST_CHECK(Submit(*engine, attested) == ProofError::NONE);
}

BOOST_AUTO_TEST_CASE(status_report) {
    auto engine = MakeEngine();
    BlockStatus status = engine->GetStatus();
    BOOST_CHECK_EQUAL(status.pending_proofs, 0u);
    BOOST_CHECK_EQUAL(status.total_multipliers, 0.0);
    BOOST_CHECK_EQUAL(status.time_remaining, 120);
    BOOST_CHECK(status.accepting_proofs);

    Submit(*engine, MakeProof(Wallet("a"), "G4", 22));
    Submit(*engine, MakeProof(Wallet("b"), "486", 35));
    *now += 45;

    status = engine->GetStatus();
    BOOST_CHECK_EQUAL(status.pending_proofs, 2u);
    BOOST_CHECK_CLOSE(status.total_multipliers, 6.0, 1e-9);
    BOOST_CHECK_EQUAL(status.block_age, 45);
    BOOST_CHECK_EQUAL(status.time_remaining, 75);
}

BOOST_AUTO_TEST_CASE(empty_window_resets) {
    auto engine = MakeEngine();
    *now += 500;
    BOOST_CHECK(!engine->ProcessBlock(uint256(), 1));

    BlockStatus status = engine->GetStatus();
    BOOST_CHECK_EQUAL(status.block_age, 0);
    BOOST_CHECK(status.accepting_proofs);
    BOOST_CHECK(Submit(*engine, MakeProof(Wallet("a"), "G4", 22)) == ProofError::NONE);
}

BOOST_AUTO_TEST_CASE(validator_lottery) {
    std::mt19937_64 rng(2025);
    BOOST_CHECK(!SelectBlockValidator({}, rng));

    std::vector<ValidatedProof> proofs(2);
    proofs[0].wallet = Wallet("light");
    proofs[0].multiplier = 0.5;
    proofs[1].wallet = Wallet("heavy");
    proofs[1].multiplier = 3.5;

    std::map<std::string, int> wins;
    for (int i = 0; i < 4000; i++) {
        std::optional<ValidatedProof> winner = SelectBlockValidator(proofs, rng);
        BOOST_REQUIRE(winner);
        wins[winner->wallet]++;
    }
    // Expected split 500 / 3500
    BOOST_CHECK(wins[Wallet("light")] > 300 && wins[Wallet("light")] < 700);
    BOOST_CHECK_EQUAL(wins[Wallet("light")] + wins[Wallet("heavy")], 4000);

    // Same seed, same winner
    std::mt19937_64 a(11), b(11);
    BOOST_CHECK_EQUAL(SelectBlockValidator(proofs, a)->wallet, SelectBlockValidator(proofs, b)->wallet);

    // All-zero weights fall back to a uniform pick
    proofs[0].multiplier = 0.0;
    proofs[1].multiplier = 0.0;
    BOOST_CHECK(SelectBlockValidator(proofs, rng));
}

BOOST_AUTO_TEST_SUITE_END()
