#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include "gtest/gtest.h"
#include "adapters/plaintext_decryption_oracle.hpp"
#include "adapters/simulated_market.hpp"
#include "core/exceptions.hpp"
#include "protocol_fixture.hpp"

using namespace orion;
using namespace orion::testing;

namespace {

Intent split_intent(const AssetId& first, const AssetId& second) {
    return Intent{IntentEntry{first, INTENT_SCALE / 2}, IntentEntry{second, INTENT_SCALE / 2}};
}

struct KeeperStep {
    Orchestrator owner = Orchestrator::STATES;
    UpkeepPayload payload;
};

struct ProtocolSnapshot {
    Phase phase = Phase::IDLE;
    std::size_t cursor = 0;
    std::uint64_t epoch_counter = 0;
    std::uint64_t last_processed_epoch = 0;
    Timestamp last_epoch_start = 0;
    std::size_t records = 0;
    std::size_t sells = 0;
    std::size_t buys = 0;
    LiquidityLedger ledger;
    std::map<VaultId, Amount> total_assets;
    std::map<VaultId, Amount> total_supply;
    std::map<VaultId, Portfolio> portfolios;
};

struct EpochOutcome {
    std::map<VaultId, Amount> total_assets;
    std::map<VaultId, Amount> total_supply;
    std::map<VaultId, Portfolio> portfolios;
    LiquidityLedger ledger;
    std::size_t steps = 0;
};

} // namespace

// Full epochs against the simulated market and the plaintext oracle.
class EpochSimulationTest : public ::testing::Test {
protected:
    EpochSimulationTest() : market("USDC", 6) {
        market.set_price("WETH", PriceQuote{Amount(1000), 0}, 18);
    }

    void start(std::size_t rounds_until_resolved = 0, const ProtocolParameters& parameters = test_parameters()) {
        harness.reset();
        oracle = std::make_unique<PlaintextDecryptionOracle>(rounds_until_resolved);
        harness = std::make_unique<ProtocolHarness>(market, market, *oracle, parameters);
    }

    Protocol& protocol() { return harness->protocol; }

    std::size_t run_epoch(std::uint64_t n) { return protocol().run_keeper(ProtocolHarness::epoch_time(n)); }

    EpochOutcome run_three_vaults(std::size_t minibatch_size) {
        ProtocolParameters parameters = test_parameters();
        parameters.minibatch_size = minibatch_size;
        start(0, parameters);

        Vault& growth = harness->create_vault("growth");
        growth.submit_intent(CURATOR, single_asset_intent("WETH"));
        growth.request_deposit(ALICE, usdc(100));
        Vault& balanced = harness->create_vault("balanced");
        balanced.submit_intent(CURATOR, split_intent("WETH", "USDC"));
        balanced.request_deposit(BOB, usdc(40));
        Vault& hidden = harness->create_vault("hidden", VaultType::ENCRYPTED);
        hidden.submit_encrypted_intent(CURATOR, PlaintextDecryptionOracle::encode_intent(split_intent("WETH", "USDC")));
        hidden.request_deposit(ALICE, usdc(7));

        EpochOutcome outcome;
        outcome.steps = run_epoch(1);
        for (const auto& id : {"growth", "balanced", "hidden"}) {
            const Vault& vault = harness->vault(id);
            outcome.total_assets[id] = vault.total_assets();
            outcome.total_supply[id] = vault.total_supply();
            outcome.portfolios[id] = vault.portfolio();
        }
        outcome.ledger = protocol().ledger();
        return outcome;
    }

    std::optional<KeeperStep> next_step(Timestamp now) {
        for (const auto owner : {Orchestrator::STATES, Orchestrator::LIQUIDITY}) {
            const UpkeepCheck check = owner == Orchestrator::STATES ? protocol().states().check_upkeep(now)
                                                                    : protocol().liquidity().check_upkeep(now);
            if (check.needed) {
                return KeeperStep{owner, decode_payload(check.payload)};
            }
        }
        return std::nullopt;
    }

    void perform(const KeeperStep& step, Timestamp now) {
        if (step.owner == Orchestrator::STATES) {
            protocol().states().perform_upkeep(KEEPER, encode_payload(step.payload), now);
        } else {
            protocol().liquidity().perform_upkeep(KEEPER, encode_payload(step.payload), now);
        }
    }

    ProtocolSnapshot snapshot() {
        const EpochState& state = protocol().epoch_state();
        ProtocolSnapshot snap;
        snap.phase = state.phase;
        snap.cursor = state.cursor;
        snap.epoch_counter = state.epoch_counter;
        snap.last_processed_epoch = state.last_processed_epoch;
        snap.last_epoch_start = state.last_epoch_start;
        snap.records = state.records.size();
        snap.sells = state.orders.sells.size();
        snap.buys = state.orders.buys.size();
        snap.ledger = protocol().ledger();
        for (const auto& id : protocol().vaults().all_vault_ids()) {
            const Vault& vault = harness->vault(id);
            snap.total_assets[id] = vault.total_assets();
            snap.total_supply[id] = vault.total_supply();
            snap.portfolios[id] = vault.portfolio();
        }
        return snap;
    }

    void expect_unchanged(const ProtocolSnapshot& before, const std::string& context) {
        SCOPED_TRACE(context);
        const ProtocolSnapshot after = snapshot();
        EXPECT_EQ(after.phase, before.phase);
        EXPECT_EQ(after.cursor, before.cursor);
        EXPECT_EQ(after.epoch_counter, before.epoch_counter);
        EXPECT_EQ(after.last_processed_epoch, before.last_processed_epoch);
        EXPECT_EQ(after.last_epoch_start, before.last_epoch_start);
        EXPECT_EQ(after.records, before.records);
        EXPECT_EQ(after.sells, before.sells);
        EXPECT_EQ(after.buys, before.buys);
        EXPECT_EQ(after.ledger.holdings, before.ledger.holdings);
        EXPECT_EQ(after.ledger.cash, before.ledger.cash);
        EXPECT_EQ(after.ledger.buffer, before.ledger.buffer);
        EXPECT_EQ(after.ledger.reserved, before.ledger.reserved);
        EXPECT_EQ(after.ledger.protocol_fees, before.ledger.protocol_fees);
        EXPECT_EQ(after.total_assets, before.total_assets);
        EXPECT_EQ(after.total_supply, before.total_supply);
        EXPECT_EQ(after.portfolios, before.portfolios);
    }

    // Steps one epoch by hand. Before every legal step, replays the previous payload and jumps
    // one phase ahead; both must be rejected without touching any state.
    void step_epoch_rejecting_out_of_order(Timestamp now, std::optional<KeeperStep>& previous,
                                           std::set<std::pair<Orchestrator, Phase>>& visited) {
        for (std::size_t guard = 0; guard < 64; ++guard) {
            const std::optional<KeeperStep> step = next_step(now);
            if (!step) {
                return;
            }
            const Phase phase = protocol().epoch_state().phase;
            visited.insert({step->owner, phase});
            const std::string context = to_string(step->owner) + " in " + to_string(phase);
            const ProtocolSnapshot before = snapshot();

            KeeperStep skip = *step;
            const Phase following = find_transition(step->owner, phase)->to;
            skip.payload.action = find_transition(step->owner, following)->action;
            skip.payload.minibatch = 0;
            EXPECT_THROW(perform(skip, now), InvalidStateError) << "skip to " << to_string(skip.payload.action)
                                                                << ", " << context;
            expect_unchanged(before, "skip, " + context);

            if (previous) {
                EXPECT_THROW(perform(*previous, now), InvalidStateError)
                    << "replay of " << to_string(previous->payload.action) << ", " << context;
                expect_unchanged(before, "replay, " + context);
            }

            perform(*step, now);
            previous = step;
        }
        FAIL() << "epoch did not settle";
    }

    SimulatedMarket market;
    std::unique_ptr<PlaintextDecryptionOracle> oracle;
    std::unique_ptr<ProtocolHarness> harness;
};

TEST_F(EpochSimulationTest, RedemptionsPriceBeforeDeposits) {
    start();
    protocol().liquidity().deposit_liquidity(ADMIN, usdc(1));
    Vault& vault = harness->create_vault("v1");
    vault.submit_intent(CURATOR, single_asset_intent("WETH"));
    vault.request_deposit(ALICE, usdc(100));
    run_epoch(1);
    ASSERT_TRUE(protocol().is_system_idle());
    ASSERT_EQ(protocol().ledger().holding("WETH"), Amount("100000000000000000"));

    market.set_price("WETH", PriceQuote{Amount(990), 0}, 18);
    vault.request_redeem(ALICE, Amount("90000000000000000000"));
    vault.request_deposit(BOB, usdc(10));
    run_epoch(2);
    ASSERT_TRUE(protocol().is_system_idle());

    // 90% of 99 USDC goes out, the deposit joins at 9.9 USDC for 10 shares
    EXPECT_EQ(vault.claimable_redemption(ALICE), Amount(89100000));
    EXPECT_EQ(vault.share_balance(BOB), Amount("10101010090807061534"));
    EXPECT_EQ(vault.total_supply(), Amount("20101010090807061534"));
    EXPECT_EQ(vault.total_assets(), Amount(19900000));
    EXPECT_EQ(vault.portfolio().at("WETH"), Amount("20101010101010101"));
    EXPECT_EQ(vault.portfolio().at("USDC"), Amount(1));

    const auto trades = market.trades();
    ASSERT_EQ(trades.size(), 2u);
    EXPECT_EQ(trades[1].side, OrderSide::SELL);
    EXPECT_EQ(trades[1].amount, Amount("79898989898989899"));
    EXPECT_EQ(trades[1].underlying, Amount(79100000));

    EXPECT_EQ(protocol().ledger().buffer, Amount(999999));
    EXPECT_EQ(vault.underlying_balance(), Amount(89100000));
    EXPECT_EQ(vault.claim_redemption(ALICE), Amount(89100000));
    EXPECT_EQ(vault.underlying_balance(), Amount(0));
}

TEST_F(EpochSimulationTest, EncryptedIntentsResolveAcrossKeeperRuns) {
    start(2);
    Vault& open = harness->create_vault("t1");
    open.submit_intent(CURATOR, single_asset_intent("WETH"));
    open.request_deposit(ALICE, usdc(100));
    Vault& sealed = harness->create_vault("e1", VaultType::ENCRYPTED);
    sealed.submit_encrypted_intent(CURATOR, PlaintextDecryptionOracle::encode_intent(split_intent("WETH", "USDC")));
    sealed.request_deposit(BOB, usdc(50));

    run_epoch(1);
    EXPECT_EQ(protocol().epoch_state().phase, Phase::PREPROCESSING_ENCRYPTED_VAULTS);
    EXPECT_EQ(oracle->pending_requests(), 1u);
    EXPECT_FALSE(protocol().is_system_idle());

    // repeated keeper runs do not hurry the oracle
    EXPECT_EQ(run_epoch(1), 0u);
    EXPECT_EQ(run_epoch(1), 0u);
    oracle->advance_round();
    EXPECT_EQ(run_epoch(1), 0u);
    EXPECT_EQ(oracle->pending_requests(), 1u);

    oracle->advance_round();
    EXPECT_GT(run_epoch(1), 0u);
    ASSERT_TRUE(protocol().is_system_idle());
    EXPECT_EQ(oracle->pending_requests(), 0u);

    ASSERT_EQ(sealed.intent().size(), 2u);
    EXPECT_EQ(sealed.intent()[0].asset, "WETH");
    EXPECT_FALSE(sealed.encrypted_intent().has_value());

    // 1 bps of 150 USDC charged pro rata to fill the buffer
    EXPECT_EQ(open.total_assets(), Amount(99990000));
    EXPECT_EQ(sealed.total_assets(), Amount(49995000));
    EXPECT_EQ(sealed.portfolio().at("WETH"), Amount("24997500000000000"));
    EXPECT_EQ(sealed.portfolio().at("USDC"), Amount(24997500));

    EXPECT_EQ(market.trades().size(), 1u);
    EXPECT_EQ(protocol().ledger().holding("WETH"), Amount("124987500000000000"));
    EXPECT_EQ(protocol().ledger().cash, Amount(25012500));
    EXPECT_EQ(protocol().ledger().buffer, Amount(15000));
}

TEST_F(EpochSimulationTest, UndecodableIntentKeepsPreviousAllocation) {
    start();
    Vault& sealed = harness->create_vault("e1", VaultType::ENCRYPTED);
    sealed.submit_encrypted_intent(CURATOR, PlaintextDecryptionOracle::encode_intent(single_asset_intent("WETH")));
    sealed.request_deposit(ALICE, usdc(100));
    run_epoch(1);
    ASSERT_TRUE(protocol().is_system_idle());
    const Portfolio before = sealed.portfolio();

    sealed.submit_encrypted_intent(CURATOR, "not an intent");
    run_epoch(2);
    ASSERT_TRUE(protocol().is_system_idle());

    ASSERT_EQ(sealed.intent().size(), 1u);
    EXPECT_EQ(sealed.intent()[0].asset, "WETH");
    EXPECT_EQ(sealed.portfolio(), before);
    EXPECT_EQ(market.trades().size(), 1u);
}

TEST_F(EpochSimulationTest, MinibatchSizeDoesNotChangeOutcome) {
    const EpochOutcome batched = run_three_vaults(1);
    const EpochOutcome single = run_three_vaults(8);

    EXPECT_GT(batched.steps, single.steps);
    EXPECT_EQ(batched.total_assets, single.total_assets);
    EXPECT_EQ(batched.total_supply, single.total_supply);
    EXPECT_EQ(batched.portfolios, single.portfolios);
    EXPECT_EQ(batched.ledger.holdings, single.ledger.holdings);
    EXPECT_EQ(batched.ledger.cash, single.ledger.cash);
    EXPECT_EQ(batched.ledger.buffer, single.ledger.buffer);
}

TEST_F(EpochSimulationTest, PauseStopsKeeperMidEpoch) {
    start();
    Vault& vault = harness->create_vault("v1");
    vault.submit_intent(CURATOR, single_asset_intent("WETH"));
    vault.request_deposit(ALICE, usdc(100));

    protocol().states().perform_upkeep(KEEPER, payload(Action::START_EPOCH, 0), ProtocolHarness::epoch_time(1));
    protocol().config().pause_all(GUARDIAN);
    EXPECT_EQ(run_epoch(1), 0u);
    EXPECT_THROW(vault.request_deposit(BOB, usdc(1)), ProtocolPausedError);

    protocol().config().unpause_all(ADMIN);
    EXPECT_GT(run_epoch(1), 0u);
    EXPECT_TRUE(protocol().is_system_idle());
    EXPECT_EQ(vault.total_supply(), Amount("100000000000000000000"));
}

TEST_F(EpochSimulationTest, PriceMovesFlowIntoValuation) {
    start();
    protocol().liquidity().deposit_liquidity(ADMIN, usdc(1));
    Vault& vault = harness->create_vault("v1");
    vault.submit_intent(CURATOR, single_asset_intent("WETH"));
    vault.request_deposit(ALICE, usdc(100));
    run_epoch(1);

    market.set_price("WETH", PriceQuote{Amount(1200), 0}, 18);
    run_epoch(2);
    ASSERT_TRUE(protocol().is_system_idle());

    // 0.1 WETH at 1200, nothing to trade
    EXPECT_EQ(vault.total_assets(), Amount(120000000));
    EXPECT_EQ(vault.portfolio().at("WETH"), Amount("100000000000000000"));
    EXPECT_EQ(market.trades().size(), 1u);
    EXPECT_EQ(vault.convert_to_assets(Amount("100000000000000000000")), Amount(119999999));
}

TEST_F(EpochSimulationTest, OutOfOrderPayloadsAreRejectedInEveryPhase) {
    start();
    market.set_price("WBTC", PriceQuote{Amount(60000), 0}, 8);
    AssetInfo wbtc;
    wbtc.decimals = 8;
    wbtc.dust_threshold = Amount(1);
    protocol().config().add_whitelisted_asset(ADMIN, "WBTC", wbtc);

    Vault& open = harness->create_vault("t1");
    open.submit_intent(CURATOR, single_asset_intent("WETH"));
    open.request_deposit(ALICE, usdc(100));
    Vault& sealed = harness->create_vault("e1", VaultType::ENCRYPTED);
    sealed.submit_encrypted_intent(CURATOR, PlaintextDecryptionOracle::encode_intent(split_intent("WETH", "USDC")));
    sealed.request_deposit(BOB, usdc(50));

    std::optional<KeeperStep> previous;
    std::set<std::pair<Orchestrator, Phase>> visited;
    step_epoch_rejecting_out_of_order(ProtocolHarness::epoch_time(1), previous, visited);
    ASSERT_TRUE(protocol().is_system_idle());

    // second epoch sells WETH and buys WBTC so every liquidity phase has work
    open.submit_intent(CURATOR, single_asset_intent("WBTC"));
    sealed.submit_encrypted_intent(CURATOR, PlaintextDecryptionOracle::encode_intent(split_intent("WETH", "USDC")));
    step_epoch_rejecting_out_of_order(ProtocolHarness::epoch_time(2), previous, visited);
    ASSERT_TRUE(protocol().is_system_idle());
    EXPECT_EQ(market.trades().size(), 3u);

    for (const auto& transition : transition_table()) {
        EXPECT_EQ(visited.count({transition.owner, transition.from}), 1u)
            << to_string(transition.owner) << " never stepped from " << to_string(transition.from);
    }

    // settled: the last deposit and a jump past the next start both bounce
    const ProtocolSnapshot settled = snapshot();
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(previous->payload.action, Action::DEPOSIT);
    EXPECT_THROW(perform(*previous, ProtocolHarness::epoch_time(2)), InvalidStateError);
    KeeperStep skip{Orchestrator::STATES, previous->payload};
    skip.payload.action = Action::PREPROCESS_TRANSPARENT;
    skip.payload.minibatch = 0;
    EXPECT_THROW(perform(skip, ProtocolHarness::epoch_time(3)), InvalidStateError);
    expect_unchanged(settled, "settled");
}

TEST_F(EpochSimulationTest, MarketFillsAroundTheQuote) {
    SimulatedMarket venue("USDC", 6, 100);
    venue.set_price("WETH", PriceQuote{Amount(2000), 0}, 18);

    EXPECT_EQ(venue.execute(OrderSide::SELL, "WETH", Amount("1000000000000000000"), Amount(1980000000)),
              Amount(1980000000));
    EXPECT_EQ(venue.execute(OrderSide::BUY, "WETH", Amount("500000000000000000"), Amount(1010000000)),
              Amount(1010000000));
    EXPECT_THROW(venue.execute(OrderSide::SELL, "WETH", Amount("1000000000000000000"), Amount(1980000001)),
                 ExecutionError);
    EXPECT_THROW(venue.quote("WBTC"), ValidationError);

    // a copy keeps its own trade log
    SimulatedMarket replay = venue;
    replay.set_slippage_bps(0);
    replay.execute(OrderSide::SELL, "WETH", Amount("1000000000000000000"), Amount(2000000000));
    EXPECT_EQ(venue.trades().size(), 2u);
    EXPECT_EQ(replay.trades().size(), 3u);
    EXPECT_EQ(replay.trades().back().underlying, Amount(2000000000));
}
