#include <tandem/anchor/anchor.hpp>
#include <tandem/bus/message.hpp>
#include <tandem/bus/message_box.hpp>
#include <tandem/core/address.hpp>
#include <tandem/core/byte_string.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/fmt/address_fmt.hpp>
#include <tandem/core/fmt/bytes_fmt.hpp>
#include <tandem/core/fmt/int_fmt.hpp>
#include <tandem/core/int.hpp>
#include <tandem/core/log_level_map.hpp>
#include <tandem/core/result.hpp>
#include <tandem/gateway/co_gateway.hpp>
#include <tandem/gateway/constants.hpp>
#include <tandem/gateway/gateway.hpp>
#include <tandem/gateway/gateway_config.hpp>
#include <tandem/gateway/intent.hpp>
#include <tandem/state/state.hpp>
#include <tandem/token/eip20_token.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <CLI/CLI.hpp>
#include <quill/Quill.h>
#include <quill/bundled/fmt/core.h>
#include <quill/bundled/fmt/format.h>

#include <cstdint>
#include <functional>
#include <map>
#include <string>

using namespace tandem;

namespace
{
    constexpr auto GATEWAY =
        0x00000000000000000000000000000000000a7e00_address;
    constexpr auto VALUE_TOKEN =
        0x0000000000000000000000000000000000007a10_address;
    constexpr auto STAKE_VAULT =
        0x000000000000000000000000000000000000fa17_address;
    constexpr auto CO_GATEWAY =
        0x00000000000000000000000000000000000c0a7e_address;
    constexpr auto UTILITY_TOKEN =
        0x0000000000000000000000000000000000007a20_address;
    constexpr auto ORGANIZATION =
        0x000000000000000000000000000000000000016a_address;
    constexpr auto ANCHOR_OWNER =
        0x00000000000000000000000000000000000a4c40_address;
    constexpr auto BURNER =
        0x000000000000000000000000000000000000dead_address;
    constexpr auto STAKER =
        0x00000000000000000000000000000000005a4e00_address;
    constexpr auto BENEFICIARY =
        0x0000000000000000000000000000000000be4e00_address;
    constexpr auto FACILITATOR =
        0x0000000000000000000000000000000000fac111_address;

    constexpr auto GATEWAY_CODE_HASH =
        0x2f6d7a3c9b1e8f4a5d0c6b3e7a2f1d9c8b4e5a6f7d3c2b1a0e9f8d7c6b5a4e3d_bytes32;
    constexpr auto LINK_SECRET =
        0x6c696e6b5f7365637265740000000000000000000000000000000000000000aa_bytes32;
    constexpr auto SECRET =
        0x1d5b16860e7306df9e2d3ee077d6f3e3c4a4b5fe22f2c9b0c9a1d2e3f4a5b6c7_bytes32;

    struct SimConfig
    {
        uint64_t amount{1000};
        uint64_t gas_price{2};
        uint64_t gas_limit{100};
        uint64_t bounty{100};
    };

    // Origin and auxiliary chain, each with its gateway, token and an anchor
    // of the other chain
    class Simulation
    {
        SimConfig const config_;

        State origin_;
        State auxiliary_;
        Anchor origin_anchor_{AnchorConfig{.owner = ANCHOR_OWNER}};
        Anchor auxiliary_anchor_{AnchorConfig{.owner = ANCHOR_OWNER}};
        EIP20Token value_token_{origin_, VALUE_TOKEN, ORGANIZATION};
        EIP20Token utility_token_{auxiliary_, UTILITY_TOKEN, CO_GATEWAY};
        Gateway gateway_;
        CoGateway co_gateway_;
        uint256_t stake_nonce_{0};
        uint256_t redeem_nonce_{0};

        GatewayConfig gateway_config(Address const &counterpart) const
        {
            return GatewayConfig{
                .value_token = VALUE_TOKEN,
                .bounty = config_.bounty,
                .organization = ORGANIZATION,
                .burner = BURNER,
                .counterpart = counterpart,
                .stake_vault = STAKE_VAULT,
                .token_name = "Value Token",
                .token_symbol = "VT",
                .decimals = 18};
        }

        uint256_t penalty() const
        {
            return uint256_t{config_.bounty} * REVOCATION_PENALTY / 100;
        }

        Result<uint64_t> relay_origin()
        {
            uint64_t const height = origin_.commit_block();
            BOOST_OUTCOME_TRY(origin_anchor_.anchor_state_root(
                ANCHOR_OWNER, height, origin_.state_root()));
            BOOST_OUTCOME_TRY(co_gateway_.prove_gateway(
                height,
                origin_.encode_account(GATEWAY),
                origin_.prove_account(GATEWAY)));
            return height;
        }

        Result<uint64_t> relay_auxiliary()
        {
            uint64_t const height = auxiliary_.commit_block();
            BOOST_OUTCOME_TRY(auxiliary_anchor_.anchor_state_root(
                ANCHOR_OWNER, height, auxiliary_.state_root()));
            BOOST_OUTCOME_TRY(gateway_.prove_gateway(
                height,
                auxiliary_.encode_account(CO_GATEWAY),
                auxiliary_.prove_account(CO_GATEWAY)));
            return height;
        }

        byte_string
        prove_origin(BoxSide const side, bytes32_t const &message_hash) const
        {
            return origin_.prove_storage(
                GATEWAY, MessageBox::slot(side, message_hash));
        }

        byte_string
        prove_auxiliary(BoxSide const side, bytes32_t const &message_hash) const
        {
            return auxiliary_.prove_storage(
                CO_GATEWAY, MessageBox::slot(side, message_hash));
        }

        Result<bytes32_t> declare_stake()
        {
            BOOST_OUTCOME_TRY(
                value_token_.approve(STAKER, GATEWAY, config_.amount));
            BOOST_OUTCOME_TRY(
                auto const message_hash,
                gateway_.stake(
                    STAKER,
                    config_.bounty,
                    config_.amount,
                    BENEFICIARY,
                    config_.gas_price,
                    config_.gas_limit,
                    stake_nonce_,
                    to_hash_lock(SECRET)));
            BOOST_OUTCOME_TRY(auto const height, relay_origin());
            BOOST_OUTCOME_TRY(co_gateway_.confirm_stake_intent(
                FACILITATOR,
                STAKER,
                stake_nonce_,
                BENEFICIARY,
                config_.amount,
                config_.gas_price,
                config_.gas_limit,
                to_hash_lock(SECRET),
                height,
                prove_origin(BoxSide::Outbox, message_hash)));
            ++stake_nonce_;
            LOG_INFO("Stake {} declared and confirmed", message_hash);
            return message_hash;
        }

        Result<bytes32_t> declare_redeem(uint256_t const &amount)
        {
            BOOST_OUTCOME_TRY(
                utility_token_.approve(BENEFICIARY, CO_GATEWAY, amount));
            BOOST_OUTCOME_TRY(
                auto const message_hash,
                co_gateway_.redeem(
                    BENEFICIARY,
                    config_.bounty,
                    amount,
                    STAKER,
                    config_.gas_price,
                    config_.gas_limit,
                    redeem_nonce_,
                    to_hash_lock(SECRET)));
            BOOST_OUTCOME_TRY(auto const height, relay_auxiliary());
            BOOST_OUTCOME_TRY(gateway_.confirm_redeem_intent(
                FACILITATOR,
                BENEFICIARY,
                redeem_nonce_,
                STAKER,
                amount,
                config_.gas_price,
                config_.gas_limit,
                to_hash_lock(SECRET),
                height,
                prove_auxiliary(BoxSide::Outbox, message_hash)));
            ++redeem_nonce_;
            LOG_INFO("Redeem {} declared and confirmed", message_hash);
            return message_hash;
        }

        // Redeems half of what the beneficiary holds
        uint256_t redeemable()
        {
            return utility_token_.balance_of(BENEFICIARY) / 2;
        }

    public:
        explicit Simulation(SimConfig const &config)
            : config_{config}
            , gateway_{
                  origin_,
                  GATEWAY,
                  gateway_config(CO_GATEWAY),
                  auxiliary_anchor_,
                  value_token_}
            , co_gateway_{
                  auxiliary_,
                  CO_GATEWAY,
                  gateway_config(GATEWAY),
                  origin_anchor_,
                  utility_token_}
        {
        }

        Result<void> setup()
        {
            origin_.create_contract(GATEWAY, GATEWAY_CODE_HASH);
            auxiliary_.create_contract(CO_GATEWAY, GATEWAY_CODE_HASH);

            uint256_t const funds = uint256_t{config_.amount} * 10 +
                                    uint256_t{config_.bounty} * 10;
            BOOST_OUTCOME_TRY(value_token_.mint(ORGANIZATION, STAKER, funds));
            BOOST_OUTCOME_TRY(
                value_token_.approve(STAKE_VAULT, GATEWAY, funds));
            for (auto const &account : {STAKER, BENEFICIARY, FACILITATOR}) {
                origin_.add_to_balance(account, funds);
                auxiliary_.add_to_balance(account, funds);
            }

            auto const hash_lock = to_hash_lock(LINK_SECRET);
            BOOST_OUTCOME_TRY(
                auto const link_hash,
                gateway_.initiate_gateway_link(ORGANIZATION, 0, hash_lock));
            BOOST_OUTCOME_TRY(auto const height, relay_origin());
            BOOST_OUTCOME_TRY(co_gateway_.confirm_gateway_link_intent(
                FACILITATOR,
                hash_gateway_link_intent(
                    GATEWAY,
                    CO_GATEWAY,
                    config_.bounty,
                    "Value Token",
                    "VT",
                    18,
                    0,
                    VALUE_TOKEN),
                0,
                ORGANIZATION,
                hash_lock,
                height,
                prove_origin(BoxSide::Outbox, link_hash)));
            BOOST_OUTCOME_TRY(gateway_.progress_gateway_link(
                ORGANIZATION, link_hash, LINK_SECRET));
            BOOST_OUTCOME_TRY(co_gateway_.progress_gateway_link(
                FACILITATOR, link_hash, LINK_SECRET));
            BOOST_OUTCOME_TRY(gateway_.activate_gateway(ORGANIZATION));
            return outcome::success();
        }

        Result<void> stake()
        {
            BOOST_OUTCOME_TRY(auto const message_hash, declare_stake());
            BOOST_OUTCOME_TRY(
                co_gateway_.progress_mint(FACILITATOR, message_hash, SECRET));
            BOOST_OUTCOME_TRY(
                gateway_.progress_stake(FACILITATOR, message_hash, SECRET));
            return outcome::success();
        }

        Result<void> stake_with_proof()
        {
            BOOST_OUTCOME_TRY(auto const message_hash, declare_stake());
            BOOST_OUTCOME_TRY(
                gateway_.progress_stake(FACILITATOR, message_hash, SECRET));
            BOOST_OUTCOME_TRY(auto const height, relay_origin());
            BOOST_OUTCOME_TRY(co_gateway_.progress_mint_with_proof(
                FACILITATOR,
                message_hash,
                prove_origin(BoxSide::Outbox, message_hash),
                height,
                MessageStatus::Progressed));
            return outcome::success();
        }

        Result<void> revert_stake()
        {
            BOOST_OUTCOME_TRY(auto const message_hash, declare_stake());
            BOOST_OUTCOME_TRY(
                gateway_.revert_stake(STAKER, penalty(), message_hash));
            BOOST_OUTCOME_TRY(auto const origin_height, relay_origin());
            BOOST_OUTCOME_TRY(
                auto const reverted,
                co_gateway_.confirm_revert_stake_intent(
                    FACILITATOR,
                    message_hash,
                    origin_height,
                    prove_origin(BoxSide::Outbox, message_hash)));
            LOG_INFO(
                "Revocation of stake {} of {} by {} (nonce {}) confirmed",
                message_hash,
                reverted.amount,
                reverted.sender,
                reverted.nonce);
            BOOST_OUTCOME_TRY(auto const auxiliary_height, relay_auxiliary());
            BOOST_OUTCOME_TRY(gateway_.progress_revert_stake(
                FACILITATOR,
                message_hash,
                auxiliary_height,
                prove_auxiliary(BoxSide::Inbox, message_hash)));
            return outcome::success();
        }

        Result<void> redeem()
        {
            BOOST_OUTCOME_TRY(stake());
            BOOST_OUTCOME_TRY(
                auto const message_hash, declare_redeem(redeemable()));
            BOOST_OUTCOME_TRY(
                gateway_.progress_unstake(FACILITATOR, message_hash, SECRET));
            BOOST_OUTCOME_TRY(
                co_gateway_.progress_redeem(FACILITATOR, message_hash, SECRET));
            return outcome::success();
        }

        Result<void> redeem_with_proof()
        {
            BOOST_OUTCOME_TRY(stake());
            BOOST_OUTCOME_TRY(
                auto const message_hash, declare_redeem(redeemable()));
            BOOST_OUTCOME_TRY(
                co_gateway_.progress_redeem(FACILITATOR, message_hash, SECRET));
            BOOST_OUTCOME_TRY(auto const height, relay_auxiliary());
            BOOST_OUTCOME_TRY(gateway_.progress_unstake_with_proof(
                FACILITATOR,
                message_hash,
                prove_auxiliary(BoxSide::Outbox, message_hash),
                height,
                MessageStatus::Progressed));
            return outcome::success();
        }

        Result<void> revert_redeem()
        {
            BOOST_OUTCOME_TRY(stake());
            BOOST_OUTCOME_TRY(
                auto const message_hash, declare_redeem(redeemable()));
            BOOST_OUTCOME_TRY(co_gateway_.revert_redemption(
                BENEFICIARY, penalty(), message_hash));
            BOOST_OUTCOME_TRY(auto const auxiliary_height, relay_auxiliary());
            BOOST_OUTCOME_TRY(
                auto const reverted,
                gateway_.confirm_revert_redeem_intent(
                    FACILITATOR,
                    message_hash,
                    auxiliary_height,
                    prove_auxiliary(BoxSide::Outbox, message_hash)));
            LOG_INFO(
                "Revocation of redeem {} of {} by {} (nonce {}) confirmed",
                message_hash,
                reverted.amount,
                reverted.sender,
                reverted.nonce);
            BOOST_OUTCOME_TRY(auto const origin_height, relay_origin());
            BOOST_OUTCOME_TRY(co_gateway_.progress_revert_redemption(
                FACILITATOR,
                message_hash,
                origin_height,
                prove_origin(BoxSide::Inbox, message_hash)));
            return outcome::success();
        }

        void print_summary()
        {
            fmt::println(
                "origin:    block={} gas_used={} vault={} staker={}",
                origin_.block_number(),
                origin_.gas_used(),
                value_token_.balance_of(STAKE_VAULT),
                value_token_.balance_of(STAKER));
            fmt::println(
                "auxiliary: block={} gas_used={} supply={} beneficiary={} "
                "facilitator={}",
                auxiliary_.block_number(),
                auxiliary_.gas_used(),
                utility_token_.total_supply(),
                utility_token_.balance_of(BENEFICIARY),
                utility_token_.balance_of(FACILITATOR));
            fmt::println(
                "burnt:     origin={} auxiliary={}",
                origin_.get_balance(BURNER),
                auxiliary_.get_balance(BURNER));
        }
    };
}

int main(int argc, char *argv[])
{
    SimConfig config;
    std::string scenario = "all";
    auto log_level = quill::LogLevel::Info;

    CLI::App cli{"tandem_sim"};
    cli.add_option("--amount", config.amount, "amount staked per scenario")
        ->check(CLI::PositiveNumber);
    cli.add_option("--gas-price", config.gas_price, "gas price of messages");
    cli.add_option("--gas-limit", config.gas_limit, "gas limit of messages");
    cli.add_option("--bounty", config.bounty, "bounty paid to facilitators");
    cli.add_option("--scenario", scenario, "scenario to run")
        ->check(CLI::IsMember(
            {"stake",
             "stake-proof",
             "revert-stake",
             "redeem",
             "redeem-proof",
             "revert-redeem",
             "all"}));
    cli.add_option("--log-level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    std::map<std::string, std::function<Result<void>(Simulation &)>> const
        scenarios{
            {"stake", &Simulation::stake},
            {"stake-proof", &Simulation::stake_with_proof},
            {"revert-stake", &Simulation::revert_stake},
            {"redeem", &Simulation::redeem},
            {"redeem-proof", &Simulation::redeem_with_proof},
            {"revert-redeem", &Simulation::revert_redeem},
        };

    Simulation sim{config};
    if (auto const res = sim.setup(); res.has_error()) {
        LOG_ERROR(
            "Error: failed to link gateways -- {}",
            res.error().message().c_str());
        quill::flush();
        return 1;
    }

    int status = 0;
    for (auto const &[name, run] : scenarios) {
        if (scenario != "all" && scenario != name) {
            continue;
        }
        fmt::println("Running scenario {}", name);
        if (auto const res = run(sim); res.has_error()) {
            LOG_ERROR(
                "Error: scenario {} failed -- {}",
                name,
                res.error().message().c_str());
            status = 1;
        }
    }
    sim.print_summary();

    quill::flush();
    return status;
}
