// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <tandem/core/address.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/keccak.hpp>
#include <tandem/mpt/proof.hpp>
#include <tandem/proof/proof_verifier.hpp>
#include <tandem/state/state.hpp>

#include <gtest/gtest.h>

using namespace tandem;

namespace
{
    constexpr auto GATEWAY = 0x00000000000000000000000000000000000a7e00_address;
    constexpr auto OTHER = 0x0000000000000000000000000000000000000b0b_address;

    constexpr auto CODE_HASH =
        0x2f6d7a3c9b1e8f4a5d0c6b3e7a2f1d9c8b4e5a6f7d3c2b1a0e9f8d7c6b5a4e3d_bytes32;

    constexpr auto SLOT_A =
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32;
    constexpr auto SLOT_B =
        0x0000000000000000000000000000000000000000000000000000000000000002_bytes32;

    constexpr auto LARGE_VALUE =
        0xff00000000000000000000000000000000000000000000000000000000000001_bytes32;

    bytes32_t account_path(Address const &address)
    {
        return to_bytes(keccak256(to_byte_string_view(address)));
    }
}

struct ProofVerifierTest : public ::testing::Test
{
    State state;

    void SetUp() override
    {
        state.create_contract(GATEWAY, CODE_HASH);
        state.set_storage(GATEWAY, SLOT_A, bytes32_t{4});
        state.set_storage(GATEWAY, SLOT_B, LARGE_VALUE);
        state.add_to_balance(OTHER, 100);
    }
};

TEST_F(ProofVerifierTest, account)
{
    auto const res = verify_account(
        state.encode_account(GATEWAY),
        state.prove_account(GATEWAY),
        account_path(GATEWAY),
        state.state_root());
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), state.storage_root(GATEWAY));
}

TEST_F(ProofVerifierTest, account_encoding_mismatch)
{
    auto const res = verify_account(
        state.encode_account(OTHER),
        state.prove_account(GATEWAY),
        account_path(GATEWAY),
        state.state_root());
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), mpt::ProofError::WrongMerkleProof);
}

TEST_F(ProofVerifierTest, account_wrong_state_root)
{
    auto const proof = state.prove_account(GATEWAY);
    auto const encoded = state.encode_account(GATEWAY);
    auto const root = state.state_root();

    state.add_to_balance(OTHER, 1);
    auto const res = verify_account(
        encoded, proof, account_path(GATEWAY), state.state_root());
    ASSERT_TRUE(res.has_error());

    EXPECT_TRUE(
        verify_account(encoded, proof, account_path(GATEWAY), root)
            .has_value());
}

TEST_F(ProofVerifierTest, storage)
{
    auto const root = state.storage_root(GATEWAY);

    auto res =
        verify_storage(SLOT_A, state.prove_storage(GATEWAY, SLOT_A), root);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), bytes32_t{4});

    res = verify_storage(SLOT_B, state.prove_storage(GATEWAY, SLOT_B), root);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), LARGE_VALUE);
}

TEST_F(ProofVerifierTest, storage_proof_of_other_slot)
{
    auto const res = verify_storage(
        SLOT_A,
        state.prove_storage(GATEWAY, SLOT_B),
        state.storage_root(GATEWAY));
    ASSERT_TRUE(res.has_error());
}

TEST_F(ProofVerifierTest, storage_empty_proof)
{
    auto const res =
        verify_storage(SLOT_A, byte_string{}, state.storage_root(GATEWAY));
    ASSERT_TRUE(res.has_error());
}

TEST_F(ProofVerifierTest, storage_of_proven_account)
{
    auto const storage_root = verify_account(
        state.encode_account(GATEWAY),
        state.prove_account(GATEWAY),
        account_path(GATEWAY),
        state.state_root());
    ASSERT_TRUE(storage_root.has_value());

    auto const value = verify_storage(
        SLOT_A, state.prove_storage(GATEWAY, SLOT_A), storage_root.value());
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), bytes32_t{4});
}
