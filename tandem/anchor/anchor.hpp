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

#pragma once

#include <tandem/anchor/state_root_provider.hpp>
#include <tandem/core/address.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>
#include <tandem/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <map>

TANDEM_NAMESPACE_BEGIN

struct AnchorConfig
{
    Address owner{};
    // Only the most recent roots are kept
    size_t max_state_roots{100};
    uint64_t initial_block_height{0};
    bytes32_t initial_state_root{};
};

// Keeps the state roots of the counterpart chain reported by its owner.
// Heights strictly increase, the oldest root is evicted once the buffer is
// full.
class Anchor final : public StateRootProvider
{
    AnchorConfig const config_;
    std::map<uint64_t, bytes32_t> state_roots_;
    uint64_t latest_block_height_;

public:
    explicit Anchor(AnchorConfig const &);

    Result<void> anchor_state_root(
        Address const &msg_sender, uint64_t block_height,
        bytes32_t const &state_root);

    bytes32_t get_state_root(uint64_t block_height) const override;
    uint64_t get_latest_state_root_block_height() const override;
};

TANDEM_NAMESPACE_END
