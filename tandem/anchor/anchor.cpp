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

#include <tandem/anchor/anchor.hpp>
#include <tandem/anchor/anchor_error.hpp>
#include <tandem/core/assert.h>
#include <tandem/core/fmt/bytes_fmt.hpp>
#include <tandem/core/likely.h>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

TANDEM_NAMESPACE_BEGIN

Anchor::Anchor(AnchorConfig const &config)
    : config_{config}
    , latest_block_height_{config.initial_block_height}
{
    TANDEM_ASSERT(config_.max_state_roots > 0);
    state_roots_.emplace(
        config_.initial_block_height, config_.initial_state_root);
}

Result<void> Anchor::anchor_state_root(
    Address const &msg_sender, uint64_t const block_height,
    bytes32_t const &state_root)
{
    if (TANDEM_UNLIKELY(msg_sender != config_.owner)) {
        return AnchorError::Unauthorized;
    }
    if (TANDEM_UNLIKELY(state_root == bytes32_t{})) {
        return AnchorError::ZeroStateRoot;
    }
    if (TANDEM_UNLIKELY(block_height <= latest_block_height_)) {
        return AnchorError::HeightNotIncreasing;
    }

    state_roots_.emplace(block_height, state_root);
    latest_block_height_ = block_height;
    while (state_roots_.size() > config_.max_state_roots) {
        state_roots_.erase(state_roots_.begin());
    }

    LOG_DEBUG("Anchored state root {} at height {}", state_root, block_height);
    return outcome::success();
}

bytes32_t Anchor::get_state_root(uint64_t const block_height) const
{
    auto const it = state_roots_.find(block_height);
    return it == state_roots_.end() ? bytes32_t{} : it->second;
}

uint64_t Anchor::get_latest_state_root_block_height() const
{
    return latest_block_height_;
}

TANDEM_NAMESPACE_END
