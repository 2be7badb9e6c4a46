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

#include <tandem/core/address.hpp>
#include <tandem/core/bytes.hpp>
#include <tandem/core/config.hpp>
#include <tandem/core/int.hpp>
#include <tandem/state/state.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstring>
#include <optional>
#include <type_traits>

TANDEM_NAMESPACE_BEGIN

// Typed view over `N` consecutive storage slots of a contract, starting at
// `offset`. Values are copied in and out, nothing aliases the storage.
template <typename T>
    requires std::is_trivially_copyable_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);

private:
    struct Adapter
    {
        union
        {
            struct
            {
                bytes32_t raw[N];

                constexpr bytes32_t &operator[](size_t const i) noexcept
                {
                    return raw[i];
                }

                constexpr bytes32_t const &
                operator[](size_t const i) const noexcept
                {
                    return raw[i];
                }

            } slots;

            T typed;
        };

        Adapter()
            : slots{}
        {
        }

        Adapter(T const &t)
            : slots{}
        {
            std::memcpy(&typed, &t, sizeof(T));
        }
    };

    State &state_;
    Address const &address_;
    uint256_t const offset_;

    void store_(Adapter const &adapter)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(
                address_,
                intx::be::store<bytes32_t>(offset_ + i),
                adapter.slots[i]);
        }
    }

    Adapter load_() const noexcept
    {
        Adapter value;
        for (size_t i = 0; i < N; ++i) {
            value.slots[i] = state_.get_storage(
                address_, intx::be::store<bytes32_t>(offset_ + i));
        }
        return value;
    }

public:
    StorageVariable(State &state, Address const &address, bytes32_t const &key)
        : state_{state}
        , address_{address}
        , offset_{intx::be::load<uint256_t>(key)}
    {
    }

    StorageVariable(State &state, Address const &address, uint256_t const key)
        : state_{state}
        , address_{address}
        , offset_{key}
    {
    }

    // First slot of the variable, as seen by a storage proof
    bytes32_t slot() const noexcept
    {
        return intx::be::store<bytes32_t>(offset_);
    }

    T load() const noexcept
    {
        return load_().typed;
    }

    std::optional<T> load_checked() const noexcept
    {
        Adapter const value = load_();
        for (size_t i = 0; i < N; ++i) {
            if (value.slots[i] != bytes32_t{}) {
                return value.typed;
            }
        }
        return std::nullopt;
    }

    void store(T const &value)
    {
        Adapter adapter(value);
        store_(adapter);
    }

    T clear()
    {
        Adapter adapter{};
        auto const res = load();
        store_(adapter);
        return res;
    }
};

TANDEM_NAMESPACE_END
