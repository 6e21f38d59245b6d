// Copyright (c) 2024, The Monero Project
// 
// All rights reserved.
// 
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
// 
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
// 
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
// 
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
// 
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

// Capability interfaces for coins and coin collections used by coin selection.
// NOTE: A coin's value-age must not change while a selection is in progress. Subsets and coin sets cache totals
//       over their coins and will silently go out of sync if it does.

#pragma once

//local headers

//third party headers
#include "boost/multiprecision/cpp_int.hpp"

//standard headers
#include <cstddef>
#include <cstdint>

//forward declarations


namespace coinset
{

/// coin amount in the smallest currency unit
using coin_amount_t = std::uint64_t;
/// amount * confirmations
using value_age_t = std::uint64_t;
/// sums of amounts or value-ages (cannot overflow for any realistic number of coins)
using coin_total_t = boost::multiprecision::uint128_t;

////
// AmountCoin
// - a spendable output with a known amount
///
class AmountCoin
{
public:
//destructor
    virtual ~AmountCoin() = default;

//member functions
    virtual coin_amount_t amount() const = 0;
};

////
// ValueAgeCoin
// - a spendable output with a known amount and value-age
///
class ValueAgeCoin : public AmountCoin
{
public:
//member functions
    virtual value_age_t value_age() const = 0;
};

////
// Coin
// - a full coin
///
class Coin : public ValueAgeCoin
{};

////
// AmountCoins
// - an ordered, indexed and reorderable collection of coins with known amounts
///
class AmountCoins
{
public:
//destructor
    virtual ~AmountCoins() = default;

//member functions
    /// get the coin at a position
    virtual const AmountCoin& amount_coin(const std::size_t index) const = 0;
    /// number of coins in the collection
    virtual std::size_t size() const = 0;
    /// exchange the coins at two positions
    virtual void swap(const std::size_t index_a, const std::size_t index_b) = 0;
};

////
// ValueAgeCoins
// - an ordered, indexed and reorderable collection of coins with known amounts and value-ages
///
class ValueAgeCoins : public AmountCoins
{
public:
//member functions
    virtual const ValueAgeCoin& value_age_coin(const std::size_t index) const = 0;
};

////
// Coins
// - an ordered, indexed and reorderable collection of full coins
///
class Coins : public ValueAgeCoins
{
public:
//member functions
    virtual const Coin& coin(const std::size_t index) const = 0;
};

} //namespace coinset
