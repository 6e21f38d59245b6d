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

// NOT FOR PRODUCTION

// Mock coins and coin set builders for unit testing.

#pragma once

//local headers
#include "coinset/coin_set.h"
#include "coinset/coin_types.h"

//third party headers

//standard headers
#include <cstddef>
#include <random>
#include <vector>

//forward declarations


namespace coinset
{
namespace mocks
{

/// coin with a fixed amount and value-age
class CoinMock final : public Coin
{
public:
//constructors
    CoinMock(const coin_amount_t amount, const value_age_t value_age) :
        m_amount{amount},
        m_value_age{value_age}
    {}

//member functions
    coin_amount_t amount() const override { return m_amount; }
    value_age_t value_age() const override { return m_value_age; }

//member variables
private:
    coin_amount_t m_amount;
    value_age_t m_value_age;
};

/// make a coin set of mock coins whose value-age equals their amount (one confirmation)
CoinSet make_mock_coin_set(const std::vector<coin_amount_t> &amounts);
/// make a coin set of mock coins with explicit value-ages
CoinSet make_mock_coin_set(const std::vector<coin_amount_t> &amounts, const std::vector<value_age_t> &value_ages);
/// make a coin set of mock coins with amounts in [0, max_amount] and value-ages in [0, max_value_age]
CoinSet gen_mock_coin_set(const std::size_t num_coins,
    const coin_amount_t max_amount,
    const value_age_t max_value_age,
    std::mt19937_64 &generator_inout);

/// amounts of all coins in collection order
std::vector<coin_amount_t> collect_amounts(const AmountCoins &coins);
/// amounts of the coins at the given positions
std::vector<coin_amount_t> collect_amounts(const AmountCoins &coins, const std::vector<std::size_t> &indices);
/// value-ages of all coins in collection order
std::vector<value_age_t> collect_value_ages(const ValueAgeCoins &coins);

} //namespace mocks
} //namespace coinset
