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

//paired header
#include "coin_mocks.h"

//local headers
#include "coinset/coin_set.h"
#include "coinset/coin_types.h"
#include "misc_log_ex.h"

//third party headers

//standard headers
#include <cstddef>
#include <memory>
#include <random>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "coinset_mocks"

namespace coinset
{
namespace mocks
{
//-------------------------------------------------------------------------------------------------------------------
CoinSet make_mock_coin_set(const std::vector<coin_amount_t> &amounts)
{
    return make_mock_coin_set(amounts, amounts);
}
//-------------------------------------------------------------------------------------------------------------------
CoinSet make_mock_coin_set(const std::vector<coin_amount_t> &amounts, const std::vector<value_age_t> &value_ages)
{
    CHECK_AND_ASSERT_THROW_MES(amounts.size() == value_ages.size(),
        "make mock coin set: amounts and value-ages have different sizes.");

    CoinSet coin_set;
    for (std::size_t coin_index{0}; coin_index < amounts.size(); ++coin_index)
        coin_set.push_coin(std::make_shared<CoinMock>(amounts[coin_index], value_ages[coin_index]));

    return coin_set;
}
//-------------------------------------------------------------------------------------------------------------------
CoinSet gen_mock_coin_set(const std::size_t num_coins,
    const coin_amount_t max_amount,
    const value_age_t max_value_age,
    std::mt19937_64 &generator_inout)
{
    std::uniform_int_distribution<coin_amount_t> amount_distribution{0, max_amount};
    std::uniform_int_distribution<value_age_t> value_age_distribution{0, max_value_age};

    CoinSet coin_set;
    for (std::size_t coin_index{0}; coin_index < num_coins; ++coin_index)
    {
        const coin_amount_t amount{amount_distribution(generator_inout)};
        const value_age_t value_age{value_age_distribution(generator_inout)};
        coin_set.push_coin(std::make_shared<CoinMock>(amount, value_age));
    }

    return coin_set;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<coin_amount_t> collect_amounts(const AmountCoins &coins)
{
    std::vector<coin_amount_t> amounts;
    amounts.reserve(coins.size());

    for (std::size_t coin_index{0}; coin_index < coins.size(); ++coin_index)
        amounts.emplace_back(coins.amount_coin(coin_index).amount());

    return amounts;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<coin_amount_t> collect_amounts(const AmountCoins &coins, const std::vector<std::size_t> &indices)
{
    std::vector<coin_amount_t> amounts;
    amounts.reserve(indices.size());

    for (const std::size_t index : indices)
        amounts.emplace_back(coins.amount_coin(index).amount());

    return amounts;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<value_age_t> collect_value_ages(const ValueAgeCoins &coins)
{
    std::vector<value_age_t> value_ages;
    value_ages.reserve(coins.size());

    for (std::size_t coin_index{0}; coin_index < coins.size(); ++coin_index)
        value_ages.emplace_back(coins.value_age_coin(coin_index).value_age());

    return value_ages;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace mocks
} //namespace coinset
