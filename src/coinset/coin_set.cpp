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

//paired header
#include "coin_set.h"

//local headers
#include "coin_types.h"
#include "misc_log_ex.h"

//third party headers

//standard headers
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "coinset"

namespace coinset
{
//-------------------------------------------------------------------------------------------------------------------
CoinSet::CoinSet(const std::vector<std::shared_ptr<const Coin>> &coins)
{
    for (const std::shared_ptr<const Coin> &coin : coins)
        this->push_coin(coin);
}
//-------------------------------------------------------------------------------------------------------------------
const AmountCoin& CoinSet::amount_coin(const std::size_t index) const
{
    return *this->coin_ptr(index);
}
//-------------------------------------------------------------------------------------------------------------------
const ValueAgeCoin& CoinSet::value_age_coin(const std::size_t index) const
{
    return *this->coin_ptr(index);
}
//-------------------------------------------------------------------------------------------------------------------
const Coin& CoinSet::coin(const std::size_t index) const
{
    return *this->coin_ptr(index);
}
//-------------------------------------------------------------------------------------------------------------------
void CoinSet::swap(const std::size_t index_a, const std::size_t index_b)
{
    CHECK_AND_ASSERT_THROW_MES(index_a < m_coins.size() && index_b < m_coins.size(),
        "coin set (swap): index out of range.");

    std::swap(m_coins[index_a], m_coins[index_b]);
}
//-------------------------------------------------------------------------------------------------------------------
const std::shared_ptr<const Coin>& CoinSet::coin_ptr(const std::size_t index) const
{
    CHECK_AND_ASSERT_THROW_MES(index < m_coins.size(), "coin set: index out of range.");

    return m_coins[index];
}
//-------------------------------------------------------------------------------------------------------------------
void CoinSet::push_coin(std::shared_ptr<const Coin> coin)
{
    CHECK_AND_ASSERT_THROW_MES(coin, "coin set (push coin): coin is null.");

    m_total_amount += coin->amount();
    m_total_value_age += coin->value_age();
    m_coins.emplace_back(std::move(coin));
}
//-------------------------------------------------------------------------------------------------------------------
std::shared_ptr<const Coin> CoinSet::pop_coin()
{
    CHECK_AND_ASSERT_THROW_MES(!m_coins.empty(), "coin set (pop coin): set is empty.");

    std::shared_ptr<const Coin> back{std::move(m_coins.back())};
    m_coins.pop_back();
    this->subtract_totals(*back);

    return back;
}
//-------------------------------------------------------------------------------------------------------------------
std::shared_ptr<const Coin> CoinSet::shift_coin()
{
    CHECK_AND_ASSERT_THROW_MES(!m_coins.empty(), "coin set (shift coin): set is empty.");

    std::shared_ptr<const Coin> front{std::move(m_coins.front())};
    m_coins.pop_front();
    this->subtract_totals(*front);

    return front;
}
//-------------------------------------------------------------------------------------------------------------------
void CoinSet::subtract_totals(const Coin &coin)
{
    m_total_amount -= coin.amount();
    m_total_value_age -= coin.value_age();
}
//-------------------------------------------------------------------------------------------------------------------
CoinSet make_coin_set(const CoinSet &source, const std::vector<std::size_t> &indices)
{
    CoinSet coin_set;

    for (const std::size_t index : indices)
        coin_set.push_coin(source.coin_ptr(index));

    return coin_set;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace coinset
