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

// Owning, ordered set of coins with cached totals.

#pragma once

//local headers
#include "coin_types.h"

//third party headers

//standard headers
#include <cstddef>
#include <deque>
#include <memory>
#include <vector>

//forward declarations


namespace coinset
{

////
// CoinSet
// - an ordered list of shared immutable coins, with the total amount and total value-age of the list cached
// - this is the standard concrete collection for coin selection, and also the materialized form of a selection
// - copies share the underlying coins
///
class CoinSet final : public Coins
{
public:
//constructors
    /// default constructor
    CoinSet() = default;
    /// normal constructor
    explicit CoinSet(const std::vector<std::shared_ptr<const Coin>> &coins);

//member functions
    const AmountCoin& amount_coin(const std::size_t index) const override;
    const ValueAgeCoin& value_age_coin(const std::size_t index) const override;
    const Coin& coin(const std::size_t index) const override;
    std::size_t size() const override { return m_coins.size(); }
    void swap(const std::size_t index_a, const std::size_t index_b) override;

    /// shared handle to the coin at a position
    const std::shared_ptr<const Coin>& coin_ptr(const std::size_t index) const;
    /// add a coin to the end of the set
    void push_coin(std::shared_ptr<const Coin> coin);
    /// remove and return the last coin (throws if the set is empty)
    std::shared_ptr<const Coin> pop_coin();
    /// remove and return the first coin (throws if the set is empty)
    std::shared_ptr<const Coin> shift_coin();

    bool empty() const { return m_coins.empty(); }
    const coin_total_t& total_amount() const { return m_total_amount; }
    const coin_total_t& total_value_age() const { return m_total_value_age; }

private:
    void subtract_totals(const Coin &coin);

//member variables
    std::deque<std::shared_ptr<const Coin>> m_coins;
    coin_total_t m_total_amount{0};
    coin_total_t m_total_value_age{0};
};

/**
* brief: make_coin_set - materialize a selection of positions in a coin set
* param: source -
* param: indices - positions in 'source'; the new set keeps this order
* return: a coin set sharing the selected coins with 'source'
*/
CoinSet make_coin_set(const CoinSet &source, const std::vector<std::size_t> &indices);

} //namespace coinset
