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

// Index-based subset of a coin collection with incrementally maintained totals.

#pragma once

//local headers
#include "coin_types.h"

//third party headers

//standard headers
#include <cstddef>
#include <deque>
#include <vector>

//forward declarations


namespace coinset
{

////
// CoinSubset
// - an ordered list of positions in a source collection
// - the total amount and total value-age of the referenced coins are cached and updated on every push/pop
//   (they are only summed from scratch on construction)
// - the source collection must outlive the subset and must not be reordered while the subset is in use
///
class CoinSubset final
{
public:
//constructors
    /// normal constructor
    CoinSubset(const ValueAgeCoins &source, std::vector<std::size_t> indices);

//member functions
    /// add the coin at a source position to the end of the subset
    void push_back(const std::size_t index);
    /// remove the last coin from the subset (throws if the subset is empty)
    const ValueAgeCoin& pop_back();
    /// remove the first coin from the subset (throws if the subset is empty)
    const ValueAgeCoin& pop_front();

    /// source positions of the coins in the subset, in subset order
    const std::deque<std::size_t>& indices() const { return m_indices; }
    std::size_t size() const { return m_indices.size(); }
    bool empty() const { return m_indices.empty(); }
    const coin_total_t& total_amount() const { return m_total_amount; }
    const coin_total_t& total_value_age() const { return m_total_value_age; }

private:
    /// get a coin from the source collection
    const ValueAgeCoin& source_coin(const std::size_t index) const;
    /// remove a coin's contribution from the cached totals
    void subtract_totals(const ValueAgeCoin &coin);

//member variables
    /// read-only reference to the source collection
    const ValueAgeCoins &m_source;

    std::deque<std::size_t> m_indices;
    coin_total_t m_total_amount{0};
    coin_total_t m_total_value_age{0};
};

} //namespace coinset
