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

// A contiguous window of a coin collection, exposed as a collection of its own.

#pragma once

//local headers
#include "coin_types.h"

//third party headers

//standard headers
#include <cstddef>

//forward declarations


namespace coinset
{

////
// CoinRangeView
// - view of the positions [begin, end) of a parent collection
// - reordering the view reorders that window of the parent; coins outside the window are never touched
///
class CoinRangeView final : public ValueAgeCoins
{
public:
//constructors
    /// normal constructor
    CoinRangeView(ValueAgeCoins &parent, const std::size_t begin, const std::size_t end);

//member functions
    const AmountCoin& amount_coin(const std::size_t index) const override;
    const ValueAgeCoin& value_age_coin(const std::size_t index) const override;
    std::size_t size() const override { return m_end - m_begin; }
    void swap(const std::size_t index_a, const std::size_t index_b) override;

    /// map a position in the view to the corresponding position in the parent collection
    std::size_t parent_index(const std::size_t index) const;

//member variables
private:
    /// the viewed collection
    ValueAgeCoins &m_parent;
    std::size_t m_begin;
    std::size_t m_end;
};

} //namespace coinset
