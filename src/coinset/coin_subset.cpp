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
#include "coin_subset.h"

//local headers
#include "coin_types.h"
#include "misc_log_ex.h"

//third party headers

//standard headers
#include <cstddef>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "coinset"

namespace coinset
{
//-------------------------------------------------------------------------------------------------------------------
CoinSubset::CoinSubset(const ValueAgeCoins &source, std::vector<std::size_t> indices) :
    m_source{source},
    m_indices(indices.begin(), indices.end())
{
    for (const std::size_t index : m_indices)
    {
        const ValueAgeCoin &coin{this->source_coin(index)};
        m_total_amount += coin.amount();
        m_total_value_age += coin.value_age();
    }
}
//-------------------------------------------------------------------------------------------------------------------
void CoinSubset::push_back(const std::size_t index)
{
    const ValueAgeCoin &coin{this->source_coin(index)};

    m_indices.push_back(index);
    m_total_amount += coin.amount();
    m_total_value_age += coin.value_age();
}
//-------------------------------------------------------------------------------------------------------------------
const ValueAgeCoin& CoinSubset::pop_back()
{
    CHECK_AND_ASSERT_THROW_MES(!m_indices.empty(), "coin subset (pop back): subset is empty.");

    const ValueAgeCoin &back{this->source_coin(m_indices.back())};
    m_indices.pop_back();
    this->subtract_totals(back);

    return back;
}
//-------------------------------------------------------------------------------------------------------------------
const ValueAgeCoin& CoinSubset::pop_front()
{
    CHECK_AND_ASSERT_THROW_MES(!m_indices.empty(), "coin subset (pop front): subset is empty.");

    const ValueAgeCoin &front{this->source_coin(m_indices.front())};
    m_indices.pop_front();
    this->subtract_totals(front);

    return front;
}
//-------------------------------------------------------------------------------------------------------------------
const ValueAgeCoin& CoinSubset::source_coin(const std::size_t index) const
{
    CHECK_AND_ASSERT_THROW_MES(index < m_source.size(), "coin subset: index out of range of the source collection.");

    return m_source.value_age_coin(index);
}
//-------------------------------------------------------------------------------------------------------------------
void CoinSubset::subtract_totals(const ValueAgeCoin &coin)
{
    m_total_amount -= coin.amount();
    m_total_value_age -= coin.value_age();
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace coinset
