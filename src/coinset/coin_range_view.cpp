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
#include "coin_range_view.h"

//local headers
#include "coin_types.h"
#include "misc_log_ex.h"

//third party headers

//standard headers
#include <cstddef>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "coinset"

namespace coinset
{
//-------------------------------------------------------------------------------------------------------------------
CoinRangeView::CoinRangeView(ValueAgeCoins &parent, const std::size_t begin, const std::size_t end) :
    m_parent{parent},
    m_begin{begin},
    m_end{end}
{
    CHECK_AND_ASSERT_THROW_MES(m_begin <= m_end, "coin range view: invalid range.");
    CHECK_AND_ASSERT_THROW_MES(m_end <= m_parent.size(), "coin range view: range exceeds the parent collection.");
}
//-------------------------------------------------------------------------------------------------------------------
const AmountCoin& CoinRangeView::amount_coin(const std::size_t index) const
{
    return m_parent.amount_coin(this->parent_index(index));
}
//-------------------------------------------------------------------------------------------------------------------
const ValueAgeCoin& CoinRangeView::value_age_coin(const std::size_t index) const
{
    return m_parent.value_age_coin(this->parent_index(index));
}
//-------------------------------------------------------------------------------------------------------------------
void CoinRangeView::swap(const std::size_t index_a, const std::size_t index_b)
{
    m_parent.swap(this->parent_index(index_a), this->parent_index(index_b));
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t CoinRangeView::parent_index(const std::size_t index) const
{
    CHECK_AND_ASSERT_THROW_MES(index < this->size(), "coin range view: index out of range.");

    return m_begin + index;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace coinset
