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
#include "coin_selector.h"

//local headers
#include "coin_selection.h"
#include "coin_set.h"
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
//-------------------------------------------------------------------------------------------------------------------
static bool try_materialize_selection(const bool selection_found,
    const CoinSet &coins,
    const std::vector<std::size_t> &selected_indices,
    CoinSet &selection_out)
{
    if (!selection_found)
    {
        selection_out = CoinSet{};
        return false;
    }

    // 'selection_out' may be the same set as 'coins'
    CoinSet selection{make_coin_set(coins, selected_indices)};
    selection_out = std::move(selection);
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
bool MinIndexCoinSelector::try_select_coins(const coin_amount_t target,
    CoinSet &coins_inout,
    CoinSet &selection_out) const
{
    std::vector<std::size_t> selected_indices;
    const bool selection_found{try_select_min_index(m_args, target, coins_inout, selected_indices)};

    return try_materialize_selection(selection_found, coins_inout, selected_indices, selection_out);
}
//-------------------------------------------------------------------------------------------------------------------
bool MinNumberCoinSelector::try_select_coins(const coin_amount_t target,
    CoinSet &coins_inout,
    CoinSet &selection_out) const
{
    std::vector<std::size_t> selected_indices;
    const bool selection_found{try_select_min_number(m_args, target, coins_inout, selected_indices)};

    return try_materialize_selection(selection_found, coins_inout, selected_indices, selection_out);
}
//-------------------------------------------------------------------------------------------------------------------
bool MaxValueAgeCoinSelector::try_select_coins(const coin_amount_t target,
    CoinSet &coins_inout,
    CoinSet &selection_out) const
{
    std::vector<std::size_t> selected_indices;
    const bool selection_found{try_select_max_value_age(m_args, target, coins_inout, selected_indices)};

    return try_materialize_selection(selection_found, coins_inout, selected_indices, selection_out);
}
//-------------------------------------------------------------------------------------------------------------------
bool MinPriorityCoinSelector::try_select_coins(const coin_amount_t target,
    CoinSet &coins_inout,
    CoinSet &selection_out) const
{
    std::vector<std::size_t> selected_indices;
    const bool selection_found{
            try_select_min_priority(m_args, m_min_avg_value_age_per_input, target, coins_inout, selected_indices)
        };

    return try_materialize_selection(selection_found, coins_inout, selected_indices, selection_out);
}
//-------------------------------------------------------------------------------------------------------------------
std::unique_ptr<CoinSelector> make_coin_selector(const CoinSelectionPolicy policy,
    const CoinSelectionArgs &args,
    const value_age_t min_avg_value_age_per_input)
{
    switch (policy)
    {
        case CoinSelectionPolicy::MIN_INDEX:
            return std::make_unique<MinIndexCoinSelector>(args);
        case CoinSelectionPolicy::MIN_NUMBER:
            return std::make_unique<MinNumberCoinSelector>(args);
        case CoinSelectionPolicy::MAX_VALUE_AGE:
            return std::make_unique<MaxValueAgeCoinSelector>(args);
        case CoinSelectionPolicy::MIN_PRIORITY:
            return std::make_unique<MinPriorityCoinSelector>(args, min_avg_value_age_per_input);
        default:
            ASSERT_MES_AND_THROW("make coin selector: unknown selection policy.");
    }
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace coinset
