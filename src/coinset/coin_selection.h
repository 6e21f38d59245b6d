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

// Greedy coin selection algorithms.
// - All algorithms are polynomial-time heuristics. None of them is guaranteed to find a selection even when one
//   exists, and none of them claims its selection is optimal.
// - Every function here is a 'try' function: 'false' means no selection is available under the given constraints,
//   which is an expected outcome (e.g. insufficient funds). The output is left empty in that case.
// - Algorithms that sort reorder the caller's collection. The indices they return refer to positions in the
//   collection after the call.

#pragma once

//local headers
#include "coin_types.h"

//third party headers

//standard headers
#include <cstddef>
#include <vector>

//forward declarations


namespace coinset
{

/// arguments shared by all selection algorithms
struct CoinSelectionArgs final
{
    /// maximum number of coins in a selection
    std::size_t max_inputs;
    /// a selection that overshoots the target must overshoot by at least this much (no dust change)
    coin_amount_t min_change_amount;
};

/// selection arguments using the defaults in coinset_config.h
CoinSelectionArgs default_coin_selection_args();

/**
* brief: satisfies_target_amount - test if a total amount is an acceptable selection total
* param: target - amount to reach
* param: min_change_amount -
* param: total - selection total
* return: true if the total hits the target exactly or exceeds it by at least the min change amount
*/
bool satisfies_target_amount(const coin_amount_t target, const coin_amount_t min_change_amount, const coin_total_t &total);
/**
* brief: try_select_min_index - select the shortest prefix of the collection that satisfies the target
*   - the collection is not reordered
* param: args -
* param: target -
* param: coins -
* outparam: selected_indices_out - positions [0, n) for the selected prefix length n
* return: true if a selection was found
*/
bool try_select_min_index(const CoinSelectionArgs &args,
    const coin_amount_t target,
    const AmountCoins &coins,
    std::vector<std::size_t> &selected_indices_out);
/**
* brief: try_select_min_number - select as few coins as possible by taking the largest amounts first
*   - the collection is sorted by descending amount
* param: args -
* param: target -
* inoutparam: coins_inout -
* outparam: selected_indices_out -
* return: true if a selection was found
*/
bool try_select_min_number(const CoinSelectionArgs &args,
    const coin_amount_t target,
    AmountCoins &coins_inout,
    std::vector<std::size_t> &selected_indices_out);
/**
* brief: try_select_max_value_age - select the coins with the most value-age first
*   - useful for maximizing the priority of a transaction where priority is weighted by input age
*   - the collection is sorted by descending value-age
* param: args -
* param: target -
* inoutparam: coins_inout -
* outparam: selected_indices_out -
* return: true if a selection was found
*/
bool try_select_max_value_age(const CoinSelectionArgs &args,
    const coin_amount_t target,
    ValueAgeCoins &coins_inout,
    std::vector<std::size_t> &selected_indices_out);
/**
* brief: try_select_min_priority - select coins whose average value-age per input is at least a threshold
*   - the selection is built from coins with value-age >= threshold ('high priority'); when possible, the average is
*     then pulled down toward the threshold by adding low-priority coins, so old coins are not spent needlessly
*   - if no window of high-priority coins covers the target, low-priority coins are added to a window by recursively
*     selecting among the low-priority coins with an adjusted threshold
*   - each distinct low-priority search runs at most once per call, and the number of searches is capped by
*     config::coinset::MIN_PRIORITY_MAX_SUPPLEMENT_SEARCHES
*   - the collection is sorted by ascending value-age
* param: args -
* param: min_avg_value_age_per_input - threshold for the average value-age of the selection
* param: target -
* inoutparam: coins_inout -
* outparam: selected_indices_out -
* return: true if a selection was found
*/
bool try_select_min_priority(const CoinSelectionArgs &args,
    const value_age_t min_avg_value_age_per_input,
    const coin_amount_t target,
    ValueAgeCoins &coins_inout,
    std::vector<std::size_t> &selected_indices_out);

} //namespace coinset
