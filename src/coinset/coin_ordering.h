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

// Orderings over coin collections, and in-place sorting of a collection through its swap operation.
// Note: Sorting reorders the caller's collection, so positions obtained before a sort do not refer to the same coins
//       after it. Sort a copy if the original positions are needed.

#pragma once

//local headers
#include "coin_types.h"

//third party headers

//standard headers
#include <algorithm>
#include <cstddef>
#include <numeric>
#include <vector>

//forward declarations


namespace coinset
{

enum class SortOrder
{
    ASCENDING,
    DESCENDING
};

/// position i < position j iff amount(i) < amount(j)
struct ByAmount final
{
    const AmountCoins &coins;

    bool operator()(const std::size_t index_a, const std::size_t index_b) const
    {
        return coins.amount_coin(index_a).amount() < coins.amount_coin(index_b).amount();
    }
};

/// position i < position j iff value_age(i) < value_age(j)
struct ByValueAge final
{
    const ValueAgeCoins &coins;

    bool operator()(const std::size_t index_a, const std::size_t index_b) const
    {
        return coins.value_age_coin(index_a).value_age() < coins.value_age_coin(index_b).value_age();
    }
};

/// reverse of an ordering (for descending sorts)
template <typename OrderingT>
struct Reversed final
{
    OrderingT ordering;

    bool operator()(const std::size_t index_a, const std::size_t index_b) const
    {
        return ordering(index_b, index_a);
    }
};

/**
* brief: apply_permutation - reorder a collection with swaps so that position k holds the coin that was at
*   position 'permutation[k]'
* param: permutation - a permutation of [0, coins.size())
* inoutparam: coins_inout -
*/
void apply_permutation(const std::vector<std::size_t> &permutation, AmountCoins &coins_inout);
/**
* brief: sort_coins - stable in-place sort of a collection according to an ordering over its positions
*   - coins that compare equal keep their relative order
* param: ordering - strict weak ordering over positions of 'coins_inout' (as they are before the sort)
* inoutparam: coins_inout -
*/
template <typename OrderingT>
void sort_coins(const OrderingT &ordering, AmountCoins &coins_inout)
{
    // 1. sort positions (the collection is left alone while the ordering reads from it)
    std::vector<std::size_t> permutation(coins_inout.size());
    std::iota(permutation.begin(), permutation.end(), 0);
    std::stable_sort(permutation.begin(), permutation.end(), ordering);

    // 2. move the coins into place
    apply_permutation(permutation, coins_inout);
}
/// sort a collection by amount
void sort_coins_by_amount(const SortOrder order, AmountCoins &coins_inout);
/// sort a collection by value-age
void sort_coins_by_value_age(const SortOrder order, ValueAgeCoins &coins_inout);

} //namespace coinset
