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
#include "coin_ordering.h"

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
void apply_permutation(const std::vector<std::size_t> &permutation, AmountCoins &coins_inout)
{
    const std::size_t num_coins{coins_inout.size()};
    CHECK_AND_ASSERT_THROW_MES(permutation.size() == num_coins,
        "apply permutation: permutation size does not match the collection size.");

    // track where each original coin currently sits, and which original coin sits at each position
    std::vector<std::size_t> position_of_original(num_coins);
    std::vector<std::size_t> original_at_position(num_coins);
    for (std::size_t i{0}; i < num_coins; ++i)
    {
        position_of_original[i] = i;
        original_at_position[i] = i;
    }

    for (std::size_t target_position{0}; target_position < num_coins; ++target_position)
    {
        const std::size_t wanted_original{permutation[target_position]};
        CHECK_AND_ASSERT_THROW_MES(wanted_original < num_coins,
            "apply permutation: permutation element out of range.");

        const std::size_t current_position{position_of_original[wanted_original]};
        CHECK_AND_ASSERT_THROW_MES(current_position >= target_position,
            "apply permutation: permutation contains a duplicate element.");

        if (current_position == target_position)
            continue;

        coins_inout.swap(target_position, current_position);

        // the coin that was displaced from the target position now sits where the wanted coin was
        const std::size_t displaced_original{original_at_position[target_position]};
        original_at_position[current_position] = displaced_original;
        position_of_original[displaced_original] = current_position;
        original_at_position[target_position] = wanted_original;
        position_of_original[wanted_original] = target_position;
    }
}
//-------------------------------------------------------------------------------------------------------------------
void sort_coins_by_amount(const SortOrder order, AmountCoins &coins_inout)
{
    if (order == SortOrder::ASCENDING)
        sort_coins(ByAmount{coins_inout}, coins_inout);
    else
        sort_coins(Reversed<ByAmount>{ByAmount{coins_inout}}, coins_inout);
}
//-------------------------------------------------------------------------------------------------------------------
void sort_coins_by_value_age(const SortOrder order, ValueAgeCoins &coins_inout)
{
    if (order == SortOrder::ASCENDING)
        sort_coins(ByValueAge{coins_inout}, coins_inout);
    else
        sort_coins(Reversed<ByValueAge>{ByValueAge{coins_inout}}, coins_inout);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace coinset
