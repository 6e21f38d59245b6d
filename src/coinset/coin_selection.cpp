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
#include "coin_selection.h"

//local headers
#include "coin_ordering.h"
#include "coin_range_view.h"
#include "coin_subset.h"
#include "coin_types.h"
#include "coinset_config.h"
#include "misc_log_ex.h"

//third party headers
#include "boost/multiprecision/cpp_int.hpp"

//standard headers
#include <algorithm>
#include <cstddef>
#include <functional>
#include <limits>
#include <map>
#include <numeric>
#include <tuple>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "coinset"

namespace coinset
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool satisfies_target_total(const coin_total_t &target, const coin_total_t &min_change, const coin_total_t &total)
{
    return total == target || total >= target + min_change;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool average_value_age_is_at_least(const CoinSubset &subset, const value_age_t min_avg_value_age_per_input)
{
    return subset.total_value_age() >= coin_total_t{min_avg_value_age_per_input} * subset.size();
}
//-------------------------------------------------------------------------------------------------------------------
// take coins in scan order until the running total satisfies the target
//-------------------------------------------------------------------------------------------------------------------
static bool try_select_in_scan_order(const std::size_t max_inputs,
    const coin_total_t &target,
    const coin_total_t &min_change,
    const AmountCoins &coins,
    const std::vector<std::size_t> &scan_order,
    std::vector<std::size_t> &selected_indices_out)
{
    selected_indices_out.clear();
    coin_total_t total{0};

    for (std::size_t scan_index{0}; scan_index < scan_order.size() && scan_index < max_inputs; ++scan_index)
    {
        selected_indices_out.emplace_back(scan_order[scan_index]);
        total += coins.amount_coin(scan_order[scan_index]).amount();

        if (satisfies_target_total(target, min_change, total))
            return true;
    }

    selected_indices_out.clear();
    return false;
}
//-------------------------------------------------------------------------------------------------------------------
// state shared by the recursive searches of one min priority selection
// - every low-priority search selects from a prefix [0, n) of the top-level collection (sorted by ascending
//   value-age), so a search is identified by n and its arguments
//-------------------------------------------------------------------------------------------------------------------
using MinPrioritySearchKey = std::tuple<
        std::size_t,   //prefix size
        std::size_t,   //max inputs
        value_age_t,   //min average value-age
        coin_total_t,  //target
        coin_total_t   //min change
    >;

struct MinPrioritySearchContext final
{
    /// selections found by finished searches (empty if a search found nothing)
    std::map<MinPrioritySearchKey, std::vector<std::size_t>> finished_searches;
    /// number of searches that may still be run
    std::size_t remaining_searches;
};
//-------------------------------------------------------------------------------------------------------------------
// element k: sum of the k largest amounts among positions [0, num_coins), for k <= min(num_coins, max_count)
//-------------------------------------------------------------------------------------------------------------------
static std::vector<coin_total_t> largest_amount_sums(const AmountCoins &coins,
    const std::size_t num_coins,
    const std::size_t max_count)
{
    std::vector<coin_amount_t> amounts;
    amounts.reserve(num_coins);

    for (std::size_t coin_index{0}; coin_index < num_coins; ++coin_index)
        amounts.emplace_back(coins.amount_coin(coin_index).amount());

    const std::size_t num_sums{std::min(num_coins, max_count)};
    std::partial_sort(amounts.begin(), amounts.begin() + num_sums, amounts.end(), std::greater<coin_amount_t>{});

    std::vector<coin_total_t> sums;
    sums.reserve(num_sums + 1);
    sums.emplace_back(0);

    for (std::size_t amount_index{0}; amount_index < num_sums; ++amount_index)
    {
        const coin_total_t next_sum{sums.back() + amounts[amount_index]};
        sums.emplace_back(next_sum);
    }

    return sums;
}
//-------------------------------------------------------------------------------------------------------------------
// threshold that 'num_low' additional coins must average so that, together with 'high_coins', the combined average
//   value-age per input is at least 'min_avg_value_age_per_input'
// - rounded up so integer division can't push the combined average below the threshold
// - fails if no coin can have a value-age that large
//-------------------------------------------------------------------------------------------------------------------
static bool try_get_low_priority_threshold(const value_age_t min_avg_value_age_per_input,
    const CoinSubset &high_coins,
    const std::size_t num_low,
    value_age_t &low_threshold_out)
{
    using boost::multiprecision::int128_t;

    const int128_t required_low_value_age{
            int128_t{min_avg_value_age_per_input} * (high_coins.size() + num_low) -
            static_cast<int128_t>(high_coins.total_value_age())
        };

    if (required_low_value_age <= 0)
    {
        low_threshold_out = 0;
        return true;
    }

    const int128_t low_threshold{(required_low_value_age + num_low - 1) / num_low};
    if (low_threshold > std::numeric_limits<value_age_t>::max())
        return false;

    low_threshold_out = static_cast<value_age_t>(low_threshold);
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
// add low-priority coins (lowest value-age first) to a selection for as long as the selection stays acceptable
//-------------------------------------------------------------------------------------------------------------------
static void lower_average_value_age(const std::size_t max_inputs,
    const coin_total_t &target,
    const coin_total_t &min_change,
    const value_age_t min_avg_value_age_per_input,
    const ValueAgeCoins &coins,
    const std::size_t num_low_priority_coins,
    CoinSubset &selection_inout)
{
    for (std::size_t low_index{0}; low_index < num_low_priority_coins; ++low_index)
    {
        if (selection_inout.size() >= max_inputs)
            break;

        // skip coins with no value-age (e.g. unconfirmed outputs)
        if (coins.value_age_coin(low_index).value_age() == 0)
            continue;

        selection_inout.push_back(low_index);

        if (!satisfies_target_total(target, min_change, selection_inout.total_amount()) ||
            !average_value_age_is_at_least(selection_inout, min_avg_value_age_per_input))
        {
            selection_inout.pop_back();
            break;
        }
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool try_select_low_priority_supplement(const std::size_t max_inputs,
    const coin_total_t &min_change,
    const value_age_t min_avg_value_age_per_input,
    const coin_total_t &target,
    ValueAgeCoins &low_priority_coins_inout,
    MinPrioritySearchContext &context_inout,
    std::vector<std::size_t> &selected_indices_out);
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool try_select_min_priority_impl(const std::size_t max_inputs,
    const coin_total_t &min_change,
    const value_age_t min_avg_value_age_per_input,
    const coin_total_t &target,
    ValueAgeCoins &coins_inout,
    MinPrioritySearchContext &context_inout,
    std::vector<std::size_t> &selected_indices_out)
{
    selected_indices_out.clear();

    // 1. order coins by ascending value-age
    // - this is the only reordering; everything below works on lists of positions
    sort_coins_by_value_age(SortOrder::ASCENDING, coins_inout);

    // 2. fail fast if the largest amounts that fit in the input limit can't reach the target
    const std::size_t num_coins{coins_inout.size()};

    if (largest_amount_sums(coins_inout, num_coins, max_inputs).back() < target)
        return false;

    // 3. find the first coin with enough value-age
    // - coins before the cutoff are 'low priority', the rest are 'high priority'
    std::size_t cutoff_index{num_coins};

    for (std::size_t coin_index{0}; coin_index < num_coins; ++coin_index)
    {
        if (coins_inout.value_age_coin(coin_index).value_age() >= min_avg_value_age_per_input)
        {
            cutoff_index = coin_index;
            break;
        }
    }

    if (cutoff_index == num_coins)
        return false;

    // - bounds on what low-priority coins can contribute
    const std::vector<coin_total_t> largest_low_amount_sums{
            largest_amount_sums(coins_inout, cutoff_index, max_inputs)
        };
    const value_age_t max_low_value_age{
            cutoff_index > 0 ? coins_inout.value_age_coin(cutoff_index - 1).value_age() : 0
        };

    // 4. grow a window of high-priority coins [cutoff, window end]
    // - the window is kept both in position order and in descending amount order (ties in position order)
    std::vector<std::size_t> high_window;
    std::vector<std::size_t> high_window_by_amount;
    CoinSubset all_high{coins_inout, {}};

    for (std::size_t window_end{cutoff_index}; window_end < num_coins; ++window_end)
    {
        high_window.emplace_back(window_end);
        high_window_by_amount.insert(
                std::upper_bound(high_window_by_amount.begin(),
                    high_window_by_amount.end(),
                    window_end,
                    Reversed<ByAmount>{ByAmount{coins_inout}}),
                window_end
            );
        all_high.push_back(window_end);

        // a. try to cover the target with the fewest high-priority coins, then spend low-priority coins alongside
        //    them while the average allows it
        std::vector<std::size_t> high_selection;
        if (try_select_in_scan_order(max_inputs,
                target,
                min_change,
                coins_inout,
                high_window_by_amount,
                high_selection))
        {
            CoinSubset extended_selection{coins_inout, std::move(high_selection)};
            lower_average_value_age(max_inputs,
                target,
                min_change,
                min_avg_value_age_per_input,
                coins_inout,
                cutoff_index,
                extended_selection);

            selected_indices_out.assign(extended_selection.indices().begin(), extended_selection.indices().end());
            return true;
        }

        // b. otherwise try to make up the difference with low-priority coins
        if (all_high.size() >= max_inputs)
            continue;

        // - what the low-priority coins must add so the combined total satisfies the target
        coin_total_t low_target;
        coin_total_t low_min_change;

        if (all_high.total_amount() <= target)
        {
            low_target = target - all_high.total_amount();
            low_min_change = min_change;
        }
        else
        {
            // the window overshoots the target by less than the min change, so the combination must overshoot by
            //   at least the min change
            low_target = target + min_change - all_high.total_amount();
            low_min_change = 0;
        }

        const std::size_t max_low_inputs{std::min(cutoff_index, max_inputs - all_high.size())};

        // - fewer low-priority coins than this can't cover the low target, even the largest ones
        const std::size_t min_low_inputs{
                std::max<std::size_t>(1,
                    std::lower_bound(largest_low_amount_sums.begin(), largest_low_amount_sums.end(), low_target) -
                        largest_low_amount_sums.begin())
            };

        for (std::size_t num_low{min_low_inputs}; num_low <= max_low_inputs; ++num_low)
        {
            value_age_t low_threshold;
            if (!try_get_low_priority_threshold(min_avg_value_age_per_input, all_high, num_low, low_threshold))
                continue;

            // - some low-priority coin must reach the threshold
            // - every window coin is at or above the average, so the threshold never decreases as num_low grows
            if (max_low_value_age < low_threshold)
                break;

            MTRACE("min priority selection: supplementing " << all_high.size() << " high priority coins with up to "
                << num_low << " low priority coins (threshold " << low_threshold << ", target " << low_target << ")");

            CoinRangeView low_priority_coins{coins_inout, 0, cutoff_index};
            std::vector<std::size_t> low_selection;

            if (!try_select_low_priority_supplement(num_low,
                    low_min_change,
                    low_threshold,
                    low_target,
                    low_priority_coins,
                    context_inout,
                    low_selection))
                continue;

            CoinSubset combined_selection{coins_inout, high_window};
            for (const std::size_t low_index : low_selection)
                combined_selection.push_back(low_priority_coins.parent_index(low_index));

            if (!satisfies_target_total(target, min_change, combined_selection.total_amount()) ||
                !average_value_age_is_at_least(combined_selection, min_avg_value_age_per_input))
                continue;

            selected_indices_out.assign(combined_selection.indices().begin(), combined_selection.indices().end());
            return true;
        }
    }

    return false;
}
//-------------------------------------------------------------------------------------------------------------------
// run a low-priority search once per distinct prefix and arguments, within the search budget
//-------------------------------------------------------------------------------------------------------------------
static bool try_select_low_priority_supplement(const std::size_t max_inputs,
    const coin_total_t &min_change,
    const value_age_t min_avg_value_age_per_input,
    const coin_total_t &target,
    ValueAgeCoins &low_priority_coins_inout,
    MinPrioritySearchContext &context_inout,
    std::vector<std::size_t> &selected_indices_out)
{
    const MinPrioritySearchKey search_key{
            low_priority_coins_inout.size(),
            max_inputs,
            min_avg_value_age_per_input,
            target,
            min_change
        };

    const auto finished_search = context_inout.finished_searches.find(search_key);
    if (finished_search != context_inout.finished_searches.end())
    {
        selected_indices_out = finished_search->second;
        return !selected_indices_out.empty();
    }

    selected_indices_out.clear();
    if (context_inout.remaining_searches == 0)
        return false;
    --context_inout.remaining_searches;

    const bool selection_found{
            try_select_min_priority_impl(max_inputs,
                min_change,
                min_avg_value_age_per_input,
                target,
                low_priority_coins_inout,
                context_inout,
                selected_indices_out)
        };
    context_inout.finished_searches.emplace(search_key, selected_indices_out);

    return selection_found;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
CoinSelectionArgs default_coin_selection_args()
{
    return CoinSelectionArgs{
            config::coinset::DEFAULT_MAX_INPUTS,
            config::coinset::DEFAULT_MIN_CHANGE_AMOUNT
        };
}
//-------------------------------------------------------------------------------------------------------------------
bool satisfies_target_amount(const coin_amount_t target, const coin_amount_t min_change_amount, const coin_total_t &total)
{
    return satisfies_target_total(coin_total_t{target}, coin_total_t{min_change_amount}, total);
}
//-------------------------------------------------------------------------------------------------------------------
bool try_select_min_index(const CoinSelectionArgs &args,
    const coin_amount_t target,
    const AmountCoins &coins,
    std::vector<std::size_t> &selected_indices_out)
{
    std::vector<std::size_t> scan_order(coins.size());
    std::iota(scan_order.begin(), scan_order.end(), 0);

    if (!try_select_in_scan_order(args.max_inputs,
            coin_total_t{target},
            coin_total_t{args.min_change_amount},
            coins,
            scan_order,
            selected_indices_out))
    {
        MDEBUG("min index selection: no selection available (target " << target << ", " << coins.size()
            << " coins, max inputs " << args.max_inputs << ").");
        return false;
    }

    MDEBUG("min index selection: selected " << selected_indices_out.size() << " of " << coins.size()
        << " coins (target " << target << ").");
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool try_select_min_number(const CoinSelectionArgs &args,
    const coin_amount_t target,
    AmountCoins &coins_inout,
    std::vector<std::size_t> &selected_indices_out)
{
    sort_coins_by_amount(SortOrder::DESCENDING, coins_inout);

    return try_select_min_index(args, target, coins_inout, selected_indices_out);
}
//-------------------------------------------------------------------------------------------------------------------
bool try_select_max_value_age(const CoinSelectionArgs &args,
    const coin_amount_t target,
    ValueAgeCoins &coins_inout,
    std::vector<std::size_t> &selected_indices_out)
{
    sort_coins_by_value_age(SortOrder::DESCENDING, coins_inout);

    return try_select_min_index(args, target, coins_inout, selected_indices_out);
}
//-------------------------------------------------------------------------------------------------------------------
bool try_select_min_priority(const CoinSelectionArgs &args,
    const value_age_t min_avg_value_age_per_input,
    const coin_amount_t target,
    ValueAgeCoins &coins_inout,
    std::vector<std::size_t> &selected_indices_out)
{
    MinPrioritySearchContext search_context{{}, config::coinset::MIN_PRIORITY_MAX_SUPPLEMENT_SEARCHES};

    const bool selection_found{
            try_select_min_priority_impl(args.max_inputs,
                coin_total_t{args.min_change_amount},
                min_avg_value_age_per_input,
                coin_total_t{target},
                coins_inout,
                search_context,
                selected_indices_out)
        };

    if (search_context.remaining_searches == 0)
    {
        MDEBUG("min priority selection: low priority search limit reached ("
            << config::coinset::MIN_PRIORITY_MAX_SUPPLEMENT_SEARCHES << " searches).");
    }

    if (!selection_found)
    {
        MDEBUG("min priority selection: no selection available (target " << target << ", min average value-age "
            << min_avg_value_age_per_input << ", " << coins_inout.size() << " coins).");
        return false;
    }

    MDEBUG("min priority selection: selected " << selected_indices_out.size() << " of " << coins_inout.size()
        << " coins (target " << target << ", min average value-age " << min_avg_value_age_per_input << ").");
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace coinset
