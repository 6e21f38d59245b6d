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

#include "coinset/coin_selection.h"
#include "coinset/coin_set.h"
#include "coinset/coin_subset.h"
#include "coinset/coin_types.h"
#include "coinset_config.h"
#include "coinset_mocks/coin_mocks.h"

#include "gtest/gtest.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <set>
#include <vector>

using namespace coinset;
using namespace mocks;

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static CoinSelectionArgs make_args(const std::size_t max_inputs, const coin_amount_t min_change_amount)
{
    return CoinSelectionArgs{max_inputs, min_change_amount};
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void check_selection(const CoinSelectionArgs &args,
    const coin_amount_t target,
    const ValueAgeCoins &coins,
    const std::vector<std::size_t> &selected_indices)
{
    ASSERT_FALSE(selected_indices.empty());
    ASSERT_LE(selected_indices.size(), args.max_inputs);

    // no coin is selected twice
    const std::set<std::size_t> unique_indices{selected_indices.begin(), selected_indices.end()};
    ASSERT_EQ(unique_indices.size(), selected_indices.size());

    const CoinSubset selection{coins, selected_indices};
    ASSERT_TRUE(satisfies_target_amount(target, args.min_change_amount, selection.total_amount()));
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_selection, satisfies_target_amount)
{
    for (coin_amount_t target{0}; target <= 12; ++target)
    {
        for (coin_amount_t min_change{0}; min_change <= 12; ++min_change)
        {
            for (std::uint64_t total{0}; total <= 30; ++total)
            {
                const bool expected{total == target || (total >= target && total - target >= min_change)};
                EXPECT_EQ(satisfies_target_amount(target, min_change, coin_total_t{total}), expected)
                    << "target " << target << ", min change " << min_change << ", total " << total;
            }
        }
    }

    // no overflow at the top of the amount range
    const coin_amount_t max_amount{std::numeric_limits<coin_amount_t>::max()};
    const coin_total_t max_total{max_amount};

    EXPECT_TRUE(satisfies_target_amount(max_amount, max_amount, max_total));
    EXPECT_FALSE(satisfies_target_amount(max_amount, max_amount, max_total + 1));
    EXPECT_TRUE(satisfies_target_amount(max_amount, max_amount, max_total * 2));
    EXPECT_FALSE(satisfies_target_amount(max_amount, max_amount, max_total - 1));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_selection, default_args)
{
    const CoinSelectionArgs args{default_coin_selection_args()};
    EXPECT_EQ(args.max_inputs, config::coinset::DEFAULT_MAX_INPUTS);
    EXPECT_EQ(args.min_change_amount, config::coinset::DEFAULT_MIN_CHANGE_AMOUNT);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_selection, min_index)
{
    const CoinSet coins{make_mock_coin_set({100, 200, 300})};
    std::vector<std::size_t> selected_indices;

    // shortest satisfying prefix
    ASSERT_TRUE(try_select_min_index(make_args(3, 0), 250, coins, selected_indices));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0, 1}));

    ASSERT_TRUE(try_select_min_index(make_args(3, 0), 100, coins, selected_indices));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0}));

    // whole collection
    ASSERT_TRUE(try_select_min_index(make_args(3, 0), 600, coins, selected_indices));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0, 1, 2}));

    // the input budget cuts the prefix short
    EXPECT_FALSE(try_select_min_index(make_args(2, 0), 600, coins, selected_indices));
    EXPECT_TRUE(selected_indices.empty());

    // insufficient funds
    EXPECT_FALSE(try_select_min_index(make_args(3, 0), 601, coins, selected_indices));
    EXPECT_TRUE(selected_indices.empty());

    // no budget
    EXPECT_FALSE(try_select_min_index(make_args(0, 0), 100, coins, selected_indices));
    EXPECT_TRUE(selected_indices.empty());

    // empty collection
    EXPECT_FALSE(try_select_min_index(make_args(3, 0), 1, CoinSet{}, selected_indices));
    EXPECT_TRUE(selected_indices.empty());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_selection, min_index_min_change)
{
    const CoinSet coins{make_mock_coin_set({100, 120})};
    std::vector<std::size_t> selected_indices;

    // exact hit needs no change
    ASSERT_TRUE(try_select_min_index(make_args(2, 50), 100, coins, selected_indices));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0}));

    // 100 would leave change of 10 (dust), 220 leaves 130
    ASSERT_TRUE(try_select_min_index(make_args(2, 50), 90, coins, selected_indices));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0, 1}));

    // 220 would leave change of 20 (dust)
    EXPECT_FALSE(try_select_min_index(make_args(2, 50), 200, coins, selected_indices));
    EXPECT_TRUE(selected_indices.empty());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_selection, min_number_largest_first)
{
    CoinSet coins{make_mock_coin_set({500, 100, 400})};
    std::vector<std::size_t> selected_indices;

    ASSERT_TRUE(try_select_min_number(make_args(3, 0), 700, coins, selected_indices));

    // the collection is left sorted by descending amount
    EXPECT_EQ(collect_amounts(coins), (std::vector<coin_amount_t>{500, 400, 100}));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(CoinSubset(coins, selected_indices).total_amount(), 900);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_selection, min_number_insufficient_funds)
{
    CoinSet coins{make_mock_coin_set({100, 100})};
    std::vector<std::size_t> selected_indices{7};

    EXPECT_FALSE(try_select_min_number(make_args(2, 0), 300, coins, selected_indices));
    EXPECT_TRUE(selected_indices.empty());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_selection, min_number_stable)
{
    // equal amounts keep their relative order
    CoinSet coins{make_mock_coin_set({5, 9, 5, 5}, {1, 2, 3, 4})};
    std::vector<std::size_t> selected_indices;

    ASSERT_TRUE(try_select_min_number(make_args(4, 0), 14, coins, selected_indices));
    EXPECT_EQ(collect_amounts(coins), (std::vector<coin_amount_t>{9, 5, 5, 5}));
    EXPECT_EQ(collect_value_ages(coins), (std::vector<value_age_t>{2, 1, 3, 4}));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0, 1}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_selection, unconfirmed_coin)
{
    // a coin with no value-age is still selectable by every policy except min priority with a positive threshold
    std::vector<std::size_t> selected_indices;

    CoinSet coins{make_mock_coin_set({200}, {0})};
    ASSERT_TRUE(try_select_min_index(make_args(1, 50), 100, coins, selected_indices));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0}));
    EXPECT_EQ(CoinSubset(coins, selected_indices).total_amount(), 200);

    ASSERT_TRUE(try_select_min_number(make_args(1, 50), 100, coins, selected_indices));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0}));

    ASSERT_TRUE(try_select_max_value_age(make_args(1, 50), 100, coins, selected_indices));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0}));

    ASSERT_TRUE(try_select_min_priority(make_args(1, 50), 0, 100, coins, selected_indices));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0}));

    EXPECT_FALSE(try_select_min_priority(make_args(1, 50), 1, 100, coins, selected_indices));
    EXPECT_TRUE(selected_indices.empty());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_selection, max_value_age)
{
    CoinSet coins{make_mock_coin_set({100, 200, 300}, {50, 10, 900})};
    std::vector<std::size_t> selected_indices;

    ASSERT_TRUE(try_select_max_value_age(make_args(3, 0), 350, coins, selected_indices));

    // the collection is left sorted by descending value-age
    EXPECT_EQ(collect_value_ages(coins), (std::vector<value_age_t>{900, 50, 10}));
    EXPECT_EQ(selected_indices, (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(collect_amounts(coins, selected_indices), (std::vector<coin_amount_t>{300, 100}));

    // the oldest coins can't cover the target within the budget
    EXPECT_FALSE(try_select_max_value_age(make_args(2, 0), 550, coins, selected_indices));
    EXPECT_TRUE(selected_indices.empty());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_selection, random_selections)
{
    std::mt19937_64 generator{42};
    std::uniform_int_distribution<std::size_t> num_coins_distribution{0, 12};
    std::uniform_int_distribution<std::size_t> max_inputs_distribution{0, 6};
    std::uniform_int_distribution<coin_amount_t> min_change_distribution{0, 100};
    std::uniform_int_distribution<coin_amount_t> target_distribution{1, 4000};

    std::size_t num_successes{0};

    for (std::size_t trial{0}; trial < 300; ++trial)
    {
        const CoinSet coins{gen_mock_coin_set(num_coins_distribution(generator), 1000, 100000, generator)};
        const CoinSelectionArgs args{make_args(max_inputs_distribution(generator), min_change_distribution(generator))};
        const coin_amount_t target{target_distribution(generator)};

        // min index
        {
            std::vector<std::size_t> selected_indices;
            if (try_select_min_index(args, target, coins, selected_indices))
            {
                ASSERT_NO_FATAL_FAILURE(check_selection(args, target, coins, selected_indices));
                ++num_successes;
            }
            else
                ASSERT_TRUE(selected_indices.empty());
        }

        // min number and max value-age: run twice on copies to check determinism
        {
            CoinSet coins_a{coins};
            CoinSet coins_b{coins};
            std::vector<std::size_t> selected_indices_a;
            std::vector<std::size_t> selected_indices_b;

            const bool result_a{try_select_min_number(args, target, coins_a, selected_indices_a)};
            const bool result_b{try_select_min_number(args, target, coins_b, selected_indices_b)};
            ASSERT_EQ(result_a, result_b);
            ASSERT_EQ(selected_indices_a, selected_indices_b);
            ASSERT_EQ(collect_amounts(coins_a), collect_amounts(coins_b));
            ASSERT_EQ(coins_a.total_amount(), coins.total_amount());

            if (result_a)
                ASSERT_NO_FATAL_FAILURE(check_selection(args, target, coins_a, selected_indices_a));
            else
                ASSERT_TRUE(selected_indices_a.empty());
        }
        {
            CoinSet coins_a{coins};
            CoinSet coins_b{coins};
            std::vector<std::size_t> selected_indices_a;
            std::vector<std::size_t> selected_indices_b;

            const bool result_a{try_select_max_value_age(args, target, coins_a, selected_indices_a)};
            const bool result_b{try_select_max_value_age(args, target, coins_b, selected_indices_b)};
            ASSERT_EQ(result_a, result_b);
            ASSERT_EQ(selected_indices_a, selected_indices_b);
            ASSERT_EQ(collect_value_ages(coins_a), collect_value_ages(coins_b));

            if (result_a)
                ASSERT_NO_FATAL_FAILURE(check_selection(args, target, coins_a, selected_indices_a));
            else
                ASSERT_TRUE(selected_indices_a.empty());
        }
    }

    // the parameters are not so tight that nothing is ever selected
    EXPECT_GT(num_successes, 0);
}
//-------------------------------------------------------------------------------------------------------------------
