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

#include "coinset/coin_ordering.h"
#include "coinset/coin_range_view.h"
#include "coinset/coin_set.h"
#include "coinset/coin_types.h"
#include "coinset_mocks/coin_mocks.h"

#include "gtest/gtest.h"

#include <algorithm>
#include <cstddef>
#include <random>
#include <vector>

using namespace coinset;
using namespace mocks;

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_ordering, orderings)
{
    const CoinSet coins{make_mock_coin_set({10, 20, 20}, {300, 200, 100})};

    const ByAmount by_amount{coins};
    EXPECT_TRUE(by_amount(0, 1));
    EXPECT_FALSE(by_amount(1, 0));
    EXPECT_FALSE(by_amount(1, 2));
    EXPECT_FALSE(by_amount(2, 1));

    const ByValueAge by_value_age{coins};
    EXPECT_TRUE(by_value_age(2, 0));
    EXPECT_FALSE(by_value_age(0, 2));

    const Reversed<ByValueAge> by_value_age_desc{by_value_age};
    EXPECT_TRUE(by_value_age_desc(0, 2));
    EXPECT_FALSE(by_value_age_desc(2, 0));
    EXPECT_FALSE(by_value_age_desc(1, 1));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_ordering, sort_by_amount)
{
    CoinSet coins{make_mock_coin_set({30, 10, 20, 10}, {1, 2, 3, 4})};

    sort_coins_by_amount(SortOrder::ASCENDING, coins);
    EXPECT_EQ(collect_amounts(coins), (std::vector<coin_amount_t>{10, 10, 20, 30}));
    EXPECT_EQ(collect_value_ages(coins), (std::vector<value_age_t>{2, 4, 3, 1}));

    sort_coins_by_amount(SortOrder::DESCENDING, coins);
    EXPECT_EQ(collect_amounts(coins), (std::vector<coin_amount_t>{30, 20, 10, 10}));
    EXPECT_EQ(collect_value_ages(coins), (std::vector<value_age_t>{1, 3, 2, 4}));

    EXPECT_EQ(coins.total_amount(), 70);
    EXPECT_EQ(coins.total_value_age(), 10);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_ordering, sort_by_value_age)
{
    CoinSet coins{make_mock_coin_set({1, 2, 3, 4}, {50, 0, 50, 7})};

    sort_coins_by_value_age(SortOrder::ASCENDING, coins);
    EXPECT_EQ(collect_value_ages(coins), (std::vector<value_age_t>{0, 7, 50, 50}));
    EXPECT_EQ(collect_amounts(coins), (std::vector<coin_amount_t>{2, 4, 1, 3}));

    sort_coins_by_value_age(SortOrder::DESCENDING, coins);
    EXPECT_EQ(collect_value_ages(coins), (std::vector<value_age_t>{50, 50, 7, 0}));
    EXPECT_EQ(collect_amounts(coins), (std::vector<coin_amount_t>{1, 3, 4, 2}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_ordering, sort_trivial_collections)
{
    CoinSet empty_coins;
    EXPECT_NO_THROW(sort_coins_by_amount(SortOrder::ASCENDING, empty_coins));
    EXPECT_TRUE(empty_coins.empty());

    CoinSet single_coin{make_mock_coin_set({5})};
    EXPECT_NO_THROW(sort_coins_by_value_age(SortOrder::DESCENDING, single_coin));
    EXPECT_EQ(collect_amounts(single_coin), (std::vector<coin_amount_t>{5}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_ordering, sort_random)
{
    std::mt19937_64 generator{3};

    for (std::size_t trial{0}; trial < 50; ++trial)
    {
        CoinSet coins{gen_mock_coin_set(40, 20, 1000000, generator)};
        std::vector<coin_amount_t> expected_amounts{collect_amounts(coins)};
        std::sort(expected_amounts.begin(), expected_amounts.end());

        sort_coins_by_amount(SortOrder::ASCENDING, coins);
        ASSERT_EQ(collect_amounts(coins), expected_amounts);
    }
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_ordering, apply_permutation)
{
    CoinSet coins{make_mock_coin_set({10, 20, 30, 40})};

    apply_permutation({2, 0, 3, 1}, coins);
    EXPECT_EQ(collect_amounts(coins), (std::vector<coin_amount_t>{30, 10, 40, 20}));

    apply_permutation({0, 1, 2, 3}, coins);
    EXPECT_EQ(collect_amounts(coins), (std::vector<coin_amount_t>{30, 10, 40, 20}));

    // not permutations of the collection's positions
    EXPECT_ANY_THROW(apply_permutation({0, 1, 2}, coins));
    EXPECT_ANY_THROW(apply_permutation({0, 1, 2, 4}, coins));
    EXPECT_ANY_THROW(apply_permutation({0, 1, 1, 3}, coins));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(coinset_ordering, range_view)
{
    CoinSet coins{make_mock_coin_set({50, 40, 30, 20, 10}, {1, 2, 3, 4, 5})};

    CoinRangeView view{coins, 1, 4};
    ASSERT_EQ(view.size(), 3);
    EXPECT_EQ(view.amount_coin(0).amount(), 40);
    EXPECT_EQ(view.value_age_coin(2).value_age(), 4);
    EXPECT_EQ(view.parent_index(2), 3);
    EXPECT_ANY_THROW(view.amount_coin(3));
    EXPECT_ANY_THROW(view.parent_index(3));
    EXPECT_ANY_THROW(view.swap(0, 3));

    // sorting the view only reorders its window of the parent
    sort_coins_by_amount(SortOrder::ASCENDING, view);
    EXPECT_EQ(collect_amounts(view), (std::vector<coin_amount_t>{20, 30, 40}));
    EXPECT_EQ(collect_amounts(coins), (std::vector<coin_amount_t>{50, 20, 30, 40, 10}));

    // bad windows
    EXPECT_ANY_THROW((CoinRangeView{coins, 3, 2}));
    EXPECT_ANY_THROW((CoinRangeView{coins, 0, 6}));

    CoinRangeView empty_view{coins, 5, 5};
    EXPECT_EQ(empty_view.size(), 0);
}
//-------------------------------------------------------------------------------------------------------------------
