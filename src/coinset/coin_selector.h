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

// Coin selectors: selection policies as interchangeable objects that produce materialized coin sets.

#pragma once

//local headers
#include "coin_selection.h"
#include "coin_set.h"
#include "coin_types.h"

//third party headers

//standard headers
#include <memory>

//forward declarations


namespace coinset
{

enum class CoinSelectionPolicy
{
    MIN_INDEX,
    MIN_NUMBER,
    MAX_VALUE_AGE,
    MIN_PRIORITY
};

////
// CoinSelector
// - interface for selecting a subset of a coin set whose total amount satisfies a target
// - a selector is not guaranteed to find a selection even if the coin set holds enough funds
// - the coins' value-ages must not change while a selection is in progress
///
class CoinSelector
{
public:
//destructor
    virtual ~CoinSelector() = default;

//overloaded operators
    /// disable copy/move (this is a pure virtual base class)
    CoinSelector& operator=(CoinSelector&&) = delete;

//member functions
    /// try to select coins for a target amount
    /// - 'coins_inout' may be reordered
    /// - on failure 'selection_out' is left empty
    virtual bool try_select_coins(const coin_amount_t target, CoinSet &coins_inout, CoinSet &selection_out) const = 0;
};

/// selects the shortest prefix of the coin set in its current order
class MinIndexCoinSelector final : public CoinSelector
{
public:
//constructors
    explicit MinIndexCoinSelector(const CoinSelectionArgs &args) : m_args{args} {}

//member functions
    bool try_select_coins(const coin_amount_t target, CoinSet &coins_inout, CoinSet &selection_out) const override;

//member variables
private:
    const CoinSelectionArgs m_args;
};

/// selects as few coins as possible, largest amounts first
class MinNumberCoinSelector final : public CoinSelector
{
public:
//constructors
    explicit MinNumberCoinSelector(const CoinSelectionArgs &args) : m_args{args} {}

//member functions
    bool try_select_coins(const coin_amount_t target, CoinSet &coins_inout, CoinSet &selection_out) const override;

//member variables
private:
    const CoinSelectionArgs m_args;
};

/// selects the coins with the most value-age first
class MaxValueAgeCoinSelector final : public CoinSelector
{
public:
//constructors
    explicit MaxValueAgeCoinSelector(const CoinSelectionArgs &args) : m_args{args} {}

//member functions
    bool try_select_coins(const coin_amount_t target, CoinSet &coins_inout, CoinSet &selection_out) const override;

//member variables
private:
    const CoinSelectionArgs m_args;
};

/// selects coins whose average value-age per input is at least a threshold
class MinPriorityCoinSelector final : public CoinSelector
{
public:
//constructors
    MinPriorityCoinSelector(const CoinSelectionArgs &args, const value_age_t min_avg_value_age_per_input) :
        m_args{args},
        m_min_avg_value_age_per_input{min_avg_value_age_per_input}
    {}

//member functions
    bool try_select_coins(const coin_amount_t target, CoinSet &coins_inout, CoinSet &selection_out) const override;

//member variables
private:
    const CoinSelectionArgs m_args;
    const value_age_t m_min_avg_value_age_per_input;
};

/**
* brief: make_coin_selector - make a selector for a selection policy
* param: policy -
* param: args -
* param: min_avg_value_age_per_input - only used by the MIN_PRIORITY policy
* return: the selector
*/
std::unique_ptr<CoinSelector> make_coin_selector(const CoinSelectionPolicy policy,
    const CoinSelectionArgs &args,
    const value_age_t min_avg_value_age_per_input = 0);

} //namespace coinset
