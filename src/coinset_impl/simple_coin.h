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

// Coin backed by a transaction output and the number of confirmations of its transaction.

#pragma once

//local headers
#include "coinset/coin_types.h"
#include "transaction_types.h"

//third party headers

//standard headers
#include <cstdint>
#include <memory>

//forward declarations


namespace coinset
{

////
// SimpleCoin
// - amount: the amount of the referenced output
// - value-age: confirmations * amount (fixed at construction; a coin is a snapshot of its transaction's depth)
///
class SimpleCoin final : public Coin
{
public:
//constructors
    /// normal constructor
    SimpleCoin(std::shared_ptr<const Transaction> tx,
        const std::uint32_t output_index,
        const std::uint64_t num_confirmations);

//member functions
    coin_amount_t amount() const override { return this->tx_output().amount; }
    value_age_t value_age() const override { return m_value_age; }

    /// the output this coin spends
    const TxOutput& tx_output() const { return m_tx->outputs[m_output_index]; }
    const Transaction& tx() const { return *m_tx; }
    std::uint32_t output_index() const { return m_output_index; }
    std::uint64_t num_confirmations() const { return m_num_confirmations; }

//member variables
private:
    std::shared_ptr<const Transaction> m_tx;
    std::uint32_t m_output_index;
    std::uint64_t m_num_confirmations;
    value_age_t m_value_age;
};

} //namespace coinset
