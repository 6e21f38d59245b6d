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
#include "simple_coin.h"

//local headers
#include "coinset/coin_types.h"
#include "misc_log_ex.h"
#include "transaction_types.h"

//third party headers
#include "boost/multiprecision/cpp_int.hpp"

//standard headers
#include <cstdint>
#include <limits>
#include <memory>
#include <utility>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "coinset_impl"

namespace coinset
{
//-------------------------------------------------------------------------------------------------------------------
SimpleCoin::SimpleCoin(std::shared_ptr<const Transaction> tx,
    const std::uint32_t output_index,
    const std::uint64_t num_confirmations) :
    m_tx{std::move(tx)},
    m_output_index{output_index},
    m_num_confirmations{num_confirmations},
    m_value_age{0}
{
    CHECK_AND_ASSERT_THROW_MES(m_tx, "simple coin: transaction is null.");
    CHECK_AND_ASSERT_THROW_MES(m_output_index < m_tx->outputs.size(),
        "simple coin: output index " << m_output_index << " out of range (transaction has "
        << m_tx->outputs.size() << " outputs).");

    const boost::multiprecision::uint128_t value_age{
            boost::multiprecision::uint128_t{m_num_confirmations} * this->tx_output().amount
        };
    CHECK_AND_ASSERT_THROW_MES(value_age <= std::numeric_limits<value_age_t>::max(),
        "simple coin: value-age overflow (" << m_num_confirmations << " confirmations, amount "
        << this->tx_output().amount << ").");

    m_value_age = static_cast<value_age_t>(value_age);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace coinset
