/*
 *     Copyright 2021 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <credence/support.hxx>
#include <credence/transactions/transaction_result.hxx>
#include <credence/transactions/uid_generator.hxx>

namespace credence
{
namespace transactions
{
    /**
     * State of a transaction across all its attempts.
     */
    class transaction_record
    {
      public:
        explicit transaction_record(std::string label)
          : transaction_id_(uid_generator::next())
          , label_(std::move(label))
          , start_time_client_(std::chrono::steady_clock::now())
        {
        }

        CR_NODISCARD const std::string& transaction_id() const
        {
            return transaction_id_;
        }

        CR_NODISCARD const std::string& label() const
        {
            return label_;
        }

        CR_NODISCARD size_t num_attempts() const
        {
            return attempts_.size();
        }

        void add_attempt()
        {
            attempts_.emplace_back(attempts_.size() + 1);
        }

        CR_NODISCARD transaction_attempt& current_attempt()
        {
            if (attempts_.empty()) {
                throw std::runtime_error("transaction record has no attempts yet");
            }
            return attempts_.back();
        }

        CR_NODISCARD std::chrono::milliseconds elapsed() const
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time_client_);
        }

        CR_NODISCARD transaction_result get_transaction_result(bool committed) const
        {
            return transaction_result{ transaction_id_, label_, attempts_, committed };
        }

      private:
        std::string transaction_id_;
        std::string label_;
        /** The time this overall transaction started */
        const std::chrono::steady_clock::time_point start_time_client_;
        std::vector<transaction_attempt> attempts_;
    };
} // namespace transactions
} // namespace credence
