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

#include <string>
#include <vector>

#include <credence/transactions/transaction_attempt.hxx>

namespace credence
{
namespace transactions
{
    /**
     * @brief Results of a transaction
     * @volatile
     *
     * Contains internal information on a transaction,
     * returned by @ref transaction_manager::run() and carried by @ref transaction_exception
     */
    struct transaction_result {
        std::string transaction_id;
        std::string label;
        std::vector<transaction_attempt> attempts;
        bool committed;
    };
} // namespace transactions
} // namespace credence
