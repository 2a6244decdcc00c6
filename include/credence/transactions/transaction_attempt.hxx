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

#include <credence/transactions/attempt_state.hxx>
#include <optional>
#include <string>
#include <vector>

namespace credence
{
namespace transactions
{
    struct transaction_attempt {
        size_t number;
        attempt_state state;
        /** labels of the operations compensated by this attempt, in the order they were compensated */
        std::vector<std::string> compensated_operations;
        std::optional<std::string> error_message;
        explicit transaction_attempt(size_t attempt_number);
    };
} // namespace transactions
} // namespace credence
