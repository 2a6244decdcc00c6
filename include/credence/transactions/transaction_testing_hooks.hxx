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

#include <functional>
#include <optional>
#include <string>

#include <credence/transactions/exceptions.hxx>

namespace credence
{
namespace transactions
{
    class transaction_context;
    namespace
    {
        std::optional<error_class> noop_1(transaction_context*)
        {
            return {};
        }

        std::optional<error_class> noop_2(transaction_context*, const std::string&)
        {
            return {};
        }

        bool noop_3(transaction_context*, const std::string&)
        {
            return false;
        }
    } // namespace

    static const std::string STAGE_BEGIN = "begin";
    static const std::string STAGE_OPERATION = "operation";
    static const std::string STAGE_AFTER_OPERATION = "afterOperation";
    static const std::string STAGE_AFTER_WORK = "afterWork";
    static const std::string STAGE_COMMIT = "commit";
    static const std::string STAGE_COMPENSATE = "compensate";
    static const std::string STAGE_ROLLBACK = "rollback";

    /**
     * Hooks purely for testing purposes.  Returning an @ref error_class from one of them injects an error of that class
     * at that point of the attempt, as if the storage or the business code had raised it.
     */
    struct transaction_testing_hooks {
        std::function<std::optional<error_class>(transaction_context*)> after_begin = noop_1;
        std::function<std::optional<error_class>(transaction_context*)> after_work = noop_1;
        std::function<std::optional<error_class>(transaction_context*)> before_commit = noop_1;
        std::function<std::optional<error_class>(transaction_context*)> before_rollback = noop_1;

        std::function<std::optional<error_class>(transaction_context*, const std::string&)> before_operation = noop_2;
        std::function<std::optional<error_class>(transaction_context*, const std::string&)> after_operation = noop_2;
        std::function<std::optional<error_class>(transaction_context*, const std::string&)> before_compensation = noop_2;

        std::function<bool(transaction_context*, const std::string&)> has_expired_client_side_hook = noop_3;
    };
} // namespace transactions
} // namespace credence
