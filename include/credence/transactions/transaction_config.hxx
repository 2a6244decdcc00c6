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

#include <memory>

#include <credence/support.hxx>
#include <credence/transactions/execution_options.hxx>

namespace credence
{
namespace transactions
{
    struct transaction_testing_hooks;
    /**
     * Manager-wide tunables: the options used when a call doesn't pass its own, and the testing hooks.
     */
    class transaction_config
    {
      public:
        transaction_config();

        ~transaction_config();

        transaction_config(const transaction_config& c);

        transaction_config& operator=(const transaction_config& c);

        CR_NODISCARD const execution_options& default_options() const
        {
            return default_options_;
        }

        void default_options(const execution_options& options)
        {
            default_options_ = options;
        }

        void test_factories(transaction_testing_hooks& hooks);

        transaction_testing_hooks& testing_hooks() const
        {
            return *testing_hooks_;
        }

      protected:
        execution_options default_options_;
        std::unique_ptr<transaction_testing_hooks> testing_hooks_;
    };
} // namespace transactions
} // namespace credence
