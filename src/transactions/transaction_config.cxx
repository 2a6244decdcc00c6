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

#include <credence/transactions/transaction_config.hxx>
#include <credence/transactions/transaction_testing_hooks.hxx>

namespace credence
{
namespace transactions
{
    transaction_config::transaction_config()
      : testing_hooks_(new transaction_testing_hooks())
    {
    }

    transaction_config::~transaction_config() = default;

    transaction_config::transaction_config(const transaction_config& config)
      : default_options_(config.default_options())
      , testing_hooks_(new transaction_testing_hooks(config.testing_hooks()))
    {
    }

    transaction_config& transaction_config::operator=(const transaction_config& c)
    {
        default_options_ = c.default_options();
        testing_hooks_.reset(new transaction_testing_hooks(c.testing_hooks()));
        return *this;
    }

    void transaction_config::test_factories(transaction_testing_hooks& hooks)
    {
        testing_hooks_.reset(new transaction_testing_hooks(hooks));
    }
} // namespace transactions
} // namespace credence
