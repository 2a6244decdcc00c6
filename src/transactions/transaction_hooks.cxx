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

#include <credence/transactions/transaction_hooks.hxx>

#include <stdexcept>

namespace credence
{
namespace transactions
{
    namespace
    {
        transaction_hook chain(const transaction_hook& first, const transaction_hook& second)
        {
            if (!first) {
                return second;
            }
            if (!second) {
                return first;
            }
            return [first, second](const transaction_event& event) {
                first(event);
                second(event);
            };
        }
    } // namespace

    const transaction_hook& transaction_hooks::hook_for(event_type type) const
    {
        switch (type) {
            case event_type::BEGIN:
                return on_begin;
            case event_type::COMMIT:
                return on_commit;
            case event_type::ROLLBACK:
                return on_rollback;
            case event_type::COMPENSATE:
                return on_compensate;
            case event_type::RETRY:
                return on_retry;
            case event_type::TIMEOUT:
                return on_timeout;
        }
        throw std::runtime_error("unknown event type");
    }

    transaction_hooks transaction_hooks::combine(const transaction_hooks& other) const
    {
        transaction_hooks combined;
        combined.on_begin = chain(on_begin, other.on_begin);
        combined.on_commit = chain(on_commit, other.on_commit);
        combined.on_rollback = chain(on_rollback, other.on_rollback);
        combined.on_compensate = chain(on_compensate, other.on_compensate);
        combined.on_retry = chain(on_retry, other.on_retry);
        combined.on_timeout = chain(on_timeout, other.on_timeout);
        return combined;
    }
} // namespace transactions
} // namespace credence
