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

#include <credence/transactions/transaction_event.hxx>

namespace credence
{
namespace transactions
{
    typedef std::function<void(const transaction_event&)> transaction_hook;

    /**
     * @brief Handlers the transaction manager calls synchronously, one per lifecycle event.
     *
     * The manager only knows about this set of hooks, never about whoever created it.  Unset hooks are skipped.
     */
    struct transaction_hooks {
        transaction_hook on_begin;
        transaction_hook on_commit;
        transaction_hook on_rollback;
        transaction_hook on_compensate;
        transaction_hook on_retry;
        transaction_hook on_timeout;

        /**
         * @brief Returns the hook for a given event type, which may be empty.
         */
        const transaction_hook& hook_for(event_type type) const;

        /**
         * @brief Combine with another set of hooks.
         *
         * Where both sets have a hook for an event, the hook from this set runs first.
         */
        transaction_hooks combine(const transaction_hooks& other) const;
    };
} // namespace transactions
} // namespace credence
