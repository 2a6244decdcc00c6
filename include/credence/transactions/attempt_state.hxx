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

#include <stdexcept>
#include <string>

namespace credence
{
namespace transactions
{
    /**
     * The states an attempt moves through inside @ref transaction_manager::execute.
     */
    enum class attempt_state {
        /**
         * The attempt has been created, nothing has happened yet.
         */
        IDLE,

        /**
         * The storage transaction is being opened.
         */
        BEGINNING,

        /**
         * The caller's work function is running.
         */
        RUNNING,

        /**
         * The work succeeded, and the storage transaction is being committed.
         */
        COMMITTING,

        /**
         * The attempt failed, executed operations are being compensated and the storage transaction rolled back.
         */
        COMPENSATING,

        /**
         * Set once the attempt failed with a retryable error, and another attempt will follow after the backoff delay.
         */
        RETRY_SCHEDULED,

        /**
         * Set once the commit is fully completed.
         */
        COMMITTED,

        /**
         * Set once the attempt has been compensated and no retry will follow.
         */
        FAILED
    };

    inline const char* attempt_state_name(attempt_state state)
    {
        switch (state) {
            case attempt_state::IDLE:
                return "IDLE";
            case attempt_state::BEGINNING:
                return "BEGINNING";
            case attempt_state::RUNNING:
                return "RUNNING";
            case attempt_state::COMMITTING:
                return "COMMITTING";
            case attempt_state::COMPENSATING:
                return "COMPENSATING";
            case attempt_state::RETRY_SCHEDULED:
                return "RETRY_SCHEDULED";
            case attempt_state::COMMITTED:
                return "COMMITTED";
            case attempt_state::FAILED:
                return "FAILED";
            default:
                throw std::runtime_error("unknown attempt state");
        }
    }
} // namespace transactions
} // namespace credence
