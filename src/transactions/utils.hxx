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
#include <cmath>
#include <cstdint>

#include <credence/transactions/execution_options.hxx>

namespace credence
{
namespace transactions
{
    // past this the doubling overflows long before it could be below any sane max_backoff
    static const size_t RETRY_EXPONENT_CAP = 30;

    /**
     * Delay before the attempt following attempt number `attempt` (1-based): the retry delay, or with exponential
     * backoff retry_delay * 2^(attempt-1) capped at max_backoff.  No jitter.
     */
    inline std::chrono::milliseconds retry_delay_for(const execution_options& options, size_t attempt)
    {
        if (!options.exponential_backoff()) {
            return options.retry_delay();
        }
        size_t exponent = attempt > 0 ? attempt - 1 : 0;
        if (exponent > RETRY_EXPONENT_CAP) {
            return options.max_backoff();
        }
        auto delay = static_cast<double>(options.retry_delay().count()) * std::pow(2.0, static_cast<double>(exponent));
        if (delay > static_cast<double>(options.max_backoff().count())) {
            return options.max_backoff();
        }
        return std::chrono::milliseconds(static_cast<int64_t>(delay));
    }

    inline int64_t now_ms()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    }

    template<typename Duration>
    int64_t to_ms(Duration d)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    }
} // namespace transactions
} // namespace credence
