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
#include <string>

#include <credence/support.hxx>
#include <credence/transactions/isolation_level.hxx>
#include <nlohmann/json.hpp>

namespace credence
{
namespace transactions
{
    /**
     * Tunables for a single call to @ref transaction_manager::execute.
     */
    class execution_options
    {
      public:
        execution_options();

        /**
         * @brief Read options from a JSON object.
         *
         * Recognised keys are `label`, `max_retries`, `retry_delay_ms`, `exponential_backoff`, `max_backoff_ms`,
         * `timeout_ms`, `isolation_level` and `read_only`.  Missing keys keep their value in `defaults`.
         */
        static execution_options from_json(const nlohmann::json& j, const execution_options& defaults = execution_options());

        CR_NODISCARD nlohmann::json to_json() const;

        CR_NODISCARD const std::string& label() const
        {
            return label_;
        }

        execution_options& label(const std::string& label)
        {
            label_ = label;
            return *this;
        }

        CR_NODISCARD size_t max_retries() const
        {
            return max_retries_;
        }

        execution_options& max_retries(size_t retries)
        {
            max_retries_ = retries;
            return *this;
        }

        CR_NODISCARD std::chrono::milliseconds retry_delay() const
        {
            return retry_delay_;
        }

        template<typename T>
        execution_options& retry_delay(T duration)
        {
            retry_delay_ = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
            return *this;
        }

        CR_NODISCARD bool exponential_backoff() const
        {
            return exponential_backoff_;
        }

        execution_options& exponential_backoff(bool value)
        {
            exponential_backoff_ = value;
            return *this;
        }

        CR_NODISCARD std::chrono::milliseconds max_backoff() const
        {
            return max_backoff_;
        }

        template<typename T>
        execution_options& max_backoff(T duration)
        {
            max_backoff_ = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
            return *this;
        }

        CR_NODISCARD std::chrono::milliseconds timeout() const
        {
            return timeout_;
        }

        template<typename T>
        execution_options& timeout(T duration)
        {
            timeout_ = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
            return *this;
        }

        CR_NODISCARD enum isolation_level isolation_level() const
        {
            return isolation_level_;
        }

        execution_options& isolation_level(enum isolation_level level)
        {
            isolation_level_ = level;
            return *this;
        }

        CR_NODISCARD bool read_only() const
        {
            return read_only_;
        }

        execution_options& read_only(bool value)
        {
            read_only_ = value;
            return *this;
        }

      private:
        std::string label_;
        size_t max_retries_;
        std::chrono::milliseconds retry_delay_;
        bool exponential_backoff_;
        std::chrono::milliseconds max_backoff_;
        std::chrono::milliseconds timeout_;
        enum isolation_level isolation_level_;
        bool read_only_;
    };
} // namespace transactions
} // namespace credence
