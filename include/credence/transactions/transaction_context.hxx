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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <credence/storage/storage.hxx>
#include <credence/support.hxx>
#include <credence/transactions/compensatable_operation.hxx>
#include <credence/transactions/transaction_config.hxx>
#include <credence/transactions/transaction_testing_hooks.hxx>

namespace credence
{
namespace transactions
{
    /**
     * What happened when one operation was compensated.
     */
    struct compensation_outcome {
        std::string operation;
        std::chrono::milliseconds duration;
        /** set if the compensation failed */
        std::optional<std::string> error_message;
    };

    /**
     * @brief Everything belonging to one attempt of a transaction.
     *
     * The work function receives the context of the current attempt.  It runs its operations through @ref execute, and
     * may use @ref scope directly for reads and writes which need no compensation.  A context is never reused: a retry
     * gets a fresh context, with a fresh storage scope and no executed operations.
     */
    class transaction_context
    {
      public:
        transaction_context(std::string transaction_id,
                            std::string label,
                            size_t attempt,
                            std::unique_ptr<storage::storage_scope> scope,
                            std::chrono::milliseconds timeout,
                            const transaction_config& config);

        ~transaction_context();

        transaction_context(const transaction_context&) = delete;
        transaction_context& operator=(const transaction_context&) = delete;

        CR_NODISCARD const std::string& transaction_id() const
        {
            return transaction_id_;
        }

        CR_NODISCARD const std::string& label() const
        {
            return label_;
        }

        CR_NODISCARD size_t attempt_number() const
        {
            return attempt_;
        }

        CR_NODISCARD storage::storage_scope& scope()
        {
            return *scope_;
        }

        /**
         * @brief Add an operation to this attempt.  Registering the same operation twice has no effect.
         *
         * @throws std::logic_error once the attempt is completed.
         */
        void register_operation(std::shared_ptr<compensatable_operation> op);

        /**
         * @brief Register the operation and run its forward action against this attempt's scope.
         *
         * The deadline is checked before and after the forward action.
         *
         * @return The result of the forward action.
         * @throws operation_failed if the forward action fails.
         * @throws attempt_expired if the attempt ran out of time.
         */
        nlohmann::json execute(std::shared_ptr<compensatable_operation> op);

        CR_NODISCARD const std::vector<std::shared_ptr<compensatable_operation>>& operations() const
        {
            return operations_;
        }

        /**
         * @brief The operations whose forward action succeeded, in the order they succeeded.
         */
        CR_NODISCARD const std::vector<std::shared_ptr<compensatable_operation>>& executed_operations() const
        {
            return executed_;
        }

        /**
         * @brief Throws @ref attempt_expired if the deadline of the attempt has passed.
         *
         * Long running work should call this from time to time.
         */
        void check_expiry(const std::string& stage = STAGE_OPERATION);

        CR_NODISCARD bool has_expired_client_side(const std::string& stage);

        CR_NODISCARD std::chrono::milliseconds remaining() const;

        /**
         * @brief Compensate the executed operations, most recent first.
         *
         * Every executed operation is compensated even if some compensations fail.
         *
         * @return One outcome per compensated operation, in the order they were compensated.
         */
        std::vector<compensation_outcome> compensate();

        CR_NODISCARD bool is_completed() const
        {
            return completed_;
        }

        void mark_completed()
        {
            completed_ = true;
        }

      private:
        std::string transaction_id_;
        std::string label_;
        size_t attempt_;
        std::unique_ptr<storage::storage_scope> scope_;
        const std::chrono::milliseconds timeout_;
        const std::chrono::steady_clock::time_point start_;
        const std::chrono::steady_clock::time_point deadline_;
        const transaction_config& config_;
        std::vector<std::shared_ptr<compensatable_operation>> operations_;
        std::vector<std::shared_ptr<compensatable_operation>> executed_;
        bool completed_;
    };
} // namespace transactions
} // namespace credence
