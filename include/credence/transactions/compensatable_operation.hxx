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
#include <memory>
#include <string>

#include <credence/storage/storage.hxx>
#include <credence/support.hxx>
#include <nlohmann/json.hpp>

namespace credence
{
namespace transactions
{
    /**
     * @brief One unit of forward work, and the action which undoes it.
     *
     * The forward action runs at most once.  The compensation runs at most once, and only if the forward action
     * succeeded.  Both are given the storage scope of the attempt they run in.
     */
    class compensatable_operation
    {
      public:
        typedef std::function<void(compensatable_operation&)> executed_listener;

        explicit compensatable_operation(std::string label);

        virtual ~compensatable_operation() = default;

        compensatable_operation(const compensatable_operation&) = delete;
        compensatable_operation& operator=(const compensatable_operation&) = delete;

        CR_NODISCARD const std::string& label() const
        {
            return label_;
        }

        /**
         * @brief Run the forward action.
         *
         * @return The result of the forward action, which is later handed to the compensation.
         * @throws operation_failed if the forward action fails.
         * @throws std::logic_error if the operation was executed before.
         */
        nlohmann::json execute(storage::storage_scope& scope);

        /**
         * @brief Undo the forward action.  Does nothing if it never succeeded, or was already compensated.
         *
         * @throws compensation_error if the compensation fails.
         */
        void compensate(storage::storage_scope& scope);

        CR_NODISCARD bool is_executed() const
        {
            return executed_;
        }

        CR_NODISCARD bool is_compensated() const
        {
            return compensated_;
        }

        CR_NODISCARD const nlohmann::json& execution_result() const
        {
            return result_;
        }

        /**
         * @brief Called once the forward action succeeded.  Used by the owning @ref transaction_context.
         */
        void on_executed(executed_listener listener)
        {
            listener_ = std::move(listener);
        }

      protected:
        virtual nlohmann::json do_execute(storage::storage_scope& scope) = 0;

        virtual void do_compensate(storage::storage_scope& scope, const nlohmann::json& result) = 0;

      private:
        std::string label_;
        bool attempted_;
        bool executed_;
        bool compensated_;
        nlohmann::json result_;
        executed_listener listener_;
    };

    /**
     * @brief An operation made of two closures.
     */
    class custom_operation : public compensatable_operation
    {
      public:
        typedef std::function<nlohmann::json(storage::storage_scope&)> forward_fn;
        typedef std::function<void(storage::storage_scope&, const nlohmann::json&)> compensate_fn;

        custom_operation(std::string label, forward_fn forward, compensate_fn compensate);

      protected:
        nlohmann::json do_execute(storage::storage_scope& scope) override;
        void do_compensate(storage::storage_scope& scope, const nlohmann::json& result) override;

      private:
        forward_fn forward_;
        compensate_fn compensate_;
    };

    inline std::shared_ptr<custom_operation> make_operation(std::string label,
                                                            custom_operation::forward_fn forward,
                                                            custom_operation::compensate_fn compensate)
    {
        return std::make_shared<custom_operation>(std::move(label), std::move(forward), std::move(compensate));
    }
} // namespace transactions
} // namespace credence
