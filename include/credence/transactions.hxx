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
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <vector>

#include <credence/storage/storage.hxx>
#include <credence/transactions/compensatable_operation.hxx>
#include <credence/transactions/exceptions.hxx>
#include <credence/transactions/execution_options.hxx>
#include <credence/transactions/storage_operations.hxx>
#include <credence/transactions/transaction_config.hxx>
#include <credence/transactions/transaction_context.hxx>
#include <credence/transactions/transaction_event.hxx>
#include <credence/transactions/transaction_hooks.hxx>
#include <credence/transactions/transaction_result.hxx>

namespace credence
{
namespace transactions
{
    /** @brief Transaction logic should be contained in a lambda of this form */
    typedef std::function<void(transaction_context&)> logic;

    /**
     * @mainpage
     * A transaction consists of a lambda which runs compensatable operations against the @ref transaction_context it
     * is given.  If anything in the lambda fails, every operation which already ran is compensated, most recent first,
     * and the storage transaction is rolled back.  Transient failures and timeouts are retried with a new attempt.  For
     * example:
     *
     * @code{.cpp}
     * storage::memory_store store;
     * transaction_manager txns(store);
     *
     * try {
     *     auto account = txns.execute<nlohmann::json>([&](transaction_context& ctx) {
     *         auto created = ctx.execute(std::make_shared<insert_operation>("create account", "accounts", account_json));
     *         ctx.execute(std::make_shared<update_operation>("debit", "ledger", "main", debit_patch));
     *         return created;
     *     }, execution_options().label("accounts.open"));
     * } catch (const transaction_expired& expired) {
     *     cerr << "txn timed out: " << expired.what() << endl;
     * } catch (const transaction_failed& failed) {
     *     cerr << "txn failed: " << failed.what() << endl;
     * }
     * @endcode
     *
     * For a more detailed example, see @ref examples/oracle_feed.cxx
     *
     * @example examples/oracle_feed.cxx
     */
    class transaction_manager
    {
      public:
        /**
         * @brief Create a transaction manager.
         *
         * @param store The store every transaction opens its storage transactions on.  Must outlive the manager.
         * @param config Defaults for every call, and testing hooks.
         */
        explicit transaction_manager(storage::storage& store, const transaction_config& config = transaction_config());

        ~transaction_manager();

        transaction_manager(const transaction_manager&) = delete;
        transaction_manager& operator=(const transaction_manager&) = delete;

        /**
         * @brief Add a set of lifecycle hooks.
         *
         * Hooks registered earlier keep running, before the new ones.  A hook which throws is logged, and does not
         * affect the transaction.
         */
        void register_hooks(const transaction_hooks& hooks);

        /**
         * @brief Run a transaction with the default options of the manager.
         *
         * @param logic The lambda containing the operations of the transaction.  It may be called more than once, once
         *              per attempt.
         * @return The result of the transaction.
         * @throws transaction_failed, transaction_expired
         */
        transaction_result run(const logic& logic);

        transaction_result run(const logic& logic, const execution_options& options);

        /**
         * @brief Run a transaction and return what its lambda returned in the attempt which committed.
         */
        template<typename T>
        T execute(const std::function<T(transaction_context&)>& work)
        {
            return execute<T>(work, config_.default_options());
        }

        template<typename T>
        T execute(const std::function<T(transaction_context&)>& work, const execution_options& options)
        {
            if constexpr (std::is_void_v<T>) {
                run(work, options);
            } else {
                std::optional<T> retval;
                run([&](transaction_context& ctx) { retval.emplace(work(ctx)); }, options);
                return std::move(*retval);
            }
        }

        /**
         * @brief Run @ref execute on a separate thread.
         *
         * Exceptions, @ref transaction_failed and @ref transaction_expired included, are raised by the future.
         */
        template<typename T>
        std::future<T> execute_async(std::function<T(transaction_context&)> work, execution_options options)
        {
            return std::async(std::launch::async, [this, work = std::move(work), options = std::move(options)]() {
                return execute<T>(work, options);
            });
        }

        template<typename T>
        std::future<T> execute_async(std::function<T(transaction_context&)> work)
        {
            return execute_async<T>(std::move(work), config_.default_options());
        }

        /**
         * @brief Ids of the transactions currently running on this manager.
         */
        CR_NODISCARD std::vector<std::string> active_transactions() const;

        CR_NODISCARD const transaction_config& config() const
        {
            return config_;
        }

        CR_NODISCARD storage::storage& store()
        {
            return storage_;
        }

      private:
        storage::storage& storage_;
        transaction_config config_;
        mutable std::mutex mutex_;
        transaction_hooks hooks_;
        std::set<std::string> active_;

        void emit(const transaction_event& event) const;
        void track(const std::string& transaction_id);
        void untrack(const std::string& transaction_id);
    };
} // namespace transactions
} // namespace credence
