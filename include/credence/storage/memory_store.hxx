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
#include <condition_variable>
#include <map>
#include <mutex>
#include <utility>

#include <credence/storage/storage.hxx>

namespace credence
{
namespace storage
{
    class memory_scope;

    typedef std::map<std::string, nlohmann::json> table_rows;
    typedef std::map<std::string, table_rows> table_map;

    /**
     * @brief In-process transactional store.
     *
     * Writes are staged in the scope and applied on commit.  Every written row is locked by the writing scope until it
     * commits or rolls back; a writer which cannot get a lock within the lock timeout fails with a
     * @ref transactions::transient_storage_error.
     *
     * Reads under READ_COMMITTED see committed rows plus the scope's own writes.  REPEATABLE_READ and SERIALIZABLE read
     * from a copy of the committed rows taken when the scope was opened.  READ_UNCOMMITTED also sees rows staged by
     * other open scopes.
     */
    class memory_store : public storage
    {
      public:
        explicit memory_store(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(1000));

        ~memory_store() override;

        memory_store(const memory_store&) = delete;
        memory_store& operator=(const memory_store&) = delete;

        /**
         * @brief Declare the primary key field of a table.  Tables are otherwise created on first write, keyed by `id`.
         */
        void define_table(const std::string& table, const std::string& key_field);

        CR_NODISCARD std::string key_field(const std::string& table) const override;

        std::unique_ptr<storage_scope> begin_transaction(isolation_level level, bool read_only) override;

        void commit(storage_scope& scope) override;

        void rollback(storage_scope& scope) override;

        // Non transactional access to committed rows, mostly for tests and diagnostics.
        CR_NODISCARD std::optional<nlohmann::json> get(const std::string& table, const std::string& key) const;
        CR_NODISCARD std::vector<nlohmann::json> all(const std::string& table) const;
        CR_NODISCARD size_t size(const std::string& table) const;
        void clear();

        CR_NODISCARD size_t active_scopes() const;

        CR_NODISCARD std::chrono::milliseconds lock_timeout() const
        {
            return lock_timeout_;
        }

      private:
        friend class memory_scope;

        typedef std::pair<std::string, std::string> row_id;

        mutable std::mutex mutex_;
        std::condition_variable lock_released_;
        table_map tables_;
        std::map<std::string, std::string> key_fields_;
        std::map<row_id, memory_scope*> locks_;
        std::map<std::string, memory_scope*> scopes_;
        const std::chrono::milliseconds lock_timeout_;

        std::string key_field_locked(const std::string& table) const;
        memory_scope& as_memory_scope(storage_scope& scope);
        void lock_row(std::unique_lock<std::mutex>& lock, memory_scope& scope, const std::string& table, const std::string& key);
        void release_locks_locked(memory_scope& scope);
        void finish(memory_scope& scope, bool apply);
    };
} // namespace storage
} // namespace credence
