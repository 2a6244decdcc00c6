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

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <credence/support.hxx>
#include <credence/transactions/isolation_level.hxx>
#include <nlohmann/json.hpp>

namespace credence
{
namespace storage
{
    using transactions::isolation_level;

    /**
     * @brief The primary key value of a record as a string.  String keys are used as they are, other values in their
     * JSON form.
     */
    inline std::string record_key(const nlohmann::json& value)
    {
        if (value.is_string()) {
            return value.get<std::string>();
        }
        return value.dump();
    }

    /**
     * @brief A storage transaction.
     *
     * All reads and writes made through a scope belong to the storage transaction it was opened for.  A scope is owned
     * by exactly one @ref transactions::transaction_context, and cannot be used once committed or rolled back.
     *
     * Records are JSON objects kept in named tables.  Each table has a primary key field, `id` unless the store says
     * otherwise.
     */
    class storage_scope
    {
      public:
        virtual ~storage_scope() = default;

        CR_NODISCARD virtual const std::string& id() const = 0;

        CR_NODISCARD virtual enum isolation_level isolation_level() const = 0;

        CR_NODISCARD virtual bool read_only() const = 0;

        /**
         * @brief False once the scope has been committed or rolled back.
         */
        CR_NODISCARD virtual bool active() const = 0;

        /**
         * @brief Name of the primary key field of a table.
         */
        CR_NODISCARD virtual std::string key_field(const std::string& table) const = 0;

        /**
         * @brief Insert a new record.
         *
         * A record without a primary key gets a generated one.
         *
         * @return The record as stored, primary key included.
         * @throws transactions::business_rule_error if a record with the same key already exists.
         */
        virtual nlohmann::json create(const std::string& table, nlohmann::json record) = 0;

        virtual std::optional<nlohmann::json> find(const std::string& table, const std::string& key) = 0;

        virtual std::vector<nlohmann::json> find_all(const std::string& table) = 0;

        /**
         * @brief Insert the record, or replace the record with the same primary key.
         */
        virtual nlohmann::json upsert(const std::string& table, nlohmann::json record) = 0;

        /**
         * @brief Merge the patch into an existing record.
         *
         * @return The updated record, or nothing if there was no record with that key.
         */
        virtual std::optional<nlohmann::json> update(const std::string& table, const std::string& key, const nlohmann::json& patch) = 0;

        /**
         * @brief Delete a record if it exists.
         *
         * @return true if a record was deleted.
         */
        virtual bool remove(const std::string& table, const std::string& key) = 0;
    };

    /**
     * @brief Any transactional store the transaction manager can drive.
     */
    class storage
    {
      public:
        virtual ~storage() = default;

        virtual std::unique_ptr<storage_scope> begin_transaction(isolation_level level, bool read_only) = 0;

        virtual void commit(storage_scope& scope) = 0;

        virtual void rollback(storage_scope& scope) = 0;

        /**
         * @brief Name of the primary key field of a table.
         */
        CR_NODISCARD virtual std::string key_field(const std::string& table) const = 0;
    };
} // namespace storage
} // namespace credence
