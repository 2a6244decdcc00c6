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

#include <credence/transactions/compensatable_operation.hxx>

namespace credence
{
namespace transactions
{
    /**
     * Creates a record.  Compensation deletes it again.
     */
    class insert_operation : public compensatable_operation
    {
      public:
        insert_operation(std::string label, std::string table, nlohmann::json record);

      protected:
        nlohmann::json do_execute(storage::storage_scope& scope) override;
        void do_compensate(storage::storage_scope& scope, const nlohmann::json& result) override;

      private:
        std::string table_;
        nlohmann::json record_;
    };

    /**
     * Merges a patch into an existing record, failing with a business_rule_error if there is none.  Compensation puts
     * back the record as it was before.
     */
    class update_operation : public compensatable_operation
    {
      public:
        update_operation(std::string label, std::string table, std::string key, nlohmann::json patch);

      protected:
        nlohmann::json do_execute(storage::storage_scope& scope) override;
        void do_compensate(storage::storage_scope& scope, const nlohmann::json& result) override;

      private:
        std::string table_;
        std::string key_;
        nlohmann::json patch_;
    };

    /**
     * Deletes a record if it exists.  Compensation re-creates it.
     */
    class delete_operation : public compensatable_operation
    {
      public:
        delete_operation(std::string label, std::string table, std::string key);

      protected:
        nlohmann::json do_execute(storage::storage_scope& scope) override;
        void do_compensate(storage::storage_scope& scope, const nlohmann::json& result) override;

      private:
        std::string table_;
        std::string key_;
    };
} // namespace transactions
} // namespace credence
