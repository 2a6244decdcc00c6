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

#include <credence/transactions/exceptions.hxx>
#include <credence/transactions/internal/logging.hxx>
#include <credence/transactions/storage_operations.hxx>

namespace tx = credence::transactions;

tx::insert_operation::insert_operation(std::string label, std::string table, nlohmann::json record)
  : compensatable_operation(std::move(label))
  , table_(std::move(table))
  , record_(std::move(record))
{
}

nlohmann::json
tx::insert_operation::do_execute(storage::storage_scope& scope)
{
    return scope.create(table_, record_);
}

void
tx::insert_operation::do_compensate(storage::storage_scope& scope, const nlohmann::json& result)
{
    auto key = storage::record_key(result.at(scope.key_field(table_)));
    if (!scope.remove(table_, key)) {
        txn_log->debug("record {}/{} was already gone", table_, key);
    }
}

tx::update_operation::update_operation(std::string label, std::string table, std::string key, nlohmann::json patch)
  : compensatable_operation(std::move(label))
  , table_(std::move(table))
  , key_(std::move(key))
  , patch_(std::move(patch))
{
}

nlohmann::json
tx::update_operation::do_execute(storage::storage_scope& scope)
{
    auto before = scope.find(table_, key_);
    if (!before) {
        throw business_rule_error("no record " + key_ + " in table " + table_);
    }
    auto after = scope.update(table_, key_, patch_);
    if (!after) {
        throw business_rule_error("record " + key_ + " in table " + table_ + " disappeared during update");
    }
    return { { "before", *before }, { "after", *after } };
}

void
tx::update_operation::do_compensate(storage::storage_scope& scope, const nlohmann::json& result)
{
    scope.upsert(table_, result.at("before"));
}

tx::delete_operation::delete_operation(std::string label, std::string table, std::string key)
  : compensatable_operation(std::move(label))
  , table_(std::move(table))
  , key_(std::move(key))
{
}

nlohmann::json
tx::delete_operation::do_execute(storage::storage_scope& scope)
{
    auto before = scope.find(table_, key_);
    if (!before) {
        return nullptr;
    }
    scope.remove(table_, key_);
    return *before;
}

void
tx::delete_operation::do_compensate(storage::storage_scope& scope, const nlohmann::json& result)
{
    if (result.is_null()) {
        return;
    }
    if (scope.find(table_, key_)) {
        txn_log->debug("record {}/{} was re-created meanwhile, leaving it", table_, key_);
        return;
    }
    scope.create(table_, result);
}
