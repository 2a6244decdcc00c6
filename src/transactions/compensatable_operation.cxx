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

#include <credence/transactions/compensatable_operation.hxx>
#include <credence/transactions/exceptions.hxx>
#include <credence/transactions/internal/logging.hxx>

#include <stdexcept>

namespace tx = credence::transactions;

tx::compensatable_operation::compensatable_operation(std::string label)
  : label_(std::move(label))
  , attempted_(false)
  , executed_(false)
  , compensated_(false)
{
}

nlohmann::json
tx::compensatable_operation::execute(storage::storage_scope& scope)
{
    if (attempted_) {
        throw std::logic_error("operation " + label_ + " has already been executed");
    }
    attempted_ = true;
    try {
        result_ = do_execute(scope);
    } catch (const client_error& e) {
        txn_log->debug("operation {} failed with {}: {}", label_, error_class_name(e.ec()), e.what());
        throw operation_failed(label_, e.ec(), e.what(), std::current_exception());
    } catch (const operation_failed&) {
        // a nested operation already classified the failure
        throw;
    } catch (const std::exception& e) {
        txn_log->debug("operation {} failed: {}", label_, e.what());
        throw operation_failed(label_, FAIL_OTHER, e.what(), std::current_exception());
    }
    executed_ = true;
    txn_log->trace("operation {} executed", label_);
    if (listener_) {
        listener_(*this);
    }
    return result_;
}

void
tx::compensatable_operation::compensate(storage::storage_scope& scope)
{
    if (!executed_) {
        txn_log->trace("operation {} never executed, nothing to compensate", label_);
        return;
    }
    if (compensated_) {
        txn_log->trace("operation {} already compensated", label_);
        return;
    }
    compensated_ = true;
    try {
        do_compensate(scope, result_);
    } catch (const std::exception& e) {
        throw compensation_error(label_, e.what());
    } catch (...) {
        throw compensation_error(label_, "Unexpected error");
    }
    txn_log->trace("operation {} compensated", label_);
}

tx::custom_operation::custom_operation(std::string label, forward_fn forward, compensate_fn compensate)
  : compensatable_operation(std::move(label))
  , forward_(std::move(forward))
  , compensate_(std::move(compensate))
{
    if (!forward_) {
        throw std::invalid_argument("operation " + this->label() + " needs a forward action");
    }
}

nlohmann::json
tx::custom_operation::do_execute(storage::storage_scope& scope)
{
    return forward_(scope);
}

void
tx::custom_operation::do_compensate(storage::storage_scope& scope, const nlohmann::json& result)
{
    if (compensate_) {
        compensate_(scope, result);
    }
}
