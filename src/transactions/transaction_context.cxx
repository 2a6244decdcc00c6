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

#include "exceptions_internal.hxx"

#include <credence/transactions/internal/logging.hxx>
#include <credence/transactions/transaction_context.hxx>

#include <algorithm>
#include <stdexcept>

namespace credence
{
namespace transactions
{
    namespace
    {
        // a timeout too large for the clock means no deadline at all
        std::chrono::steady_clock::time_point deadline_after(std::chrono::steady_clock::time_point start, std::chrono::milliseconds timeout)
        {
            auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::time_point::max() - start);
            if (timeout >= headroom) {
                return std::chrono::steady_clock::time_point::max();
            }
            return start + timeout;
        }
    } // namespace

    transaction_context::transaction_context(std::string transaction_id,
                                             std::string label,
                                             size_t attempt,
                                             std::unique_ptr<storage::storage_scope> scope,
                                             std::chrono::milliseconds timeout,
                                             const transaction_config& config)
      : transaction_id_(std::move(transaction_id))
      , label_(std::move(label))
      , attempt_(attempt)
      , scope_(std::move(scope))
      , timeout_(timeout)
      , start_(std::chrono::steady_clock::now())
      , deadline_(deadline_after(start_, timeout))
      , config_(config)
      , completed_(false)
    {
        if (!scope_) {
            throw std::invalid_argument("transaction context needs a storage scope");
        }
    }

    transaction_context::~transaction_context()
    {
        // the operations may outlive us, don't leave them pointing back here
        for (auto& op : operations_) {
            op->on_executed(nullptr);
        }
    }

    void transaction_context::register_operation(std::shared_ptr<compensatable_operation> op)
    {
        if (!op) {
            throw std::invalid_argument("cannot register a null operation");
        }
        if (completed_) {
            throw std::logic_error("transaction " + transaction_id_ + " is already completed, cannot register " + op->label());
        }
        if (std::find(operations_.begin(), operations_.end(), op) != operations_.end()) {
            return;
        }
        op->on_executed([this](compensatable_operation& executed) {
            for (auto& candidate : operations_) {
                if (candidate.get() == &executed) {
                    executed_.push_back(candidate);
                    return;
                }
            }
        });
        operations_.push_back(std::move(op));
    }

    nlohmann::json transaction_context::execute(std::shared_ptr<compensatable_operation> op)
    {
        register_operation(op);
        check_expiry(STAGE_OPERATION);
        internal::inject_error(config_.testing_hooks().before_operation(this, op->label()), STAGE_OPERATION);
        txn_log->trace(fmt::runtime(attempt_format_string + " executing {}"), transaction_id_, attempt_, op->label());
        auto result = op->execute(*scope_);
        internal::inject_error(config_.testing_hooks().after_operation(this, op->label()), STAGE_AFTER_OPERATION);
        check_expiry(STAGE_AFTER_OPERATION);
        return result;
    }

    void transaction_context::check_expiry(const std::string& stage)
    {
        if (has_expired_client_side(stage)) {
            throw attempt_expired("Transaction " + transaction_id_ + " timed out after " + std::to_string(timeout_.count()) + "ms");
        }
    }

    bool transaction_context::has_expired_client_side(const std::string& stage)
    {
        auto now = std::chrono::steady_clock::now();
        bool over = now > deadline_;
        bool hook = config_.testing_hooks().has_expired_client_side_hook(this, stage);
        if (over || hook) {
            txn_log->info(fmt::runtime(attempt_format_string + " has expired client side at {} (elapsed={}ms, hook={})"),
                          transaction_id_,
                          attempt_,
                          stage,
                          std::chrono::duration_cast<std::chrono::milliseconds>(now - start_).count(),
                          hook);
        }
        return over || hook;
    }

    std::chrono::milliseconds transaction_context::remaining() const
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    std::vector<compensation_outcome> transaction_context::compensate()
    {
        std::vector<compensation_outcome> outcomes;
        txn_log->debug(fmt::runtime(attempt_format_string + " compensating {} operations"), transaction_id_, attempt_, executed_.size());
        for (auto it = executed_.rbegin(); it != executed_.rend(); ++it) {
            auto& op = *it;
            compensation_outcome outcome{ op->label(), std::chrono::milliseconds(0), {} };
            auto started = std::chrono::steady_clock::now();
            try {
                internal::inject_error(config_.testing_hooks().before_compensation(this, op->label()), STAGE_COMPENSATE);
                op->compensate(*scope_);
            } catch (const std::exception& e) {
                txn_log->error(
                  fmt::runtime(attempt_format_string + " compensation of {} failed, continuing: {}"), transaction_id_, attempt_, op->label(), e.what());
                outcome.error_message = e.what();
            } catch (...) {
                txn_log->error(
                  fmt::runtime(attempt_format_string + " compensation of {} failed, continuing: Unexpected error"), transaction_id_, attempt_, op->label());
                outcome.error_message = "Unexpected error";
            }
            outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            outcomes.push_back(outcome);
        }
        return outcomes;
    }
} // namespace transactions
} // namespace credence
