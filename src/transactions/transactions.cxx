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
#include "transaction_record.hxx"
#include "utils.hxx"
#include <credence/transactions.hxx>
#include <credence/transactions/internal/logging.hxx>

#include <thread>

namespace tx = credence::transactions;

namespace
{
tx::transaction_event
make_event(tx::event_type type,
           const tx::transaction_record& record,
           size_t attempt,
           int64_t duration_ms,
           bool terminal = false,
           std::optional<std::string> operation = {},
           std::optional<std::string> error_message = {})
{
    return tx::transaction_event{ type,
                                  record.transaction_id(),
                                  record.label(),
                                  std::move(operation),
                                  attempt,
                                  tx::now_ms(),
                                  duration_ms,
                                  std::move(error_message),
                                  terminal };
}
} // namespace

tx::transaction_manager::transaction_manager(storage::storage& store, const transaction_config& config)
  : storage_(store)
  , config_(config)
{
    txn_log->info("creating new transaction manager, default label {}", config_.default_options().label());
}

tx::transaction_manager::~transaction_manager()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_.empty()) {
        txn_log->warn("transaction manager destroyed with {} transactions still running", active_.size());
    }
}

void
tx::transaction_manager::register_hooks(const transaction_hooks& hooks)
{
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_ = hooks_.combine(hooks);
}

std::vector<std::string>
tx::transaction_manager::active_transactions() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return { active_.begin(), active_.end() };
}

void
tx::transaction_manager::track(const std::string& transaction_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    active_.insert(transaction_id);
}

void
tx::transaction_manager::untrack(const std::string& transaction_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(transaction_id);
}

void
tx::transaction_manager::emit(const transaction_event& event) const
{
    transaction_hook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = hooks_.hook_for(event.type);
    }
    if (!hook) {
        return;
    }
    try {
        hook(event);
    } catch (const std::exception& e) {
        txn_log->error(
          fmt::runtime(attempt_format_string + " {} hook raised, ignoring: {}"), event.transaction_id, event.attempt, event_type_name(event.type), e.what());
    } catch (...) {
        txn_log->error(fmt::runtime(attempt_format_string + " {} hook raised, ignoring: Unexpected error"),
                       event.transaction_id,
                       event.attempt,
                       event_type_name(event.type));
    }
}

tx::transaction_result
tx::transaction_manager::run(const logic& logic)
{
    return run(logic, config_.default_options());
}

tx::transaction_result
tx::transaction_manager::run(const logic& logic, const execution_options& options)
{
    transaction_record record(options.label());

    struct active_guard {
        transaction_manager& manager;
        const std::string& id;
        ~active_guard()
        {
            manager.untrack(id);
        }
    };
    track(record.transaction_id());
    active_guard guard{ *this, record.transaction_id() };

    txn_log->info("starting transaction {} ({})", record.transaction_id(), record.label());
    while (true) {
        record.add_attempt();
        const size_t attempt = record.num_attempts();
        std::unique_ptr<transaction_context> ctx;
        std::optional<attempt_failure> failure;
        bool began = false;
        bool committed = false;

        txn_log->debug(fmt::runtime(attempt_format_string + " starting attempt"), record.transaction_id(), attempt);
        try {
            record.current_attempt().state = attempt_state::BEGINNING;
            auto scope = storage_.begin_transaction(options.isolation_level(), options.read_only());
            ctx = std::make_unique<transaction_context>(record.transaction_id(), record.label(), attempt, std::move(scope), options.timeout(), config_);
            began = true;
            emit(make_event(event_type::BEGIN, record, attempt, 0));
            internal::inject_error(config_.testing_hooks().after_begin(ctx.get()), STAGE_BEGIN);

            record.current_attempt().state = attempt_state::RUNNING;
            logic(*ctx);
            internal::inject_error(config_.testing_hooks().after_work(ctx.get()), STAGE_AFTER_WORK);
            ctx->check_expiry(STAGE_AFTER_WORK);

            record.current_attempt().state = attempt_state::COMMITTING;
            internal::inject_error(config_.testing_hooks().before_commit(ctx.get()), STAGE_COMMIT);
            storage_.commit(ctx->scope());
            committed = true;
        } catch (...) {
            failure = attempt_failure::from(std::current_exception());
        }

        // once the storage committed, nothing may turn this attempt into a failure
        if (committed) {
            ctx->mark_completed();
            record.current_attempt().state = attempt_state::COMMITTED;
            emit(make_event(event_type::COMMIT, record, attempt, to_ms(record.elapsed()), true));
            txn_log->info(fmt::runtime(attempt_format_string + " committed after {}ms"), record.transaction_id(), attempt, to_ms(record.elapsed()));
            return record.get_transaction_result(true);
        }

        record.current_attempt().error_message = failure->message();
        if (!began) {
            emit(make_event(event_type::BEGIN, record, attempt, 0));
        }
        txn_log->warn(fmt::runtime(attempt_format_string + " failed (attempt {}/{}) with {}: {}"),
                      record.transaction_id(),
                      attempt,
                      attempt,
                      options.max_retries() + 1,
                      error_class_name(failure->ec()),
                      failure->message());
        if (failure->expired()) {
            emit(make_event(event_type::TIMEOUT, record, attempt, to_ms(record.elapsed()), false, {}, failure->message()));
        }

        record.current_attempt().state = attempt_state::COMPENSATING;
        if (ctx) {
            for (const auto& outcome : ctx->compensate()) {
                record.current_attempt().compensated_operations.push_back(outcome.operation);
                emit(make_event(
                  event_type::COMPENSATE, record, attempt, to_ms(outcome.duration), false, outcome.operation, outcome.error_message));
            }
            try {
                internal::inject_error(config_.testing_hooks().before_rollback(ctx.get()), STAGE_ROLLBACK);
                storage_.rollback(ctx->scope());
            } catch (const std::exception& e) {
                txn_log->error(fmt::runtime(attempt_format_string + " got error {} while rolling back, keeping original error {}"),
                               record.transaction_id(),
                               attempt,
                               e.what(),
                               failure->message());
            }
            ctx->mark_completed();
            ctx.reset();
        }

        bool retry = is_retryable(failure->ec()) && attempt <= options.max_retries();
        record.current_attempt().state = retry ? attempt_state::RETRY_SCHEDULED : attempt_state::FAILED;
        emit(make_event(event_type::ROLLBACK, record, attempt, to_ms(record.elapsed()), !retry, {}, failure->message()));

        if (!retry) {
            txn_log->error("transaction {} failed after {} attempts: {}", record.transaction_id(), attempt, failure->message());
            failure->do_throw(record.get_transaction_result(false));
        }

        auto delay = retry_delay_for(options, attempt);
        txn_log->debug(fmt::runtime(attempt_format_string + " retrying in {}ms"), record.transaction_id(), attempt, delay.count());
        std::this_thread::sleep_for(delay);
        emit(make_event(event_type::RETRY, record, attempt + 1, delay.count()));
    }
}
