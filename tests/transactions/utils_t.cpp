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

#include <gtest/gtest.h>

#include <limits>

#include "../../src/transactions/exceptions_internal.hxx"
#include "../../src/transactions/utils.hxx"
#include <credence/transactions/transaction_event.hxx>
#include <credence/transactions/transaction_testing_hooks.hxx>

using namespace credence::transactions;
using namespace std;

// convenience stuff
auto one_ms = chrono::milliseconds(1);
auto hundred_ms = chrono::milliseconds(100);

TEST(RetryDelay, ExponentialDoubles)
{
    auto options = execution_options().exponential_backoff(true).retry_delay(hundred_ms).max_backoff(chrono::seconds(10));
    ASSERT_EQ(100, retry_delay_for(options, 1).count());
    ASSERT_EQ(200, retry_delay_for(options, 2).count());
    ASSERT_EQ(400, retry_delay_for(options, 3).count());
    ASSERT_EQ(800, retry_delay_for(options, 4).count());
}

TEST(RetryDelay, ExponentialIsCapped)
{
    auto options = execution_options().exponential_backoff(true).retry_delay(hundred_ms).max_backoff(chrono::milliseconds(250));
    ASSERT_EQ(100, retry_delay_for(options, 1).count());
    ASSERT_EQ(200, retry_delay_for(options, 2).count());
    ASSERT_EQ(250, retry_delay_for(options, 3).count());
    ASSERT_EQ(250, retry_delay_for(options, 20).count());
}

TEST(RetryDelay, HugeAttemptDoesNotOverflow)
{
    auto options = execution_options().exponential_backoff(true).retry_delay(one_ms).max_backoff(chrono::seconds(5));
    ASSERT_EQ(5000, retry_delay_for(options, 64).count());
    ASSERT_EQ(5000, retry_delay_for(options, numeric_limits<size_t>::max()).count());
}

TEST(RetryDelay, ConstantWithoutBackoff)
{
    auto options = execution_options().exponential_backoff(false).retry_delay(hundred_ms).max_backoff(chrono::milliseconds(50));
    for (size_t attempt = 1; attempt < 10; ++attempt) {
        ASSERT_EQ(100, retry_delay_for(options, attempt).count());
    }
}

TEST(ExecutionOptions, Defaults)
{
    execution_options options;
    ASSERT_EQ("transaction", options.label());
    ASSERT_EQ(3, options.max_retries());
    ASSERT_EQ(100, options.retry_delay().count());
    ASSERT_TRUE(options.exponential_backoff());
    ASSERT_EQ(10000, options.max_backoff().count());
    ASSERT_EQ(30000, options.timeout().count());
    ASSERT_EQ(isolation_level::READ_COMMITTED, options.isolation_level());
    ASSERT_FALSE(options.read_only());
}

TEST(ExecutionOptions, FromJson)
{
    auto options = execution_options::from_json(nlohmann::json::parse(R"({
        "label": "orders.place",
        "max_retries": 5,
        "retry_delay_ms": 20,
        "exponential_backoff": false,
        "timeout_ms": 1500,
        "isolation_level": "SERIALIZABLE",
        "read_only": true
    })"));
    ASSERT_EQ("orders.place", options.label());
    ASSERT_EQ(5, options.max_retries());
    ASSERT_EQ(20, options.retry_delay().count());
    ASSERT_FALSE(options.exponential_backoff());
    ASSERT_EQ(10000, options.max_backoff().count());
    ASSERT_EQ(1500, options.timeout().count());
    ASSERT_EQ(isolation_level::SERIALIZABLE, options.isolation_level());
    ASSERT_TRUE(options.read_only());
}

TEST(ExecutionOptions, FromJsonKeepsGivenDefaults)
{
    auto defaults = execution_options().label("base").max_retries(7);
    auto options = execution_options::from_json(nlohmann::json::parse(R"({"timeout_ms": 10})"), defaults);
    ASSERT_EQ("base", options.label());
    ASSERT_EQ(7, options.max_retries());
    ASSERT_EQ(10, options.timeout().count());
}

TEST(ExecutionOptions, FromJsonRejectsNegative)
{
    ASSERT_ANY_THROW(execution_options::from_json(nlohmann::json::parse(R"({"max_retries": -1})")));
    ASSERT_ANY_THROW(execution_options::from_json(nlohmann::json::parse(R"({"timeout_ms": -5})")));
}

TEST(ExecutionOptions, JsonRoundTrip)
{
    auto options = execution_options().label("x").max_retries(1).timeout(chrono::seconds(2)).isolation_level(isolation_level::REPEATABLE_READ);
    auto copy = execution_options::from_json(options.to_json());
    ASSERT_EQ(options.to_json(), copy.to_json());
}

TEST(ErrorClasses, OnlyTransientAndTimeoutRetry)
{
    ASSERT_TRUE(is_retryable(FAIL_TRANSIENT));
    ASSERT_TRUE(is_retryable(FAIL_TIMEOUT));
    ASSERT_FALSE(is_retryable(FAIL_OTHER));
    ASSERT_FALSE(is_retryable(FAIL_VALIDATION));
    ASSERT_FALSE(is_retryable(FAIL_BUSINESS_RULE));
    ASSERT_FALSE(is_retryable(FAIL_COMPENSATION));
}

TEST(ErrorClasses, AttemptFailureClassifies)
{
    auto from = [](auto err) { return attempt_failure::from(make_exception_ptr(err)); };
    ASSERT_EQ(FAIL_TRANSIENT, from(transient_storage_error("t")).ec());
    ASSERT_EQ(FAIL_VALIDATION, from(validation_error("v")).ec());
    ASSERT_EQ(FAIL_BUSINESS_RULE, from(business_rule_error("b")).ec());
    ASSERT_TRUE(from(attempt_expired("e")).expired());
    ASSERT_EQ(FAIL_OTHER, from(runtime_error("r")).ec());
    auto op = from(operation_failed("op", FAIL_TRANSIENT, "locked"));
    ASSERT_EQ(FAIL_TRANSIENT, op.ec());
    ASSERT_EQ("op", *op.failed_operation());
    auto unknown = attempt_failure::from(make_exception_ptr(42));
    ASSERT_EQ(FAIL_OTHER, unknown.ec());
    ASSERT_EQ("Unexpected error", unknown.message());
}

TEST(ErrorClasses, InjectError)
{
    ASSERT_NO_THROW(internal::inject_error({}, STAGE_BEGIN));
    ASSERT_THROW(internal::inject_error(FAIL_TRANSIENT, STAGE_BEGIN), internal::test_fail_transient);
    ASSERT_THROW(internal::inject_error(FAIL_TIMEOUT, STAGE_BEGIN), internal::test_fail_timeout);
    ASSERT_THROW(internal::inject_error(FAIL_OTHER, STAGE_BEGIN), internal::test_fail_other);
    try {
        internal::inject_error(FAIL_VALIDATION, STAGE_COMMIT);
        FAIL() << "expected client_error";
    } catch (const client_error& e) {
        ASSERT_EQ(FAIL_VALIDATION, e.ec());
        ASSERT_NE(string::npos, string(e.what()).find(STAGE_COMMIT));
    }
}

TEST(Events, JsonRoundTrip)
{
    transaction_event event{ event_type::COMPENSATE, "id-1", "label", string("op"), 2, now_ms(), 15, string("broken"), false };
    auto copy = event_from_json(to_json(event));
    ASSERT_EQ(event.type, copy.type);
    ASSERT_EQ(event.transaction_id, copy.transaction_id);
    ASSERT_EQ(event.operation, copy.operation);
    ASSERT_EQ(event.attempt, copy.attempt);
    ASSERT_EQ(event.timestamp_ms, copy.timestamp_ms);
    ASSERT_EQ(event.duration_ms, copy.duration_ms);
    ASSERT_EQ(event.error_message, copy.error_message);
    ASSERT_EQ(event.terminal, copy.terminal);
}

TEST(Events, TypeNames)
{
    for (auto t : { event_type::BEGIN, event_type::COMMIT, event_type::ROLLBACK, event_type::COMPENSATE, event_type::RETRY, event_type::TIMEOUT }) {
        ASSERT_EQ(t, event_type_value(event_type_name(t)));
    }
    ASSERT_THROW(event_type_value("explode"), std::runtime_error);
}
