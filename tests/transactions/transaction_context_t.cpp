/*
 *     Copyright 2022 Couchbase, Inc.
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

#include "transactions_env.h"
#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

using namespace credence::transactions;
using credence::storage::memory_store;

class SimpleTxnContext : public ::testing::Test
{
  protected:
    memory_store store;
    transaction_config config;

    std::unique_ptr<transaction_context> make_context(std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        return std::make_unique<transaction_context>(unique_key(),
                                                     "ctx-test",
                                                     1,
                                                     store.begin_transaction(isolation_level::READ_COMMITTED, false),
                                                     timeout,
                                                     config);
    }
};

TEST_F(SimpleTxnContext, NeedsScope)
{
    ASSERT_THROW(transaction_context("id", "label", 1, nullptr, std::chrono::seconds(1), config), std::invalid_argument);
}

TEST_F(SimpleTxnContext, ExecuteTracksOperations)
{
    auto ctx = make_context();
    std::vector<std::string> journal;
    auto a = journaled_op("a", journal);
    auto b = journaled_op("b", journal);
    ctx->execute(a);
    ctx->execute(b);
    ASSERT_EQ(2, ctx->operations().size());
    ASSERT_EQ(2, ctx->executed_operations().size());
    ASSERT_EQ(a, ctx->executed_operations()[0]);
    ASSERT_EQ(b, ctx->executed_operations()[1]);
}

TEST_F(SimpleTxnContext, RegisterTwiceIsIgnored)
{
    auto ctx = make_context();
    std::vector<std::string> journal;
    auto a = journaled_op("a", journal);
    ctx->register_operation(a);
    ctx->register_operation(a);
    ASSERT_EQ(1, ctx->operations().size());
    ASSERT_TRUE(ctx->executed_operations().empty());
}

TEST_F(SimpleTxnContext, RegisteredButFailedIsNotExecuted)
{
    auto ctx = make_context();
    std::vector<std::string> journal;
    ctx->execute(journaled_op("ok", journal));
    ASSERT_THROW(ctx->execute(journaled_op("bad", journal, [] { throw std::runtime_error("nope"); })), operation_failed);
    ASSERT_EQ(2, ctx->operations().size());
    ASSERT_EQ(1, ctx->executed_operations().size());
}

TEST_F(SimpleTxnContext, CompensatesInReverseOrder)
{
    auto ctx = make_context();
    std::vector<std::string> journal;
    ctx->execute(journaled_op("A", journal));
    ctx->execute(journaled_op("B", journal));
    ctx->execute(journaled_op("C", journal));
    auto outcomes = ctx->compensate();
    ASSERT_EQ((std::vector<std::string>{ "+A", "+B", "+C", "-C", "-B", "-A" }), journal);
    ASSERT_EQ(3, outcomes.size());
    ASSERT_EQ("C", outcomes[0].operation);
    ASSERT_EQ("B", outcomes[1].operation);
    ASSERT_EQ("A", outcomes[2].operation);
    for (auto& o : outcomes) {
        ASSERT_FALSE(o.error_message);
    }
}

TEST_F(SimpleTxnContext, FailingCompensationDoesNotStopUnwind)
{
    auto ctx = make_context();
    std::vector<std::string> journal;
    ctx->execute(journaled_op("A", journal));
    ctx->execute(journaled_op("B", journal, nullptr, [] { throw std::runtime_error("B will not undo"); }));
    ctx->execute(journaled_op("C", journal));
    auto outcomes = ctx->compensate();
    ASSERT_EQ((std::vector<std::string>{ "+A", "+B", "+C", "-C", "-B", "-A" }), journal);
    ASSERT_EQ(3, outcomes.size());
    ASSERT_FALSE(outcomes[0].error_message);
    ASSERT_TRUE(outcomes[1].error_message);
    ASSERT_EQ("B will not undo", *outcomes[1].error_message);
    ASSERT_FALSE(outcomes[2].error_message);
}

TEST_F(SimpleTxnContext, NonStandardCompensationFailureDoesNotStopUnwind)
{
    auto ctx = make_context();
    std::vector<std::string> journal;
    ctx->execute(journaled_op("a", journal));
    ctx->execute(journaled_op("b", journal, nullptr, [] { throw 42; }));
    auto outcomes = ctx->compensate();
    ASSERT_EQ((std::vector<std::string>{ "+a", "+b", "-b", "-a" }), journal);
    ASSERT_EQ(2, outcomes.size());
    ASSERT_EQ("Unexpected error", *outcomes[0].error_message);
    ASSERT_FALSE(outcomes[1].error_message);
}

TEST_F(SimpleTxnContext, CompensateSkipsOperationsWhichNeverRan)
{
    auto ctx = make_context();
    std::vector<std::string> journal;
    ctx->execute(journaled_op("A", journal));
    ctx->register_operation(journaled_op("pending", journal));
    auto outcomes = ctx->compensate();
    ASSERT_EQ(1, outcomes.size());
    ASSERT_EQ("A", outcomes[0].operation);
}

TEST_F(SimpleTxnContext, CannotRegisterOnceCompleted)
{
    auto ctx = make_context();
    std::vector<std::string> journal;
    ctx->mark_completed();
    ASSERT_TRUE(ctx->is_completed());
    ASSERT_THROW(ctx->register_operation(journaled_op("late", journal)), std::logic_error);
}

TEST_F(SimpleTxnContext, ExpiredBeforeOperation)
{
    auto ctx = make_context(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    std::vector<std::string> journal;
    try {
        ctx->execute(journaled_op("slow", journal));
        FAIL() << "expected attempt_expired";
    } catch (const attempt_expired& e) {
        ASSERT_EQ(FAIL_TIMEOUT, e.ec());
        ASSERT_NE(std::string::npos, std::string(e.what()).find("timed out after"));
    }
    // the forward action never ran
    ASSERT_TRUE(journal.empty());
    ASSERT_TRUE(ctx->executed_operations().empty());
}

TEST_F(SimpleTxnContext, ExpiredAfterOperationKeepsItForCompensation)
{
    auto ctx = make_context(std::chrono::milliseconds(20));
    std::vector<std::string> journal;
    auto slow = tx::make_operation(
      "slow",
      [&journal](credence::storage::storage_scope&) {
          std::this_thread::sleep_for(std::chrono::milliseconds(40));
          journal.push_back("+slow");
          return nlohmann::json();
      },
      [&journal](credence::storage::storage_scope&, const nlohmann::json&) { journal.push_back("-slow"); });
    ASSERT_THROW(ctx->execute(slow), attempt_expired);
    ASSERT_EQ(1, ctx->executed_operations().size());
    ctx->compensate();
    ASSERT_EQ((std::vector<std::string>{ "+slow", "-slow" }), journal);
}

TEST_F(SimpleTxnContext, RemainingCountsDown)
{
    auto ctx = make_context(std::chrono::milliseconds(200));
    ASSERT_LE(ctx->remaining().count(), 200);
    ASSERT_GT(ctx->remaining().count(), 0);
    auto expired = make_context(std::chrono::milliseconds(0));
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    ASSERT_EQ(0, expired->remaining().count());
}

TEST_F(SimpleTxnContext, HugeTimeoutNeverExpires)
{
    auto ctx = make_context(std::chrono::milliseconds(10000000000000LL));
    std::vector<std::string> journal;
    ASSERT_NO_THROW(ctx->execute(journaled_op("a", journal)));
    ASSERT_NO_THROW(ctx->check_expiry());
    ASSERT_GT(ctx->remaining().count(), 0);
    auto forever = make_context(std::chrono::milliseconds::max());
    ASSERT_NO_THROW(forever->check_expiry());
}

TEST_F(SimpleTxnContext, ExpiryHookForcesTimeout)
{
    transaction_testing_hooks hooks;
    hooks.has_expired_client_side_hook = [](transaction_context*, const std::string& stage) { return stage == STAGE_AFTER_OPERATION; };
    config.test_factories(hooks);
    auto ctx = make_context();
    std::vector<std::string> journal;
    ASSERT_THROW(ctx->execute(journaled_op("a", journal)), attempt_expired);
    ASSERT_EQ(std::vector<std::string>{ "+a" }, journal);
}

TEST_F(SimpleTxnContext, BeforeOperationHookInjectsError)
{
    transaction_testing_hooks hooks;
    hooks.before_operation = [](transaction_context*, const std::string& label) -> std::optional<error_class> {
        if (label == "b") {
            return FAIL_TRANSIENT;
        }
        return {};
    };
    config.test_factories(hooks);
    auto ctx = make_context();
    std::vector<std::string> journal;
    ctx->execute(journaled_op("a", journal));
    try {
        ctx->execute(journaled_op("b", journal));
        FAIL() << "expected injected error";
    } catch (const client_error& e) {
        ASSERT_EQ(FAIL_TRANSIENT, e.ec());
    }
    ASSERT_EQ(std::vector<std::string>{ "+a" }, journal);
}

TEST_F(SimpleTxnContext, ScopeIsUsable)
{
    auto ctx = make_context();
    ctx->scope().create("plain", { { "id", "p1" } });
    ASSERT_TRUE(ctx->scope().find("plain", "p1"));
    ASSERT_EQ(1, ctx->attempt_number());
    ASSERT_EQ("ctx-test", ctx->label());
}
