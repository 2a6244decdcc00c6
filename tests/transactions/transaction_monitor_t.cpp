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

#include "transactions_env.h"
#include <credence/transactions/transaction_monitor.hxx>
#include <gtest/gtest.h>

#include <stdexcept>

using namespace credence::transactions;
using credence::storage::memory_store;

namespace
{
transaction_event
event(event_type type, const std::string& id, const std::string& label, int64_t duration = 0, bool terminal = false, int64_t timestamp = 0)
{
    return transaction_event{ type, id, label, {}, 1, timestamp, duration, {}, terminal };
}
} // namespace

class TransactionMonitor : public ::testing::Test
{
  protected:
    memory_store store;
    transaction_monitor monitor;
    std::unique_ptr<transaction_manager> txns;

    void SetUp() override
    {
        txns = std::make_unique<transaction_manager>(store, fast_config());
        txns->register_hooks(monitor.create_hooks());
    }
};

TEST_F(TransactionMonitor, EmptyStatistics)
{
    auto stats = monitor.get_statistics();
    ASSERT_EQ(0, stats.total_transactions);
    ASSERT_EQ(0, stats.average_duration_ms);
    ASSERT_EQ(0, stats.retry_rate);
    ASSERT_TRUE(monitor.get_all_metrics().empty());
    ASSERT_FALSE(monitor.get_metrics("nothing"));
}

TEST_F(TransactionMonitor, CountsCommitsAndFailures)
{
    txns->run([](transaction_context&) {}, fast_options("ok"));
    txns->run([](transaction_context&) {}, fast_options("ok"));
    ASSERT_THROW(txns->run([](transaction_context&) { throw validation_error("bad"); }, fast_options("bad")), transaction_failed);

    auto stats = monitor.get_statistics();
    ASSERT_EQ(3, stats.total_transactions);
    ASSERT_EQ(2, stats.successful_transactions);
    ASSERT_EQ(1, stats.failed_transactions);

    auto ok = monitor.get_metrics("ok");
    ASSERT_TRUE(ok);
    ASSERT_EQ(2, ok->count);
    ASSERT_EQ(0, ok->failure_count);
    auto bad = monitor.get_metrics("bad");
    ASSERT_TRUE(bad);
    ASSERT_EQ(1, bad->count);
    ASSERT_EQ(1, bad->failure_count);
    ASSERT_EQ(2, monitor.get_all_metrics().size());
}

TEST_F(TransactionMonitor, RetriedTransactionCountsOnce)
{
    int calls = 0;
    txns->run(
      [&](transaction_context&) {
          if (++calls < 3) {
              throw transient_storage_error("busy");
          }
      },
      fast_options("flaky"));
    auto metrics = monitor.get_metrics("flaky");
    ASSERT_TRUE(metrics);
    ASSERT_EQ(1, metrics->count);
    ASSERT_EQ(2, metrics->retry_count);
    ASSERT_EQ(0, metrics->failure_count);
    auto stats = monitor.get_statistics();
    ASSERT_EQ(1, stats.total_transactions);
    ASSERT_EQ(2.0, stats.retry_rate);
}

TEST_F(TransactionMonitor, AverageDuration)
{
    monitor.record_event(event(event_type::COMMIT, "a", "l", 10, true));
    monitor.record_event(event(event_type::COMMIT, "b", "l", 30, true));
    monitor.record_event(event(event_type::ROLLBACK, "c", "l", 50, false));
    monitor.record_event(event(event_type::ROLLBACK, "c", "l", 80, true));
    auto stats = monitor.get_statistics();
    ASSERT_EQ(3, stats.total_transactions);
    ASSERT_EQ(1, stats.failed_transactions);
    ASSERT_DOUBLE_EQ(40.0, stats.average_duration_ms);
    ASSERT_EQ(120, monitor.get_metrics("l")->total_duration_ms);
}

TEST_F(TransactionMonitor, ReplayGivesSameStatistics)
{
    std::vector<std::string> journal;
    txns->run([](transaction_context&) {}, fast_options("a"));
    int calls = 0;
    txns->run(
      [&](transaction_context& ctx) {
          ctx.execute(journaled_op("step", journal));
          if (++calls < 2) {
              throw transient_storage_error("busy");
          }
      },
      fast_options("b"));
    ASSERT_THROW(txns->run(
                   [&](transaction_context& ctx) {
                       ctx.execute(journaled_op("step", journal));
                       throw business_rule_error("no");
                   },
                   fast_options("c")),
                 transaction_failed);

    auto events = monitor.get_events();
    auto stats = monitor.get_statistics();
    auto metrics = monitor.get_all_metrics();

    monitor.clear_history();
    ASSERT_TRUE(monitor.get_events().empty());
    ASSERT_EQ(0, monitor.get_statistics().total_transactions);

    for (auto& e : events) {
        monitor.record_event(e);
    }
    ASSERT_EQ(stats, monitor.get_statistics());
    auto replayed = monitor.get_all_metrics();
    ASSERT_EQ(metrics.size(), replayed.size());
    for (auto& m : metrics) {
        ASSERT_EQ(m.second.count, replayed[m.first].count);
        ASSERT_EQ(m.second.failure_count, replayed[m.first].failure_count);
        ASSERT_EQ(m.second.retry_count, replayed[m.first].retry_count);
        ASSERT_EQ(m.second.total_duration_ms, replayed[m.first].total_duration_ms);
    }
}

TEST_F(TransactionMonitor, SubscribeAndUnsubscribe)
{
    std::vector<event_type> seen;
    auto unsubscribe = monitor.subscribe([&](const transaction_event& e) { seen.push_back(e.type); });
    txns->run([](transaction_context&) {});
    ASSERT_EQ((std::vector<event_type>{ event_type::BEGIN, event_type::COMMIT }), seen);
    unsubscribe();
    txns->run([](transaction_context&) {});
    ASSERT_EQ(2, seen.size());
}

TEST_F(TransactionMonitor, ThrowingListenerDoesNotStopOthers)
{
    int good = 0;
    auto bad = monitor.subscribe([](const transaction_event&) { throw std::runtime_error("listener broke"); });
    auto ok = monitor.subscribe([&](const transaction_event&) { good++; });
    txns->run([](transaction_context&) {});
    ASSERT_EQ(2, good);
    ASSERT_EQ(1, monitor.get_statistics().total_transactions);
    bad();
    ok();
}

TEST_F(TransactionMonitor, NonStandardListenerFailureIsContained)
{
    int good = 0;
    auto bad = monitor.subscribe([](const transaction_event& e) {
        if (e.type == event_type::COMMIT) {
            throw 7;
        }
    });
    auto ok = monitor.subscribe([&](const transaction_event&) { good++; });
    auto result = txns->run([](transaction_context& ctx) { ctx.scope().upsert("docs", { { "id", "listened" } }); });
    ASSERT_TRUE(result.committed);
    ASSERT_EQ(2, good);
    ASSERT_TRUE(store.get("docs", "listened"));
    bad();
    ok();
}

TEST_F(TransactionMonitor, ClearKeepsSubscriptions)
{
    int count = 0;
    auto unsubscribe = monitor.subscribe([&](const transaction_event&) { count++; });
    monitor.clear_history();
    monitor.record_event(event(event_type::BEGIN, "x", "l"));
    ASSERT_EQ(1, count);
    unsubscribe();
}

TEST_F(TransactionMonitor, FilterEvents)
{
    monitor.record_event(event(event_type::BEGIN, "a", "one", 0, false, 100));
    monitor.record_event(event(event_type::COMMIT, "a", "one", 5, true, 105));
    monitor.record_event(event(event_type::BEGIN, "b", "two", 0, false, 200));
    monitor.record_event(event(event_type::ROLLBACK, "b", "two", 9, true, 209));

    ASSERT_EQ(4, monitor.get_events().size());

    event_filter by_id;
    by_id.transaction_id = "a";
    ASSERT_EQ(2, monitor.get_events(by_id).size());

    event_filter by_label;
    by_label.label = "two";
    auto two = monitor.get_events(by_label);
    ASSERT_EQ(2, two.size());
    ASSERT_EQ("b", two[0].transaction_id);

    event_filter by_type;
    by_type.type = event_type::BEGIN;
    ASSERT_EQ(2, monitor.get_events(by_type).size());

    event_filter by_time;
    by_time.start_ms = 105;
    by_time.end_ms = 200;
    auto window = monitor.get_events(by_time);
    ASSERT_EQ(2, window.size());
    ASSERT_EQ(event_type::COMMIT, window[0].type);
    ASSERT_EQ(event_type::BEGIN, window[1].type);
}

TEST_F(TransactionMonitor, HistoryIsBounded)
{
    monitor.set_max_events_history(3);
    for (int i = 0; i < 5; ++i) {
        monitor.record_event(event(event_type::COMMIT, std::to_string(i), "l", 1, true));
    }
    auto events = monitor.get_events();
    ASSERT_EQ(3, events.size());
    ASSERT_EQ("2", events.front().transaction_id);
    ASSERT_EQ("4", events.back().transaction_id);
    // metrics still see every event
    ASSERT_EQ(5, monitor.get_metrics("l")->count);

    monitor.set_max_events_history(1);
    ASSERT_EQ(1, monitor.get_events().size());
}

TEST_F(TransactionMonitor, ExportMetrics)
{
    txns->run([](transaction_context&) {}, fast_options("exported"));
    auto exported = monitor.export_metrics();
    ASSERT_TRUE(exported.contains("statistics"));
    ASSERT_TRUE(exported.contains("metrics"));
    ASSERT_TRUE(exported.contains("events"));
    ASSERT_EQ(1, exported["statistics"]["total_transactions"].get<int>());
    ASSERT_EQ(1, exported["metrics"]["exported"]["count"].get<int>());
    ASSERT_EQ(2, exported["events"].size());
    ASSERT_EQ("begin", exported["events"][0]["type"].get<std::string>());
    ASSERT_EQ("commit", exported["events"][1]["type"].get<std::string>());
    // transport neutral: survives a trip through text
    ASSERT_EQ(exported, nlohmann::json::parse(exported.dump()));
}
