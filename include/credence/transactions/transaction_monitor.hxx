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

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <credence/support.hxx>
#include <credence/transactions/transaction_event.hxx>
#include <credence/transactions/transaction_hooks.hxx>
#include <nlohmann/json.hpp>

namespace credence
{
namespace transactions
{
    /**
     * Aggregates for all the transactions of one label.
     */
    struct label_metrics {
        size_t count{ 0 };
        int64_t total_duration_ms{ 0 };
        size_t failure_count{ 0 };
        size_t retry_count{ 0 };
    };

    struct transaction_statistics {
        size_t total_transactions{ 0 };
        size_t successful_transactions{ 0 };
        size_t failed_transactions{ 0 };
        double average_duration_ms{ 0 };
        /** retries per finished transaction */
        double retry_rate{ 0 };
    };

    inline bool operator==(const transaction_statistics& a, const transaction_statistics& b)
    {
        return a.total_transactions == b.total_transactions && a.successful_transactions == b.successful_transactions &&
               a.failed_transactions == b.failed_transactions && a.average_duration_ms == b.average_duration_ms &&
               a.retry_rate == b.retry_rate;
    }

    /**
     * Criteria for @ref transaction_monitor::get_events.  Unset fields match everything, time bounds are inclusive.
     */
    struct event_filter {
        std::optional<std::string> transaction_id;
        std::optional<std::string> label;
        std::optional<event_type> type;
        std::optional<int64_t> start_ms;
        std::optional<int64_t> end_ms;
    };

    /**
     * @brief Records the lifecycle events of transactions, and aggregates them per label.
     *
     * The monitor only ever sees events: plug it into a @ref transaction_manager with
     * `manager.register_hooks(monitor.create_hooks())`.  Metrics are derived from the events alone, so replaying a
     * sequence of events into a cleared monitor reproduces the same statistics.
     *
     * A transaction counts once it has finished, on its commit or on the rollback of its last attempt.
     *
     * All members may be called concurrently.  The monitor must outlive the hooks it created, and the functions
     * returned by @ref subscribe.
     */
    class transaction_monitor
    {
      public:
        typedef std::function<void(const transaction_event&)> listener;

        static const size_t DEFAULT_MAX_EVENTS_HISTORY = 1000;

        transaction_monitor() = default;

        transaction_monitor(const transaction_monitor&) = delete;
        transaction_monitor& operator=(const transaction_monitor&) = delete;

        /**
         * @brief Hooks which record every event into this monitor.
         */
        transaction_hooks create_hooks();

        /**
         * @brief Ingest one event.
         */
        void record_event(const transaction_event& event);

        /**
         * @brief Get every event recorded from now on.
         *
         * A listener which throws is logged, and does not stop the other listeners.
         *
         * @return A function which removes the listener.
         */
        std::function<void()> subscribe(listener callback);

        CR_NODISCARD transaction_statistics get_statistics() const;

        CR_NODISCARD std::map<std::string, label_metrics> get_all_metrics() const;

        CR_NODISCARD std::optional<label_metrics> get_metrics(const std::string& label) const;

        CR_NODISCARD std::vector<transaction_event> get_events(const event_filter& filter = event_filter()) const;

        /**
         * @brief Statistics, metrics per label, and the event history, as `{ statistics, metrics, events }`.
         */
        CR_NODISCARD nlohmann::json export_metrics() const;

        /**
         * @brief Forget all events and metrics.  Subscriptions are kept.
         */
        void clear_history();

        /**
         * @brief Bound the number of events kept, dropping the oldest first.  Metrics are not affected.
         */
        void set_max_events_history(size_t max);

      private:
        mutable std::mutex mutex_;
        std::deque<transaction_event> events_;
        std::map<std::string, label_metrics> metrics_;
        std::map<uint64_t, listener> listeners_;
        uint64_t next_listener_id_{ 0 };
        size_t max_events_history_{ DEFAULT_MAX_EVENTS_HISTORY };

        void trim_locked();
    };
} // namespace transactions
} // namespace credence
