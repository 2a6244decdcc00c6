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

#include <credence/transactions/internal/logging.hxx>
#include <credence/transactions/transaction_monitor.hxx>

namespace credence
{
namespace transactions
{
    const size_t transaction_monitor::DEFAULT_MAX_EVENTS_HISTORY;

    transaction_hooks transaction_monitor::create_hooks()
    {
        auto record = [this](const transaction_event& event) { record_event(event); };
        transaction_hooks hooks;
        hooks.on_begin = record;
        hooks.on_commit = record;
        hooks.on_rollback = record;
        hooks.on_compensate = record;
        hooks.on_retry = record;
        hooks.on_timeout = record;
        return hooks;
    }

    void transaction_monitor::record_event(const transaction_event& event)
    {
        std::vector<listener> to_notify;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
            trim_locked();

            switch (event.type) {
                case event_type::COMMIT: {
                    auto& m = metrics_[event.label];
                    m.count++;
                    m.total_duration_ms += event.duration_ms;
                    break;
                }
                case event_type::ROLLBACK:
                    if (event.terminal) {
                        auto& m = metrics_[event.label];
                        m.count++;
                        m.total_duration_ms += event.duration_ms;
                        m.failure_count++;
                    }
                    break;
                case event_type::RETRY:
                    metrics_[event.label].retry_count++;
                    break;
                default:
                    break;
            }
            for (auto& l : listeners_) {
                to_notify.push_back(l.second);
            }
        }

        switch (event.type) {
            case event_type::COMMIT:
                monitor_log->debug("transaction {} ({}) committed in {}ms", event.transaction_id, event.label, event.duration_ms);
                break;
            case event_type::ROLLBACK:
                monitor_log->warn("transaction {} ({}) rolled back: {}",
                                  event.transaction_id,
                                  event.label,
                                  event.error_message ? *event.error_message : "Unknown error");
                break;
            case event_type::RETRY:
                monitor_log->warn("transaction {} ({}) retry attempt {}", event.transaction_id, event.label, event.attempt);
                break;
            default:
                monitor_log->trace("transaction {} ({}) {}", event.transaction_id, event.label, event_type_name(event.type));
                break;
        }

        for (auto& l : to_notify) {
            try {
                l(event);
            } catch (const std::exception& e) {
                monitor_log->error("error in transaction event listener: {}", e.what());
            } catch (...) {
                monitor_log->error("error in transaction event listener: Unexpected error");
            }
        }
    }

    std::function<void()> transaction_monitor::subscribe(listener callback)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_listener_id_++;
        listeners_.emplace(id, std::move(callback));
        return [this, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            listeners_.erase(id);
        };
    }

    transaction_statistics transaction_monitor::get_statistics() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transaction_statistics stats;
        int64_t total_duration = 0;
        size_t total_retries = 0;
        for (auto& m : metrics_) {
            stats.total_transactions += m.second.count;
            stats.failed_transactions += m.second.failure_count;
            total_duration += m.second.total_duration_ms;
            total_retries += m.second.retry_count;
        }
        stats.successful_transactions = stats.total_transactions - stats.failed_transactions;
        if (stats.total_transactions > 0) {
            stats.average_duration_ms = static_cast<double>(total_duration) / static_cast<double>(stats.total_transactions);
            stats.retry_rate = static_cast<double>(total_retries) / static_cast<double>(stats.total_transactions);
        }
        return stats;
    }

    std::map<std::string, label_metrics> transaction_monitor::get_all_metrics() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return metrics_;
    }

    std::optional<label_metrics> transaction_monitor::get_metrics(const std::string& label) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = metrics_.find(label);
        if (it == metrics_.end()) {
            return {};
        }
        return it->second;
    }

    std::vector<transaction_event> transaction_monitor::get_events(const event_filter& filter) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<transaction_event> retval;
        for (auto& e : events_) {
            if (filter.transaction_id && e.transaction_id != *filter.transaction_id) {
                continue;
            }
            if (filter.label && e.label != *filter.label) {
                continue;
            }
            if (filter.type && e.type != *filter.type) {
                continue;
            }
            if (filter.start_ms && e.timestamp_ms < *filter.start_ms) {
                continue;
            }
            if (filter.end_ms && e.timestamp_ms > *filter.end_ms) {
                continue;
            }
            retval.push_back(e);
        }
        return retval;
    }

    nlohmann::json transaction_monitor::export_metrics() const
    {
        auto stats = get_statistics();
        nlohmann::json metrics = nlohmann::json::object();
        for (auto& m : get_all_metrics()) {
            metrics[m.first] = { { "count", m.second.count },
                                 { "total_duration_ms", m.second.total_duration_ms },
                                 { "failure_count", m.second.failure_count },
                                 { "retry_count", m.second.retry_count } };
        }
        nlohmann::json events = nlohmann::json::array();
        for (auto& e : get_events()) {
            events.push_back(to_json(e));
        }
        return { { "statistics",
                   { { "total_transactions", stats.total_transactions },
                     { "successful_transactions", stats.successful_transactions },
                     { "failed_transactions", stats.failed_transactions },
                     { "average_duration_ms", stats.average_duration_ms },
                     { "retry_rate", stats.retry_rate } } },
                 { "metrics", metrics },
                 { "events", events } };
    }

    void transaction_monitor::clear_history()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
        metrics_.clear();
    }

    void transaction_monitor::set_max_events_history(size_t max)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        max_events_history_ = max;
        trim_locked();
    }

    void transaction_monitor::trim_locked()
    {
        while (events_.size() > max_events_history_) {
            events_.pop_front();
        }
    }
} // namespace transactions
} // namespace credence
