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

#include <credence/transactions/transaction_event.hxx>

#include <stdexcept>

namespace credence
{
namespace transactions
{
    const char* event_type_name(event_type type)
    {
        switch (type) {
            case event_type::BEGIN:
                return "begin";
            case event_type::COMMIT:
                return "commit";
            case event_type::ROLLBACK:
                return "rollback";
            case event_type::COMPENSATE:
                return "compensate";
            case event_type::RETRY:
                return "retry";
            case event_type::TIMEOUT:
                return "timeout";
        }
        throw std::runtime_error("unknown event type");
    }

    event_type event_type_value(const std::string& str)
    {
        if (str == "begin") {
            return event_type::BEGIN;
        } else if (str == "commit") {
            return event_type::COMMIT;
        } else if (str == "rollback") {
            return event_type::ROLLBACK;
        } else if (str == "compensate") {
            return event_type::COMPENSATE;
        } else if (str == "retry") {
            return event_type::RETRY;
        } else if (str == "timeout") {
            return event_type::TIMEOUT;
        }
        throw std::runtime_error("unknown event type: " + str);
    }

    nlohmann::json to_json(const transaction_event& event)
    {
        nlohmann::json j = { { "type", event_type_name(event.type) },
                             { "transaction_id", event.transaction_id },
                             { "label", event.label },
                             { "attempt", event.attempt },
                             { "timestamp_ms", event.timestamp_ms },
                             { "duration_ms", event.duration_ms },
                             { "terminal", event.terminal } };
        if (event.operation) {
            j["operation"] = *event.operation;
        }
        if (event.error_message) {
            j["error_message"] = *event.error_message;
        }
        return j;
    }

    transaction_event event_from_json(const nlohmann::json& j)
    {
        transaction_event event{ event_type_value(j.at("type").get<std::string>()),
                                 j.at("transaction_id").get<std::string>(),
                                 j.at("label").get<std::string>(),
                                 {},
                                 j.at("attempt").get<size_t>(),
                                 j.value("timestamp_ms", int64_t(0)),
                                 j.value("duration_ms", int64_t(0)),
                                 {},
                                 j.value("terminal", false) };
        if (j.contains("operation")) {
            event.operation = j.at("operation").get<std::string>();
        }
        if (j.contains("error_message")) {
            event.error_message = j.at("error_message").get<std::string>();
        }
        return event;
    }
} // namespace transactions
} // namespace credence
