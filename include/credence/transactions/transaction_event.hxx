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
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace credence
{
namespace transactions
{
    enum class event_type { BEGIN, COMMIT, ROLLBACK, COMPENSATE, RETRY, TIMEOUT };

    const char* event_type_name(event_type type);

    event_type event_type_value(const std::string& str);

    /**
     * @brief A lifecycle event emitted by the transaction manager.
     *
     * Events are values: once emitted they are never changed.
     */
    struct transaction_event {
        event_type type;
        std::string transaction_id;
        std::string label;
        /** set for compensate events, the label of the compensated operation */
        std::optional<std::string> operation;
        size_t attempt;
        /** milliseconds since epoch */
        int64_t timestamp_ms;
        int64_t duration_ms;
        std::optional<std::string> error_message;
        /** true on the last event of a transaction: its commit, or the rollback of its last attempt */
        bool terminal;
    };

    nlohmann::json to_json(const transaction_event& event);

    transaction_event event_from_json(const nlohmann::json& j);

    template<typename OStream>
    OStream& operator<<(OStream& os, const transaction_event& event)
    {
        os << "transaction_event{";
        os << "type: " << event_type_name(event.type) << ",";
        os << " id: " << event.transaction_id << ",";
        os << " label: " << event.label << ",";
        os << " attempt: " << event.attempt;
        if (event.operation) {
            os << ", operation: " << *event.operation;
        }
        if (event.error_message) {
            os << ", error: " << *event.error_message;
        }
        os << "}";
        return os;
    }
} // namespace transactions
} // namespace credence
