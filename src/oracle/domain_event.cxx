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

#include <credence/oracle/domain_event.hxx>
#include <credence/transactions/uid_generator.hxx>

#include <chrono>

namespace credence
{
namespace oracle
{
    domain_event make_domain_event(const std::string& aggregate_id,
                                   const std::string& aggregate_type,
                                   const std::string& event_type,
                                   nlohmann::json payload,
                                   int version)
    {
        auto now = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch());
        return domain_event{
            transactions::uid_generator::next(), aggregate_id, aggregate_type, event_type, std::move(payload), version, now.count()
        };
    }

    void to_json(nlohmann::json& j, const domain_event& event)
    {
        j = { { "event_id", event.event_id },
              { "aggregate_id", event.aggregate_id },
              { "aggregate_type", event.aggregate_type },
              { "event_type", event.event_type },
              { "payload", event.payload },
              { "version", event.version },
              { "timestamp_ms", event.timestamp_ms } };
    }
} // namespace oracle
} // namespace credence
