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
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace credence
{
namespace oracle
{
    /**
     * @brief A business event, published once the transaction which produced it has committed.
     */
    struct domain_event {
        std::string event_id;
        std::string aggregate_id;
        std::string aggregate_type;
        std::string event_type;
        nlohmann::json payload;
        int version;
        int64_t timestamp_ms;
    };

    /**
     * @brief Build an event with a fresh id, stamped with the current time.
     */
    domain_event make_domain_event(const std::string& aggregate_id,
                                   const std::string& aggregate_type,
                                   const std::string& event_type,
                                   nlohmann::json payload,
                                   int version = 1);

    void to_json(nlohmann::json& j, const domain_event& event);

    static const std::string SNAPSHOT_AGGREGATE = "OracleSnapshot";
    static const std::string LATEST_PRICE_AGGREGATE = "OracleLatestPrice";
    static const std::string SNAPSHOT_RECORDED = "OracleSnapshotRecorded";
    static const std::string PRICE_FEED_UPDATED = "PriceFeedUpdated";
} // namespace oracle
} // namespace credence
