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
#include <vector>

#include <nlohmann/json.hpp>

namespace credence
{
namespace oracle
{
    struct feed_price {
        std::string pair;
        /** decimal string, kept as a string to avoid rounding */
        std::string price;
        int decimals;
    };

    /**
     * A signed set of prices, as submitted by the oracle signer.
     */
    struct update_snapshot_request {
        /** unix time, in seconds or in milliseconds (anything above 1e12 is taken as milliseconds) */
        int64_t timestamp;
        std::vector<feed_price> feeds;
        std::string signature;
        /** if set, must match the signer recovered from the signature */
        std::optional<std::string> signer;
    };

    struct update_snapshot_result {
        std::string snapshot_id;
        size_t feeds_updated;
    };

    /**
     * The current price of a pair, with the snapshot it came from.
     */
    struct latest_price {
        std::string pair;
        std::string price;
        int decimals;
        int64_t timestamp_ms;
        std::string snapshot_id;
    };

    struct batch_failure {
        /** position of the failed request in the batch */
        size_t index;
        std::string message;
        int http_status;
    };

    /**
     * Each request of a batch is its own transaction: the successful ones stay committed whatever happens to the
     * others.
     */
    struct batch_update_result {
        std::vector<update_snapshot_result> results;
        std::vector<batch_failure> failures;
    };

    void to_json(nlohmann::json& j, const feed_price& feed);
    void from_json(const nlohmann::json& j, feed_price& feed);

    void to_json(nlohmann::json& j, const latest_price& price);
    void from_json(const nlohmann::json& j, latest_price& price);

    void from_json(const nlohmann::json& j, update_snapshot_request& request);
} // namespace oracle
} // namespace credence
