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

#include <credence/oracle/types.hxx>

namespace credence
{
namespace oracle
{
    void to_json(nlohmann::json& j, const feed_price& feed)
    {
        j = { { "pair", feed.pair }, { "price", feed.price }, { "decimals", feed.decimals } };
    }

    void from_json(const nlohmann::json& j, feed_price& feed)
    {
        j.at("pair").get_to(feed.pair);
        j.at("price").get_to(feed.price);
        j.at("decimals").get_to(feed.decimals);
    }

    void to_json(nlohmann::json& j, const latest_price& price)
    {
        j = { { "pair", price.pair },
              { "price", price.price },
              { "decimals", price.decimals },
              { "timestamp_ms", price.timestamp_ms },
              { "snapshot_id", price.snapshot_id } };
    }

    void from_json(const nlohmann::json& j, latest_price& price)
    {
        j.at("pair").get_to(price.pair);
        j.at("price").get_to(price.price);
        j.at("decimals").get_to(price.decimals);
        j.at("timestamp_ms").get_to(price.timestamp_ms);
        j.at("snapshot_id").get_to(price.snapshot_id);
    }

    void from_json(const nlohmann::json& j, update_snapshot_request& request)
    {
        j.at("timestamp").get_to(request.timestamp);
        j.at("feeds").get_to(request.feeds);
        j.at("signature").get_to(request.signature);
        if (j.contains("signer") && !j.at("signer").is_null()) {
            request.signer = j.at("signer").get<std::string>();
        }
    }
} // namespace oracle
} // namespace credence
