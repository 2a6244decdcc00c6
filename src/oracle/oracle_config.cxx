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

#include <credence/oracle/oracle_config.hxx>

#include <stdexcept>

namespace credence
{
namespace oracle
{
    transactions::execution_options oracle_config::default_update_options()
    {
        return transactions::execution_options()
          .label("oracle.update_snapshot")
          .max_retries(3)
          .retry_delay(std::chrono::milliseconds(100))
          .exponential_backoff(true)
          .max_backoff(std::chrono::milliseconds(5000))
          .timeout(std::chrono::milliseconds(30000))
          .isolation_level(transactions::isolation_level::READ_COMMITTED);
    }

    oracle_config oracle_config::from_json(const nlohmann::json& j)
    {
        oracle_config config;
        if (j.is_null()) {
            return config;
        }
        if (!j.is_object()) {
            throw std::invalid_argument("oracle configuration must be a JSON object");
        }
        config.signer_address = j.value("signer_address", config.signer_address);
        config.max_clock_skew = std::chrono::milliseconds(j.value("max_clock_skew_ms", config.max_clock_skew.count()));
        config.snapshots_table = j.value("snapshots_table", config.snapshots_table);
        config.latest_prices_table = j.value("latest_prices_table", config.latest_prices_table);
        if (j.contains("update_options")) {
            config.update_options = transactions::execution_options::from_json(j.at("update_options"), config.update_options);
        }
        config.cache_ttl = std::chrono::seconds(j.value("cache_ttl_s", config.cache_ttl.count()));
        return config;
    }
} // namespace oracle
} // namespace credence
