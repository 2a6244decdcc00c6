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

#include <chrono>
#include <string>

#include <credence/transactions/execution_options.hxx>
#include <nlohmann/json.hpp>

namespace credence
{
namespace oracle
{
    /**
     * Settings of the @ref oracle_service.
     */
    struct oracle_config {
        /** expected signer of every snapshot, not checked if empty */
        std::string signer_address;
        std::chrono::milliseconds max_clock_skew{ 120000 };
        std::string snapshots_table{ "oracle_snapshots" };
        std::string latest_prices_table{ "oracle_latest_prices" };
        transactions::execution_options update_options{ default_update_options() };
        std::chrono::seconds cache_ttl{ 60 };

        static transactions::execution_options default_update_options();

        /**
         * @brief Read the configuration from a JSON object.
         *
         * Recognised keys are `signer_address`, `max_clock_skew_ms`, `snapshots_table`, `latest_prices_table`,
         * `update_options` (see @ref transactions::execution_options::from_json) and `cache_ttl_s`.
         */
        static oracle_config from_json(const nlohmann::json& j);
    };
} // namespace oracle
} // namespace credence
