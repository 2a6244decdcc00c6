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
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <credence/oracle/domain_event.hxx>
#include <credence/oracle/types.hxx>
#include <nlohmann/json.hpp>

namespace credence
{
namespace oracle
{
    /**
     * Where domain events go.  Implementations decide about delivery, retries and ordering across publishers.
     */
    class event_bus
    {
      public:
        virtual ~event_bus() = default;

        virtual void publish(const domain_event& event) = 0;

        virtual void publish_batch(const std::vector<domain_event>& events) = 0;
    };

    /**
     * A key/value cache with expiry.
     */
    class cache
    {
      public:
        virtual ~cache() = default;

        virtual std::optional<nlohmann::json> get(const std::string& key) = 0;

        virtual void set(const std::string& key, const nlohmann::json& value, std::chrono::seconds ttl) = 0;

        virtual void invalidate(const std::string& key) = 0;
    };

    class signature_verifier
    {
      public:
        virtual ~signature_verifier() = default;

        /**
         * @brief Recover the address which signed the given timestamp and feeds.
         *
         * @throws transactions::validation_error if the signature is malformed.
         */
        virtual std::string recover_signer(const std::string& signature, int64_t timestamp, const std::vector<feed_price>& feeds) = 0;
    };
} // namespace oracle
} // namespace credence
