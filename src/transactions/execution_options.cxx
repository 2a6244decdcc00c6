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

#include <credence/transactions/execution_options.hxx>

#include <stdexcept>

namespace credence
{
namespace transactions
{
    namespace
    {
        int64_t non_negative(const nlohmann::json& j, const char* key, int64_t current)
        {
            if (!j.contains(key)) {
                return current;
            }
            auto value = j.at(key).get<int64_t>();
            if (value < 0) {
                throw std::invalid_argument(std::string(key) + " must not be negative");
            }
            return value;
        }
    } // namespace

    execution_options::execution_options()
      : label_("transaction")
      , max_retries_(3)
      , retry_delay_(std::chrono::milliseconds(100))
      , exponential_backoff_(true)
      , max_backoff_(std::chrono::milliseconds(10000))
      , timeout_(std::chrono::milliseconds(30000))
      , isolation_level_(isolation_level::READ_COMMITTED)
      , read_only_(false)
    {
    }

    execution_options execution_options::from_json(const nlohmann::json& j, const execution_options& defaults)
    {
        execution_options options(defaults);
        if (j.is_null()) {
            return options;
        }
        if (!j.is_object()) {
            throw std::invalid_argument("execution options must be a JSON object");
        }
        options.label(j.value("label", options.label()));
        options.max_retries(static_cast<size_t>(non_negative(j, "max_retries", static_cast<int64_t>(options.max_retries()))));
        options.retry_delay(std::chrono::milliseconds(non_negative(j, "retry_delay_ms", options.retry_delay().count())));
        options.exponential_backoff(j.value("exponential_backoff", options.exponential_backoff()));
        options.max_backoff(std::chrono::milliseconds(non_negative(j, "max_backoff_ms", options.max_backoff().count())));
        options.timeout(std::chrono::milliseconds(non_negative(j, "timeout_ms", options.timeout().count())));
        if (j.contains("isolation_level")) {
            options.isolation_level(isolation_level_value(j.at("isolation_level").get<std::string>()));
        }
        options.read_only(j.value("read_only", options.read_only()));
        return options;
    }

    nlohmann::json execution_options::to_json() const
    {
        return { { "label", label_ },
                 { "max_retries", max_retries_ },
                 { "retry_delay_ms", retry_delay_.count() },
                 { "exponential_backoff", exponential_backoff_ },
                 { "max_backoff_ms", max_backoff_.count() },
                 { "timeout_ms", timeout_.count() },
                 { "isolation_level", isolation_level_to_string(isolation_level_) },
                 { "read_only", read_only_ } };
    }
} // namespace transactions
} // namespace credence
