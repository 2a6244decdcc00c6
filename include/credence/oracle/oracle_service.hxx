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

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include <credence/oracle/capabilities.hxx>
#include <credence/oracle/oracle_config.hxx>
#include <credence/oracle/types.hxx>
#include <credence/transactions.hxx>

namespace credence
{
namespace oracle
{
    static const std::string LATEST_CACHE_KEY = "oracle:latest";

    /**
     * @brief Records signed price snapshots, and keeps the latest price of every pair.
     *
     * A snapshot update is one transaction: the snapshot record, then one upsert per feed.  If any step fails, the
     * steps already done are compensated: the snapshot is deleted, and every updated pair gets its previous price back
     * (or is deleted if it had none).  Domain events are only published once the transaction committed.
     */
    class oracle_service
    {
      public:
        /**
         * @param txns Runs the snapshot updates.  Must outlive the service.
         * @param bus Receives the domain events.  Must outlive the service.
         * @param verifier Recovers the signer of a request.  Must outlive the service.
         * @param config Settings.
         * @param cache Optional cache for @ref get_latest.
         */
        oracle_service(transactions::transaction_manager& txns,
                       event_bus& bus,
                       signature_verifier& verifier,
                       oracle_config config,
                       std::shared_ptr<cache> cache = nullptr);

        /**
         * @brief Validate the request, then record the snapshot and the new prices in one transaction.
         *
         * @throws transactions::validation_error if the request is invalid.  Nothing is written in that case.
         * @throws transactions::transaction_failed, transactions::transaction_expired if the transaction failed.
         */
        update_snapshot_result update_snapshot(const update_snapshot_request& request);

        /**
         * @brief Current price of every pair, from the cache if there is one.
         */
        std::vector<latest_price> get_latest();

        /**
         * @brief Run @ref update_snapshot for each request.  A failing request does not stop the others.
         */
        batch_update_result batch_update_snapshots(const std::vector<update_snapshot_request>& requests);

        /**
         * @brief Check a request without touching storage.
         *
         * @return The address of the signer.
         * @throws transactions::validation_error
         */
        std::string validate(const update_snapshot_request& request);

        CR_NODISCARD const oracle_config& config() const
        {
            return config_;
        }

      private:
        transactions::transaction_manager& txns_;
        event_bus& bus_;
        signature_verifier& verifier_;
        oracle_config config_;
        std::shared_ptr<cache> cache_;

        void publish(const std::vector<domain_event>& events);
    };

    /**
     * @brief The HTTP status which best describes an error raised by the oracle service.
     *
     * Validation errors are 400, business rule violations 422, transient failures which persisted after all the retries
     * 503, timeouts 504, and anything else 500.
     */
    int http_status(const std::exception& err);

    /** largest timestamp accepted in a request, in milliseconds (year 5138) */
    static constexpr int64_t MAX_TIMESTAMP_MS = 100000000000000LL;

    /**
     * @brief Snapshot timestamps may be in seconds or milliseconds.  Returns milliseconds.
     *
     * Only defined for timestamps in (0, @ref MAX_TIMESTAMP_MS], which @ref oracle_service::validate enforces.
     */
    inline int64_t timestamp_to_ms(int64_t timestamp)
    {
        return timestamp > 1000000000000LL ? timestamp : timestamp * 1000;
    }
} // namespace oracle
} // namespace credence
