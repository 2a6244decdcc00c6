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

#include <credence/oracle/oracle_service.hxx>
#include <credence/transactions/internal/logging.hxx>

#include <boost/algorithm/string/predicate.hpp>

#include <chrono>
#include <cstdlib>
#include <map>
#include <regex>

namespace credence
{
namespace oracle
{
    using transactions::oracle_log;

    namespace
    {
        bool is_number_string(const std::string& value)
        {
            static const std::regex number("^[+-]?([0-9]*[.])?[0-9]+$");
            return std::regex_match(value, number);
        }

        int64_t now_ms()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
        }

        // what the snapshot transaction hands back once committed
        struct snapshot_outcome {
            update_snapshot_result result;
            std::map<std::string, std::optional<std::string>> previous_prices;
        };
    } // namespace

    oracle_service::oracle_service(transactions::transaction_manager& txns,
                                   event_bus& bus,
                                   signature_verifier& verifier,
                                   oracle_config config,
                                   std::shared_ptr<cache> cache)
      : txns_(txns)
      , bus_(bus)
      , verifier_(verifier)
      , config_(std::move(config))
      , cache_(std::move(cache))
    {
        if (config_.signer_address.empty()) {
            oracle_log->warn("no oracle signer address configured, any signer will be accepted");
        }
    }

    std::string oracle_service::validate(const update_snapshot_request& request)
    {
        if (request.timestamp <= 0 || request.timestamp > MAX_TIMESTAMP_MS) {
            throw transactions::validation_error("timestamp out of range: " + std::to_string(request.timestamp));
        }
        auto timestamp_ms = timestamp_to_ms(request.timestamp);
        if (std::llabs(now_ms() - timestamp_ms) > config_.max_clock_skew.count()) {
            throw transactions::validation_error("timestamp out of allowed skew");
        }
        for (const auto& feed : request.feeds) {
            if (feed.pair.empty()) {
                throw transactions::validation_error("feed pair must not be empty");
            }
            if (!is_number_string(feed.price)) {
                throw transactions::validation_error("price of " + feed.pair + " is not a number: " + feed.price);
            }
        }
        if (request.signature.empty()) {
            throw transactions::validation_error("signature must not be empty");
        }
        auto recovered = verifier_.recover_signer(request.signature, request.timestamp, request.feeds);
        if (recovered.empty()) {
            throw transactions::validation_error("could not recover the signer of the snapshot");
        }
        if (!config_.signer_address.empty() && !boost::algorithm::iequals(recovered, config_.signer_address)) {
            throw transactions::validation_error("snapshot is not signed by the oracle signer");
        }
        if (request.signer && !boost::algorithm::iequals(*request.signer, recovered)) {
            throw transactions::validation_error("signer does not match the signature");
        }
        return recovered;
    }

    update_snapshot_result oracle_service::update_snapshot(const update_snapshot_request& request)
    {
        auto signer = validate(request);
        auto timestamp_ms = timestamp_to_ms(request.timestamp);
        nlohmann::json feeds = request.feeds;
        const auto& snapshots = config_.snapshots_table;
        const auto& latest = config_.latest_prices_table;

        auto outcome = txns_.execute<snapshot_outcome>(
          [&](transactions::transaction_context& ctx) {
              snapshot_outcome out;
              auto snapshot = ctx.execute(transactions::make_operation(
                "CreateOracleSnapshot",
                [&](storage::storage_scope& scope) {
                    return scope.create(
                      snapshots, { { "timestamp_ms", timestamp_ms }, { "signer", signer }, { "signature", request.signature }, { "feeds", feeds } });
                },
                [snapshots](storage::storage_scope& scope, const nlohmann::json& created) {
                    auto id = storage::record_key(created.at(scope.key_field(snapshots)));
                    scope.remove(snapshots, id);
                    oracle_log->warn("compensated: deleted snapshot {}", id);
                }));
              auto snapshot_id = storage::record_key(snapshot.at(ctx.scope().key_field(snapshots)));

              for (const auto& feed : request.feeds) {
                  auto updated = ctx.execute(transactions::make_operation(
                    "UpdatePriceFeed_" + feed.pair,
                    [latest, feed, timestamp_ms, snapshot_id](storage::storage_scope& scope) {
                        auto previous = scope.find(latest, feed.pair);
                        nlohmann::json record = latest_price{ feed.pair, feed.price, feed.decimals, timestamp_ms, snapshot_id };
                        record[scope.key_field(latest)] = feed.pair;
                        scope.upsert(latest, record);
                        return nlohmann::json{ { "pair", feed.pair }, { "previous", previous ? *previous : nlohmann::json(nullptr) } };
                    },
                    [latest](storage::storage_scope& scope, const nlohmann::json& result) {
                        const auto& previous = result.at("previous");
                        auto pair = result.at("pair").get<std::string>();
                        if (previous.is_null()) {
                            scope.remove(latest, pair);
                            oracle_log->warn("compensated: deleted new price for {}", pair);
                        } else {
                            scope.upsert(latest, previous);
                            oracle_log->warn("compensated: restored previous price for {}", pair);
                        }
                    }));
                  const auto& previous = updated.at("previous");
                  if (previous.is_null()) {
                      out.previous_prices[feed.pair] = std::nullopt;
                  } else {
                      out.previous_prices[feed.pair] = previous.at("price").get<std::string>();
                  }
              }
              out.result = update_snapshot_result{ snapshot_id, request.feeds.size() };
              oracle_log->info("snapshot {} created with {} price feeds updated", snapshot_id, request.feeds.size());
              return out;
          },
          config_.update_options);

        const auto& snapshot_id = outcome.result.snapshot_id;
        std::vector<domain_event> events;
        events.push_back(make_domain_event(snapshot_id,
                                           SNAPSHOT_AGGREGATE,
                                           SNAPSHOT_RECORDED,
                                           { { "signer", signer },
                                             { "signature", request.signature },
                                             { "feeds", feeds },
                                             { "timestamp_ms", timestamp_ms } }));
        for (const auto& feed : request.feeds) {
            nlohmann::json payload = { { "pair", feed.pair },
                                       { "price", feed.price },
                                       { "decimals", feed.decimals },
                                       { "timestamp_ms", timestamp_ms },
                                       { "snapshot_id", snapshot_id } };
            const auto& previous = outcome.previous_prices[feed.pair];
            if (previous) {
                payload["previous_price"] = *previous;
            }
            events.push_back(make_domain_event(feed.pair, LATEST_PRICE_AGGREGATE, PRICE_FEED_UPDATED, std::move(payload)));
        }
        publish(events);

        if (cache_) {
            try {
                cache_->invalidate(LATEST_CACHE_KEY);
            } catch (const std::exception& e) {
                oracle_log->error("could not invalidate {} after snapshot {}: {}", LATEST_CACHE_KEY, snapshot_id, e.what());
            }
        }
        return outcome.result;
    }

    void oracle_service::publish(const std::vector<domain_event>& events)
    {
        if (events.empty()) {
            return;
        }
        // the snapshot is committed whatever happens here, so a failing bus is reported, not raised
        try {
            bus_.publish(events.front());
            if (events.size() > 1) {
                bus_.publish_batch(std::vector<domain_event>(events.begin() + 1, events.end()));
            }
        } catch (const std::exception& e) {
            oracle_log->error("publishing events of snapshot {} failed: {}", events.front().aggregate_id, e.what());
        }
    }

    std::vector<latest_price> oracle_service::get_latest()
    {
        if (cache_) {
            auto cached = cache_->get(LATEST_CACHE_KEY);
            if (cached) {
                oracle_log->trace("latest prices served from cache");
                return cached->get<std::vector<latest_price>>();
            }
        }
        auto options = transactions::execution_options(config_.update_options).label("oracle.get_latest").read_only(true);
        const auto& table = config_.latest_prices_table;
        auto prices = txns_.execute<std::vector<latest_price>>(
          [&table](transactions::transaction_context& ctx) {
              std::vector<latest_price> retval;
              for (const auto& row : ctx.scope().find_all(table)) {
                  retval.push_back(row.get<latest_price>());
              }
              return retval;
          },
          options);
        if (cache_) {
            cache_->set(LATEST_CACHE_KEY, prices, config_.cache_ttl);
        }
        return prices;
    }

    batch_update_result oracle_service::batch_update_snapshots(const std::vector<update_snapshot_request>& requests)
    {
        batch_update_result batch;
        for (size_t i = 0; i < requests.size(); ++i) {
            try {
                batch.results.push_back(update_snapshot(requests[i]));
            } catch (const std::exception& e) {
                oracle_log->error("failed to update snapshot {} of batch: {}", i, e.what());
                batch.failures.push_back(batch_failure{ i, e.what(), http_status(e) });
            }
        }
        return batch;
    }

    int http_status(const std::exception& err)
    {
        auto ec = transactions::FAIL_OTHER;
        if (auto txn = dynamic_cast<const transactions::transaction_exception*>(&err)) {
            ec = txn->cause();
        } else if (auto client = dynamic_cast<const transactions::client_error*>(&err)) {
            ec = client->ec();
        } else if (auto op = dynamic_cast<const transactions::operation_failed*>(&err)) {
            ec = op->ec();
        }
        switch (ec) {
            case transactions::FAIL_VALIDATION:
                return 400;
            case transactions::FAIL_BUSINESS_RULE:
                return 422;
            case transactions::FAIL_TRANSIENT:
                return 503;
            case transactions::FAIL_TIMEOUT:
                return 504;
            default:
                return 500;
        }
    }
} // namespace oracle
} // namespace credence
