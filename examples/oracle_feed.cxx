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
#include <credence/storage/memory_store.hxx>
#include <credence/transactions.hxx>
#include <credence/transactions/logging.hxx>
#include <credence/transactions/transaction_monitor.hxx>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>

using namespace std;
using namespace credence;

// Prints events instead of delivering them anywhere.
class console_event_bus : public oracle::event_bus
{
  public:
    void publish(const oracle::domain_event& event) override
    {
        cout << "event " << event.event_type << " for " << event.aggregate_id << ": " << event.payload.dump() << endl;
    }

    void publish_batch(const vector<oracle::domain_event>& events) override
    {
        for (const auto& event : events) {
            publish(event);
        }
    }
};

// Demo only: a signature is "<signer address>:<anything>".
class prefix_verifier : public oracle::signature_verifier
{
  public:
    string recover_signer(const string& signature, int64_t, const vector<oracle::feed_price>&) override
    {
        auto colon = signature.find(':');
        if (colon == string::npos) {
            throw transactions::validation_error("malformed signature");
        }
        return signature.substr(0, colon);
    }
};

class map_cache : public oracle::cache
{
  private:
    map<string, pair<nlohmann::json, chrono::steady_clock::time_point>> entries_;

  public:
    optional<nlohmann::json> get(const string& key) override
    {
        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.second < chrono::steady_clock::now()) {
            return {};
        }
        return it->second.first;
    }

    void set(const string& key, const nlohmann::json& value, chrono::seconds ttl) override
    {
        entries_[key] = { value, chrono::steady_clock::now() + ttl };
    }

    void invalidate(const string& key) override
    {
        entries_.erase(key);
    }
};

static nlohmann::json load_config(const string& path)
{
    ifstream in(path);
    if (!in.is_open()) {
        cerr << "no configuration at " << path << ", using defaults" << endl;
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(in);
}

static oracle::update_snapshot_request make_request(const string& signer, vector<oracle::feed_price> feeds)
{
    auto now = chrono::duration_cast<chrono::seconds>(chrono::system_clock::now().time_since_epoch()).count();
    return oracle::update_snapshot_request{ now, move(feeds), signer + ":demo", {} };
}

int main(int argc, const char* argv[])
{
    string config_path = argc > 1 ? argv[1] : "config.json";
    auto conf = load_config(config_path);

    transactions::create_loggers(transactions::log_level_value(conf.value("log_level", "info")), nullptr);

    auto oracle_conf = oracle::oracle_config::from_json(conf.value("oracle", nlohmann::json::object()));
    if (const char* signer = getenv("CREDENCE_ORACLE_SIGNER")) {
        oracle_conf.signer_address = signer;
    }
    if (oracle_conf.signer_address.empty()) {
        oracle_conf.signer_address = "GORACLESIGNER";
    }

    storage::memory_store store(chrono::milliseconds(conf.value("lock_timeout_ms", 1000)));
    store.define_table(oracle_conf.latest_prices_table, "pair");

    transactions::transaction_config txn_config;
    txn_config.default_options(transactions::execution_options::from_json(conf.value("transactions", nlohmann::json::object())));
    transactions::transaction_manager txns(store, txn_config);

    transactions::transaction_monitor monitor;
    txns.register_hooks(monitor.create_hooks());

    console_event_bus bus;
    prefix_verifier verifier;
    oracle::oracle_service service(txns, bus, verifier, oracle_conf, make_shared<map_cache>());

    try {
        auto result = service.update_snapshot(
          make_request(oracle_conf.signer_address, { { "XLM/USD", "0.1234", 4 }, { "BTC/USD", "64250.50", 2 } }));
        cout << "snapshot " << result.snapshot_id << " updated " << result.feeds_updated << " feeds" << endl;
    } catch (const transactions::transaction_exception& e) {
        cerr << "snapshot failed: " << e.what() << " (http " << oracle::http_status(e) << ")" << endl;
    } catch (const transactions::client_error& e) {
        cerr << "snapshot rejected: " << e.what() << " (http " << oracle::http_status(e) << ")" << endl;
    }

    auto batch = service.batch_update_snapshots({
      make_request(oracle_conf.signer_address, { { "XLM/USD", "0.1301", 4 } }),
      make_request("GSOMEONEELSE", { { "ETH/USD", "3100.00", 2 } }),
      make_request(oracle_conf.signer_address, { { "ETH/USD", "not-a-price", 2 } }),
    });
    cout << "batch: " << batch.results.size() << " succeeded, " << batch.failures.size() << " failed" << endl;
    for (const auto& failure : batch.failures) {
        cout << "  request " << failure.index << ": " << failure.message << " (http " << failure.http_status << ")" << endl;
    }

    for (const auto& price : service.get_latest()) {
        cout << price.pair << " = " << price.price << " (snapshot " << price.snapshot_id << ")" << endl;
    }

    cout << monitor.export_metrics().dump(2) << endl;
    return 0;
}
