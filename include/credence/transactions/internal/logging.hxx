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

#include <memory>
#include <string>

#include <credence/transactions/logging.hxx>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

// To avoid static initialization order issues, #define instead of static const
#define TXN_LOG "transactions"
#define MONITOR_LOG "transaction_monitor"
#define STORAGE_LOG "storage"
#define ORACLE_LOG "oracle"
#define LOGGER_PATTERN "[%H:%M:%S.%e][%n][%l][t:%t] %v"

namespace credence
{
namespace transactions
{
    std::shared_ptr<spdlog::logger> init_txn_log();
    std::shared_ptr<spdlog::logger> init_monitor_log();
    std::shared_ptr<spdlog::logger> init_storage_log();
    std::shared_ptr<spdlog::logger> init_oracle_log();

    static std::shared_ptr<spdlog::logger> txn_log = init_txn_log();
    static std::shared_ptr<spdlog::logger> monitor_log = init_monitor_log();
    static std::shared_ptr<spdlog::logger> storage_log = init_storage_log();
    static std::shared_ptr<spdlog::logger> oracle_log = init_oracle_log();

    // prefix for messages logged on behalf of an attempt: [<transaction id>/<attempt>]:
    static const std::string attempt_format_string("[{}/{}]:");

    spdlog::level::level_enum cr_to_spdlog_level(log_level level);
} // namespace transactions
} // namespace credence
