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

#include <credence/transactions/internal/logging.hxx>

#include <boost/algorithm/string/case_conv.hpp>

namespace credence
{
namespace transactions
{
    namespace
    {
        std::shared_ptr<spdlog::logger> make_logger(const std::string& name)
        {
            auto logger = spdlog::get(name);
            if (!logger) {
                logger = spdlog::stdout_logger_mt(name);
            }
            logger->set_pattern(LOGGER_PATTERN);
            return logger;
        }
    } // namespace

    std::shared_ptr<spdlog::logger> init_txn_log()
    {
        static std::shared_ptr<spdlog::logger> txnlogger = make_logger(TXN_LOG);
        return txnlogger;
    }

    std::shared_ptr<spdlog::logger> init_monitor_log()
    {
        static auto monitorlogger = make_logger(MONITOR_LOG);
        return monitorlogger;
    }

    std::shared_ptr<spdlog::logger> init_storage_log()
    {
        static auto storagelogger = make_logger(STORAGE_LOG);
        return storagelogger;
    }

    std::shared_ptr<spdlog::logger> init_oracle_log()
    {
        static auto oraclelogger = make_logger(ORACLE_LOG);
        return oraclelogger;
    }

    spdlog::level::level_enum cr_to_spdlog_level(log_level level)
    {
        switch (level) {
            case log_level::TRACE:
                return spdlog::level::trace;
            case log_level::DEBUG:
                return spdlog::level::debug;
            case log_level::INFO:
                return spdlog::level::info;
            case log_level::WARN:
                return spdlog::level::warn;
            case log_level::ERROR:
                return spdlog::level::err;
            case log_level::CRITICAL:
                return spdlog::level::critical;
            default:
                return spdlog::level::off;
        }
    }

    log_level log_level_value(const std::string& name)
    {
        auto lvl = spdlog::level::from_str(name);
        if (lvl == spdlog::level::off && name != "off" && name != "OFF") {
            // spdlog only knows lower case names, and "warning" rather than "warn"
            auto lower = boost::algorithm::to_lower_copy(name);
            lvl = spdlog::level::from_str(lower == "warn" ? "warning" : lower);
        }
        switch (lvl) {
            case spdlog::level::trace:
                return log_level::TRACE;
            case spdlog::level::debug:
                return log_level::DEBUG;
            case spdlog::level::info:
                return log_level::INFO;
            case spdlog::level::warn:
                return log_level::WARN;
            case spdlog::level::err:
                return log_level::ERROR;
            case spdlog::level::critical:
                return log_level::CRITICAL;
            default:
                return log_level::OFF;
        }
    }

    void set_transactions_log_level(log_level level)
    {
        spdlog::level::level_enum lvl = cr_to_spdlog_level(level);
        init_txn_log()->set_level(lvl);
        init_monitor_log()->set_level(lvl);
        init_storage_log()->set_level(lvl);
        init_oracle_log()->set_level(lvl);
    }

    void create_loggers(log_level level, spdlog::sink_ptr sink)
    {
        if (!sink) {
            sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
        }
        for (auto& logger : { init_txn_log(), init_monitor_log(), init_storage_log(), init_oracle_log() }) {
            logger->sinks().clear();
            logger->sinks().push_back(sink);
            logger->set_pattern(LOGGER_PATTERN);
            logger->set_level(cr_to_spdlog_level(level));
            logger->flush_on(spdlog::level::trace);
        }
    }
} // namespace transactions
} // namespace credence
