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

#include <string>

#include <spdlog/common.h>

namespace credence
{
namespace transactions
{
    enum class log_level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };

    /**
     * @brief Parse a level name such as "debug" or "WARN".
     */
    log_level log_level_value(const std::string& name);

    /**
     * @brief Set the level of all the library loggers.
     */
    void set_transactions_log_level(log_level level);

    /**
     * @brief Send the output of all the library loggers to the given sink, at the given level.
     *
     * A null sink sends the output back to stdout.  Not safe to call while other threads are logging.
     */
    void create_loggers(log_level level, spdlog::sink_ptr sink);
} // namespace transactions
} // namespace credence
