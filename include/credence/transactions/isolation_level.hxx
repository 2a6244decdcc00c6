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

#include <stdexcept>
#include <string>

namespace credence
{
namespace transactions
{
    enum class isolation_level {
        /**
         * Reads may observe writes of other transactions which are not committed yet.
         */
        READ_UNCOMMITTED = 0x00,

        /**
         * Reads only observe committed writes, plus the writes of the current transaction.
         */
        READ_COMMITTED = 0x01,

        /**
         * Reads observe the committed state as of the start of the transaction.
         */
        REPEATABLE_READ = 0x02,

        /**
         * Strongest isolation the store offers.
         */
        SERIALIZABLE = 0x03
    };

    inline std::string isolation_level_to_string(isolation_level l)
    {
        switch (l) {
            case isolation_level::READ_UNCOMMITTED:
                return "READ UNCOMMITTED";
            case isolation_level::READ_COMMITTED:
                return "READ COMMITTED";
            case isolation_level::REPEATABLE_READ:
                return "REPEATABLE READ";
            case isolation_level::SERIALIZABLE:
                return "SERIALIZABLE";
        }
        throw std::runtime_error("unknown isolation level");
    }

    inline isolation_level isolation_level_value(const std::string& str)
    {
        if (str == "READ UNCOMMITTED" || str == "READ_UNCOMMITTED") {
            return isolation_level::READ_UNCOMMITTED;
        } else if (str == "READ COMMITTED" || str == "READ_COMMITTED") {
            return isolation_level::READ_COMMITTED;
        } else if (str == "REPEATABLE READ" || str == "REPEATABLE_READ") {
            return isolation_level::REPEATABLE_READ;
        } else if (str == "SERIALIZABLE") {
            return isolation_level::SERIALIZABLE;
        } else {
            throw std::runtime_error("unknown isolation level: " + str);
        }
    }
} // namespace transactions
} // namespace credence
