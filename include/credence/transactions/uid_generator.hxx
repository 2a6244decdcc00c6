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

#include <mutex>
#include <string>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace credence
{
namespace transactions
{
    /**
     * Random (v4) UUIDs, used for transaction ids, record keys and domain event ids.
     */
    class uid_generator
    {
      public:
        static std::string next()
        {
            // random_generator is not thread safe
            static std::mutex mutex;
            static boost::uuids::random_generator generator;
            std::lock_guard<std::mutex> lock(mutex);
            return boost::uuids::to_string(generator());
        }
    };
} // namespace transactions
} // namespace credence
