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

#include <credence/transactions/exceptions.hxx>

namespace credence
{
namespace transactions
{
    const char* error_class_name(error_class ec)
    {
        switch (ec) {
            case FAIL_TRANSIENT:
                return "FAIL_TRANSIENT";
            case FAIL_VALIDATION:
                return "FAIL_VALIDATION";
            case FAIL_BUSINESS_RULE:
                return "FAIL_BUSINESS_RULE";
            case FAIL_TIMEOUT:
                return "FAIL_TIMEOUT";
            case FAIL_COMPENSATION:
                return "FAIL_COMPENSATION";
            default:
                return "FAIL_OTHER";
        }
    }

    transaction_exception::transaction_exception(const std::string& what,
                                                 error_class cause,
                                                 failure_type type,
                                                 transaction_result result,
                                                 std::optional<std::string> failed_operation,
                                                 std::exception_ptr original)
      : std::runtime_error(what)
      , result_(std::move(result))
      , cause_(cause)
      , type_(type)
      , failed_operation_(std::move(failed_operation))
      , original_(std::move(original))
    {
    }
} // namespace transactions
} // namespace credence
