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
#include <optional>
#include <string>

#include <credence/transactions/exceptions.hxx>
#include <credence/transactions/transaction_result.hxx>

namespace credence
{
namespace transactions
{
    /**
     * Whatever failed an attempt, classified.  The transaction logic consumes this to decide whether to retry, and what
     * to raise if it doesn't.
     */
    class attempt_failure
    {
      public:
        attempt_failure(error_class ec, std::string message, std::optional<std::string> failed_operation, std::exception_ptr original)
          : ec_(ec)
          , message_(std::move(message))
          , failed_operation_(std::move(failed_operation))
          , original_(std::move(original))
        {
        }

        /**
         * Classify an exception raised during an attempt.  Anything not derived from std::exception is FAIL_OTHER, with
         * the message "Unexpected error".
         */
        static attempt_failure from(std::exception_ptr err)
        {
            try {
                std::rethrow_exception(err);
            } catch (const operation_failed& e) {
                return { e.ec(), e.what(), e.operation(), err };
            } catch (const client_error& e) {
                return { e.ec(), e.what(), {}, err };
            } catch (const std::exception& e) {
                return { FAIL_OTHER, e.what(), {}, err };
            } catch (...) {
                return { FAIL_OTHER, "Unexpected error", {}, err };
            }
        }

        error_class ec() const
        {
            return ec_;
        }

        const std::string& message() const
        {
            return message_;
        }

        const std::optional<std::string>& failed_operation() const
        {
            return failed_operation_;
        }

        bool expired() const
        {
            return ec_ == FAIL_TIMEOUT;
        }

        [[noreturn]] void do_throw(const transaction_result& result) const
        {
            if (expired()) {
                throw transaction_expired(message_, ec_, failure_type::EXPIRY, result, failed_operation_, original_);
            }
            throw transaction_failed(message_, ec_, failure_type::FAIL, result, failed_operation_, original_);
        }

      private:
        error_class ec_;
        std::string message_;
        std::optional<std::string> failed_operation_;
        std::exception_ptr original_;
    };

    namespace internal
    {
        /**
         * Used only in testing: injects an error that will be handled as FAIL_TRANSIENT.
         *
         * E.g. lock contention in the store, which a retry of the transaction is expected to get past.
         */
        class test_fail_transient : public client_error
        {
          public:
            explicit test_fail_transient(const std::string& stage)
              : client_error(FAIL_TRANSIENT, "Injecting a FAIL_TRANSIENT error at " + stage)
            {
            }
        };

        /**
         * Used only in testing: injects an error that will be handled as FAIL_OTHER.
         *
         * E.g. an error which is not retryable.
         */
        class test_fail_other : public client_error
        {
          public:
            explicit test_fail_other(const std::string& stage)
              : client_error(FAIL_OTHER, "Injecting a FAIL_OTHER error at " + stage)
            {
            }
        };

        class test_fail_timeout : public client_error
        {
          public:
            explicit test_fail_timeout(const std::string& stage)
              : client_error(FAIL_TIMEOUT, "Injecting a FAIL_TIMEOUT error at " + stage)
            {
            }
        };

        inline void inject_error(const std::optional<error_class>& ec, const std::string& stage)
        {
            if (!ec) {
                return;
            }
            switch (*ec) {
                case FAIL_TRANSIENT:
                    throw test_fail_transient(stage);
                case FAIL_TIMEOUT:
                    throw test_fail_timeout(stage);
                case FAIL_OTHER:
                    throw test_fail_other(stage);
                default:
                    throw client_error(*ec, std::string("Injecting a ") + error_class_name(*ec) + " error at " + stage);
            }
        }
    } // namespace internal
} // namespace transactions
} // namespace credence
