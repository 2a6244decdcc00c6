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

#include <credence/support.hxx>
#include <credence/transactions/transaction_result.hxx>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace credence
{
namespace transactions
{
    enum error_class {
        FAIL_OTHER = 0,
        FAIL_TRANSIENT,
        FAIL_VALIDATION,
        FAIL_BUSINESS_RULE,
        FAIL_TIMEOUT,
        FAIL_COMPENSATION
    };

    const char* error_class_name(error_class ec);

    /**
     * Only transient storage failures and timeouts are worth another attempt.
     */
    inline bool is_retryable(error_class ec)
    {
        return ec == FAIL_TRANSIENT || ec == FAIL_TIMEOUT;
    }

    /**
     * @brief Base class for errors raised by storage and business code inside a transaction.
     *
     * The @ref error_class decides whether the transaction manager retries the attempt.
     */
    class client_error : public std::runtime_error
    {
      private:
        error_class ec_;

      public:
        explicit client_error(error_class ec, const std::string& what)
          : std::runtime_error(what)
          , ec_(ec)
        {
        }

        error_class ec() const
        {
            return ec_;
        }
    };

    /**
     * Lock contention, dropped connection and similar - expected to succeed on retry.
     */
    class transient_storage_error : public client_error
    {
      public:
        explicit transient_storage_error(const std::string& what)
          : client_error(FAIL_TRANSIENT, what)
        {
        }
    };

    class validation_error : public client_error
    {
      public:
        explicit validation_error(const std::string& what)
          : client_error(FAIL_VALIDATION, what)
        {
        }
    };

    class business_rule_error : public client_error
    {
      public:
        explicit business_rule_error(const std::string& what)
          : client_error(FAIL_BUSINESS_RULE, what)
        {
        }
    };

    // Prefer this as it reads better than throw client_error(FAIL_TIMEOUT, ...)
    class attempt_expired : public client_error
    {
      public:
        explicit attempt_expired(const std::string& what)
          : client_error(FAIL_TIMEOUT, what)
        {
        }
    };

    /**
     * Raised by a failing compensation.  Never escapes the unwind loop.
     */
    class compensation_error : public client_error
    {
      private:
        std::string operation_;

      public:
        compensation_error(const std::string& operation, const std::string& what)
          : client_error(FAIL_COMPENSATION, what)
          , operation_(operation)
        {
        }

        const std::string& operation() const
        {
            return operation_;
        }
    };

    /**
     * @brief The forward action of a @ref compensatable_operation failed.
     *
     * Keeps the label of the operation, and the error class of the underlying cause so the
     * transaction manager can still tell a transient failure from a business one.  The message is the message of the
     * cause.
     */
    class operation_failed : public std::runtime_error
    {
      private:
        std::string operation_;
        error_class ec_;
        std::exception_ptr cause_;

      public:
        operation_failed(const std::string& operation, error_class ec, const std::string& what, std::exception_ptr cause = nullptr)
          : std::runtime_error(what)
          , operation_(operation)
          , ec_(ec)
          , cause_(std::move(cause))
        {
        }

        CR_NODISCARD std::exception_ptr cause() const
        {
            return cause_;
        }

        const std::string& operation() const
        {
            return operation_;
        }

        error_class ec() const
        {
            return ec_;
        }
    };

    enum class failure_type { FAIL, EXPIRY };

    /**
     * @brief Base class for all exceptions expected to be raised from a transaction.
     *
     * Subclasses of this are the only exceptions that are raised out of @ref transaction_manager::execute.  The message is
     * always the message of the error which failed the last attempt, never the one of a compensation.
     */
    class transaction_exception : public std::runtime_error
    {
      private:
        transaction_result result_;
        error_class cause_;
        failure_type type_;
        std::optional<std::string> failed_operation_;
        std::exception_ptr original_;

      public:
        /**
         * @brief Construct from the error that failed the last attempt.
         *
         * @param what Message of the original error.
         * @param cause Error class of the original error.
         * @param type Whether the transaction failed, or ran out of time.
         * @param result The internal state of the transaction at the time of the exception.
         * @param failed_operation Label of the operation whose forward action failed, if any.
         * @param original The original exception.
         */
        transaction_exception(const std::string& what,
                              error_class cause,
                              failure_type type,
                              transaction_result result,
                              std::optional<std::string> failed_operation,
                              std::exception_ptr original);

        /**
         * @brief Internal state of transaction at time of exception
         *
         * @returns Internal state of transaction.
         */
        const transaction_result& get_transaction_result() const
        {
            return result_;
        }

        /**
         * @brief The cause of the exception
         *
         * @returns The error class of the underlying cause for this exception.
         */
        error_class cause() const
        {
            return cause_;
        }

        failure_type type() const
        {
            return type_;
        }

        /**
         * @brief Number of attempts made, including the failing one.
         */
        size_t attempts() const
        {
            return result_.attempts.size();
        }

        const std::optional<std::string>& failed_operation() const
        {
            return failed_operation_;
        }

        CR_NODISCARD std::exception_ptr original_exception() const
        {
            return original_;
        }

        [[noreturn]] void rethrow_original() const
        {
            std::rethrow_exception(original_);
        }
    };

    /**
     * @brief Transaction failed
     *
     * This is raised when the transaction doesn't time out, but fails for some other reason: a non-transient error, or
     * transient errors which persisted after all the configured retries.
     */
    class transaction_failed : public transaction_exception
    {
      public:
        using transaction_exception::transaction_exception;
    };

    /**
     * @brief Transaction expired.
     *
     * The last attempt exceeded its deadline.  All the operations it executed have been compensated before this is
     * raised.
     */
    class transaction_expired : public transaction_exception
    {
      public:
        using transaction_exception::transaction_exception;
    };

} // namespace transactions
} // namespace credence
