// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "ScopeValidator.hh"

#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace storekit::jws
{
  ScopeValidator::ScopeValidator(Environment environment, std::string bundle_id, std::optional<std::int64_t> app_apple_id)
    : environment_(environment)
    , bundle_id_(std::move(bundle_id))
    , app_apple_id_(app_apple_id)
  {
  }

  Result<void> ScopeValidator::validate(const DecodedPayload &payload) const
  {
    return std::visit(
      [this](const auto &p) -> Result<void> {
        if constexpr (std::is_same_v<std::decay_t<decltype(p)>, UnknownPayload>)
          {
            return outcome::success();
          }
        else
          {
            return validate(p);
          }
      },
      payload);
  }

  Result<void> ScopeValidator::check_bundle_id(const std::optional<std::string> &bundle_id, const char *field) const
  {
    if (bundle_id != bundle_id_)
      {
        logger_->error("Bundle id '{}' does not match expected '{}'", bundle_id.value_or("<none>"), bundle_id_);
        return VerificationError::for_field(VerificationErrc::InvalidBundleId,
                                            field,
                                            fmt::format("'{}' instead of '{}'", bundle_id.value_or(""), bundle_id_));
      }
    return outcome::success();
  }

  Result<void> ScopeValidator::check_environment(const std::optional<std::string> &environment, const char *field) const
  {
    auto expected = storekit::utils::enum_to_string(environment_);
    if (!environment || *environment != expected)
      {
        logger_->error("Environment '{}' does not match expected '{}'", environment.value_or("<none>"), expected);
        return VerificationError::for_field(VerificationErrc::InvalidEnvironment,
                                            field,
                                            fmt::format("'{}' instead of '{}'", environment.value_or(""), expected));
      }
    return outcome::success();
  }

  Result<void> ScopeValidator::validate(const TransactionInfo &transaction) const
  {
    auto rc = check_bundle_id(transaction.bundle_id, "bundleId");
    if (!rc)
      {
        return rc;
      }
    return check_environment(transaction.environment, "environment");
  }

  Result<void> ScopeValidator::validate(const RenewalInfo &renewal) const
  {
    return check_environment(renewal.environment, "environment");
  }

  Result<void> ScopeValidator::validate(const AppTransaction &app_transaction) const
  {
    auto rc = check_bundle_id(app_transaction.bundle_id, "bundleId");
    if (!rc)
      {
        return rc;
      }

    if (app_apple_id_ && app_transaction.app_apple_id && *app_apple_id_ != *app_transaction.app_apple_id)
      {
        logger_->error("App id {} does not match expected {}", *app_transaction.app_apple_id, *app_apple_id_);
        return VerificationError::for_field(VerificationErrc::InvalidAppIdentifier,
                                            "appAppleId",
                                            fmt::format("{} instead of {}", *app_transaction.app_apple_id, *app_apple_id_));
      }

    return check_environment(app_transaction.receipt_type, "receiptType");
  }

  Result<void> ScopeValidator::validate(const NotificationEnvelope &notification) const
  {
    std::optional<std::string> bundle_id;
    std::optional<std::int64_t> app_apple_id;
    std::optional<std::string> environment;
    std::string source;

    if (notification.data)
      {
        bundle_id = notification.data->bundle_id;
        app_apple_id = notification.data->app_apple_id;
        environment = notification.data->environment;
        source = "data";
      }
    else if (notification.summary)
      {
        bundle_id = notification.summary->bundle_id;
        app_apple_id = notification.summary->app_apple_id;
        environment = notification.summary->environment;
        source = "summary";
      }
    else if (notification.external_purchase_token)
      {
        const auto &token = *notification.external_purchase_token;
        bundle_id = token.bundle_id;
        app_apple_id = token.app_apple_id;
        environment = std::string(storekit::utils::enum_to_string(token.is_sandbox() ? Environment::Sandbox : Environment::Production));
        source = "externalPurchaseToken";
      }

    if (bundle_id && *bundle_id != bundle_id_)
      {
        logger_->error("Notification bundle id '{}' does not match expected '{}'", *bundle_id, bundle_id_);
        return VerificationError::for_field(VerificationErrc::InvalidBundleId,
                                            source + ".bundleId",
                                            fmt::format("'{}' instead of '{}'", *bundle_id, bundle_id_));
      }

    if (app_apple_id_ && app_apple_id && *app_apple_id != *app_apple_id_)
      {
        logger_->error("Notification app id {} does not match expected {}", *app_apple_id, *app_apple_id_);
        return VerificationError::for_field(VerificationErrc::InvalidAppIdentifier,
                                            source + ".appAppleId",
                                            fmt::format("{} instead of {}", *app_apple_id, *app_apple_id_));
      }

    if (environment_ == Environment::Production && app_apple_id_ && !app_apple_id)
      {
        logger_->error("Production notification carries no app id");
        return VerificationError(VerificationErrc::InvalidAppIdentifier, "notification carries no app id");
      }

    if (environment && environment_ != Environment::LocalTesting && *environment != storekit::utils::enum_to_string(environment_))
      {
        logger_->error("Notification environment '{}' does not match expected '{}'", *environment, environment_);
        return VerificationError::for_field(VerificationErrc::InvalidEnvironment,
                                            source + ".environment",
                                            fmt::format("'{}' instead of '{}'", *environment, environment_));
      }

    return outcome::success();
  }

} // namespace storekit::jws
