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

#ifndef JWS_SCOPE_VALIDATOR_HH
#define JWS_SCOPE_VALIDATOR_HH

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

#include "jws/Environment.hh"
#include "jws/Payloads.hh"
#include "jws/VerificationErrors.hh"
#include "utils/Logging.hh"

namespace storekit::jws
{
  // Checks that a decoded payload belongs to the configured app and
  // deployment environment.
  class ScopeValidator
  {
  public:
    ScopeValidator(Environment environment, std::string bundle_id, std::optional<std::int64_t> app_apple_id);

    Result<void> validate(const DecodedPayload &payload) const;

    Result<void> validate(const TransactionInfo &transaction) const;
    Result<void> validate(const RenewalInfo &renewal) const;
    Result<void> validate(const AppTransaction &app_transaction) const;
    Result<void> validate(const NotificationEnvelope &notification) const;

  private:
    Result<void> check_bundle_id(const std::optional<std::string> &bundle_id, const char *field) const;
    Result<void> check_environment(const std::optional<std::string> &environment, const char *field) const;

  private:
    Environment environment_;
    std::string bundle_id_;
    std::optional<std::int64_t> app_apple_id_;
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:scope")};
  };

} // namespace storekit::jws

#endif // JWS_SCOPE_VALIDATOR_HH
