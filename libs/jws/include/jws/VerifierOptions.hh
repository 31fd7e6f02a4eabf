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

#ifndef JWS_VERIFIER_OPTIONS_HH
#define JWS_VERIFIER_OPTIONS_HH

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "jws/Environment.hh"

namespace storekit::jws
{
  struct VerifierOptions
  {
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;

    Environment environment{Environment::Production};
    std::string bundle_id;
    std::optional<std::int64_t> app_apple_id;

    bool enable_revocation_check{false};
    RevocationFailurePolicy revocation_failure_policy{RevocationFailurePolicy::FailClosed};
    std::chrono::milliseconds revocation_timeout{std::chrono::seconds(5)};

    // Requires the platform's receipt-signing extensions on the leaf and
    // intermediate certificates.
    bool enable_strict_checks{false};

    // Clock used for certificate validity windows.
    TimeSource time_source{[]() { return std::chrono::system_clock::now(); }};
  };
} // namespace storekit::jws

#endif // JWS_VERIFIER_OPTIONS_HH
