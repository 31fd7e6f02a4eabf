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

#ifndef JWS_ENVIRONMENT_HH
#define JWS_ENVIRONMENT_HH

#include <array>
#include <string_view>
#include <utility>

#include "utils/Enum.hh"

namespace storekit::jws
{
  // Deployment context under which a token was issued. Xcode and LocalTesting
  // tokens are produced by local tooling and are not chained to a trusted root.
  enum class Environment
  {
    Sandbox,
    Production,
    Xcode,
    LocalTesting
  };

  enum class RevocationFailurePolicy
  {
    FailClosed,
    FailOpen
  };
} // namespace storekit::jws

template<>
struct storekit::utils::enum_traits<storekit::jws::Environment>
{
  static constexpr std::array<std::pair<std::string_view, storekit::jws::Environment>, 4> names{
    {{"Sandbox", storekit::jws::Environment::Sandbox},
     {"Production", storekit::jws::Environment::Production},
     {"Xcode", storekit::jws::Environment::Xcode},
     {"LocalTesting", storekit::jws::Environment::LocalTesting}}};
};

template<>
struct storekit::utils::enum_traits<storekit::jws::RevocationFailurePolicy>
{
  static constexpr std::array<std::pair<std::string_view, storekit::jws::RevocationFailurePolicy>, 2> names{
    {{"fail-closed", storekit::jws::RevocationFailurePolicy::FailClosed},
     {"fail-open", storekit::jws::RevocationFailurePolicy::FailOpen}}};
};

#endif // JWS_ENVIRONMENT_HH
