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

#ifndef JWS_CHAIN_VALIDATOR_HH
#define JWS_CHAIN_VALIDATOR_HH

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "jws/VerificationErrors.hh"
#include "Certificate.hh"
#include "TrustedRootSet.hh"
#include "utils/Logging.hh"

namespace storekit::jws
{
  struct ValidatedChain
  {
    // Leaf first, as carried by the token.
    std::vector<Certificate> certificates;

    // Trusted root the last certificate equals or was issued by. Owned by the
    // TrustedRootSet.
    const Certificate *anchor{nullptr};
  };

  class ChainValidator
  {
  public:
    static constexpr size_t max_chain_length = 5;
    static constexpr const char *leaf_extension_oid = "1.2.840.113635.100.6.11.1";
    static constexpr const char *intermediate_extension_oid = "1.2.840.113635.100.6.2.1";

    ChainValidator(const TrustedRootSet &roots, bool strict_checks);

    Result<ValidatedChain> validate(const std::vector<std::string> &chain_der, std::chrono::system_clock::time_point now) const;

  private:
    Result<void> check_validity(const Certificate &cert, size_t index, std::chrono::system_clock::time_point now) const;
    Result<void> check_extensions(const ValidatedChain &chain) const;

  private:
    const TrustedRootSet &roots_;
    bool strict_checks_{false};
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:chain")};
  };

} // namespace storekit::jws

#endif // JWS_CHAIN_VALIDATOR_HH
