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

#ifndef JWS_REVOCATION_CHECKER_HH
#define JWS_REVOCATION_CHECKER_HH

#include <chrono>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "jws/Environment.hh"
#include "jws/RevocationTransport.hh"
#include "jws/VerificationErrors.hh"
#include "ChainValidator.hh"
#include "TrustedRootSet.hh"
#include "utils/Logging.hh"

namespace storekit::jws
{
  class RevocationChecker
  {
  public:
    enum class Status
    {
      Good,
      Revoked,
      Unknown
    };

    RevocationChecker(const TrustedRootSet &roots,
                      std::shared_ptr<IRevocationTransport> transport,
                      RevocationFailurePolicy policy,
                      std::chrono::milliseconds timeout);

    // Checks every certificate of the chain that is not itself a trusted root.
    Result<void> check(const ValidatedChain &chain) const;

    // DER encoded OCSP request for `subject`, identified by a SHA-1 CertID.
    static outcome::std_result<std::string> create_request(const Certificate &subject, const Certificate &issuer);

  private:
    Result<void> check_certificate(const ValidatedChain &chain, size_t index) const;
    outcome::std_result<Status> query(const ValidatedChain &chain, const Certificate &subject, const Certificate &issuer) const;
    outcome::std_result<Status> parse_response(const std::string &response_der,
                                               const ValidatedChain &chain,
                                               const Certificate &subject,
                                               const Certificate &issuer) const;

  private:
    const TrustedRootSet &roots_;
    std::shared_ptr<IRevocationTransport> transport_;
    RevocationFailurePolicy policy_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:ocsp")};
  };

} // namespace storekit::jws

#endif // JWS_REVOCATION_CHECKER_HH
