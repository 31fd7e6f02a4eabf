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

#ifndef JWS_SIGNED_DATA_VERIFIER_HH
#define JWS_SIGNED_DATA_VERIFIER_HH

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/outcome/std_result.hpp>

#include "jws/Environment.hh"
#include "jws/Payloads.hh"
#include "jws/RevocationTransport.hh"
#include "jws/VerificationErrors.hh"
#include "jws/VerifierOptions.hh"

namespace outcome = boost::outcome_v2;

namespace storekit::jws
{
  // Verifies compact signed tokens carrying an x5c certificate chain against
  // a fixed set of trusted roots and decodes their payload.
  //
  // A verifier is immutable after creation and may be shared by concurrent
  // callers.
  class SignedDataVerifier
  {
  public:
    // Root certificates are DER, or PEM. Fails with
    // VerificationErrc::InvalidRootCertificate when the set is empty or a
    // root does not parse.
    static outcome::std_result<SignedDataVerifier> create(const std::vector<std::string> &root_certificates,
                                                          Environment environment,
                                                          std::string bundle_id,
                                                          std::optional<std::int64_t> app_apple_id,
                                                          bool enable_revocation_check);
    static outcome::std_result<SignedDataVerifier> create(const std::vector<std::string> &root_certificates,
                                                          VerifierOptions options);
    static outcome::std_result<SignedDataVerifier> create(const std::vector<std::string> &root_certificates,
                                                          VerifierOptions options,
                                                          std::shared_ptr<IRevocationTransport> revocation_transport);

    ~SignedDataVerifier();

    SignedDataVerifier(const SignedDataVerifier &) = delete;
    SignedDataVerifier &operator=(const SignedDataVerifier &) = delete;
    SignedDataVerifier(SignedDataVerifier &&) noexcept;
    SignedDataVerifier &operator=(SignedDataVerifier &&) noexcept;

    Result<NotificationEnvelope> verify_and_decode_notification(std::string_view token) const;
    Result<TransactionInfo> verify_and_decode_transaction(std::string_view token) const;
    Result<RenewalInfo> verify_and_decode_renewal_info(std::string_view token) const;
    Result<AppTransaction> verify_and_decode_app_transaction(std::string_view token) const;

    // Accepts any payload shape.
    Result<DecodedPayload> verify_and_decode(std::string_view token) const;

    const VerifierOptions &options() const;

  private:
    class Impl;
    explicit SignedDataVerifier(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> pimpl;
  };

} // namespace storekit::jws

#endif // JWS_SIGNED_DATA_VERIFIER_HH
