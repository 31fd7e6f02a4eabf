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

#include "RevocationChecker.hh"

#include <utility>

#include <fmt/format.h>
#include <openssl/ocsp.h>
#include <openssl/err.h>

namespace storekit::jws
{
  namespace
  {
    // Allowed clock difference between responder and verifier.
    constexpr long max_clock_skew_seconds = 300;

    using OcspCertId = std::unique_ptr<OCSP_CERTID, decltype(&OCSP_CERTID_free)>;
  } // namespace

  RevocationChecker::RevocationChecker(const TrustedRootSet &roots,
                                       std::shared_ptr<IRevocationTransport> transport,
                                       RevocationFailurePolicy policy,
                                       std::chrono::milliseconds timeout)
    : roots_(roots)
    , transport_(std::move(transport))
    , policy_(policy)
    , timeout_(timeout)
  {
  }

  Result<void> RevocationChecker::check(const ValidatedChain &chain) const
  {
    for (size_t i = 0; i < chain.certificates.size(); ++i)
      {
        if (roots_.contains(chain.certificates[i]))
          {
            logger_->debug("Skipping revocation check of trusted root at index {}", i);
            continue;
          }

        auto rc = check_certificate(chain, i);
        if (!rc)
          {
            return rc;
          }
      }
    return outcome::success();
  }

  Result<void> RevocationChecker::check_certificate(const ValidatedChain &chain, size_t index) const
  {
    const auto &subject = chain.certificates[index];
    const auto &issuer = index + 1 < chain.certificates.size() ? chain.certificates[index + 1] : *chain.anchor;

    auto status = query(chain, subject, issuer);
    if (status && status.value() == Status::Revoked)
      {
        logger_->error("Certificate {} ('{}') is revoked", index, subject.subject_name());
        return VerificationError::at_index(VerificationErrc::CertificateRevoked, index, subject.subject_name());
      }

    if (status && status.value() == Status::Good)
      {
        logger_->debug("Certificate {} ('{}') is not revoked", index, subject.subject_name());
        return outcome::success();
      }

    std::string reason = status ? std::string("responder reports unknown status") : status.error().message();
    if (policy_ == RevocationFailurePolicy::FailOpen)
      {
        logger_->warn("Revocation status of certificate {} could not be determined ({}), continuing ({})", index, reason, policy_);
        return outcome::success();
      }

    logger_->error("Revocation status of certificate {} could not be determined ({})", index, reason);
    return VerificationError::at_index(VerificationErrc::RevocationCheckFailed, index, reason);
  }

  outcome::std_result<RevocationChecker::Status> RevocationChecker::query(const ValidatedChain &chain,
                                                                          const Certificate &subject,
                                                                          const Certificate &issuer) const
  {
    auto url = subject.ocsp_url();
    if (!url)
      {
        logger_->error("Certificate '{}' has no OCSP responder", subject.subject_name());
        return VerificationErrc::RevocationCheckFailed;
      }

    auto request = create_request(subject, issuer);
    if (!request)
      {
        return request.error();
      }

    if (!transport_)
      {
        logger_->error("No revocation transport configured");
        return VerificationErrc::RevocationCheckFailed;
      }

    logger_->debug("Querying OCSP responder {} for '{}'", *url, subject.subject_name());
    auto response = transport_->post(*url, request.value(), timeout_);
    if (!response)
      {
        logger_->error("OCSP transport to {} failed: {}", *url, response.error().message());
        return response.error();
      }

    return parse_response(response.value(), chain, subject, issuer);
  }

  outcome::std_result<std::string> RevocationChecker::create_request(const Certificate &subject, const Certificate &issuer)
  {
    std::unique_ptr<OCSP_REQUEST, decltype(&OCSP_REQUEST_free)> request(OCSP_REQUEST_new(), OCSP_REQUEST_free);
    OCSP_CERTID *id = OCSP_cert_to_id(EVP_sha1(), subject.get(), issuer.get());
    if (!request || id == nullptr)
      {
        OCSP_CERTID_free(id);
        return VerificationErrc::SystemError;
      }

    if (OCSP_request_add0_id(request.get(), id) == nullptr)
      {
        OCSP_CERTID_free(id);
        return VerificationErrc::SystemError;
      }

    unsigned char *buffer = nullptr;
    int len = i2d_OCSP_REQUEST(request.get(), &buffer);
    if (len <= 0 || buffer == nullptr)
      {
        return VerificationErrc::SystemError;
      }

    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    std::string der(reinterpret_cast<const char *>(buffer), static_cast<size_t>(len));
    OPENSSL_free(buffer);
    return der;
  }

  outcome::std_result<RevocationChecker::Status> RevocationChecker::parse_response(const std::string &response_der,
                                                                                   const ValidatedChain &chain,
                                                                                   const Certificate &subject,
                                                                                   const Certificate &issuer) const
  {
    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    const auto *p = reinterpret_cast<const unsigned char *>(response_der.data());
    std::unique_ptr<OCSP_RESPONSE, decltype(&OCSP_RESPONSE_free)> response(
      d2i_OCSP_RESPONSE(nullptr, &p, static_cast<long>(response_der.size())),
      OCSP_RESPONSE_free);
    if (!response)
      {
        logger_->error("Malformed OCSP response");
        return VerificationErrc::RevocationCheckFailed;
      }

    int response_status = OCSP_response_status(response.get());
    if (response_status != OCSP_RESPONSE_STATUS_SUCCESSFUL)
      {
        logger_->error("OCSP response status {}", OCSP_response_status_str(response_status));
        return VerificationErrc::RevocationCheckFailed;
      }

    std::unique_ptr<OCSP_BASICRESP, decltype(&OCSP_BASICRESP_free)> basic(OCSP_response_get1_basic(response.get()),
                                                                          OCSP_BASICRESP_free);
    if (!basic)
      {
        logger_->error("OCSP response has no basic response");
        return VerificationErrc::RevocationCheckFailed;
      }

    std::unique_ptr<STACK_OF(X509), void (*)(STACK_OF(X509) *)> certs(sk_X509_new_null(), [](STACK_OF(X509) * sk) {
      sk_X509_pop_free(sk, X509_free);
    });
    if (!certs)
      {
        return VerificationErrc::SystemError;
      }

    for (const auto &cert: chain.certificates)
      {
        X509_up_ref(cert.get());
        if (sk_X509_push(certs.get(), cert.get()) <= 0)
          {
            X509_free(cert.get());
            return VerificationErrc::SystemError;
          }
      }

    if (OCSP_basic_verify(basic.get(), certs.get(), roots_.store(), 0) != 1)
      {
        logger_->error("OCSP response signature does not verify: {}", ERR_error_string(ERR_get_error(), nullptr));
        ERR_clear_error();
        return VerificationErrc::RevocationCheckFailed;
      }

    OcspCertId id(OCSP_cert_to_id(EVP_sha1(), subject.get(), issuer.get()), OCSP_CERTID_free);
    if (!id)
      {
        return VerificationErrc::SystemError;
      }

    int status = V_OCSP_CERTSTATUS_UNKNOWN;
    int reason = 0;
    ASN1_GENERALIZEDTIME *revoked_at = nullptr;
    ASN1_GENERALIZEDTIME *this_update = nullptr;
    ASN1_GENERALIZEDTIME *next_update = nullptr;
    if (OCSP_resp_find_status(basic.get(), id.get(), &status, &reason, &revoked_at, &this_update, &next_update) != 1)
      {
        logger_->error("OCSP response does not cover '{}'", subject.subject_name());
        return VerificationErrc::RevocationCheckFailed;
      }

    if (OCSP_check_validity(this_update, next_update, max_clock_skew_seconds, -1) != 1)
      {
        logger_->error("OCSP response for '{}' is outside its validity period", subject.subject_name());
        ERR_clear_error();
        return VerificationErrc::RevocationCheckFailed;
      }

    switch (status)
      {
      case V_OCSP_CERTSTATUS_GOOD:
        return Status::Good;
      case V_OCSP_CERTSTATUS_REVOKED:
        logger_->debug("OCSP reports '{}' revoked, reason {}", subject.subject_name(), OCSP_crl_reason_str(reason));
        return Status::Revoked;
      default:
        return Status::Unknown;
      }
  }

} // namespace storekit::jws
