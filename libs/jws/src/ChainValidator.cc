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

#include "ChainValidator.hh"

#include <utility>

#include <fmt/format.h>

namespace storekit::jws
{
  ChainValidator::ChainValidator(const TrustedRootSet &roots, bool strict_checks)
    : roots_(roots)
    , strict_checks_(strict_checks)
  {
  }

  Result<ValidatedChain> ChainValidator::validate(const std::vector<std::string> &chain_der,
                                                  std::chrono::system_clock::time_point now) const
  {
    if (chain_der.empty())
      {
        return VerificationError(VerificationErrc::MissingCertificateChain, "empty certificate chain");
      }

    if (chain_der.size() > max_chain_length)
      {
        logger_->error("Certificate chain has {} certificates, at most {} allowed", chain_der.size(), max_chain_length);
        return VerificationError(VerificationErrc::ChainTooLong, fmt::format("{} certificates", chain_der.size()));
      }

    ValidatedChain chain;
    for (size_t i = 0; i < chain_der.size(); ++i)
      {
        auto cert_result = Certificate::from_der(chain_der[i]);
        if (!cert_result)
          {
            logger_->error("Certificate {} in chain does not parse", i);
            return VerificationError::at_index(VerificationErrc::InvalidCertificateEncoding, i, "not a DER X.509 certificate");
          }
        chain.certificates.emplace_back(std::move(cert_result.value()));
      }

    for (size_t i = 0; i + 1 < chain.certificates.size(); ++i)
      {
        if (!chain.certificates[i].is_issued_by(chain.certificates[i + 1]))
          {
            logger_->error("Certificate {} is not issued by certificate {}", i, i + 1);
            return VerificationError::at_index(VerificationErrc::BrokenChainLink,
                                               i,
                                               fmt::format("'{}' not issued by '{}'",
                                                           chain.certificates[i].subject_name(),
                                                           chain.certificates[i + 1].subject_name()));
          }
      }

    const auto &last = chain.certificates.back();
    chain.anchor = roots_.find_anchor(last);
    if (chain.anchor == nullptr)
      {
        logger_->error("Certificate chain does not end at a trusted root (issuer '{}')", last.issuer_name());
        return VerificationError(VerificationErrc::UntrustedRoot, fmt::format("issuer '{}' not trusted", last.issuer_name()));
      }

    for (size_t i = 0; i < chain.certificates.size(); ++i)
      {
        auto rc = check_validity(chain.certificates[i], i, now);
        if (!rc)
          {
            return rc.error();
          }
      }

    auto rc = check_validity(*chain.anchor, chain.certificates.size(), now);
    if (!rc)
      {
        return rc.error();
      }

    if (strict_checks_)
      {
        rc = check_extensions(chain);
        if (!rc)
          {
            return rc.error();
          }
      }

    logger_->debug("Certificate chain of {} certificates validated against '{}'", chain.certificates.size(), chain.anchor->subject_name());
    return std::move(chain);
  }

  Result<void> ChainValidator::check_validity(const Certificate &cert, size_t index, std::chrono::system_clock::time_point now) const
  {
    auto validity = cert.validity_at(now);
    if (!validity)
      {
        return VerificationError::at_index(VerificationErrc::InvalidCertificateEncoding, index, "unreadable validity period");
      }

    switch (validity.value())
      {
      case Certificate::Validity::Expired:
        logger_->error("Certificate {} ('{}') expired", index, cert.subject_name());
        return VerificationError::at_index(VerificationErrc::CertificateExpired, index, cert.subject_name());
      case Certificate::Validity::NotYetValid:
        logger_->error("Certificate {} ('{}') not yet valid", index, cert.subject_name());
        return VerificationError::at_index(VerificationErrc::CertificateNotYetValid, index, cert.subject_name());
      case Certificate::Validity::Valid:
        break;
      }
    return outcome::success();
  }

  Result<void> ChainValidator::check_extensions(const ValidatedChain &chain) const
  {
    if (!chain.certificates[0].has_extension(leaf_extension_oid))
      {
        logger_->error("Leaf certificate lacks extension {}", leaf_extension_oid);
        return VerificationError::at_index(VerificationErrc::MissingRequiredExtension, 0, leaf_extension_oid);
      }

    if (chain.certificates.size() < 2 || !chain.certificates[1].has_extension(intermediate_extension_oid))
      {
        logger_->error("Intermediate certificate lacks extension {}", intermediate_extension_oid);
        return VerificationError::at_index(VerificationErrc::MissingRequiredExtension, 1, intermediate_extension_oid);
      }
    return outcome::success();
  }

} // namespace storekit::jws
