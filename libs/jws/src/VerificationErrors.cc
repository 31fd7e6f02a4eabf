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

#include "jws/VerificationErrors.hh"

#include <utility>

#include <fmt/format.h>

namespace storekit::jws
{
  std::string VerificationErrorCategory::message(int ev) const
  {
    switch (static_cast<VerificationErrc>(ev))
      {
      case VerificationErrc::MalformedToken:
        return "Malformed compact token";
      case VerificationErrc::MalformedPayload:
        return "Malformed payload";
      case VerificationErrc::InvalidCertificateEncoding:
        return "Invalid certificate encoding";
      case VerificationErrc::MissingCertificateChain:
        return "Missing certificate chain";
      case VerificationErrc::InvalidRootCertificate:
        return "Invalid root certificate";
      case VerificationErrc::BrokenChainLink:
        return "Broken certificate chain link";
      case VerificationErrc::UntrustedRoot:
        return "Certificate chain does not end at a trusted root";
      case VerificationErrc::ChainTooLong:
        return "Certificate chain too long";
      case VerificationErrc::CertificateExpired:
        return "Certificate expired";
      case VerificationErrc::CertificateNotYetValid:
        return "Certificate not yet valid";
      case VerificationErrc::MissingRequiredExtension:
        return "Certificate lacks a required extension";
      case VerificationErrc::CertificateRevoked:
        return "Certificate revoked";
      case VerificationErrc::RevocationCheckFailed:
        return "Revocation check failed";
      case VerificationErrc::UnsupportedAlgorithm:
        return "Unsupported signature algorithm";
      case VerificationErrc::InvalidSignature:
        return "Invalid signature";
      case VerificationErrc::InvalidBundleId:
        return "Invalid bundle identifier";
      case VerificationErrc::InvalidAppIdentifier:
        return "Invalid app identifier";
      case VerificationErrc::InvalidEnvironment:
        return "Invalid environment";
      case VerificationErrc::SystemError:
        return "System error";
      default:
        return "Unknown error";
      }
  }

  const std::error_category &verification_error_category()
  {
    static VerificationErrorCategory instance;
    return instance;
  }

  std::error_code make_error_code(VerificationErrc e)
  {
    return {static_cast<int>(e), verification_error_category()};
  }

  VerificationError::VerificationError(VerificationErrc kind, std::string message)
    : kind(kind)
    , message(std::move(message))
  {
  }

  VerificationError VerificationError::at_index(VerificationErrc kind, std::size_t index, std::string message)
  {
    VerificationError error(kind, std::move(message));
    error.index = index;
    return error;
  }

  VerificationError VerificationError::for_field(VerificationErrc kind, std::string field, std::string message)
  {
    VerificationError error(kind, std::move(message));
    error.field = std::move(field);
    return error;
  }

  std::error_code VerificationError::code() const
  {
    return make_error_code(kind);
  }

  std::string VerificationError::to_string() const
  {
    std::string s = code().message();
    if (index)
      {
        s += fmt::format(" (certificate {})", *index);
      }
    if (field)
      {
        s += fmt::format(" (field {})", *field);
      }
    if (!message.empty())
      {
        s += ": " + message;
      }
    return s;
  }

} // namespace storekit::jws
