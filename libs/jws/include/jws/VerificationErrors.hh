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

#ifndef JWS_VERIFICATION_ERRORS_HH
#define JWS_VERIFICATION_ERRORS_HH

#include <cstddef>
#include <optional>
#include <string>
#include <system_error>

#include <boost/outcome/basic_result.hpp>
#include <boost/outcome/policy/throw_bad_result_access.hpp>

namespace outcome = boost::outcome_v2;

namespace storekit::jws
{
  enum class VerificationErrc
  {
    MalformedToken = 1,
    MalformedPayload,
    InvalidCertificateEncoding,
    MissingCertificateChain,
    InvalidRootCertificate,
    BrokenChainLink,
    UntrustedRoot,
    ChainTooLong,
    CertificateExpired,
    CertificateNotYetValid,
    MissingRequiredExtension,
    CertificateRevoked,
    RevocationCheckFailed,
    UnsupportedAlgorithm,
    InvalidSignature,
    InvalidBundleId,
    InvalidAppIdentifier,
    InvalidEnvironment,
    SystemError
  };

  class VerificationErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept override
    {
      return "storekit.jws";
    }

    std::string message(int ev) const override;
  };

  const std::error_category &verification_error_category();
  std::error_code make_error_code(VerificationErrc e);

  // Classified failure of a verification call. `index` is the position in
  // the leaf-first certificate chain for chain and revocation failures,
  // `field` the JSON path of an offending payload field.
  struct VerificationError
  {
    VerificationError() = default;
    VerificationError(VerificationErrc kind, std::string message);

    static VerificationError at_index(VerificationErrc kind, std::size_t index, std::string message);
    static VerificationError for_field(VerificationErrc kind, std::string field, std::string message);

    std::error_code code() const;
    std::string to_string() const;

    VerificationErrc kind{VerificationErrc::SystemError};
    std::optional<std::size_t> index;
    std::optional<std::string> field;
    std::string message;
  };

  template<typename T>
  using Result = outcome::basic_result<T, VerificationError, outcome::policy::throw_bad_result_access<VerificationError, void>>;

} // namespace storekit::jws

namespace std
{
  template<>
  struct is_error_code_enum<storekit::jws::VerificationErrc> : true_type
  {
  };
} // namespace std

#endif // JWS_VERIFICATION_ERRORS_HH
