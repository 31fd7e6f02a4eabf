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

#ifndef JWS_CERTIFICATE_HH
#define JWS_CERTIFICATE_HH

#include <memory>
#include <optional>
#include <string>
#include <chrono>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>
#include <openssl/x509.h>

#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace storekit::jws
{
  class PublicKey;

  class Certificate
  {
  public:
    enum class Validity
    {
      Valid,
      Expired,
      NotYetValid
    };

    explicit Certificate(std::unique_ptr<X509, decltype(&X509_free)> x509_cert);
    Certificate() = delete;

    Certificate(Certificate &&other) noexcept = default;
    Certificate &operator=(Certificate &&other) noexcept = default;
    Certificate(const Certificate &) = delete;
    Certificate &operator=(const Certificate &) = delete;
    ~Certificate() = default;

    X509 *get() const;

    static outcome::std_result<Certificate> from_pem(const std::string &cert_pem);
    static outcome::std_result<Certificate> from_der(const std::string &cert_der);

    // Accepts DER, or PEM when the input starts with a PEM header.
    static outcome::std_result<Certificate> from_bytes(const std::string &cert);

    outcome::std_result<std::string> to_der() const;

    std::string subject_name() const;
    std::string issuer_name() const;
    bool is_self_signed() const;

    // basicConstraints CA:TRUE, and keyCertSign when keyUsage is present.
    bool can_sign_certificates() const;

    // Issuer name of this certificate equals the subject of `issuer`, the
    // issuer may sign certificates, and the signature verifies under the
    // issuer's public key.
    bool is_issued_by(const Certificate &issuer) const;

    bool has_extension(const std::string &oid) const;
    std::optional<std::string> ocsp_url() const;

    outcome::std_result<std::chrono::system_clock::time_point> get_not_before() const;
    outcome::std_result<std::chrono::system_clock::time_point> get_not_after() const;
    outcome::std_result<Validity> validity_at(const std::chrono::system_clock::time_point &timestamp) const;

    outcome::std_result<PublicKey> get_public_key() const;

    bool operator==(const Certificate &other) const;
    bool operator!=(const Certificate &other) const;

  private:
    outcome::std_result<std::chrono::system_clock::time_point> to_time_point(const ASN1_TIME *time) const;

  private:
    std::unique_ptr<X509, decltype(&X509_free)> x509_cert_{nullptr, X509_free};
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:certificate")};
  };

} // namespace storekit::jws

#endif // JWS_CERTIFICATE_HH
