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

#include "Certificate.hh"

#include <chrono>
#include <ctime>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>
#include <openssl/ocsp.h>
#include <openssl/evp.h>
#include <openssl/asn1.h>

#include "jws/VerificationErrors.hh"
#include "utils/DateUtils.hh"
#include "PublicKey.hh"

namespace storekit::jws
{
  Certificate::Certificate(std::unique_ptr<X509, decltype(&X509_free)> x509_cert)
    : x509_cert_(std::move(x509_cert))
  {
  }

  X509 *Certificate::get() const
  {
    return x509_cert_.get();
  }

  outcome::std_result<Certificate> Certificate::from_pem(const std::string &cert_pem)
  {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_mem_buf(cert_pem.data(), static_cast<int>(cert_pem.size())), BIO_free);
    if (!bio)
      {
        return VerificationErrc::SystemError;
      }

    X509 *cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (cert == nullptr)
      {
        return VerificationErrc::InvalidCertificateEncoding;
      }
    return Certificate(std::unique_ptr<X509, decltype(&X509_free)>(cert, X509_free));
  }

  outcome::std_result<Certificate> Certificate::from_der(const std::string &cert_der)
  {
    if (cert_der.empty())
      {
        return VerificationErrc::InvalidCertificateEncoding;
      }

    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    const auto *data = reinterpret_cast<const unsigned char *>(cert_der.data());
    const unsigned char *p = data;
    X509 *cert = d2i_X509(nullptr, &p, static_cast<long>(cert_der.size()));
    if (cert == nullptr)
      {
        return VerificationErrc::InvalidCertificateEncoding;
      }
    if (p != data + cert_der.size())
      {
        X509_free(cert);
        return VerificationErrc::InvalidCertificateEncoding;
      }
    return Certificate(std::unique_ptr<X509, decltype(&X509_free)>(cert, X509_free));
  }

  outcome::std_result<Certificate> Certificate::from_bytes(const std::string &cert)
  {
    if (cert.starts_with("-----BEGIN"))
      {
        return from_pem(cert);
      }
    return from_der(cert);
  }

  outcome::std_result<std::string> Certificate::to_der() const
  {
    unsigned char *buffer = nullptr;
    int len = i2d_X509(x509_cert_.get(), &buffer);
    if (len <= 0 || buffer == nullptr)
      {
        logger_->error("Failed to encode certificate to DER");
        return VerificationErrc::SystemError;
      }

    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    std::string der(reinterpret_cast<const char *>(buffer), static_cast<size_t>(len));
    OPENSSL_free(buffer);
    return der;
  }

  std::string Certificate::subject_name() const
  {
    char *name = X509_NAME_oneline(X509_get_subject_name(get()), nullptr, 0);
    if (name == nullptr)
      {
        return "";
      }
    std::string result(name);
    OPENSSL_free(name);
    return result;
  }

  std::string Certificate::issuer_name() const
  {
    char *name = X509_NAME_oneline(X509_get_issuer_name(get()), nullptr, 0);
    if (name == nullptr)
      {
        return "";
      }
    std::string result(name);
    OPENSSL_free(name);
    return result;
  }

  bool Certificate::is_self_signed() const
  {
    return is_issued_by(*this);
  }

  bool Certificate::can_sign_certificates() const
  {
    X509 *cert = get();
    if (X509_check_ca(cert) < 1)
      {
        return false;
      }
    if ((X509_get_extension_flags(cert) & EXFLAG_KUSAGE) != 0 && (X509_get_key_usage(cert) & KU_KEY_CERT_SIGN) == 0)
      {
        return false;
      }
    return true;
  }

  bool Certificate::is_issued_by(const Certificate &issuer) const
  {
    X509_NAME *issuer_name = X509_get_issuer_name(get());
    X509_NAME *subject_name = X509_get_subject_name(issuer.get());

    if (issuer_name == nullptr || subject_name == nullptr)
      {
        return false;
      }

    if (X509_NAME_cmp(issuer_name, subject_name) != 0)
      {
        logger_->debug("Issuer '{}' does not match subject '{}'", this->issuer_name(), issuer.subject_name());
        return false;
      }

    if (!issuer.can_sign_certificates())
      {
        logger_->debug("'{}' is not a certificate authority", issuer.subject_name());
        return false;
      }

    EVP_PKEY *pkey = X509_get0_pubkey(issuer.get());
    if (pkey == nullptr)
      {
        return false;
      }

    int verify_result = X509_verify(get(), pkey);
    if (verify_result != 1)
      {
        logger_->debug("Signature of '{}' does not verify under '{}'", this->subject_name(), issuer.subject_name());
        return false;
      }
    return true;
  }

  bool Certificate::has_extension(const std::string &oid) const
  {
    std::unique_ptr<ASN1_OBJECT, decltype(&ASN1_OBJECT_free)> obj(OBJ_txt2obj(oid.c_str(), 1), ASN1_OBJECT_free);
    if (!obj)
      {
        logger_->error("Failed to create OID object for {}", oid);
        return false;
      }

    return X509_get_ext_by_OBJ(get(), obj.get(), -1) >= 0;
  }

  std::optional<std::string> Certificate::ocsp_url() const
  {
    STACK_OF(OPENSSL_STRING) *urls = X509_get1_ocsp(get());
    if (urls == nullptr)
      {
        return {};
      }

    std::optional<std::string> url;
    if (sk_OPENSSL_STRING_num(urls) > 0)
      {
        url = std::string(sk_OPENSSL_STRING_value(urls, 0));
      }
    X509_email_free(urls);
    return url;
  }

  outcome::std_result<std::chrono::system_clock::time_point> Certificate::to_time_point(const ASN1_TIME *time) const
  {
    if (time == nullptr)
      {
        return VerificationErrc::InvalidCertificateEncoding;
      }

    struct tm tm_time = {};
    if (ASN1_TIME_to_tm(time, &tm_time) != 1)
      {
        logger_->error("Failed to convert certificate time");
        return VerificationErrc::InvalidCertificateEncoding;
      }

    return storekit::utils::DateUtils::from_utc_tm(tm_time);
  }

  outcome::std_result<std::chrono::system_clock::time_point> Certificate::get_not_before() const
  {
    return to_time_point(X509_get0_notBefore(get()));
  }

  outcome::std_result<std::chrono::system_clock::time_point> Certificate::get_not_after() const
  {
    return to_time_point(X509_get0_notAfter(get()));
  }

  outcome::std_result<Certificate::Validity> Certificate::validity_at(const std::chrono::system_clock::time_point &timestamp) const
  {
    auto not_before_result = get_not_before();
    if (!not_before_result)
      {
        return not_before_result.error();
      }

    auto not_after_result = get_not_after();
    if (!not_after_result)
      {
        return not_after_result.error();
      }

    if (timestamp < not_before_result.value())
      {
        logger_->debug("Certificate '{}' not valid before {}",
                       subject_name(),
                       storekit::utils::DateUtils::to_iso_string(not_before_result.value()));
        return Validity::NotYetValid;
      }
    if (timestamp > not_after_result.value())
      {
        logger_->debug("Certificate '{}' expired at {}",
                       subject_name(),
                       storekit::utils::DateUtils::to_iso_string(not_after_result.value()));
        return Validity::Expired;
      }
    return Validity::Valid;
  }

  outcome::std_result<PublicKey> Certificate::get_public_key() const
  {
    if (!x509_cert_)
      {
        logger_->error("Cannot extract public key: no certificate loaded");
        return VerificationErrc::InvalidCertificateEncoding;
      }

    EVP_PKEY *pkey = X509_get_pubkey(x509_cert_.get());
    if (pkey == nullptr)
      {
        logger_->error("Failed to extract public key from certificate");
        return VerificationErrc::InvalidCertificateEncoding;
      }

    return PublicKey::from_evp_key(pkey);
  }

  bool Certificate::operator==(const Certificate &other) const
  {
    if (x509_cert_ == nullptr || other.x509_cert_ == nullptr)
      {
        return x509_cert_ == other.x509_cert_;
      }
    return X509_cmp(x509_cert_.get(), other.x509_cert_.get()) == 0;
  }

  bool Certificate::operator!=(const Certificate &other) const
  {
    return !(*this == other);
  }

} // namespace storekit::jws
