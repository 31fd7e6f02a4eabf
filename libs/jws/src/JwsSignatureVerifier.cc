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

#include "JwsSignatureVerifier.hh"

#include <array>

#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/objects.h>

#include "Certificate.hh"
#include "CompactToken.hh"
#include "PublicKey.hh"

namespace storekit::jws
{
  namespace
  {
    constexpr std::array<JwsSignatureVerifier::Algorithm, 3> algorithms{{
      {"ES256", DigestAlgorithm::SHA256, NID_X9_62_prime256v1, 32},
      {"ES384", DigestAlgorithm::SHA384, NID_secp384r1, 48},
      {"ES512", DigestAlgorithm::SHA512, NID_secp521r1, 66},
    }};
  } // namespace

  std::optional<JwsSignatureVerifier::Algorithm> JwsSignatureVerifier::find_algorithm(std::string_view name)
  {
    for (const auto &algorithm: algorithms)
      {
        if (algorithm.name == name)
          {
            return algorithm;
          }
      }
    return {};
  }

  Result<void> JwsSignatureVerifier::verify(const CompactToken &token, const Certificate &leaf) const
  {
    auto key_result = leaf.get_public_key();
    if (!key_result)
      {
        logger_->error("Failed to get public key of leaf certificate: {}", key_result.error().message());
        return VerificationError::at_index(VerificationErrc::InvalidCertificateEncoding, 0, "leaf public key unreadable");
      }

    return verify(token.signing_input(), token.signature, token.algorithm, key_result.value());
  }

  Result<void> JwsSignatureVerifier::verify(const std::string &signing_input,
                                            const std::string &signature,
                                            std::string_view algorithm_name,
                                            const PublicKey &key) const
  {
    auto algorithm = find_algorithm(algorithm_name);
    if (!algorithm)
      {
        logger_->error("Unsupported algorithm '{}'", algorithm_name);
        return VerificationError(VerificationErrc::UnsupportedAlgorithm, std::string(algorithm_name));
      }

    if (key.get_algorithm() != KeyAlgorithm::ECDSA || key.get_curve_nid() != algorithm->curve_nid)
      {
        logger_->error("Leaf key does not match algorithm {}", algorithm->name);
        return VerificationError(VerificationErrc::InvalidSignature, "key type does not match " + std::string(algorithm->name));
      }

    if (signature.size() != 2 * algorithm->component_size)
      {
        logger_->error("Signature has {} bytes, expected {}", signature.size(), 2 * algorithm->component_size);
        return VerificationError(VerificationErrc::InvalidSignature, "wrong signature length");
      }

    auto der = raw_to_der(signature, algorithm->component_size);
    if (!der)
      {
        return der.error();
      }

    auto verified = key.verify_signature(signing_input, der.value(), algorithm->digest);
    if (!verified)
      {
        logger_->error("Signature verification error: {}", verified.error().message());
        if (verified.error() == VerificationErrc::SystemError)
          {
            return VerificationError(VerificationErrc::SystemError, verified.error().message());
          }
        return VerificationError(VerificationErrc::InvalidSignature, verified.error().message());
      }
    if (!verified.value())
      {
        logger_->error("Token signature does not verify");
        return VerificationError(VerificationErrc::InvalidSignature, "signature does not match");
      }

    logger_->debug("Token signature verified ({})", algorithm->name);
    return outcome::success();
  }

  Result<std::string> JwsSignatureVerifier::raw_to_der(const std::string &raw_signature, size_t component_size)
  {
    if (raw_signature.size() != 2 * component_size)
      {
        return VerificationError(VerificationErrc::InvalidSignature, "wrong signature length");
      }

    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    const auto *data = reinterpret_cast<const unsigned char *>(raw_signature.data());
    BIGNUM *r = BN_bin2bn(data, static_cast<int>(component_size), nullptr);
    BIGNUM *s = BN_bin2bn(data + component_size, static_cast<int>(component_size), nullptr);
    std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(ECDSA_SIG_new(), ECDSA_SIG_free);
    if (r == nullptr || s == nullptr || !sig || ECDSA_SIG_set0(sig.get(), r, s) != 1)
      {
        BN_free(r);
        BN_free(s);
        return VerificationError(VerificationErrc::SystemError, "failed to build ECDSA signature");
      }

    unsigned char *buffer = nullptr;
    int len = i2d_ECDSA_SIG(sig.get(), &buffer);
    if (len <= 0 || buffer == nullptr)
      {
        return VerificationError(VerificationErrc::SystemError, "failed to encode ECDSA signature");
      }

    // NOLINTNEXTLINE: OpenSSL API requires binary data conversion
    std::string der(reinterpret_cast<const char *>(buffer), static_cast<size_t>(len));
    OPENSSL_free(buffer);
    return der;
  }

} // namespace storekit::jws
