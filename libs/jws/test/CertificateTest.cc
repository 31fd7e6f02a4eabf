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
#include "PublicKey.hh"
#include "JwsSignatureVerifier.hh"
#include "CryptographicAlgorithms.hh"
#include "TestCertificates.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <openssl/objects.h>

namespace storekit::jws::test
{
  class CertificateTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      ChainSpec spec;
      spec.leaf_ocsp_url = "http://ocsp.example.com/leaf";
      chain_ = std::make_unique<TestChain>(TestChain::create(spec));
    }

    std::unique_ptr<TestChain> chain_;
  };

  TEST_F(CertificateTest, ParseInvalidCertificate)
  {
    auto cert = Certificate::from_pem("invalid certificate data");
    EXPECT_TRUE(cert.has_error());
  }

  TEST_F(CertificateTest, ParseInvalidCertificateFromDER)
  {
    const std::string invalid_der = {'\x00', '\x01', '\x02', '\x03'};
    auto cert = Certificate::from_der(invalid_der);
    EXPECT_TRUE(cert.has_error());
  }

  TEST_F(CertificateTest, ParseCertificateFromDER)
  {
    auto cert = Certificate::from_der(chain_->leaf.der());
    ASSERT_TRUE(cert.has_value());
    EXPECT_THAT(cert.value().subject_name(), ::testing::HasSubstr("Test Signing Leaf"));
    EXPECT_THAT(cert.value().issuer_name(), ::testing::HasSubstr("Test Intermediate CA"));
    EXPECT_FALSE(cert.value().is_self_signed());
  }

  TEST_F(CertificateTest, RejectsTrailingBytesAfterDER)
  {
    auto cert = Certificate::from_der(chain_->leaf.der() + "extra");
    EXPECT_TRUE(cert.has_error());
  }

  TEST_F(CertificateTest, ParseCertificateFromPEM)
  {
    auto cert = Certificate::from_pem(chain_->root.pem());
    ASSERT_TRUE(cert.has_value());
    EXPECT_TRUE(cert.value().is_self_signed());
  }

  TEST_F(CertificateTest, FromBytesDetectsEncoding)
  {
    auto from_pem = Certificate::from_bytes(chain_->intermediate.pem());
    auto from_der = Certificate::from_bytes(chain_->intermediate.der());
    ASSERT_TRUE(from_pem.has_value());
    ASSERT_TRUE(from_der.has_value());
    EXPECT_TRUE(from_pem.value() == from_der.value());
  }

  TEST_F(CertificateTest, ToDerRoundTrip)
  {
    auto cert = Certificate::from_der(chain_->leaf.der());
    ASSERT_TRUE(cert.has_value());
    auto der = cert.value().to_der();
    ASSERT_TRUE(der.has_value());
    EXPECT_EQ(der.value(), chain_->leaf.der());
  }

  TEST_F(CertificateTest, IssuedBy)
  {
    auto root = Certificate::from_der(chain_->root.der());
    auto intermediate = Certificate::from_der(chain_->intermediate.der());
    auto leaf = Certificate::from_der(chain_->leaf.der());
    ASSERT_TRUE(root && intermediate && leaf);

    EXPECT_TRUE(leaf.value().is_issued_by(intermediate.value()));
    EXPECT_TRUE(intermediate.value().is_issued_by(root.value()));
    EXPECT_FALSE(leaf.value().is_issued_by(root.value()));
    EXPECT_FALSE(intermediate.value().is_issued_by(leaf.value()));
  }

  TEST_F(CertificateTest, IssuedByRequiresSignatureNotJustName)
  {
    // Same subject name, different key.
    auto impostor_chain = TestChain::create();
    auto impostor = Certificate::from_der(impostor_chain.intermediate.der());
    auto leaf = Certificate::from_der(chain_->leaf.der());
    ASSERT_TRUE(impostor && leaf);

    EXPECT_EQ(leaf.value().issuer_name(), impostor.value().subject_name());
    EXPECT_FALSE(leaf.value().is_issued_by(impostor.value()));
  }

  TEST_F(CertificateTest, OnlyCertificateAuthoritiesIssue)
  {
    CertificateSpec spec;
    spec.common_name = "Forged Leaf";
    auto forged_der = TestCertificate::create_issued(chain_->leaf, spec).der();

    auto forged = Certificate::from_der(forged_der);
    auto leaf = Certificate::from_der(chain_->leaf.der());
    auto intermediate = Certificate::from_der(chain_->intermediate.der());
    auto root = Certificate::from_der(chain_->root.der());
    ASSERT_TRUE(forged && leaf && intermediate && root);

    EXPECT_TRUE(root.value().can_sign_certificates());
    EXPECT_TRUE(intermediate.value().can_sign_certificates());
    EXPECT_FALSE(leaf.value().can_sign_certificates());

    EXPECT_EQ(forged.value().issuer_name(), leaf.value().subject_name());
    EXPECT_FALSE(forged.value().is_issued_by(leaf.value()));
  }

  TEST_F(CertificateTest, CertificateAuthorityNeedsKeyCertSign)
  {
    CertificateSpec spec;
    spec.common_name = "Signing Only CA";
    spec.is_ca = true;
    spec.key_usage = "critical,digitalSignature";
    auto ca = TestCertificate::create_issued(chain_->intermediate, spec);

    spec.common_name = "Issued Leaf";
    spec.is_ca = false;
    spec.key_usage.reset();
    auto issued = TestCertificate::create_issued(ca, spec);

    auto ca_cert = Certificate::from_der(ca.der());
    auto issued_cert = Certificate::from_der(issued.der());
    ASSERT_TRUE(ca_cert && issued_cert);

    EXPECT_FALSE(ca_cert.value().can_sign_certificates());
    EXPECT_FALSE(issued_cert.value().is_issued_by(ca_cert.value()));
  }

  TEST_F(CertificateTest, Extensions)
  {
    auto leaf = Certificate::from_der(chain_->leaf.der());
    auto intermediate = Certificate::from_der(chain_->intermediate.der());
    ASSERT_TRUE(leaf && intermediate);

    EXPECT_TRUE(leaf.value().has_extension(leaf_marker_oid));
    EXPECT_FALSE(leaf.value().has_extension(intermediate_marker_oid));
    EXPECT_TRUE(intermediate.value().has_extension(intermediate_marker_oid));
    EXPECT_FALSE(intermediate.value().has_extension("not an oid"));
  }

  TEST_F(CertificateTest, OcspUrl)
  {
    auto leaf = Certificate::from_der(chain_->leaf.der());
    auto intermediate = Certificate::from_der(chain_->intermediate.der());
    ASSERT_TRUE(leaf && intermediate);

    EXPECT_EQ(leaf.value().ocsp_url(), std::optional<std::string>("http://ocsp.example.com/leaf"));
    EXPECT_FALSE(intermediate.value().ocsp_url().has_value());
  }

  TEST_F(CertificateTest, ValidityWindow)
  {
    auto leaf = Certificate::from_der(chain_->leaf.der());
    ASSERT_TRUE(leaf.has_value());

    auto now = std::chrono::system_clock::now();
    auto not_before = leaf.value().get_not_before();
    auto not_after = leaf.value().get_not_after();
    ASSERT_TRUE(not_before && not_after);
    EXPECT_LT(not_before.value(), now);
    EXPECT_GT(not_after.value(), now);

    EXPECT_EQ(leaf.value().validity_at(now).value(), Certificate::Validity::Valid);
    EXPECT_EQ(leaf.value().validity_at(now + std::chrono::hours(24 * 400)).value(), Certificate::Validity::Expired);
    EXPECT_EQ(leaf.value().validity_at(now - std::chrono::hours(2)).value(), Certificate::Validity::NotYetValid);
  }

  TEST_F(CertificateTest, PublicKey)
  {
    auto leaf = Certificate::from_der(chain_->leaf.der());
    ASSERT_TRUE(leaf.has_value());

    auto key = leaf.value().get_public_key();
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key.value().get_algorithm(), KeyAlgorithm::ECDSA);
    EXPECT_EQ(key.value().get_curve_nid(), NID_X9_62_prime256v1);
  }

  TEST_F(CertificateTest, Equality)
  {
    auto a = Certificate::from_der(chain_->leaf.der());
    auto b = Certificate::from_der(chain_->leaf.der());
    auto c = Certificate::from_der(chain_->intermediate.der());
    ASSERT_TRUE(a && b && c);

    EXPECT_TRUE(a.value() == b.value());
    EXPECT_TRUE(a.value() != c.value());
  }

  TEST(PublicKeyTest, ParseInvalidKey)
  {
    EXPECT_TRUE(PublicKey::from_pem("not a key").has_error());
    EXPECT_TRUE(PublicKey::from_der(std::string("\x30\x03\x02\x01\x01", 5)).has_error());
  }

  TEST(PublicKeyTest, CurveOfLargerKeys)
  {
    ChainSpec spec;
    spec.leaf_curve = "P-384";
    auto chain = TestChain::create(spec);

    auto leaf = Certificate::from_der(chain.leaf.der());
    ASSERT_TRUE(leaf.has_value());
    auto key = leaf.value().get_public_key();
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key.value().get_curve_nid(), NID_secp384r1);
  }

  TEST(PublicKeyTest, VerifyDerSignature)
  {
    auto chain = TestChain::create();
    auto leaf = Certificate::from_der(chain.leaf.der());
    ASSERT_TRUE(leaf.has_value());
    auto key = leaf.value().get_public_key();
    ASSERT_TRUE(key.has_value());

    auto raw = sign_es(chain.leaf.key(), "hello", EVP_sha256(), 32);
    auto der = JwsSignatureVerifier::raw_to_der(raw, 32);
    ASSERT_TRUE(der.has_value());

    auto verified = key.value().verify_signature("hello", der.value(), DigestAlgorithm::SHA256);
    ASSERT_TRUE(verified.has_value());
    EXPECT_TRUE(verified.value());

    verified = key.value().verify_signature("hellO", der.value(), DigestAlgorithm::SHA256);
    ASSERT_TRUE(verified.has_value());
    EXPECT_FALSE(verified.value());
  }

} // namespace storekit::jws::test
