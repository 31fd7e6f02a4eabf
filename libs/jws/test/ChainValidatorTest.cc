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
#include "TrustedRootSet.hh"
#include "TestCertificates.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace storekit::jws::test
{
  class ChainValidatorTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      chain_ = std::make_unique<TestChain>(TestChain::create());
      ASSERT_TRUE(roots_.load({chain_->root.der()}).has_value());
    }

    Result<ValidatedChain> validate(const std::vector<std::string> &x5c, bool strict = false)
    {
      ChainValidator validator(roots_, strict);
      return validator.validate(x5c, std::chrono::system_clock::now());
    }

    std::unique_ptr<TestChain> chain_;
    TrustedRootSet roots_;
  };

  TEST_F(ChainValidatorTest, ValidChainWithRoot)
  {
    auto result = validate(chain_->x5c_der());
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result.value().certificates.size(), 3);
    ASSERT_NE(result.value().anchor, nullptr);
    EXPECT_THAT(result.value().anchor->subject_name(), ::testing::HasSubstr("Test Root CA"));
  }

  TEST_F(ChainValidatorTest, ValidChainWithoutRoot)
  {
    auto result = validate({chain_->leaf.der(), chain_->intermediate.der()});
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result.value().certificates.size(), 2);
    ASSERT_NE(result.value().anchor, nullptr);
  }

  TEST_F(ChainValidatorTest, EmptyChain)
  {
    auto result = validate({});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MissingCertificateChain);
  }

  TEST_F(ChainValidatorTest, ChainTooLong)
  {
    std::vector<std::string> x5c(ChainValidator::max_chain_length + 1, chain_->leaf.der());
    auto result = validate(x5c);
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::ChainTooLong);
  }

  TEST_F(ChainValidatorTest, UnparsableCertificateReportsIndex)
  {
    auto result = validate({chain_->leaf.der(), "garbage"});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::InvalidCertificateEncoding);
    EXPECT_EQ(result.error().index, std::optional<std::size_t>(1));
  }

  TEST_F(ChainValidatorTest, BrokenLink)
  {
    auto result = validate({chain_->leaf.der(), chain_->root.der()});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::BrokenChainLink);
    EXPECT_EQ(result.error().index, std::optional<std::size_t>(0));
  }

  TEST_F(ChainValidatorTest, BrokenLinkBySwappedIntermediate)
  {
    auto other = TestChain::create();
    auto result = validate({chain_->leaf.der(), other.intermediate.der(), chain_->root.der()});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::BrokenChainLink);
    EXPECT_EQ(result.error().index, std::optional<std::size_t>(0));
  }

  TEST_F(ChainValidatorTest, BrokenLinkWhenIssuerIsEndEntity)
  {
    CertificateSpec spec;
    spec.common_name = "Forged Leaf";
    auto forged = TestCertificate::create_issued(chain_->leaf, spec);

    auto result = validate({forged.der(), chain_->leaf.der(), chain_->intermediate.der(), chain_->root.der()});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::BrokenChainLink);
    EXPECT_EQ(result.error().index, std::optional<std::size_t>(0));
  }

  TEST_F(ChainValidatorTest, BrokenLinkWhenIssuerLacksKeyCertSign)
  {
    CertificateSpec spec;
    spec.common_name = "Signing Only CA";
    spec.is_ca = true;
    spec.key_usage = "critical,digitalSignature";
    auto ca = TestCertificate::create_issued(chain_->intermediate, spec);

    spec.common_name = "Issued Leaf";
    spec.is_ca = false;
    spec.key_usage.reset();
    auto leaf = TestCertificate::create_issued(ca, spec);

    auto result = validate({leaf.der(), ca.der(), chain_->intermediate.der(), chain_->root.der()});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::BrokenChainLink);
    EXPECT_EQ(result.error().index, std::optional<std::size_t>(0));
  }

  TEST_F(ChainValidatorTest, UntrustedRootEvenWhenLinksVerify)
  {
    auto other = TestChain::create();
    auto result = validate(other.x5c_der());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::UntrustedRoot);
  }

  TEST_F(ChainValidatorTest, ExpiredLeaf)
  {
    ChainSpec spec;
    spec.leaf_not_before = -std::chrono::hours(48);
    spec.leaf_not_after = -std::chrono::hours(24);
    auto expired = TestChain::create(spec);

    TrustedRootSet roots;
    ASSERT_TRUE(roots.load({expired.root.der()}).has_value());
    ChainValidator validator(roots, false);

    auto result = validator.validate(expired.x5c_der(), std::chrono::system_clock::now());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::CertificateExpired);
    EXPECT_EQ(result.error().index, std::optional<std::size_t>(0));
  }

  TEST_F(ChainValidatorTest, VerificationTimeComesFromCaller)
  {
    ChainValidator validator(roots_, false);

    auto later = validator.validate(chain_->x5c_der(), std::chrono::system_clock::now() + std::chrono::hours(24 * 366));
    ASSERT_TRUE(later.has_error());
    EXPECT_EQ(later.error().kind, VerificationErrc::CertificateExpired);
    EXPECT_EQ(later.error().index, std::optional<std::size_t>(0));

    auto earlier = validator.validate(chain_->x5c_der(), std::chrono::system_clock::now() - std::chrono::hours(2));
    ASSERT_TRUE(earlier.has_error());
    EXPECT_EQ(earlier.error().kind, VerificationErrc::CertificateNotYetValid);
  }

  TEST_F(ChainValidatorTest, StrictChecksAcceptMarkedChain)
  {
    auto result = validate(chain_->x5c_der(), true);
    EXPECT_TRUE(result.has_value());
  }

  TEST_F(ChainValidatorTest, StrictChecksRejectUnmarkedChain)
  {
    ChainSpec spec;
    spec.marker_extensions = false;
    auto unmarked = TestChain::create(spec);

    TrustedRootSet roots;
    ASSERT_TRUE(roots.load({unmarked.root.der()}).has_value());

    ChainValidator lenient(roots, false);
    EXPECT_TRUE(lenient.validate(unmarked.x5c_der(), std::chrono::system_clock::now()).has_value());

    ChainValidator strict(roots, true);
    auto result = strict.validate(unmarked.x5c_der(), std::chrono::system_clock::now());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MissingRequiredExtension);
    EXPECT_EQ(result.error().index, std::optional<std::size_t>(0));
  }

  TEST(TrustedRootSetTest, EndEntityRootAnchorsOnlyItself)
  {
    CertificateSpec spec;
    spec.common_name = "Trusted End Entity";
    auto trusted = TestCertificate::create_root(spec);
    spec.common_name = "Issued By End Entity";
    auto issued = TestCertificate::create_issued(trusted, spec);

    TrustedRootSet roots;
    ASSERT_TRUE(roots.load({trusted.der()}).has_value());

    auto trusted_cert = Certificate::from_der(trusted.der());
    auto issued_cert = Certificate::from_der(issued.der());
    ASSERT_TRUE(trusted_cert && issued_cert);
    EXPECT_NE(roots.find_anchor(trusted_cert.value()), nullptr);
    EXPECT_EQ(roots.find_anchor(issued_cert.value()), nullptr);

    ChainValidator validator(roots, false);
    auto result = validator.validate({issued.der()}, std::chrono::system_clock::now());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::UntrustedRoot);
  }

  TEST(TrustedRootSetTest, RejectsEmptySet)
  {
    TrustedRootSet roots;
    auto rc = roots.load({});
    ASSERT_TRUE(rc.has_error());
    EXPECT_EQ(rc.error().kind, VerificationErrc::InvalidRootCertificate);
  }

  TEST(TrustedRootSetTest, RejectsUnparsableRoot)
  {
    auto chain = TestChain::create();
    TrustedRootSet roots;
    auto rc = roots.load({chain.root.der(), "not a certificate"});
    ASSERT_TRUE(rc.has_error());
    EXPECT_EQ(rc.error().kind, VerificationErrc::InvalidRootCertificate);
    EXPECT_EQ(rc.error().index, std::optional<std::size_t>(1));
  }

  TEST(TrustedRootSetTest, AcceptsPemAndDer)
  {
    auto a = TestChain::create();
    auto b = TestChain::create();
    TrustedRootSet roots;
    ASSERT_TRUE(roots.load({a.root.der(), b.root.pem()}).has_value());
    EXPECT_EQ(roots.size(), 2);
    EXPECT_NE(roots.store(), nullptr);

    auto b_root = Certificate::from_der(b.root.der());
    auto b_leaf = Certificate::from_der(b.leaf.der());
    ASSERT_TRUE(b_root && b_leaf);
    EXPECT_TRUE(roots.contains(b_root.value()));
    EXPECT_FALSE(roots.contains(b_leaf.value()));
  }

} // namespace storekit::jws::test
