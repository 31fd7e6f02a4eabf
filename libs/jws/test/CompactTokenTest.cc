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

#include "CompactToken.hh"
#include "TestCertificates.hh"
#include "utils/Base64.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace storekit::jws::test
{
  class CompactTokenTest : public ::testing::Test
  {
  protected:
    static std::string encode_header(const std::string &json)
    {
      return storekit::utils::Base64::encode_url(json);
    }

    static std::string encode_payload()
    {
      return storekit::utils::Base64::encode_url(R"({"transactionId":"1000"})");
    }

    static std::string encode_signature()
    {
      return storekit::utils::Base64::encode_url(std::string(64, '\x02'));
    }
  };

  TEST_F(CompactTokenTest, ParseValidToken)
  {
    auto chain = TestChain::create();
    auto token = make_token(transaction_payload(), chain);

    auto result = CompactToken::parse(token);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    const auto &parsed = result.value();
    EXPECT_EQ(parsed.algorithm, "ES256");
    ASSERT_EQ(parsed.certificate_chain.size(), 3);
    EXPECT_EQ(parsed.certificate_chain[0], chain.leaf.der());
    EXPECT_EQ(parsed.certificate_chain[1], chain.intermediate.der());
    EXPECT_EQ(parsed.certificate_chain[2], chain.root.der());
    EXPECT_EQ(parsed.signature.size(), 64);
    EXPECT_EQ(parsed.signing_input() + "." + parsed.signature_segment, token);
  }

  TEST_F(CompactTokenTest, RejectsWrongSegmentCount)
  {
    auto result = CompactToken::parse("abc.def");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MalformedToken);

    result = CompactToken::parse("abc.def.ghi.jkl");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MalformedToken);
  }

  TEST_F(CompactTokenTest, RejectsEmptyToken)
  {
    auto result = CompactToken::parse("");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MalformedToken);
  }

  TEST_F(CompactTokenTest, RejectsEmptySegment)
  {
    auto result = CompactToken::parse(encode_header(R"({"alg":"ES256"})") + ".." + encode_signature());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MalformedToken);
  }

  TEST_F(CompactTokenTest, RejectsNonBase64UrlSegment)
  {
    auto result = CompactToken::parse(encode_header(R"({"alg":"ES256"})") + ".pay+load/." + encode_signature());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MalformedToken);
  }

  TEST_F(CompactTokenTest, RejectsSignatureWithUnusedBitsSet)
  {
    auto signature = encode_signature();
    ASSERT_EQ(signature.back(), 'g');

    auto token = encode_header(R"({"alg":"ES256"})") + "." + encode_payload() + ".";
    ASSERT_TRUE(CompactToken::parse(token + signature, false).has_value());

    signature.back() = 'h';
    auto result = CompactToken::parse(token + signature, false);
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::InvalidSignature);
  }

  TEST_F(CompactTokenTest, RejectsHeaderThatIsNotJson)
  {
    auto result = CompactToken::parse(encode_header("not json") + "." + encode_payload() + "." + encode_signature());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MalformedToken);
  }

  TEST_F(CompactTokenTest, RejectsHeaderThatIsNotAnObject)
  {
    auto result = CompactToken::parse(encode_header("[1,2,3]") + "." + encode_payload() + "." + encode_signature());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MalformedToken);
  }

  TEST_F(CompactTokenTest, RejectsHeaderWithoutAlgorithm)
  {
    auto result = CompactToken::parse(encode_header(R"({"x5c":["AAAA"]})") + "." + encode_payload() + "." + encode_signature());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MalformedToken);
  }

  TEST_F(CompactTokenTest, RejectsMissingChain)
  {
    auto result = CompactToken::parse(encode_header(R"({"alg":"ES256"})") + "." + encode_payload() + "." + encode_signature());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MissingCertificateChain);
  }

  TEST_F(CompactTokenTest, RejectsEmptyChain)
  {
    auto result = CompactToken::parse(encode_header(R"({"alg":"ES256","x5c":[]})") + "." + encode_payload() + "." + encode_signature());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MissingCertificateChain);
  }

  TEST_F(CompactTokenTest, RejectsChainThatIsNotAnArray)
  {
    auto result = CompactToken::parse(encode_header(R"({"alg":"ES256","x5c":"AAAA"})") + "." + encode_payload() + "."
                                      + encode_signature());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::MissingCertificateChain);
  }

  TEST_F(CompactTokenTest, ReportsIndexOfUndecodableChainEntry)
  {
    auto result = CompactToken::parse(encode_header(R"({"alg":"ES256","x5c":["AAAA","not*base64"]})") + "." + encode_payload()
                                      + "." + encode_signature());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::InvalidCertificateEncoding);
    ASSERT_TRUE(result.error().index.has_value());
    EXPECT_EQ(*result.error().index, 1);
  }

  TEST_F(CompactTokenTest, ReportsIndexOfNonStringChainEntry)
  {
    auto result = CompactToken::parse(encode_header(R"({"alg":"ES256","x5c":[42]})") + "." + encode_payload() + "."
                                      + encode_signature());
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().kind, VerificationErrc::InvalidCertificateEncoding);
    EXPECT_EQ(result.error().index, std::optional<std::size_t>(0));
  }

  TEST_F(CompactTokenTest, ChainIsOptionalForLocalTokens)
  {
    auto result = CompactToken::parse(make_unsigned_token(transaction_payload()), false);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_TRUE(result.value().certificate_chain.empty());
    EXPECT_EQ(result.value().algorithm, "ES256");
  }

} // namespace storekit::jws::test
