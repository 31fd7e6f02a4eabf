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

#include "jws/RevocationTransport.hh"
#include "jws/VerificationErrors.hh"
#include "http/HttpClientErrors.hh"
#include "HttpClientMock.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace testing;

namespace storekit::jws::test
{
  class HttpRevocationTransportTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      http_ = std::make_shared<HttpClientMock>();
    }

    std::shared_ptr<HttpClientMock> http_;
  };

  TEST_F(HttpRevocationTransportTest, PostsOcspRequest)
  {
    EXPECT_CALL(*http_, post("http://ocsp.example.com/leaf", "application/ocsp-request", "request-der"))
      .WillOnce(InvokeWithoutArgs([]() -> boost::asio::awaitable<outcome::std_result<storekit::http::Response>> {
        co_return storekit::http::Response{200, "response-der"};
      }));

    HttpRevocationTransport transport(http_);
    auto rc = transport.post("http://ocsp.example.com/leaf", "request-der", std::chrono::milliseconds(1000));
    ASSERT_TRUE(rc.has_value());
    EXPECT_EQ(rc.value(), "response-der");
  }

  TEST_F(HttpRevocationTransportTest, HttpErrorStatus)
  {
    EXPECT_CALL(*http_, post(_, _, _)).WillOnce(InvokeWithoutArgs([]() -> boost::asio::awaitable<outcome::std_result<storekit::http::Response>> {
      co_return storekit::http::Response{503, "unavailable"};
    }));

    HttpRevocationTransport transport(http_);
    auto rc = transport.post("http://ocsp.example.com/leaf", "request-der", std::chrono::milliseconds(1000));
    ASSERT_TRUE(rc.has_error());
    EXPECT_EQ(rc.error(), VerificationErrc::RevocationCheckFailed);
  }

  TEST_F(HttpRevocationTransportTest, ClientError)
  {
    EXPECT_CALL(*http_, post(_, _, _)).WillOnce(InvokeWithoutArgs([]() -> boost::asio::awaitable<outcome::std_result<storekit::http::Response>> {
      co_return storekit::http::HttpClientErrc::CommunicationError;
    }));

    HttpRevocationTransport transport(http_);
    auto rc = transport.post("http://ocsp.example.com/leaf", "request-der", std::chrono::milliseconds(1000));
    ASSERT_TRUE(rc.has_error());
    EXPECT_EQ(rc.error(), storekit::http::HttpClientErrc::CommunicationError);
  }

  TEST_F(HttpRevocationTransportTest, Timeout)
  {
    EXPECT_CALL(*http_, post(_, _, _)).WillOnce(InvokeWithoutArgs([]() -> boost::asio::awaitable<outcome::std_result<storekit::http::Response>> {
      auto executor = co_await boost::asio::this_coro::executor;
      boost::asio::steady_timer timer(executor, std::chrono::seconds(5));
      co_await timer.async_wait(boost::asio::use_awaitable);
      co_return storekit::http::Response{200, "too late"};
    }));

    HttpRevocationTransport transport(http_);
    auto start = std::chrono::steady_clock::now();
    auto rc = transport.post("http://ocsp.example.com/leaf", "request-der", std::chrono::milliseconds(100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(rc.has_error());
    EXPECT_EQ(rc.error(), storekit::http::HttpClientErrc::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
  }

} // namespace storekit::jws::test
