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

#include <cstddef>
#include <optional>
#include <utility>

#include <boost/asio.hpp>

#include "jws/VerificationErrors.hh"
#include "http/HttpClientErrors.hh"

namespace storekit::jws
{
  namespace
  {
    constexpr std::size_t max_ocsp_response_size = 64 * 1024;
  } // namespace

  HttpRevocationTransport::HttpRevocationTransport(std::shared_ptr<storekit::http::IHttpClient> http_client)
    : http_client_(std::move(http_client))
  {
  }

  outcome::std_result<std::string> HttpRevocationTransport::post(const std::string &url,
                                                                 const std::string &request_der,
                                                                 std::chrono::milliseconds timeout)
  {
    std::shared_ptr<storekit::http::IHttpClient> client = http_client_;
    if (!client)
      {
        client = std::make_shared<storekit::http::HttpClient>();
        client->options().set_timeout(timeout);
        client->options().set_max_response_size(max_ocsp_response_size);
      }

    std::optional<outcome::std_result<storekit::http::Response>> response;
    boost::asio::io_context ioc;

    boost::asio::co_spawn(
      ioc,
      [&]() -> boost::asio::awaitable<void> {
        response = co_await client->post(url, "application/ocsp-request", request_der);
      },
      boost::asio::detached);

    ioc.run_for(timeout);

    if (!response)
      {
        logger_->error("OCSP request to {} timed out after {} ms", url, timeout.count());
        return storekit::http::HttpClientErrc::Timeout;
      }

    if (!response->has_value())
      {
        logger_->error("OCSP request to {} failed: {}", url, response->error().message());
        return response->error();
      }

    auto [status_code, body] = response->value();

    constexpr int HTTP_OK = 200;
    if (status_code != HTTP_OK)
      {
        logger_->error("OCSP responder {} returned HTTP {}", url, status_code);
        return VerificationErrc::RevocationCheckFailed;
      }

    logger_->debug("OCSP responder {} returned {} bytes", url, body.size());
    return body;
  }

} // namespace storekit::jws
