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

#ifndef JWS_REVOCATION_TRANSPORT_HH
#define JWS_REVOCATION_TRANSPORT_HH

#include <chrono>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "http/HttpClient.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

namespace storekit::jws
{
  // Delivers one DER encoded OCSP request and returns the DER encoded
  // response. Blocks for at most `timeout`.
  class IRevocationTransport
  {
  public:
    virtual ~IRevocationTransport() = default;

    virtual outcome::std_result<std::string> post(const std::string &url,
                                                  const std::string &request_der,
                                                  std::chrono::milliseconds timeout) = 0;
  };

  // Posts OCSP requests over HTTP. Each request runs on a private io_context
  // so that a blocking check never runs on a caller's event loop.
  class HttpRevocationTransport : public IRevocationTransport
  {
  public:
    HttpRevocationTransport() = default;
    explicit HttpRevocationTransport(std::shared_ptr<storekit::http::IHttpClient> http_client);

    outcome::std_result<std::string> post(const std::string &url,
                                          const std::string &request_der,
                                          std::chrono::milliseconds timeout) override;

  private:
    std::shared_ptr<storekit::http::IHttpClient> http_client_;
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:ocsp:http")};
  };

} // namespace storekit::jws

#endif // JWS_REVOCATION_TRANSPORT_HH
