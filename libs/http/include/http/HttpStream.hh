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

#ifndef NET_HTTP_HTTPSTREAM_HH
#define NET_HTTP_HTTPSTREAM_HH

#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/url.hpp>
#include <boost/url/url_view.hpp>
#include <boost/outcome/std_result.hpp>

#include "utils/Logging.hh"

#include "http/Options.hh"
#include "http/HttpClientErrors.hh"

namespace outcome = boost::outcome_v2;

namespace storekit::http
{
  struct Request
  {
    boost::beast::http::verb method{boost::beast::http::verb::get};
    std::string url;
    std::string content_type;
    std::string body;
  };

  // Executes one plain HTTP request, following redirects over a reused
  // connection where host and port allow it.
  class HttpStream
  {
  public:
    using request_t = boost::beast::http::request<boost::beast::http::string_body>;
    using response_t = boost::beast::http::response<boost::beast::http::string_body>;
    using stream_t = boost::beast::tcp_stream;

    explicit HttpStream(storekit::http::Options options);

    boost::asio::awaitable<outcome::std_result<HttpStream::response_t>> execute(Request request);

  private:
    bool is_redirect(auto code);
    HttpClientErrc classify(const boost::system::error_code &ec, HttpClientErrc fallback) const;

    outcome::std_result<boost::urls::url> parse_url(const std::string &u);
    bool connect_required();
    boost::asio::awaitable<outcome::std_result<void>> connect();

    boost::asio::awaitable<outcome::std_result<HttpStream::response_t>> send_receive_request();
    request_t create_request();
    outcome::std_result<bool> handle_redirect(const response_t &response);

    boost::asio::awaitable<outcome::std_result<void>> send_request(request_t req);
    boost::asio::awaitable<outcome::std_result<HttpStream::response_t>> receive_response_body();
    void shutdown();

  private:
    storekit::http::Options options;
    std::shared_ptr<stream_t> stream;
    int redirect_count{0};
    Request request;
    boost::urls::url requested_url;
    std::optional<boost::urls::url> connected_url;
    std::shared_ptr<spdlog::logger> logger{storekit::utils::Logging::create("storekit:http:stream")};
  };
} // namespace storekit::http

#endif // NET_HTTP_HTTPSTREAM_HH
