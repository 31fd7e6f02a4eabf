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

#include "http/HttpStream.hh"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include <boost/url/parse.hpp>
#include <boost/beast/http.hpp>

#include "http/HttpClientErrors.hh"
#include "http/Options.hh"

using namespace storekit::http;

HttpStream::HttpStream(Options options_)
  : options(std::move(options_))
{
}

boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::execute(Request request_)
{
  request = std::move(request_);

  auto url_rc = parse_url(request.url);
  if (!url_rc)
    {
      co_return url_rc.as_failure();
    }
  requested_url = url_rc.value();

  outcome::std_result<HttpStream::response_t> response_rc = outcome::success();
  while (true)
    {
      if (connect_required())
        {
          shutdown();
          auto rc = co_await connect();
          if (!rc)
            {
              co_return rc.as_failure();
            }
        }

      response_rc = co_await send_receive_request();
      if (!response_rc)
        {
          shutdown();
          co_return response_rc.as_failure();
        }

      auto redirect_rc = handle_redirect(response_rc.value());
      if (!redirect_rc)
        {
          shutdown();
          co_return redirect_rc.as_failure();
        }

      if (!redirect_rc.value())
        {
          break;
        }
      logger->info("redirecting {} to {}", boost::beast::http::to_string(request.method), requested_url.c_str());
    }

  shutdown();
  co_return response_rc;
}

boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::send_receive_request()
{
  auto req = create_request();

  auto request_rc = co_await send_request(std::move(req));
  if (!request_rc)
    {
      co_return request_rc.as_failure();
    }

  co_return co_await receive_response_body();
}

outcome::std_result<boost::urls::url>
HttpStream::parse_url(const std::string &u)
{
  auto url_rc = boost::urls::parse_uri(u);

  if (!url_rc)
    {
      logger->error("malformed URL '{}' ({})", u, url_rc.error().message());
      return HttpClientErrc::MalformedURL;
    }
  boost::urls::url url = url_rc.value();

  if (url.scheme() != "http")
    {
      logger->error("unsupported URL scheme in '{}'", u);
      return HttpClientErrc::MalformedURL;
    }

  if (url.port().empty())
    {
      url.set_port("80");
    }

  logger->debug("parsed URL {}", url.c_str());
  return url;
}

bool
HttpStream::connect_required()
{
  return !stream || !connected_url || requested_url.host() != connected_url->host()
         || requested_url.port() != connected_url->port();
}

HttpClientErrc
HttpStream::classify(const boost::system::error_code &ec, HttpClientErrc fallback) const
{
  if (ec == boost::beast::error::timeout)
    {
      return HttpClientErrc::Timeout;
    }
  return fallback;
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::connect()
{
  auto url = requested_url;
  connected_url.reset();

  auto executor = co_await boost::asio::this_coro::executor;
  stream = std::make_shared<stream_t>(executor);

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(executor);
  auto results = co_await resolver.async_resolve(std::string(url.host()),
                                                 std::string(url.port()),
                                                 boost::asio::redirect_error(boost::asio::use_awaitable, ec));

  if (ec)
    {
      logger->error("failed to resolve hostname '{}' ({})", url.host(), ec.message());
      co_return HttpClientErrc::NameResolutionFailed;
    }

  stream->expires_after(options.get_timeout());
  co_await stream->async_connect(results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to connect to '{}:{}' ({})", url.host(), url.port(), ec.message());
      co_return classify(ec, HttpClientErrc::ConnectionRefused);
    }
  connected_url = url;
  co_return outcome::success();
}

HttpStream::request_t
HttpStream::create_request()
{
  constexpr auto http_version = 11;
  request_t req;
  req.method(request.method);
  req.target(requested_url.encoded_resource());
  req.version(http_version);
  req.set(boost::beast::http::field::host, std::string(requested_url.host()));
  req.set(boost::beast::http::field::user_agent, options.get_user_agent());
  if (request.method == boost::beast::http::verb::post)
    {
      req.set(boost::beast::http::field::content_type, request.content_type);
      req.body() = request.body;
    }
  req.prepare_payload();

  logger->debug("req {} HTTP/{} {} ({} bytes)", req.method_string(), req.version(), req.target(), req.body().size());
  return req;
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::send_request(request_t req)
{
  boost::system::error_code ec;

  stream->expires_after(options.get_timeout());
  co_await boost::beast::http::async_write(*stream, req, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to send HTTP request to '{}' ({})", connected_url->host(), ec.message());
      co_return classify(ec, HttpClientErrc::CommunicationError);
    }

  co_return outcome::success();
}

boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::receive_response_body()
{
  boost::system::error_code ec;
  boost::beast::flat_buffer buffer;
  boost::beast::http::response_parser<boost::beast::http::string_body> parser;
  parser.body_limit(options.get_max_response_size());

  stream->expires_after(options.get_timeout());
  co_await boost::beast::http::async_read(*stream, buffer, parser, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec == boost::beast::http::error::body_limit)
    {
      logger->error("response from {} exceeds {} bytes", connected_url->host(), options.get_max_response_size());
      co_return HttpClientErrc::ResponseTooLarge;
    }
  if (ec)
    {
      logger->error("failed to read HTTP response from {} ({})", connected_url->host(), ec.message());
      co_return classify(ec, HttpClientErrc::CommunicationError);
    }

  logger->debug("resp HTTP/{} {} ({} bytes)", parser.get().version(), parser.get().result_int(), parser.get().body().size());
  co_return parser.release();
}

outcome::std_result<bool>
HttpStream::handle_redirect(const response_t &response)
{
  if (!is_redirect(response.result()))
    {
      redirect_count = 0;
      return false;
    }

  redirect_count++;
  if (!options.get_follow_redirects() || redirect_count > options.get_max_redirects())
    {
      logger->error("too many redirects");
      return HttpClientErrc::TooManyRedirects;
    }

  std::string redirect_url = std::string(response.base()[boost::beast::http::field::location]);
  if (redirect_url.empty())
    {
      logger->error("no Location header in redirect response from {}", connected_url->host());
      return HttpClientErrc::InvalidRedirect;
    }

  logger->debug("redirecting to {}", redirect_url);
  if (redirect_url[0] == '/')
    {
      requested_url.set_path(redirect_url);
    }
  else
    {
      auto url_rc = parse_url(redirect_url);
      if (!url_rc)
        {
          logger->error("malformed redirect URL '{}'", redirect_url);
          return HttpClientErrc::InvalidRedirect;
        }
      requested_url = std::move(url_rc.value());
    }

  // Only 307 and 308 preserve the request method and body.
  if (response.result() != boost::beast::http::status::temporary_redirect
      && response.result() != boost::beast::http::status::permanent_redirect)
    {
      request.method = boost::beast::http::verb::get;
      request.body.clear();
      request.content_type.clear();
    }
  return true;
}

void
HttpStream::shutdown()
{
  if (!stream)
    {
      return;
    }

  boost::system::error_code ec;
  stream->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  stream->socket().close(ec);
  stream.reset();
  connected_url.reset();
}

bool
HttpStream::is_redirect(auto code)
{
  return code == boost::beast::http::status::moved_permanently || code == boost::beast::http::status::found
         || code == boost::beast::http::status::see_other || code == boost::beast::http::status::temporary_redirect
         || code == boost::beast::http::status::permanent_redirect;
}
