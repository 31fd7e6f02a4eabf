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

#include "TestServer.hh"

#include <utility>

#include <boost/beast/version.hpp>

using namespace storekit::http::test;

TestServer::TestServer(unsigned short port)
  : port(port)
{
}

TestServer::~TestServer()
{
  stop();
}

void
TestServer::add(std::string_view target, std::string body, std::string content_type)
{
  Document document;
  document.body = std::move(body);
  document.content_type = std::move(content_type);
  add(target, std::move(document));
}

void
TestServer::add(std::string_view target, Document document)
{
  documents[std::string(target)] = std::move(document);
}

void
TestServer::add_redirect(std::string_view from, std::string_view to, boost::beast::http::status status)
{
  redirects[std::string(from)] = {std::string(to), status};
}

std::string
TestServer::url(std::string_view target) const
{
  return "http://127.0.0.1:" + std::to_string(port) + std::string(target);
}

std::vector<RecordedRequest>
TestServer::requests() const
{
  std::scoped_lock lock(mutex);
  return recorded;
}

void
TestServer::run()
{
  auto const address = boost::asio::ip::make_address("127.0.0.1");
  boost::asio::ip::tcp::endpoint endpoint{address, port};

  auto acceptor = std::make_shared<boost::asio::ip::tcp::acceptor>(ioc);
  acceptor->open(endpoint.protocol());
  acceptor->set_option(boost::asio::socket_base::reuse_address(true));
  acceptor->bind(endpoint);
  acceptor->listen(boost::asio::socket_base::max_listen_connections);

  boost::asio::co_spawn(
    ioc,
    [this, acceptor]() -> boost::asio::awaitable<void> {
      for (;;)
        {
          boost::system::error_code ec;
          auto socket = co_await acceptor->async_accept(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
          if (ec)
            {
              logger->debug("accept stopped ({})", ec.message());
              co_return;
            }
          boost::asio::co_spawn(ioc, do_session(boost::beast::tcp_stream(std::move(socket))), boost::asio::detached);
        }
    },
    boost::asio::detached);

  workers.reserve(threads);
  for (auto i = 0; i < threads; ++i)
    {
      workers.emplace_back([this] { ioc.run(); });
    }
}

void
TestServer::stop()
{
  ioc.stop();
  for (auto &w: workers)
    {
      if (w.joinable())
        {
          w.join();
        }
    }
  workers.clear();
}

boost::beast::http::response<boost::beast::http::string_body>
TestServer::make_response(const boost::beast::http::request<boost::beast::http::string_body> &req,
                          std::chrono::milliseconds &delay)
{
  auto target = std::string(req.target());

  if (auto r = redirects.find(target); r != redirects.end())
    {
      logger->info("redirecting {} to {}", target, r->second.first);
      boost::beast::http::response<boost::beast::http::string_body> res{r->second.second, req.version()};
      res.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
      res.set(boost::beast::http::field::location, r->second.first);
      res.keep_alive(req.keep_alive());
      res.prepare_payload();
      return res;
    }

  if (auto d = documents.find(target); d != documents.end())
    {
      const auto &document = d->second;
      delay = document.delay;

      boost::beast::http::response<boost::beast::http::string_body> res{document.status, req.version()};
      res.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
      res.set(boost::beast::http::field::content_type, document.content_type);
      res.keep_alive(req.keep_alive());
      res.body() = document.body;
      res.prepare_payload();
      return res;
    }

  logger->debug("sending not found document: {}", target);
  boost::beast::http::response<boost::beast::http::string_body> res{boost::beast::http::status::not_found, req.version()};
  res.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
  res.set(boost::beast::http::field::content_type, "text/html");
  res.keep_alive(req.keep_alive());
  res.body() = "The resource '" + target + "' was not found.";
  res.prepare_payload();
  return res;
}

boost::asio::awaitable<void>
TestServer::do_session(boost::beast::tcp_stream stream)
{
  boost::beast::error_code ec;
  boost::beast::flat_buffer buffer;

  for (;;)
    {
      boost::beast::http::request<boost::beast::http::string_body> req;
      stream.expires_after(std::chrono::seconds(30));
      co_await boost::beast::http::async_read(stream, buffer, req, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      if (ec == boost::beast::http::error::end_of_stream)
        {
          break;
        }
      if (ec)
        {
          logger->debug("session read failed ({})", ec.message());
          co_return;
        }

      {
        std::scoped_lock lock(mutex);
        recorded.push_back({std::string(req.method_string()),
                            std::string(req.target()),
                            std::string(req[boost::beast::http::field::content_type]),
                            std::string(req[boost::beast::http::field::user_agent]),
                            req.body()});
      }

      std::chrono::milliseconds delay{0};
      auto res = make_response(req, delay);
      if (delay.count() > 0)
        {
          boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, delay);
          co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }

      auto close = res.need_eof();
      co_await boost::beast::http::async_write(stream, res, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      if (ec)
        {
          logger->debug("session write failed ({})", ec.message());
          co_return;
        }
      if (close)
        {
          break;
        }
    }

  stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
}
