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

#include "http/Options.hh"

using namespace storekit::http;

void
Options::set_timeout(std::chrono::milliseconds timeout)
{
  this->timeout = timeout;
}

std::chrono::milliseconds
Options::get_timeout() const
{
  return timeout;
}

void
Options::set_follow_redirects(bool follow_redirects)
{
  this->follow_redirects = follow_redirects;
}

bool
Options::get_follow_redirects() const
{
  return follow_redirects;
}

void
Options::set_max_redirects(int max_redirects)
{
  this->max_redirects = max_redirects;
}

int
Options::get_max_redirects() const
{
  return max_redirects;
}

void
Options::set_user_agent(const std::string &user_agent)
{
  this->user_agent = user_agent;
}

std::string
Options::get_user_agent() const
{
  return user_agent;
}

void
Options::set_max_response_size(std::size_t max_response_size)
{
  this->max_response_size = max_response_size;
}

std::size_t
Options::get_max_response_size() const
{
  return max_response_size;
}
