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

#ifndef UTILS_BASE64_HH
#define UTILS_BASE64_HH

#include <stdexcept>
#include <string>

namespace storekit::utils
{
  class Base64Exception : public std::runtime_error
  {
  public:
    explicit Base64Exception(const std::string &what)
      : std::runtime_error(what)
    {
    }
  };

  class Base64
  {
  public:
    static std::string decode(const std::string &val);
    static std::string encode(const std::string &val);

    // RFC 4648 section 5 alphabet ('-' and '_'), padding optional on input
    // and omitted on output.
    static std::string decode_url(const std::string &val);
    static std::string encode_url(const std::string &val);
  };
} // namespace storekit::utils

#endif // UTILS_BASE64_HH
