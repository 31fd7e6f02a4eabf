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

#ifndef UTILS_DATE_UTILS_HH
#define UTILS_DATE_UTILS_HH

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace storekit::utils
{
  class DateUtils
  {
  public:
    // Milliseconds since the Unix epoch, as used in signed payload timestamps.
    static std::chrono::system_clock::time_point from_epoch_millis(std::int64_t millis);
    static std::int64_t to_epoch_millis(std::chrono::system_clock::time_point tp);

    // Interprets a broken-down time as UTC (unlike std::mktime).
    static std::chrono::system_clock::time_point from_utc_tm(const std::tm &tm);

    static std::string to_iso_string(std::chrono::system_clock::time_point tp);
  };
} // namespace storekit::utils

#endif // UTILS_DATE_UTILS_HH
