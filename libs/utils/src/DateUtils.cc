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

#include "utils/DateUtils.hh"

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/posix_time/conversion.hpp>

using namespace storekit::utils;

namespace
{
  const boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
}

std::chrono::system_clock::time_point
DateUtils::from_epoch_millis(std::int64_t millis)
{
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

std::int64_t
DateUtils::to_epoch_millis(std::chrono::system_clock::time_point tp)
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point
DateUtils::from_utc_tm(const std::tm &tm)
{
  boost::posix_time::ptime pt = boost::posix_time::ptime_from_tm(tm);
  boost::posix_time::time_duration duration = pt - epoch;
  return std::chrono::system_clock::time_point(std::chrono::seconds(duration.total_seconds()));
}

std::string
DateUtils::to_iso_string(std::chrono::system_clock::time_point tp)
{
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
  boost::posix_time::ptime pt = epoch + boost::posix_time::seconds(static_cast<long>(seconds));
  return boost::posix_time::to_iso_extended_string(pt) + "Z";
}
