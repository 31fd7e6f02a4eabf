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

#ifndef JWS_JSON_UTILS_HH
#define JWS_JSON_UTILS_HH

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "jws/VerificationErrors.hh"
#include "utils/Logging.hh"

namespace storekit::jws
{
  // Reads optional typed fields from a JSON object. A field that is absent or
  // null leaves the output empty; a field of the wrong type records a
  // MalformedPayload error naming the field and stops further reads.
  class JsonUtils
  {
  public:
    explicit JsonUtils(const boost::json::object &obj, std::string path = "");

    static Result<boost::json::object> parse_object(const std::string &text);

    JsonUtils &read(std::string_view key, std::optional<std::string> &out);
    JsonUtils &read(std::string_view key, std::optional<std::int64_t> &out);
    JsonUtils &read(std::string_view key, std::optional<bool> &out);
    JsonUtils &read(std::string_view key, std::optional<std::vector<std::string>> &out);

    const boost::json::object *read_object(std::string_view key);

    bool ok() const;
    const VerificationError &error() const;
    std::string field_path(std::string_view key) const;

  private:
    const boost::json::value *lookup(std::string_view key) const;
    void fail(std::string_view key, std::string_view expected);

  private:
    const boost::json::object &obj_;
    std::string path_;
    std::optional<VerificationError> error_;
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:json")};
  };

} // namespace storekit::jws

#endif // JWS_JSON_UTILS_HH
