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

#include "JsonUtils.hh"

#include <limits>
#include <utility>

#include <fmt/format.h>

namespace storekit::jws
{
  JsonUtils::JsonUtils(const boost::json::object &obj, std::string path)
    : obj_(obj)
    , path_(std::move(path))
  {
  }

  Result<boost::json::object> JsonUtils::parse_object(const std::string &text)
  {
    try
      {
        boost::json::value json_val = boost::json::parse(text);
        if (!json_val.is_object())
          {
            return VerificationError(VerificationErrc::MalformedPayload, "payload is not a JSON object");
          }
        return std::move(json_val.as_object());
      }
    catch (const std::exception &e)
      {
        return VerificationError(VerificationErrc::MalformedPayload, fmt::format("payload is not valid JSON: {}", e.what()));
      }
  }

  const boost::json::value *JsonUtils::lookup(std::string_view key) const
  {
    if (error_)
      {
        return nullptr;
      }
    const auto *value = obj_.if_contains(boost::json::string_view(key.data(), key.size()));
    if (value == nullptr || value->is_null())
      {
        return nullptr;
      }
    return value;
  }

  void JsonUtils::fail(std::string_view key, std::string_view expected)
  {
    auto field = field_path(key);
    logger_->error("Field '{}' is not {}", field, expected);
    error_ = VerificationError::for_field(VerificationErrc::MalformedPayload, field, fmt::format("expected {}", expected));
  }

  std::string JsonUtils::field_path(std::string_view key) const
  {
    if (path_.empty())
      {
        return std::string(key);
      }
    return path_ + "." + std::string(key);
  }

  JsonUtils &JsonUtils::read(std::string_view key, std::optional<std::string> &out)
  {
    const auto *value = lookup(key);
    if (value == nullptr)
      {
        return *this;
      }
    if (!value->is_string())
      {
        fail(key, "a string");
        return *this;
      }
    out = std::string(value->as_string());
    return *this;
  }

  JsonUtils &JsonUtils::read(std::string_view key, std::optional<std::int64_t> &out)
  {
    const auto *value = lookup(key);
    if (value == nullptr)
      {
        return *this;
      }
    if (value->is_int64())
      {
        out = value->as_int64();
      }
    else if (value->is_uint64() && value->as_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
      {
        out = static_cast<std::int64_t>(value->as_uint64());
      }
    else
      {
        fail(key, "an integer");
      }
    return *this;
  }

  JsonUtils &JsonUtils::read(std::string_view key, std::optional<bool> &out)
  {
    const auto *value = lookup(key);
    if (value == nullptr)
      {
        return *this;
      }
    if (!value->is_bool())
      {
        fail(key, "a boolean");
        return *this;
      }
    out = value->as_bool();
    return *this;
  }

  JsonUtils &JsonUtils::read(std::string_view key, std::optional<std::vector<std::string>> &out)
  {
    const auto *value = lookup(key);
    if (value == nullptr)
      {
        return *this;
      }
    if (!value->is_array())
      {
        fail(key, "an array of strings");
        return *this;
      }

    std::vector<std::string> items;
    for (const auto &item: value->as_array())
      {
        if (!item.is_string())
          {
            fail(key, "an array of strings");
            return *this;
          }
        items.emplace_back(item.as_string());
      }
    out = std::move(items);
    return *this;
  }

  const boost::json::object *JsonUtils::read_object(std::string_view key)
  {
    const auto *value = lookup(key);
    if (value == nullptr)
      {
        return nullptr;
      }
    if (!value->is_object())
      {
        fail(key, "an object");
        return nullptr;
      }
    return &value->as_object();
  }

  bool JsonUtils::ok() const
  {
    return !error_.has_value();
  }

  const VerificationError &JsonUtils::error() const
  {
    return *error_;
  }

} // namespace storekit::jws
