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

#include "jws/Payloads.hh"

namespace storekit::jws
{
  bool ExternalPurchaseToken::is_sandbox() const
  {
    return external_purchase_id && external_purchase_id->starts_with("SANDBOX");
  }

  NotificationType NotificationEnvelope::type() const
  {
    return storekit::utils::enum_from_string<NotificationType>(notification_type);
  }

  NotificationSubtype NotificationEnvelope::subtype_value() const
  {
    if (!subtype)
      {
        return NotificationSubtype::Unknown;
      }
    return storekit::utils::enum_from_string<NotificationSubtype>(*subtype);
  }

  std::string_view payload_kind_name(const DecodedPayload &payload)
  {
    struct Visitor
    {
      std::string_view operator()(const NotificationEnvelope &) const
      {
        return "notification";
      }
      std::string_view operator()(const TransactionInfo &) const
      {
        return "transaction";
      }
      std::string_view operator()(const RenewalInfo &) const
      {
        return "renewal";
      }
      std::string_view operator()(const AppTransaction &) const
      {
        return "app-transaction";
      }
      std::string_view operator()(const UnknownPayload &) const
      {
        return "unknown";
      }
    };
    return std::visit(Visitor{}, payload);
  }

} // namespace storekit::jws
