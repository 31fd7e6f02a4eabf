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

#ifndef JWS_PAYLOAD_DECODER_HH
#define JWS_PAYLOAD_DECODER_HH

#include <functional>
#include <memory>
#include <string>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "jws/Payloads.hh"
#include "jws/VerificationErrors.hh"
#include "utils/Logging.hh"

namespace storekit::jws
{
  class PayloadDecoder
  {
  public:
    // Verifies a nested compact token through the complete pipeline.
    using NestedVerifier = std::function<Result<DecodedPayload>(const std::string &token)>;

    explicit PayloadDecoder(NestedVerifier nested_verifier);

    Result<DecodedPayload> decode(const std::string &payload_segment) const;
    Result<DecodedPayload> decode(const boost::json::object &payload) const;

    Result<NotificationEnvelope> decode_notification(const boost::json::object &payload) const;
    Result<TransactionInfo> decode_transaction(const boost::json::object &payload) const;
    Result<RenewalInfo> decode_renewal_info(const boost::json::object &payload) const;
    Result<AppTransaction> decode_app_transaction(const boost::json::object &payload) const;

  private:
    Result<void> decode_nested(NotificationData &data) const;

  private:
    NestedVerifier nested_verifier_;
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:payload")};
  };

} // namespace storekit::jws

#endif // JWS_PAYLOAD_DECODER_HH
