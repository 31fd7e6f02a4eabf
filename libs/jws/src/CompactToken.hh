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

#ifndef JWS_COMPACT_TOKEN_HH
#define JWS_COMPACT_TOKEN_HH

#include <string>
#include <string_view>
#include <vector>
#include <boost/json.hpp>

#include "jws/VerificationErrors.hh"

namespace storekit::jws
{
  // A compact JWS: header.payload.signature, each segment base64url encoded.
  // The payload segment is kept encoded until the signature has been checked.
  struct CompactToken
  {
    std::string header_segment;
    std::string payload_segment;
    std::string signature_segment;

    boost::json::object header;
    std::string algorithm;

    // DER certificates from the x5c header, leaf first.
    std::vector<std::string> certificate_chain;
    std::string signature;

    // Bytes covered by the signature, as transmitted.
    std::string signing_input() const;

    // Tokens from local tooling may omit the x5c header.
    static Result<CompactToken> parse(std::string_view token, bool require_chain = true);
  };

} // namespace storekit::jws

#endif // JWS_COMPACT_TOKEN_HH
