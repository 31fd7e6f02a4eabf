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

#include "CompactToken.hh"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "utils/Base64.hh"
#include "utils/Logging.hh"

namespace storekit::jws
{
  namespace
  {
    constexpr size_t segment_count = 3;

    bool is_base64url_segment(std::string_view segment)
    {
      if (segment.empty())
        {
          return false;
        }
      return std::all_of(segment.begin(), segment.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_' || c == '=';
      });
    }

    std::vector<std::string_view> split_segments(std::string_view token)
    {
      std::vector<std::string_view> segments;
      size_t start = 0;
      while (true)
        {
          size_t pos = token.find('.', start);
          if (pos == std::string_view::npos)
            {
              segments.push_back(token.substr(start));
              break;
            }
          segments.push_back(token.substr(start, pos - start));
          start = pos + 1;
        }
      return segments;
    }

    Result<void> decode_chain(const boost::json::array &chain, std::vector<std::string> &certificates)
    {
      for (size_t i = 0; i < chain.size(); ++i)
        {
          if (!chain[i].is_string())
            {
              return VerificationError::at_index(VerificationErrc::InvalidCertificateEncoding, i, "x5c entry is not a string");
            }
          try
            {
              std::string der = storekit::utils::Base64::decode(std::string(chain[i].as_string()));
              if (der.empty())
                {
                  return VerificationError::at_index(VerificationErrc::InvalidCertificateEncoding, i, "empty x5c entry");
                }
              certificates.emplace_back(std::move(der));
            }
          catch (const storekit::utils::Base64Exception &e)
            {
              return VerificationError::at_index(VerificationErrc::InvalidCertificateEncoding, i, e.what());
            }
        }
      return outcome::success();
    }
  } // namespace

  std::string CompactToken::signing_input() const
  {
    return header_segment + "." + payload_segment;
  }

  Result<CompactToken> CompactToken::parse(std::string_view token, bool require_chain)
  {
    auto logger = storekit::utils::Logging::create("storekit:jws:token");

    auto segments = split_segments(token);
    if (segments.size() != segment_count)
      {
        logger->error("Token has {} segments, expected {}", segments.size(), segment_count);
        return VerificationError(VerificationErrc::MalformedToken, "expected three dot-separated segments");
      }

    for (const auto &segment: segments)
      {
        if (!is_base64url_segment(segment))
          {
            logger->error("Token segment is empty or not base64url");
            return VerificationError(VerificationErrc::MalformedToken, "segment is empty or not base64url");
          }
      }

    CompactToken result;
    result.header_segment = std::string(segments[0]);
    result.payload_segment = std::string(segments[1]);
    result.signature_segment = std::string(segments[2]);

    try
      {
        std::string header_json = storekit::utils::Base64::decode_url(result.header_segment);
        boost::json::value header = boost::json::parse(header_json);
        if (!header.is_object())
          {
            logger->error("Token header is not a JSON object");
            return VerificationError(VerificationErrc::MalformedToken, "header is not a JSON object");
          }
        result.header = header.as_object();
      }
    catch (const storekit::utils::Base64Exception &e)
      {
        logger->error("Failed to decode token header: {}", e.what());
        return VerificationError(VerificationErrc::MalformedToken, "header is not base64url");
      }
    catch (const boost::system::system_error &e)
      {
        logger->error("Failed to parse token header: {}", e.what());
        return VerificationError(VerificationErrc::MalformedToken, "header is not valid JSON");
      }

    const auto *alg = result.header.if_contains("alg");
    if (alg == nullptr || !alg->is_string())
      {
        logger->error("Token header has no algorithm");
        return VerificationError(VerificationErrc::MalformedToken, "header has no alg");
      }
    result.algorithm = std::string(alg->as_string());

    const auto *x5c = result.header.if_contains("x5c");
    if (!require_chain && x5c == nullptr)
      {
        logger->debug("Token without certificate chain accepted");
      }
    else if (x5c == nullptr || !x5c->is_array() || x5c->as_array().empty())
      {
        logger->error("Token header has no certificate chain");
        return VerificationError(VerificationErrc::MissingCertificateChain, "header has no x5c chain");
      }

    if (x5c != nullptr)
      {
        auto rc = decode_chain(x5c->as_array(), result.certificate_chain);
        if (!rc)
          {
            logger->error("Failed to decode certificate chain: {}", rc.error().to_string());
            return rc.error();
          }
      }

    try
      {
        result.signature = storekit::utils::Base64::decode_url(result.signature_segment);
      }
    catch (const storekit::utils::Base64Exception &e)
      {
        logger->error("Failed to decode token signature: {}", e.what());
        return VerificationError(VerificationErrc::InvalidSignature, "signature is not canonical base64url");
      }

    logger->debug("Parsed token with algorithm {} and {} certificates", result.algorithm, result.certificate_chain.size());
    return std::move(result);
  }

} // namespace storekit::jws
