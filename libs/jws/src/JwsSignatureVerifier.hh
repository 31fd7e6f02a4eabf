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

#ifndef JWS_SIGNATURE_VERIFIER_HH
#define JWS_SIGNATURE_VERIFIER_HH

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

#include "jws/VerificationErrors.hh"
#include "utils/Logging.hh"
#include "CryptographicAlgorithms.hh"

namespace storekit::jws
{
  class Certificate;
  class PublicKey;
  struct CompactToken;

  class JwsSignatureVerifier
  {
  public:
    struct Algorithm
    {
      std::string_view name;
      DigestAlgorithm digest;
      int curve_nid;
      size_t component_size;
    };

    static std::optional<Algorithm> find_algorithm(std::string_view name);

    Result<void> verify(const CompactToken &token, const Certificate &leaf) const;
    Result<void> verify(const std::string &signing_input,
                        const std::string &signature,
                        std::string_view algorithm,
                        const PublicKey &key) const;

    // Converts a fixed-size r||s signature into a DER encoded ECDSA-Sig-Value.
    static Result<std::string> raw_to_der(const std::string &raw_signature, size_t component_size);

  private:
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:signature")};
  };

} // namespace storekit::jws

#endif // JWS_SIGNATURE_VERIFIER_HH
