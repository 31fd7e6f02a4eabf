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

#ifndef JWS_PUBLICKEY_HH
#define JWS_PUBLICKEY_HH

#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>
#include <openssl/evp.h>

#include "utils/Logging.hh"
#include "CryptographicAlgorithms.hh"

namespace outcome = boost::outcome_v2;

namespace storekit::jws
{
  class PublicKey
  {
  private:
    struct EVPKeyDeleter
    {
      void operator()(EVP_PKEY *key) const
      {
        if (key != nullptr)
          {
            EVP_PKEY_free(key);
          }
      }
    };

  public:
    explicit PublicKey(std::unique_ptr<EVP_PKEY, EVPKeyDeleter> evp_key);
    PublicKey() = delete;
    PublicKey(PublicKey &&other) noexcept = default;
    PublicKey &operator=(PublicKey &&other) noexcept = default;
    PublicKey(const PublicKey &) = delete;
    PublicKey &operator=(const PublicKey &) = delete;
    ~PublicKey() = default;

    static outcome::std_result<PublicKey> from_pem(const std::string &key_pem);
    static outcome::std_result<PublicKey> from_der(const std::string &key_der);

    // Takes ownership of evp_key.
    static outcome::std_result<PublicKey> from_evp_key(EVP_PKEY *evp_key);

    EVP_PKEY *get() const;
    KeyAlgorithm get_algorithm() const;

    // NID of the named curve of an EC key, NID_undef otherwise.
    int get_curve_nid() const;

    // `signature` is DER encoded for ECDSA keys.
    outcome::std_result<bool> verify_signature(const std::string &data,
                                               const std::string &signature,
                                               DigestAlgorithm digest_algorithm = DigestAlgorithm::SHA256) const;

  private:
    std::unique_ptr<EVP_PKEY, EVPKeyDeleter> evp_key_{nullptr};
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:publickey")};
  };

} // namespace storekit::jws

#endif // JWS_PUBLICKEY_HH
