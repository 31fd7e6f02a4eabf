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

#ifndef JWS_TRUSTED_ROOT_SET_HH
#define JWS_TRUSTED_ROOT_SET_HH

#include <string>
#include <vector>
#include <memory>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>

#include "jws/VerificationErrors.hh"
#include "Certificate.hh"
#include "utils/Logging.hh"

namespace storekit::jws
{
  class TrustedRootSet
  {
  public:
    TrustedRootSet() = default;
    ~TrustedRootSet() = default;

    TrustedRootSet(const TrustedRootSet &) = delete;
    TrustedRootSet &operator=(const TrustedRootSet &) = delete;
    TrustedRootSet(TrustedRootSet &&) noexcept = default;
    TrustedRootSet &operator=(TrustedRootSet &&) noexcept = default;

    Result<void> load(const std::vector<std::string> &root_certificates);

    bool contains(const Certificate &cert) const;

    // Trusted root that equals `cert` or issued it, nullptr if none.
    const Certificate *find_anchor(const Certificate &cert) const;

    X509_STORE *store() const;
    size_t size() const;

  private:
    Result<void> init_root_store();

  private:
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:roots")};
    std::vector<Certificate> root_certificates_;
    std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)> root_store_{nullptr, X509_STORE_free};
  };

} // namespace storekit::jws

#endif // JWS_TRUSTED_ROOT_SET_HH
