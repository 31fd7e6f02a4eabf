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

#include "TrustedRootSet.hh"

#include <algorithm>

#include <openssl/x509_vfy.h>

namespace storekit::jws
{
  Result<void> TrustedRootSet::load(const std::vector<std::string> &root_certificates)
  {
    if (root_certificates.empty())
      {
        logger_->error("No root certificates configured");
        return VerificationError(VerificationErrc::InvalidRootCertificate, "no root certificates");
      }

    std::vector<Certificate> roots;
    for (size_t i = 0; i < root_certificates.size(); ++i)
      {
        auto cert_result = Certificate::from_bytes(root_certificates[i]);
        if (!cert_result)
          {
            logger_->error("Invalid root certificate {}", i);
            return VerificationError::at_index(VerificationErrc::InvalidRootCertificate, i, "root certificate does not parse");
          }
        roots.emplace_back(std::move(cert_result.value()));
      }

    root_certificates_ = std::move(roots);
    return init_root_store();
  }

  Result<void> TrustedRootSet::init_root_store()
  {
    std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)> store(X509_STORE_new(), X509_STORE_free);
    if (!store)
      {
        logger_->error("Failed to create certificate store");
        return VerificationError(VerificationErrc::SystemError, "X509_STORE_new failed");
      }

    // Validity windows are checked against the configured clock by the chain validator.
    X509_STORE_set_flags(store.get(), X509_V_FLAG_NO_CHECK_TIME);

    for (const auto &root_cert: root_certificates_)
      {
        if (X509_STORE_add_cert(store.get(), root_cert.get()) != 1)
          {
            logger_->warn("Failed to add root certificate to store, may be duplicate");
          }
      }
    root_store_ = std::move(store);
    logger_->debug("Loaded {} trusted root certificates", root_certificates_.size());
    return outcome::success();
  }

  bool TrustedRootSet::contains(const Certificate &cert) const
  {
    return std::any_of(root_certificates_.begin(), root_certificates_.end(), [&cert](const auto &root) { return root == cert; });
  }

  const Certificate *TrustedRootSet::find_anchor(const Certificate &cert) const
  {
    for (const auto &root: root_certificates_)
      {
        if (root == cert)
          {
            return &root;
          }
      }
    for (const auto &root: root_certificates_)
      {
        if (cert.is_issued_by(root))
          {
            return &root;
          }
      }
    return nullptr;
  }

  X509_STORE *TrustedRootSet::store() const
  {
    return root_store_.get();
  }

  size_t TrustedRootSet::size() const
  {
    return root_certificates_.size();
  }

} // namespace storekit::jws
