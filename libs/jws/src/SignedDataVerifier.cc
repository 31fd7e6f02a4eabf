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

#include "jws/SignedDataVerifier.hh"

#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "utils/Logging.hh"
#include "ChainValidator.hh"
#include "CompactToken.hh"
#include "JwsSignatureVerifier.hh"
#include "PayloadDecoder.hh"
#include "RevocationChecker.hh"
#include "ScopeValidator.hh"
#include "TrustedRootSet.hh"

namespace storekit::jws
{
  class SignedDataVerifier::Impl
  {
  public:
    Impl(VerifierOptions options, std::shared_ptr<IRevocationTransport> revocation_transport)
      : options_(std::move(options))
      , chain_validator_(roots_, options_.enable_strict_checks)
      , payload_decoder_([this](const std::string &token) { return verify_token(token); })
      , scope_validator_(options_.environment, options_.bundle_id, options_.app_apple_id)
    {
      if (!options_.time_source)
        {
          options_.time_source = []() { return std::chrono::system_clock::now(); };
        }

      if (options_.enable_revocation_check && !is_local_environment())
        {
          if (!revocation_transport)
            {
              revocation_transport = std::make_shared<HttpRevocationTransport>();
            }
          revocation_checker_ = std::make_unique<RevocationChecker>(roots_,
                                                                    std::move(revocation_transport),
                                                                    options_.revocation_failure_policy,
                                                                    options_.revocation_timeout);
        }
    }

    Result<void> load_roots(const std::vector<std::string> &root_certificates)
    {
      return roots_.load(root_certificates);
    }

    const VerifierOptions &options() const
    {
      return options_;
    }

    bool is_local_environment() const
    {
      return options_.environment == Environment::Xcode || options_.environment == Environment::LocalTesting;
    }

    // Parse, chain, revocation, signature and payload stages. Nested tokens
    // re-enter here.
    Result<DecodedPayload> verify_token(std::string_view text) const
    {
      auto token = CompactToken::parse(text, !is_local_environment());
      if (!token)
        {
          return token.error();
        }

      if (is_local_environment())
        {
          logger_->debug("Skipping chain and signature verification in {} environment", options_.environment);
          return payload_decoder_.decode(token.value().payload_segment);
        }

      auto chain = chain_validator_.validate(token.value().certificate_chain, options_.time_source());
      if (!chain)
        {
          return chain.error();
        }

      if (revocation_checker_)
        {
          auto rc = revocation_checker_->check(chain.value());
          if (!rc)
            {
              return rc.error();
            }
        }

      auto rc = signature_verifier_.verify(token.value(), chain.value().certificates.front());
      if (!rc)
        {
          return rc.error();
        }

      return payload_decoder_.decode(token.value().payload_segment);
    }

    Result<DecodedPayload> verify_and_decode(std::string_view text) const
    {
      auto payload = verify_token(text);
      if (!payload)
        {
          logger_->warn("Token verification failed: {}", payload.error().to_string());
          return payload.error();
        }

      auto rc = scope_validator_.validate(payload.value());
      if (!rc)
        {
          logger_->warn("Token scope check failed: {}", rc.error().to_string());
          return rc.error();
        }

      logger_->info("Verified {} token", payload_kind_name(payload.value()));
      return payload;
    }

    template<typename T>
    Result<T> verify_and_decode_as(std::string_view text, const char *expected) const
    {
      auto payload = verify_token(text);
      if (!payload)
        {
          logger_->warn("Token verification failed: {}", payload.error().to_string());
          return payload.error();
        }

      auto *typed = std::get_if<T>(&payload.value());
      if (typed == nullptr)
        {
          logger_->warn("Token payload is a {}, expected {}", payload_kind_name(payload.value()), expected);
          return VerificationError(VerificationErrc::MalformedPayload,
                                   std::string("payload is not a ") + expected);
        }

      auto rc = scope_validator_.validate(*typed);
      if (!rc)
        {
          logger_->warn("Token scope check failed: {}", rc.error().to_string());
          return rc.error();
        }

      logger_->info("Verified {} token", expected);
      return std::move(*typed);
    }

  private:
    VerifierOptions options_;
    TrustedRootSet roots_;
    ChainValidator chain_validator_;
    std::unique_ptr<RevocationChecker> revocation_checker_;
    JwsSignatureVerifier signature_verifier_;
    PayloadDecoder payload_decoder_;
    ScopeValidator scope_validator_;
    std::shared_ptr<spdlog::logger> logger_{storekit::utils::Logging::create("storekit:jws:verifier")};
  };

  SignedDataVerifier::SignedDataVerifier(std::unique_ptr<Impl> impl)
    : pimpl(std::move(impl))
  {
  }

  SignedDataVerifier::~SignedDataVerifier() = default;
  SignedDataVerifier::SignedDataVerifier(SignedDataVerifier &&) noexcept = default;
  SignedDataVerifier &SignedDataVerifier::operator=(SignedDataVerifier &&) noexcept = default;

  outcome::std_result<SignedDataVerifier> SignedDataVerifier::create(const std::vector<std::string> &root_certificates,
                                                                     Environment environment,
                                                                     std::string bundle_id,
                                                                     std::optional<std::int64_t> app_apple_id,
                                                                     bool enable_revocation_check)
  {
    VerifierOptions options;
    options.environment = environment;
    options.bundle_id = std::move(bundle_id);
    options.app_apple_id = app_apple_id;
    options.enable_revocation_check = enable_revocation_check;
    return create(root_certificates, std::move(options));
  }

  outcome::std_result<SignedDataVerifier> SignedDataVerifier::create(const std::vector<std::string> &root_certificates,
                                                                     VerifierOptions options)
  {
    return create(root_certificates, std::move(options), nullptr);
  }

  outcome::std_result<SignedDataVerifier> SignedDataVerifier::create(const std::vector<std::string> &root_certificates,
                                                                     VerifierOptions options,
                                                                     std::shared_ptr<IRevocationTransport> revocation_transport)
  {
    auto logger = storekit::utils::Logging::create("storekit:jws:verifier");

    auto impl = std::make_unique<Impl>(std::move(options), std::move(revocation_transport));
    auto rc = impl->load_roots(root_certificates);
    if (!rc)
      {
        logger->error("Failed to load trusted roots: {}", rc.error().to_string());
        return rc.error().code();
      }

    logger->info("Created verifier for '{}' in {} environment (revocation check {})",
                 impl->options().bundle_id,
                 impl->options().environment,
                 impl->options().enable_revocation_check ? "enabled" : "disabled");
    return SignedDataVerifier(std::move(impl));
  }

  Result<NotificationEnvelope> SignedDataVerifier::verify_and_decode_notification(std::string_view token) const
  {
    return pimpl->verify_and_decode_as<NotificationEnvelope>(token, "notification");
  }

  Result<TransactionInfo> SignedDataVerifier::verify_and_decode_transaction(std::string_view token) const
  {
    return pimpl->verify_and_decode_as<TransactionInfo>(token, "transaction");
  }

  Result<RenewalInfo> SignedDataVerifier::verify_and_decode_renewal_info(std::string_view token) const
  {
    return pimpl->verify_and_decode_as<RenewalInfo>(token, "renewal");
  }

  Result<AppTransaction> SignedDataVerifier::verify_and_decode_app_transaction(std::string_view token) const
  {
    return pimpl->verify_and_decode_as<AppTransaction>(token, "app-transaction");
  }

  Result<DecodedPayload> SignedDataVerifier::verify_and_decode(std::string_view token) const
  {
    return pimpl->verify_and_decode(token);
  }

  const VerifierOptions &SignedDataVerifier::options() const
  {
    return pimpl->options();
  }

} // namespace storekit::jws
