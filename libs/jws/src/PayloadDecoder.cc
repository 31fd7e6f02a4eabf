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

#include "PayloadDecoder.hh"

#include <optional>
#include <utility>
#include <variant>

#include "utils/Base64.hh"
#include "JsonUtils.hh"

namespace storekit::jws
{
  namespace
  {
    bool has(const boost::json::object &obj, const char *key)
    {
      return obj.contains(key);
    }
  } // namespace

  PayloadDecoder::PayloadDecoder(NestedVerifier nested_verifier)
    : nested_verifier_(std::move(nested_verifier))
  {
  }

  Result<DecodedPayload> PayloadDecoder::decode(const std::string &payload_segment) const
  {
    std::string payload_json;
    try
      {
        payload_json = storekit::utils::Base64::decode_url(payload_segment);
      }
    catch (const storekit::utils::Base64Exception &e)
      {
        logger_->error("Failed to decode payload: {}", e.what());
        return VerificationError(VerificationErrc::MalformedPayload, "payload is not base64url");
      }

    auto obj = JsonUtils::parse_object(payload_json);
    if (!obj)
      {
        logger_->error("Failed to parse payload: {}", obj.error().message);
        return obj.error();
      }
    return decode(obj.value());
  }

  Result<DecodedPayload> PayloadDecoder::decode(const boost::json::object &payload) const
  {
    if (has(payload, "notificationType"))
      {
        auto rc = decode_notification(payload);
        if (!rc)
          {
            return rc.error();
          }
        return DecodedPayload(std::move(rc.value()));
      }

    if (has(payload, "receiptType")
        || (has(payload, "applicationVersion") && (has(payload, "appAppleId") || has(payload, "bundleId"))
            && !has(payload, "transactionId")))
      {
        auto rc = decode_app_transaction(payload);
        if (!rc)
          {
            return rc.error();
          }
        return DecodedPayload(std::move(rc.value()));
      }

    if (has(payload, "autoRenewProductId") || has(payload, "autoRenewStatus"))
      {
        auto rc = decode_renewal_info(payload);
        if (!rc)
          {
            return rc.error();
          }
        return DecodedPayload(std::move(rc.value()));
      }

    if (has(payload, "transactionId") || has(payload, "originalTransactionId"))
      {
        auto rc = decode_transaction(payload);
        if (!rc)
          {
            return rc.error();
          }
        return DecodedPayload(std::move(rc.value()));
      }

    logger_->info("Payload has no known discriminator, returning it undecoded");
    return DecodedPayload(UnknownPayload{payload});
  }

  Result<TransactionInfo> PayloadDecoder::decode_transaction(const boost::json::object &payload) const
  {
    TransactionInfo info;
    JsonUtils json(payload);
    json.read("originalTransactionId", info.original_transaction_id)
      .read("transactionId", info.transaction_id)
      .read("webOrderLineItemId", info.web_order_line_item_id)
      .read("bundleId", info.bundle_id)
      .read("productId", info.product_id)
      .read("subscriptionGroupIdentifier", info.subscription_group_identifier)
      .read("purchaseDate", info.purchase_date)
      .read("originalPurchaseDate", info.original_purchase_date)
      .read("expiresDate", info.expires_date)
      .read("quantity", info.quantity)
      .read("type", info.type)
      .read("appAccountToken", info.app_account_token)
      .read("inAppOwnershipType", info.in_app_ownership_type)
      .read("signedDate", info.signed_date)
      .read("revocationReason", info.revocation_reason)
      .read("revocationDate", info.revocation_date)
      .read("isUpgraded", info.is_upgraded)
      .read("offerType", info.offer_type)
      .read("offerIdentifier", info.offer_identifier)
      .read("environment", info.environment)
      .read("storefront", info.storefront)
      .read("storefrontId", info.storefront_id)
      .read("transactionReason", info.transaction_reason)
      .read("currency", info.currency)
      .read("price", info.price)
      .read("offerDiscountType", info.offer_discount_type)
      .read("appTransactionId", info.app_transaction_id)
      .read("offerPeriod", info.offer_period);
    if (!json.ok())
      {
        return json.error();
      }

    info.raw = payload;
    return info;
  }

  Result<RenewalInfo> PayloadDecoder::decode_renewal_info(const boost::json::object &payload) const
  {
    RenewalInfo info;
    JsonUtils json(payload);
    json.read("expirationIntent", info.expiration_intent)
      .read("originalTransactionId", info.original_transaction_id)
      .read("autoRenewProductId", info.auto_renew_product_id)
      .read("productId", info.product_id)
      .read("autoRenewStatus", info.auto_renew_status)
      .read("isInBillingRetryPeriod", info.is_in_billing_retry_period)
      .read("priceIncreaseStatus", info.price_increase_status)
      .read("gracePeriodExpiresDate", info.grace_period_expires_date)
      .read("offerType", info.offer_type)
      .read("offerIdentifier", info.offer_identifier)
      .read("signedDate", info.signed_date)
      .read("environment", info.environment)
      .read("recentSubscriptionStartDate", info.recent_subscription_start_date)
      .read("renewalDate", info.renewal_date)
      .read("currency", info.currency)
      .read("renewalPrice", info.renewal_price)
      .read("offerDiscountType", info.offer_discount_type)
      .read("eligibleWinBackOfferIds", info.eligible_win_back_offer_ids)
      .read("appAccountToken", info.app_account_token)
      .read("appTransactionId", info.app_transaction_id)
      .read("offerPeriod", info.offer_period);
    if (!json.ok())
      {
        return json.error();
      }

    info.raw = payload;
    return info;
  }

  Result<AppTransaction> PayloadDecoder::decode_app_transaction(const boost::json::object &payload) const
  {
    AppTransaction info;
    JsonUtils json(payload);
    json.read("receiptType", info.receipt_type)
      .read("appAppleId", info.app_apple_id)
      .read("bundleId", info.bundle_id)
      .read("applicationVersion", info.application_version)
      .read("versionExternalIdentifier", info.version_external_identifier)
      .read("receiptCreationDate", info.receipt_creation_date)
      .read("originalPurchaseDate", info.original_purchase_date)
      .read("originalApplicationVersion", info.original_application_version)
      .read("deviceVerification", info.device_verification)
      .read("deviceVerificationNonce", info.device_verification_nonce)
      .read("preorderDate", info.preorder_date)
      .read("signedDate", info.signed_date)
      .read("appTransactionId", info.app_transaction_id)
      .read("originalPlatform", info.original_platform);
    if (!json.ok())
      {
        return json.error();
      }

    info.raw = payload;
    return info;
  }

  Result<NotificationEnvelope> PayloadDecoder::decode_notification(const boost::json::object &payload) const
  {
    NotificationEnvelope envelope;
    JsonUtils json(payload);

    std::optional<std::string> notification_type;
    json.read("notificationType", notification_type)
      .read("subtype", envelope.subtype)
      .read("notificationUUID", envelope.notification_uuid)
      .read("version", envelope.version)
      .read("signedDate", envelope.signed_date);
    if (!json.ok())
      {
        return json.error();
      }
    if (!notification_type)
      {
        return VerificationError::for_field(VerificationErrc::MalformedPayload, "notificationType", "missing");
      }
    envelope.notification_type = std::move(*notification_type);

    if (const auto *data_obj = json.read_object("data"); data_obj != nullptr)
      {
        NotificationData data;
        JsonUtils data_json(*data_obj, "data");
        data_json.read("environment", data.environment)
          .read("appAppleId", data.app_apple_id)
          .read("bundleId", data.bundle_id)
          .read("bundleVersion", data.bundle_version)
          .read("signedTransactionInfo", data.signed_transaction_info)
          .read("signedRenewalInfo", data.signed_renewal_info)
          .read("status", data.status)
          .read("consumptionRequestReason", data.consumption_request_reason);
        if (!data_json.ok())
          {
            return data_json.error();
          }
        envelope.data = std::move(data);
      }

    if (const auto *summary_obj = json.read_object("summary"); summary_obj != nullptr)
      {
        NotificationSummary summary;
        JsonUtils summary_json(*summary_obj, "summary");
        summary_json.read("environment", summary.environment)
          .read("appAppleId", summary.app_apple_id)
          .read("bundleId", summary.bundle_id)
          .read("productId", summary.product_id)
          .read("requestIdentifier", summary.request_identifier)
          .read("storefrontCountryCodes", summary.storefront_country_codes)
          .read("succeededCount", summary.succeeded_count)
          .read("failedCount", summary.failed_count);
        if (!summary_json.ok())
          {
            return summary_json.error();
          }
        envelope.summary = std::move(summary);
      }

    if (const auto *token_obj = json.read_object("externalPurchaseToken"); token_obj != nullptr)
      {
        ExternalPurchaseToken token;
        JsonUtils token_json(*token_obj, "externalPurchaseToken");
        token_json.read("externalPurchaseId", token.external_purchase_id)
          .read("tokenCreationDate", token.token_creation_date)
          .read("appAppleId", token.app_apple_id)
          .read("bundleId", token.bundle_id);
        if (!token_json.ok())
          {
            return token_json.error();
          }
        envelope.external_purchase_token = std::move(token);
      }

    if (!json.ok())
      {
        return json.error();
      }

    if (envelope.data)
      {
        auto rc = decode_nested(*envelope.data);
        if (!rc)
          {
            return rc.error();
          }
      }

    envelope.raw = payload;
    logger_->debug("Decoded notification {} ({})", envelope.notification_type, envelope.subtype.value_or("no subtype"));
    return envelope;
  }

  Result<void> PayloadDecoder::decode_nested(NotificationData &data) const
  {
    if (data.signed_transaction_info)
      {
        logger_->debug("Verifying nested signed transaction");
        auto nested = nested_verifier_(*data.signed_transaction_info);
        if (!nested)
          {
            logger_->error("Nested signed transaction failed verification: {}", nested.error().to_string());
            return nested.error();
          }

        auto *transaction = std::get_if<TransactionInfo>(&nested.value());
        if (transaction == nullptr)
          {
            return VerificationError::for_field(VerificationErrc::MalformedPayload,
                                                "data.signedTransactionInfo",
                                                "nested token is not a transaction");
          }

        if (transaction->bundle_id && data.bundle_id && *transaction->bundle_id != *data.bundle_id)
          {
            logger_->error("Nested transaction bundle id '{}' differs from notification '{}'", *transaction->bundle_id, *data.bundle_id);
            return VerificationError::for_field(VerificationErrc::InvalidBundleId,
                                                "data.signedTransactionInfo",
                                                "nested transaction belongs to another bundle");
          }

        if (transaction->environment && data.environment && *transaction->environment != *data.environment)
          {
            logger_->error("Nested transaction environment '{}' differs from notification '{}'",
                           *transaction->environment,
                           *data.environment);
            return VerificationError::for_field(VerificationErrc::InvalidEnvironment,
                                                "data.signedTransactionInfo",
                                                "nested transaction belongs to another environment");
          }
        data.transaction = std::move(*transaction);
      }

    if (data.signed_renewal_info)
      {
        logger_->debug("Verifying nested signed renewal info");
        auto nested = nested_verifier_(*data.signed_renewal_info);
        if (!nested)
          {
            logger_->error("Nested signed renewal info failed verification: {}", nested.error().to_string());
            return nested.error();
          }

        auto *renewal = std::get_if<RenewalInfo>(&nested.value());
        if (renewal == nullptr)
          {
            return VerificationError::for_field(VerificationErrc::MalformedPayload,
                                                "data.signedRenewalInfo",
                                                "nested token is not renewal info");
          }

        if (renewal->environment && data.environment && *renewal->environment != *data.environment)
          {
            logger_->error("Nested renewal info environment '{}' differs from notification '{}'",
                           *renewal->environment,
                           *data.environment);
            return VerificationError::for_field(VerificationErrc::InvalidEnvironment,
                                                "data.signedRenewalInfo",
                                                "nested renewal info belongs to another environment");
          }
        data.renewal = std::move(*renewal);
      }
    return outcome::success();
  }

} // namespace storekit::jws
