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

#ifndef JWS_PAYLOADS_HH
#define JWS_PAYLOADS_HH

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <boost/json.hpp>

#include "utils/Enum.hh"

namespace storekit::jws
{
  // Timestamps are milliseconds since the Unix epoch. Every payload keeps the
  // decoded JSON object in `raw` so that fields not modelled here remain
  // reachable.

  struct TransactionInfo
  {
    std::optional<std::string> original_transaction_id;
    std::optional<std::string> transaction_id;
    std::optional<std::string> web_order_line_item_id;
    std::optional<std::string> bundle_id;
    std::optional<std::string> product_id;
    std::optional<std::string> subscription_group_identifier;
    std::optional<std::int64_t> purchase_date;
    std::optional<std::int64_t> original_purchase_date;
    std::optional<std::int64_t> expires_date;
    std::optional<std::int64_t> quantity;
    std::optional<std::string> type;
    std::optional<std::string> app_account_token;
    std::optional<std::string> in_app_ownership_type;
    std::optional<std::int64_t> signed_date;
    std::optional<std::int64_t> revocation_reason;
    std::optional<std::int64_t> revocation_date;
    std::optional<bool> is_upgraded;
    std::optional<std::int64_t> offer_type;
    std::optional<std::string> offer_identifier;
    std::optional<std::string> environment;
    std::optional<std::string> storefront;
    std::optional<std::string> storefront_id;
    std::optional<std::string> transaction_reason;
    std::optional<std::string> currency;
    std::optional<std::int64_t> price;
    std::optional<std::string> offer_discount_type;
    std::optional<std::string> app_transaction_id;
    std::optional<std::string> offer_period;

    boost::json::object raw;
  };

  struct RenewalInfo
  {
    std::optional<std::int64_t> expiration_intent;
    std::optional<std::string> original_transaction_id;
    std::optional<std::string> auto_renew_product_id;
    std::optional<std::string> product_id;
    std::optional<std::int64_t> auto_renew_status;
    std::optional<bool> is_in_billing_retry_period;
    std::optional<std::int64_t> price_increase_status;
    std::optional<std::int64_t> grace_period_expires_date;
    std::optional<std::int64_t> offer_type;
    std::optional<std::string> offer_identifier;
    std::optional<std::int64_t> signed_date;
    std::optional<std::string> environment;
    std::optional<std::int64_t> recent_subscription_start_date;
    std::optional<std::int64_t> renewal_date;
    std::optional<std::string> currency;
    std::optional<std::int64_t> renewal_price;
    std::optional<std::string> offer_discount_type;
    std::optional<std::vector<std::string>> eligible_win_back_offer_ids;
    std::optional<std::string> app_account_token;
    std::optional<std::string> app_transaction_id;
    std::optional<std::string> offer_period;

    boost::json::object raw;
  };

  struct AppTransaction
  {
    std::optional<std::string> receipt_type;
    std::optional<std::int64_t> app_apple_id;
    std::optional<std::string> bundle_id;
    std::optional<std::string> application_version;
    std::optional<std::int64_t> version_external_identifier;
    std::optional<std::int64_t> receipt_creation_date;
    std::optional<std::int64_t> original_purchase_date;
    std::optional<std::string> original_application_version;
    std::optional<std::string> device_verification;
    std::optional<std::string> device_verification_nonce;
    std::optional<std::int64_t> preorder_date;
    std::optional<std::int64_t> signed_date;
    std::optional<std::string> app_transaction_id;
    std::optional<std::string> original_platform;

    boost::json::object raw;
  };

  enum class NotificationType
  {
    Unknown,
    Subscribed,
    DidChangeRenewalPref,
    DidChangeRenewalStatus,
    OfferRedeemed,
    DidRenew,
    Expired,
    DidFailToRenew,
    GracePeriodExpired,
    PriceIncrease,
    Refund,
    RefundDeclined,
    ConsumptionRequest,
    RenewalExtended,
    Revoke,
    Test,
    RenewalExtension,
    RefundReversed,
    ExternalPurchaseToken
  };

  enum class NotificationSubtype
  {
    Unknown,
    InitialBuy,
    Resubscribe,
    Downgrade,
    Upgrade,
    AutoRenewEnabled,
    AutoRenewDisabled,
    Voluntary,
    BillingRetry,
    PriceIncrease,
    GracePeriod,
    Pending,
    Accepted,
    BillingRecovery,
    ProductNotForSale,
    Summary,
    Failure,
    Unreported
  };

  struct NotificationData
  {
    std::optional<std::string> environment;
    std::optional<std::int64_t> app_apple_id;
    std::optional<std::string> bundle_id;
    std::optional<std::string> bundle_version;
    std::optional<std::string> signed_transaction_info;
    std::optional<std::string> signed_renewal_info;
    std::optional<std::int64_t> status;
    std::optional<std::string> consumption_request_reason;

    // Verified contents of the nested signed tokens.
    std::optional<TransactionInfo> transaction;
    std::optional<RenewalInfo> renewal;
  };

  struct NotificationSummary
  {
    std::optional<std::string> environment;
    std::optional<std::int64_t> app_apple_id;
    std::optional<std::string> bundle_id;
    std::optional<std::string> product_id;
    std::optional<std::string> request_identifier;
    std::optional<std::vector<std::string>> storefront_country_codes;
    std::optional<std::int64_t> succeeded_count;
    std::optional<std::int64_t> failed_count;
  };

  struct ExternalPurchaseToken
  {
    std::optional<std::string> external_purchase_id;
    std::optional<std::int64_t> token_creation_date;
    std::optional<std::int64_t> app_apple_id;
    std::optional<std::string> bundle_id;

    bool is_sandbox() const;
  };

  struct NotificationEnvelope
  {
    std::string notification_type;
    std::optional<std::string> subtype;
    std::optional<std::string> notification_uuid;
    std::optional<std::string> version;
    std::optional<std::int64_t> signed_date;
    std::optional<NotificationData> data;
    std::optional<NotificationSummary> summary;
    std::optional<ExternalPurchaseToken> external_purchase_token;

    boost::json::object raw;

    NotificationType type() const;
    NotificationSubtype subtype_value() const;
  };

  struct UnknownPayload
  {
    boost::json::object raw;
  };

  using DecodedPayload = std::variant<NotificationEnvelope, TransactionInfo, RenewalInfo, AppTransaction, UnknownPayload>;

  std::string_view payload_kind_name(const DecodedPayload &payload);

} // namespace storekit::jws

template<>
struct storekit::utils::enum_traits<storekit::jws::NotificationType>
{
  using T = storekit::jws::NotificationType;

  static constexpr auto invalid = T::Unknown;

  static constexpr std::array<std::pair<std::string_view, storekit::jws::NotificationType>, 18> names{
    {{"SUBSCRIBED", T::Subscribed},
     {"DID_CHANGE_RENEWAL_PREF", T::DidChangeRenewalPref},
     {"DID_CHANGE_RENEWAL_STATUS", T::DidChangeRenewalStatus},
     {"OFFER_REDEEMED", T::OfferRedeemed},
     {"DID_RENEW", T::DidRenew},
     {"EXPIRED", T::Expired},
     {"DID_FAIL_TO_RENEW", T::DidFailToRenew},
     {"GRACE_PERIOD_EXPIRED", T::GracePeriodExpired},
     {"PRICE_INCREASE", T::PriceIncrease},
     {"REFUND", T::Refund},
     {"REFUND_DECLINED", T::RefundDeclined},
     {"CONSUMPTION_REQUEST", T::ConsumptionRequest},
     {"RENEWAL_EXTENDED", T::RenewalExtended},
     {"REVOKE", T::Revoke},
     {"TEST", T::Test},
     {"RENEWAL_EXTENSION", T::RenewalExtension},
     {"REFUND_REVERSED", T::RefundReversed},
     {"EXTERNAL_PURCHASE_TOKEN", T::ExternalPurchaseToken}}};
};

template<>
struct storekit::utils::enum_traits<storekit::jws::NotificationSubtype>
{
  using T = storekit::jws::NotificationSubtype;

  static constexpr auto invalid = T::Unknown;

  static constexpr std::array<std::pair<std::string_view, storekit::jws::NotificationSubtype>, 17> names{
    {{"INITIAL_BUY", T::InitialBuy},
     {"RESUBSCRIBE", T::Resubscribe},
     {"DOWNGRADE", T::Downgrade},
     {"UPGRADE", T::Upgrade},
     {"AUTO_RENEW_ENABLED", T::AutoRenewEnabled},
     {"AUTO_RENEW_DISABLED", T::AutoRenewDisabled},
     {"VOLUNTARY", T::Voluntary},
     {"BILLING_RETRY", T::BillingRetry},
     {"PRICE_INCREASE", T::PriceIncrease},
     {"GRACE_PERIOD", T::GracePeriod},
     {"PENDING", T::Pending},
     {"ACCEPTED", T::Accepted},
     {"BILLING_RECOVERY", T::BillingRecovery},
     {"PRODUCT_NOT_FOR_SALE", T::ProductNotForSale},
     {"SUMMARY", T::Summary},
     {"FAILURE", T::Failure},
     {"UNREPORTED", T::Unreported}}};
};

#endif // JWS_PAYLOADS_HH
