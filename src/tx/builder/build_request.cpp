#include "builder/build_request.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace txforge::builder {

namespace {

using primitives::Amount;

const nlohmann::json* Field(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

// Integer sompi given as a JSON integer or a digit string.
bool ReadSompi(const nlohmann::json& value, Amount* out, std::string* error) {
  if (value.is_number_unsigned()) {
    *out = value.get<Amount>();
  } else if (value.is_number_integer()) {
    const auto v = value.get<std::int64_t>();
    if (v < 0) {
      if (error) *error = "amount must not be negative";
      return false;
    }
    *out = static_cast<Amount>(v);
  } else if (value.is_string()) {
    if (!primitives::ParseSompi(value.get<std::string>(), out, error)) {
      return false;
    }
  } else {
    if (error) *error = "amount must be an integer or a digit string";
    return false;
  }
  if (!primitives::MoneyRange(*out)) {
    if (error) *error = "amount out of range";
    return false;
  }
  return true;
}

// Decimal KAS given as a string or a JSON number; converted exactly.
bool ReadKas(const nlohmann::json& value, Amount* out, std::string* error) {
  if (value.is_string()) {
    return primitives::ParseKasAmount(value.get<std::string>(), out, error);
  }
  if (value.is_number()) {
    return primitives::ParseKasAmount(value.dump(), out, error);
  }
  if (error) *error = "amountKas must be a decimal number or string";
  return false;
}

bool ReadAddress(const nlohmann::json* value, std::string_view prefix, crypto::KaspaAddress* out,
                 std::string* error) {
  if (value == nullptr || !value->is_string()) {
    if (error) *error = "address missing";
    return false;
  }
  std::string text = value->get<std::string>();
  text.erase(std::remove_if(text.begin(), text.end(),
                            [](unsigned char c) { return std::isspace(c); }),
             text.end());
  return crypto::DecodeAddress(text, prefix, out, error);
}

// Non-negative millisecond value; zero is treated as "not provided".
bool ReadLatency(const nlohmann::json& telemetry, const char* key,
                 std::optional<std::uint64_t>* out, std::string* error) {
  const auto* value = Field(telemetry, key);
  if (value == nullptr) {
    return true;
  }
  if (!value->is_number()) {
    if (error) *error = std::string("telemetry.") + key + " must be a number";
    return false;
  }
  const double ms = value->get<double>();
  if (!std::isfinite(ms)) {
    if (error) *error = std::string("telemetry.") + key + " must be finite";
    return false;
  }
  const double clamped = std::clamp(ms, 0.0, 86'400'000.0);
  const auto rounded = static_cast<std::uint64_t>(std::llround(clamped));
  if (rounded > 0) {
    *out = rounded;
  }
  return true;
}

bool ReadTelemetry(const nlohmann::json& telemetry, policy::TelemetrySnapshot* out,
                   std::string* error) {
  if (!telemetry.is_object()) {
    if (error) *error = "telemetry must be an object";
    return false;
  }
  if (!ReadLatency(telemetry, "observedConfirmP95Ms", &out->observed_confirm_p95_ms, error) ||
      !ReadLatency(telemetry, "receiptLagP95Ms", &out->receipt_lag_p95_ms, error) ||
      !ReadLatency(telemetry, "schedulerCallbackLatencyP95Ms", &out->scheduler_callback_p95_ms,
                   error)) {
    return false;
  }
  if (!out->scheduler_callback_p95_ms &&
      !ReadLatency(telemetry, "schedulerCallbackLatencyP95BucketMs",
                   &out->scheduler_callback_p95_ms, error)) {
    return false;
  }
  if (const auto* pct = Field(telemetry, "daaCongestionPct")) {
    if (!pct->is_number() || !std::isfinite(pct->get<double>())) {
      if (error) *error = "telemetry.daaCongestionPct must be a number";
      return false;
    }
    out->daa_congestion_pct =
        static_cast<std::uint32_t>(std::llround(std::clamp(pct->get<double>(), 0.0, 100.0)));
  }
  return true;
}

bool ReadOutput(const nlohmann::json& entry, std::size_t index, std::string_view prefix,
                PaymentOutput* out, std::string* error) {
  const std::string where = "outputs[" + std::to_string(index) + "]";
  if (!entry.is_object()) {
    if (error) *error = where + " must be an object";
    return false;
  }
  std::string detail;
  const auto* address = Field(entry, "address");
  if (address == nullptr) {
    address = Field(entry, "to");
  }
  if (!ReadAddress(address, prefix, &out->address, &detail)) {
    if (error) *error = where + ": " + detail;
    return false;
  }
  bool have_amount = false;
  for (const char* key : {"amountSompi", "amountInBaseUnit"}) {
    if (const auto* value = Field(entry, key)) {
      if (!ReadSompi(*value, &out->amount, &detail)) {
        if (error) *error = where + "." + key + ": " + detail;
        return false;
      }
      have_amount = true;
      break;
    }
  }
  if (!have_amount) {
    if (const auto* value = Field(entry, "amountKas")) {
      if (!ReadKas(*value, &out->amount, &detail)) {
        if (error) *error = where + ".amountKas: " + detail;
        return false;
      }
      have_amount = true;
    }
  }
  if (!have_amount) {
    if (error) *error = where + ": amount missing";
    return false;
  }
  if (out->amount == 0) {
    if (error) *error = where + ": amount must be positive";
    return false;
  }
  return true;
}

// Cuts at a UTF-8 character boundary so the result stays valid UTF-8.
std::string TruncateUtf8(const std::string& text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  std::size_t end = max_bytes;
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
    --end;
  }
  return text.substr(0, end);
}

}  // namespace

Amount BuildRequest::OutputsTotal() const {
  Amount total = 0;
  for (const auto& payment : outputs) {
    total = primitives::SaturatingAdd(total, payment.amount);
  }
  return total;
}

bool ParseBuildRequest(const nlohmann::json& body, BuildRequest* out, std::string* error) {
  if (!body.is_object()) {
    if (error) *error = "request body must be a JSON object";
    return false;
  }
  BuildRequest request;
  if (const auto* wallet = Field(body, "wallet")) {
    if (!wallet->is_string() || wallet->get<std::string>() != "kastle") {
      if (error) *error = "unsupported wallet";
      return false;
    }
  }
  const auto* network = Field(body, "networkId");
  if (network == nullptr || !network->is_string() ||
      !config::ParseNetworkId(network->get<std::string>(), &request.network)) {
    if (error) *error = "networkId must be \"mainnet\" or \"testnet-10\"";
    return false;
  }
  const std::string& prefix = config::ConfigFor(request.network).address_prefix;

  std::string detail;
  if (!ReadAddress(Field(body, "fromAddress"), prefix, &request.from, &detail)) {
    if (error) *error = "fromAddress: " + detail;
    return false;
  }
  request.from_address = crypto::EncodeAddress(request.from);

  const auto* outputs = Field(body, "outputs");
  if (outputs == nullptr || !outputs->is_array() || outputs->empty()) {
    if (error) *error = "outputs must be a non-empty array";
    return false;
  }
  if (outputs->size() > kMaxPaymentOutputs) {
    if (error) *error = "too many outputs (max " + std::to_string(kMaxPaymentOutputs) + ")";
    return false;
  }
  Amount total = 0;
  for (std::size_t i = 0; i < outputs->size(); ++i) {
    PaymentOutput payment;
    if (!ReadOutput((*outputs)[i], i, prefix, &payment, error)) {
      return false;
    }
    if (!primitives::CheckedAdd(total, payment.amount, &total)) {
      if (error) *error = "sum of outputs out of range";
      return false;
    }
    request.outputs.push_back(std::move(payment));
  }

  for (const char* key : {"requestedFeeInBaseUnit", "priorityFeeSompi"}) {
    if (const auto* fee = Field(body, key)) {
      Amount value = 0;
      if (!ReadSompi(*fee, &value, &detail)) {
        if (error) *error = std::string(key) + ": " + detail;
        return false;
      }
      request.requested_fee = value;
      break;
    }
  }

  if (const auto* purpose = Field(body, "purpose")) {
    if (!purpose->is_string()) {
      if (error) *error = "purpose must be a string";
      return false;
    }
    request.purpose = TruncateUtf8(purpose->get<std::string>(), kMaxPurposeLength);
  }

  if (const auto* telemetry = Field(body, "telemetry")) {
    if (!ReadTelemetry(*telemetry, &request.telemetry, error)) {
      return false;
    }
  }

  if (out) {
    *out = std::move(request);
  }
  return true;
}

}  // namespace txforge::builder
