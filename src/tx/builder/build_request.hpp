#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "builder/tx_generator.hpp"
#include "config/network.hpp"
#include "policy/telemetry_snapshot.hpp"
#include "primitives/amount.hpp"

namespace txforge::builder {

inline constexpr std::size_t kMaxPaymentOutputs = 100;
inline constexpr std::size_t kMaxPurposeLength = 140;

// A validated build request. Addresses are decoded against the request's
// network and kept in canonical (lowercase) form.
struct BuildRequest {
  config::NetworkType network{config::NetworkType::kMainnet};
  std::string from_address;
  crypto::KaspaAddress from;
  std::vector<PaymentOutput> outputs;
  std::optional<primitives::Amount> requested_fee;
  std::string purpose;
  // Caller-supplied telemetry; unset fields are resolved from the summaries.
  policy::TelemetrySnapshot telemetry{};

  primitives::Amount OutputsTotal() const;
};

// Validates the JSON body of a build request. Every malformed field is an
// error; nothing is silently dropped.
bool ParseBuildRequest(const nlohmann::json& body, BuildRequest* out, std::string* error);

}  // namespace txforge::builder
