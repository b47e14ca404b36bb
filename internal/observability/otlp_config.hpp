#pragma once

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace fleet::observability {

inline OtlpConfig ToOtlpConfig(const fleet::runtime::config::ObservabilityConfig& observability) {
  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == fleet::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.metrics().collection_interval_ms() > 0) {
    otlp.metric_interval_ms = observability.metrics().collection_interval_ms();
  }
  return otlp;
}

} // namespace fleet::observability
