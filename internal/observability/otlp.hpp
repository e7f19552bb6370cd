#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace saga::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

bool UseOtlpHttp(const saga::runtime::config::ObservabilityConfig& config);

// observability.otlp_endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// then OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
std::string ResolveOtlpEndpoint(const saga::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

opentelemetry::sdk::resource::Resource ServiceResource();

inline constexpr std::string_view kServiceName    = "saga-orchestrator";
inline constexpr std::string_view kServiceVersion = "0.1.0";

} // namespace saga::observability

#endif
