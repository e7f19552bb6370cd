#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

namespace saga::observability {

bool UseOtlpHttp(const saga::runtime::config::ObservabilityConfig& config) {
  return config.transport() == saga::runtime::config::OTLP_TRANSPORT_HTTP;
}

std::string ResolveOtlpEndpoint(const saga::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_env)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (!UseOtlpHttp(config)) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

opentelemetry::sdk::resource::Resource ServiceResource() {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", std::string(kServiceName)},
      {"service.version", std::string(kServiceVersion)},
  };
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace saga::observability

#endif
