#pragma once

#include <chrono>
#include <string>

namespace saga::lease {

// Exclusive right of one caller to drive a saga id inside this process.
struct ExecutionLease {
  std::string lease_id;
  std::string saga_id;
  std::string holder;

  std::chrono::steady_clock::time_point expires_at;
};

} // namespace saga::lease
