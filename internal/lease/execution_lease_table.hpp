#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "lease.hpp"

namespace saga::lease {

/*
  In-process execution leases, at most one live lease per saga id.

  Expired leases are dropped lazily by whichever call observes them, so a
  caller that dies without releasing blocks the id only until expiry.
*/
class ExecutionLeaseTable {
 public:
  using Clock = std::chrono::steady_clock;

  // nullopt when another live lease holds saga_id.
  std::optional<ExecutionLease> TryAcquire(const std::string& saga_id, const std::string& holder, std::chrono::milliseconds ttl);

  // Extends a live lease. false when the lease is gone or expired.
  bool Renew(const std::string& lease_id, std::chrono::milliseconds ttl);

  void Release(const std::string& lease_id);

  bool IsLeased(const std::string& saga_id);

  std::size_t ActiveCount();

 private:
  std::mutex mutex_;

  std::unordered_map<std::string, ExecutionLease> by_saga_;
  std::unordered_map<std::string, std::string>    saga_by_lease_;

  static bool IsExpired(const ExecutionLease& lease, Clock::time_point now);
  void        EraseLocked(const std::string& saga_id);
};

/*
  RAII holder: releases its lease when it goes out of scope.
*/
class ScopedExecutionLease {
 public:
  ScopedExecutionLease(ExecutionLeaseTable& table, ExecutionLease lease) : table_(&table), lease_(std::move(lease)) {
  }

  ~ScopedExecutionLease() {
    if (table_) table_->Release(lease_.lease_id);
  }

  ScopedExecutionLease(const ScopedExecutionLease&)            = delete;
  ScopedExecutionLease& operator=(const ScopedExecutionLease&) = delete;

  ScopedExecutionLease(ScopedExecutionLease&& other) noexcept : table_(other.table_), lease_(std::move(other.lease_)) {
    other.table_ = nullptr;
  }
  ScopedExecutionLease& operator=(ScopedExecutionLease&&) = delete;

  bool Renew(std::chrono::milliseconds ttl) {
    return table_ && table_->Renew(lease_.lease_id, ttl);
  }

  const ExecutionLease& Lease() const {
    return lease_;
  }

 private:
  ExecutionLeaseTable* table_;
  ExecutionLease       lease_;
};

} // namespace saga::lease
