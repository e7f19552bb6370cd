#include "execution_lease_table.hpp"

#include "internal/util/uuid.hpp"

namespace saga::lease {

bool ExecutionLeaseTable::IsExpired(const ExecutionLease& lease, Clock::time_point now) {
  return lease.expires_at <= now;
}

void ExecutionLeaseTable::EraseLocked(const std::string& saga_id) {
  auto it = by_saga_.find(saga_id);
  if (it == by_saga_.end()) return;

  saga_by_lease_.erase(it->second.lease_id);
  by_saga_.erase(it);
}

std::optional<ExecutionLease> ExecutionLeaseTable::TryAcquire(const std::string& saga_id, const std::string& holder,
                                                              std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now = Clock::now();
  if (auto it = by_saga_.find(saga_id); it != by_saga_.end()) {
    if (!IsExpired(it->second, now)) return std::nullopt;
    EraseLocked(saga_id);
  }

  ExecutionLease lease;
  lease.lease_id   = util::NewSagaId();
  lease.saga_id    = saga_id;
  lease.holder     = holder;
  lease.expires_at = now + ttl;

  saga_by_lease_[lease.lease_id] = saga_id;
  by_saga_[saga_id]              = lease;
  return lease;
}

bool ExecutionLeaseTable::Renew(const std::string& lease_id, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  auto owner = saga_by_lease_.find(lease_id);
  if (owner == saga_by_lease_.end()) return false;

  const std::string saga_id = owner->second;
  auto              it      = by_saga_.find(saga_id);
  if (it == by_saga_.end()) {
    saga_by_lease_.erase(owner);
    return false;
  }

  const auto now = Clock::now();
  if (IsExpired(it->second, now)) {
    EraseLocked(saga_id);
    return false;
  }

  it->second.expires_at = now + ttl;
  return true;
}

void ExecutionLeaseTable::Release(const std::string& lease_id) {
  std::lock_guard lock(mutex_);

  auto owner = saga_by_lease_.find(lease_id);
  if (owner == saga_by_lease_.end()) return;

  // copy: EraseLocked invalidates owner
  const std::string saga_id = owner->second;
  EraseLocked(saga_id);
}

bool ExecutionLeaseTable::IsLeased(const std::string& saga_id) {
  std::lock_guard lock(mutex_);

  auto it = by_saga_.find(saga_id);
  if (it == by_saga_.end()) return false;
  if (IsExpired(it->second, Clock::now())) {
    EraseLocked(saga_id);
    return false;
  }
  return true;
}

std::size_t ExecutionLeaseTable::ActiveCount() {
  std::lock_guard lock(mutex_);

  const auto now = Clock::now();
  for (auto it = by_saga_.begin(); it != by_saga_.end();) {
    if (IsExpired(it->second, now)) {
      saga_by_lease_.erase(it->second.lease_id);
      it = by_saga_.erase(it);
      continue;
    }
    ++it;
  }
  return by_saga_.size();
}

} // namespace saga::lease
