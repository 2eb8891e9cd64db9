#include "application/services/PendingRequestTable.hpp"

#include <utility>

namespace hookline::proxy::application::services
{

PendingRequestTable::RecordStatus PendingRequestTable::record(const RequestId& id,
                                                              std::string method,
                                                              Clock::time_point now)
{
  std::lock_guard<std::mutex> lk(mu_);
  auto [it, inserted] = entries_.try_emplace(id, Slot{method, now});
  if (inserted) return RecordStatus::inserted;

  it->second = Slot{std::move(method), now};
  return RecordStatus::replaced;
}

std::optional<std::string> PendingRequestTable::resolve(const RequestId& id)
{
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;

  std::string method = std::move(it->second.method);
  entries_.erase(it);
  return method;
}

bool PendingRequestTable::forget(const RequestId& id)
{
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.erase(id) > 0;
}

std::vector<PendingRequestTable::Entry> PendingRequestTable::evict_expired(Clock::time_point now)
{
  std::vector<Entry> evicted;
  if (timeout_.count() <= 0) return evicted;

  std::lock_guard<std::mutex> lk(mu_);
  for (auto it = entries_.begin(); it != entries_.end();)
  {
    if (now - it->second.recorded_at >= timeout_)
    {
      evicted.push_back(Entry{it->first, std::move(it->second.method), it->second.recorded_at});
      it = entries_.erase(it);
    }
    else
    {
      ++it;
    }
  }
  return evicted;
}

std::size_t PendingRequestTable::clear()
{
  std::lock_guard<std::mutex> lk(mu_);
  const std::size_t n = entries_.size();
  entries_.clear();
  return n;
}

std::size_t PendingRequestTable::size() const
{
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

}  // namespace hookline::proxy::application::services
