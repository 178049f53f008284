#include "kenclient/pool.hh"

#include "kenclient/client.hh"
#include "kenclient/engine.hh"
#include "kenclient/exception.hh"

#include <algorithm>

namespace kenclient {

namespace {

std::size_t CheckCapacity(unsigned int order, std::size_t capacity) {
  UTIL_THROW_IF(!order, CapacityException, "A pool needs a model order of at least 1");
  const std::size_t minimum = static_cast<std::size_t>(order) + 1;
  if (!capacity) return minimum;
  UTIL_THROW_IF(capacity < minimum, CapacityException, "A pool for a model of order " << order << " needs at least " << minimum << " slots, not " << capacity);
  return capacity;
}

} // namespace

Pool::Pool(const Client &client, std::size_t capacity)
  : order_(client.Order()),
    capacity_(CheckCapacity(order_, capacity)),
    buffer_(util::CallocArrayOrThrow<int64_t>(capacity_)),
    count_(0),
    handle_(client.GetEngine(), client.GetEngine()->CreatePool(Slots(), capacity_)) {}

Pool::Pool(const boost::shared_ptr<Engine> &engine, unsigned int order, std::size_t capacity)
  : order_(order),
    capacity_(CheckCapacity(order_, capacity)),
    buffer_(util::CallocArrayOrThrow<int64_t>(capacity_)),
    count_(0),
    handle_(engine, engine->CreatePool(Slots(), capacity_)) {}

Pool::~Pool() {}

void Pool::Write(const std::vector<int64_t> &ids) {
  Write(ids.empty() ? NULL : &ids[0], ids.empty() ? NULL : &ids[0] + ids.size());
}

void Pool::Write(const int64_t *begin, const int64_t *end) {
  PoolLease lease(*this);
  WriteLeased(begin, end);
}

void Pool::Destroy() {
  PoolLease lease(*this);
  handle_.Release();
}

std::size_t Pool::Count() const {
  handle_.Get();
  return count_;
}

void Pool::WriteLeased(const int64_t *begin, const int64_t *end) {
  handle_.Get();
  const std::size_t count = end - begin;
  UTIL_THROW_IF(count > capacity_ - 1, CapacityException, "Rule of " << count << " ids does not fit in a pool of capacity " << capacity_);
  int64_t *slots = Slots();
  slots[0] = static_cast<int64_t>(count);
  std::copy(begin, end, slots + 1);
  count_ = count;
}

PoolLease::PoolLease(Pool &pool) : lock_(pool.in_use_, boost::try_to_lock) {
  UTIL_THROW_IF(!lock_.owns_lock(), PoolBusyException, "The pool is in use by another caller; use one pool per thread");
}

} // namespace kenclient
