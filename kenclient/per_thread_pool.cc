#include "kenclient/per_thread_pool.hh"

#include "kenclient/client.hh"
#include "kenclient/exception.hh"

namespace kenclient {

PerThreadPool::PerThreadPool(const Client &client, std::size_t capacity)
  : engine_(client.GetEngine()), order_(client.Order()), capacity_(capacity ? capacity : order_ + 1) {
  UTIL_THROW_IF(capacity_ < order_ + 1, CapacityException, "A pool for a model of order " << order_ << " needs at least " << (order_ + 1) << " slots, not " << capacity_);
}

} // namespace kenclient
