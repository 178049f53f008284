#ifndef KENCLIENT_POOL_H
#define KENCLIENT_POOL_H

#include "kenclient/handle.hh"
#include "util/scoped.hh"

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>

#include <cstddef>
#include <vector>

#include <stdint.h>

namespace kenclient {

class Client;
class Engine;

/* Scratch buffer through which rule queries hand n-gram ids to the engine
 * without allocating per call.  Layout is capacity int64_t slots: the id
 * count, then the ids.  By convention negative ids are non-terminals.
 *
 * A Pool is not thread safe.  Each operation borrows it through a PoolLease
 * and a second concurrent borrower gets PoolBusyException.  The usual pattern
 * is one Pool per worker thread; see PerThreadPool.
 *
 * Pools are not owned by a Client and can serve any Client on the same engine
 * whose order fits.
 */
class Pool : boost::noncopyable {
  public:
    // capacity 0 means client.Order() + 1, the minimum.  Throws
    // CapacityException for anything smaller.
    explicit Pool(const Client &client, std::size_t capacity = 0);

    Pool(const boost::shared_ptr<Engine> &engine, unsigned int order, std::size_t capacity = 0);

    ~Pool();

    // Throws CapacityException if ids has more than Capacity() - 1 entries.
    void Write(const std::vector<int64_t> &ids);
    void Write(const int64_t *begin, const int64_t *end);

    // Idempotent.
    void Destroy();

    bool Destroyed() const { return !handle_.Live(); }

    std::size_t Capacity() const { return capacity_; }

    // Order of the model the pool was sized for.
    unsigned int Order() const { return order_; }

    // Ids in the last Write.
    std::size_t Count() const;

  private:
    friend class Client;
    friend class PoolLease;

    void WriteLeased(const int64_t *begin, const int64_t *end);

    int64_t *Slots() { return buffer_.as<int64_t>(); }

    const unsigned int order_;

    const std::size_t capacity_;

    // The engine reads this until handle_ is released.
    util::scoped_malloc buffer_;

    std::size_t count_;

    boost::mutex in_use_;

    // Declared after buffer_ so the engine pool goes first.
    PoolHandle handle_;
};

// Exclusive borrow of a Pool for the duration of one call.
class PoolLease : boost::noncopyable {
  public:
    // Throws PoolBusyException if another caller holds the pool.
    explicit PoolLease(Pool &pool);

  private:
    boost::unique_lock<boost::mutex> lock_;
};

} // namespace kenclient

#endif // KENCLIENT_POOL_H
