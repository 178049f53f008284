#ifndef KENCLIENT_PER_THREAD_POOL_H
#define KENCLIENT_PER_THREAD_POOL_H

#include "kenclient/pool.hh"

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/tss.hpp>

#include <cstddef>

namespace kenclient {

class Client;
class Engine;

/* One Pool per calling thread, created on first use.  A thread's pool is
 * destroyed when the thread exits; the owning thread's pool is destroyed with
 * this object.  Workers must be done querying before this object goes away.
 */
class PerThreadPool : boost::noncopyable {
  public:
    explicit PerThreadPool(const Client &client, std::size_t capacity = 0);

    Pool &Get() {
      Pool *ret = pools_.get();
      if (!ret) {
        ret = new Pool(engine_, order_, capacity_);
        pools_.reset(ret);
      }
      return *ret;
    }

  private:
    boost::shared_ptr<Engine> engine_;

    const unsigned int order_;

    const std::size_t capacity_;

    boost::thread_specific_ptr<Pool> pools_;
};

} // namespace kenclient

#endif // KENCLIENT_PER_THREAD_POOL_H
