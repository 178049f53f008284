#ifndef KENCLIENT_HANDLE_H
#define KENCLIENT_HANDLE_H

#include "kenclient/engine.hh"
#include "kenclient/exception.hh"

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>

namespace kenclient {

/* Unique owner of one engine token.  The only way to get a token in is the
 * constructor, which takes the value returned by the boundary call; the only
 * way out is Get(), which refuses the sentinel.  Release() swaps in the
 * sentinel under a mutex, so an explicit release racing the destructor
 * reaches the engine once.
 *
 * Traits supplies:
 *   static void Destroy(Engine &engine, EngineHandle value);
 *   static const char *Name();
 */
template <class Traits> class OwnedHandle : boost::noncopyable {
  public:
    OwnedHandle(const boost::shared_ptr<Engine> &engine, EngineHandle value)
      : engine_(engine), value_(value) {}

    ~OwnedHandle() { Release(); }

    EngineHandle Get() const {
      boost::lock_guard<boost::mutex> lock(mutex_);
      UTIL_THROW_IF(value_ == kNoHandle, UseAfterReleaseException, "KenLM " << Traits::Name() << " has not been properly initialized, or has already been released");
      return value_;
    }

    bool Live() const {
      boost::lock_guard<boost::mutex> lock(mutex_);
      return value_ != kNoHandle;
    }

    // Returns true if this call destroyed the engine object.
    bool Release() {
      EngineHandle value;
      {
        boost::lock_guard<boost::mutex> lock(mutex_);
        value = value_;
        value_ = kNoHandle;
      }
      if (value == kNoHandle) return false;
      Traits::Destroy(*engine_, value);
      return true;
    }

    const boost::shared_ptr<Engine> &SharedEngine() const { return engine_; }

  private:
    boost::shared_ptr<Engine> engine_;

    mutable boost::mutex mutex_;

    EngineHandle value_;
};

struct ModelTraits {
  static void Destroy(Engine &engine, EngineHandle value) { engine.Destroy(value); }
  static const char *Name() { return "model handle"; }
};

struct PoolTraits {
  static void Destroy(Engine &engine, EnginePool value) { engine.DestroyPool(value); }
  static const char *Name() { return "pool"; }
};

typedef OwnedHandle<ModelTraits> ModelHandle;
typedef OwnedHandle<PoolTraits> PoolHandle;

} // namespace kenclient

#endif // KENCLIENT_HANDLE_H
