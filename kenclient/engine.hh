#ifndef KENCLIENT_ENGINE_H
#define KENCLIENT_ENGINE_H

#include <boost/noncopyable.hpp>

#include <cstddef>
#include <string>
#include <vector>

#include <stdint.h>

namespace kenclient {

// Opaque engine tokens.  Zero is the unset sentinel.
typedef uint64_t EngineHandle;
typedef uint64_t EnginePool;

const EngineHandle kNoHandle = 0;
const EnginePool kNoPool = 0;

/* The scoring engine as seen from this side of the boundary.  Implementations
 * forward to the engine without validation: every argument has already been
 * checked by Client or Pool.  See engine_abi.h for the contract of each call.
 */
class Engine : boost::noncopyable {
  public:
    virtual ~Engine();

    // Throws ModelLoadException if the engine rejects file_name.  Never
    // returns kNoHandle.
    virtual EngineHandle Construct(const std::string &file_name) = 0;

    virtual void Destroy(EngineHandle handle) = 0;

    // As reported by the engine.  Client rejects anything below 1.
    virtual int Order(EngineHandle handle) = 0;

    virtual bool RegisterWord(EngineHandle handle, const std::string &word, int id) = 0;

    virtual float Prob(EngineHandle handle, const int *begin, const int *end) = 0;

    virtual float ProbForString(EngineHandle handle, const std::vector<std::string> &words) = 0;

    virtual float ProbString(EngineHandle handle, const int *begin, const int *end, std::size_t start) = 0;

    virtual bool IsKnownWord(EngineHandle handle, const std::string &word) = 0;

    virtual bool IsLmOov(EngineHandle handle, int id) = 0;

    // buffer must outlive the returned pool.
    virtual EnginePool CreatePool(int64_t *buffer, std::size_t slots) = 0;

    virtual void DestroyPool(EnginePool pool) = 0;

    // Packed per ResultCodec.
    virtual uint64_t ProbRule(EngineHandle handle, EnginePool pool) = 0;

    virtual float EstimateRule(EngineHandle handle, const int64_t *begin, const int64_t *end) = 0;

  protected:
    Engine() {}
};

} // namespace kenclient

#endif // KENCLIENT_ENGINE_H
