#ifndef KENCLIENT_TESTING_TOY_ENGINE_H
#define KENCLIENT_TESTING_TOY_ENGINE_H

#include "kenclient/engine.hh"

#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace kenclient {
namespace testing {

/* Small ARPA backoff scorer standing in for libken in tests.  Unlike the real
 * engine it tolerates stale handles: it counts them instead, so tests can
 * assert the client never sent one.
 *
 * Rule queries: positive ids are words, -k continues from the state k that an
 * earlier ProbRule on the same pool returned.  EstimateRule treats every
 * non-terminal as an empty context.
 */
class ToyEngine : public Engine {
  public:
    ToyEngine();
    ~ToyEngine();

    EngineHandle Construct(const std::string &file_name);
    void Destroy(EngineHandle handle);
    int Order(EngineHandle handle);
    bool RegisterWord(EngineHandle handle, const std::string &word, int id);
    float Prob(EngineHandle handle, const int *begin, const int *end);
    float ProbForString(EngineHandle handle, const std::vector<std::string> &words);
    float ProbString(EngineHandle handle, const int *begin, const int *end, std::size_t start);
    bool IsKnownWord(EngineHandle handle, const std::string &word);
    bool IsLmOov(EngineHandle handle, int id);
    EnginePool CreatePool(int64_t *buffer, std::size_t slots);
    void DestroyPool(EnginePool pool);
    uint64_t ProbRule(EngineHandle handle, EnginePool pool);
    float EstimateRule(EngineHandle handle, const int64_t *begin, const int64_t *end);

    std::size_t LiveModels() const;
    std::size_t LivePools() const;
    std::size_t DestroyCalls() const;
    std::size_t RuleCalls() const;
    // Calls naming a handle or pool that is unknown or already destroyed.
    std::size_t BadHandleCalls() const;

    class Model;
    struct RulePool;

  private:
    Model *FindModel(EngineHandle handle);
    RulePool *FindPool(EnginePool pool);

    mutable boost::mutex mutex_;

    std::map<EngineHandle, boost::shared_ptr<Model> > models_;
    std::map<EnginePool, boost::shared_ptr<RulePool> > pools_;

    uint64_t next_;

    std::size_t destroy_calls_, rule_calls_, bad_handle_calls_;
};

} // namespace testing
} // namespace kenclient

#endif // KENCLIENT_TESTING_TOY_ENGINE_H
