#ifndef KENCLIENT_SHARED_LIBRARY_ENGINE_H
#define KENCLIENT_SHARED_LIBRARY_ENGINE_H

#include "kenclient/engine.hh"
#include "kenclient/engine_abi.h"
#include "util/dl.hh"

#include <string>

namespace kenclient {

// Engine backed by the entry points of a dlopen'd libken.
class SharedLibraryEngine : public Engine {
  public:
    // Takes ownership of library.  Throws LibraryLoadException if an entry
    // point is missing; library is closed in that case.
    SharedLibraryEngine(void *library, const std::string &location);

    ~SharedLibraryEngine();

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

  private:
    util::scoped_dl library_;

    const std::string location_;

    ken_construct_fn construct_;
    ken_destroy_fn destroy_;
    ken_order_fn order_;
    ken_register_word_fn register_word_;
    ken_prob_fn prob_;
    ken_prob_for_string_fn prob_for_string_;
    ken_prob_string_fn prob_string_;
    ken_is_known_word_fn is_known_word_;
    ken_is_lm_oov_fn is_lm_oov_;
    ken_create_pool_fn create_pool_;
    ken_destroy_pool_fn destroy_pool_;
    ken_prob_rule_fn prob_rule_;
    ken_estimate_rule_fn estimate_rule_;
};

} // namespace kenclient

#endif // KENCLIENT_SHARED_LIBRARY_ENGINE_H
