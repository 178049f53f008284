#ifndef KENCLIENT_CLIENT_H
#define KENCLIENT_CLIENT_H

#include "kenclient/config.hh"
#include "kenclient/handle.hh"
#include "kenclient/result_codec.hh"

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include <string>
#include <vector>

#include <stdint.h>

namespace kenclient {

class Engine;
class Pool;

/* Owns one model loaded in the engine.  Every query checks the handle and its
 * arguments before crossing into the engine, which checks nothing and would
 * fault on a stale handle.
 *
 * Queries may run concurrently on one Client.  RegisterWord and Release must
 * not race other calls on the same Client.
 */
class Client : boost::noncopyable {
  public:
    /* Load the engine library per config, then the model.  Throws
     * LibraryLoadException if the engine can't be loaded and
     * ModelLoadException if it rejects file_name.  Nothing is left allocated
     * in the engine on failure.
     */
    explicit Client(const std::string &file_name, const Config &config = Config());

    // Same, on an engine that is already loaded.
    Client(const boost::shared_ptr<Engine> &engine, const std::string &file_name, const Config &config = Config());

    // Releases the model if the owner forgot to, with a warning.
    ~Client();

    unsigned int Order() const;

    /* Associate an external id with a vocabulary word for use in the integer
     * queries.  Returns the engine's verdict.
     */
    bool RegisterWord(const std::string &word, int id);

    // log10 p(last word | preceding words).
    float Probability(const std::vector<int> &ids) const;
    float Probability(const std::vector<std::string> &words) const;

    /* Sum of log10 probabilities of ids[start] onwards, each conditioned on
     * the words before it.  Throws IndexException unless
     * 0 <= start <= ids.size().  start == ids.size() scores 0.
     */
    float ProbabilityOfSuffix(const std::vector<int> &ids, int start) const;

    bool IsKnownWord(const std::string &word) const;

    // True if id was never registered or names a word the model lacks.
    bool IsOutOfVocabulary(int id) const;

    /* Rule probability with dynamic state.  The pool must hold the rule,
     * written with Pool::Write.  Non-terminals are negative: -state for a
     * state returned by an earlier call.
     */
    ProbResult ProbabilityOfRule(Pool &pool) const;

    // Write ids and query under one lease so no caller can interleave.
    ProbResult ProbabilityOfRule(Pool &pool, const std::vector<int64_t> &ids) const;

    // Estimate of a rule without state.
    float EstimateRule(const std::vector<int64_t> &ids) const;

    // Idempotent.  Every query afterwards throws UseAfterReleaseException.
    void Release();

    bool Released() const { return !handle_.Live(); }

    const boost::shared_ptr<Engine> &GetEngine() const { return engine_; }

    const Config &GetConfig() const { return config_; }

  private:
    ProbResult QueryRule(Pool &pool) const;

    const Config config_;

    boost::shared_ptr<Engine> engine_;

    // Destroyed on the way out of a throwing constructor, so a model whose
    // order can't be read is not leaked.
    ModelHandle handle_;

    const unsigned int order_;
};

} // namespace kenclient

#endif // KENCLIENT_CLIENT_H
