#include "kenclient/client.hh"

#include "kenclient/engine.hh"
#include "kenclient/exception.hh"
#include "kenclient/native_library.hh"
#include "kenclient/pool.hh"

#include <ostream>

namespace kenclient {

namespace {

boost::shared_ptr<Engine> LoadOrComplain(const Config &config) {
  try {
    return LoadEngine(config);
  } catch (const LibraryLoadException &) {
    if (config.messages) *config.messages << "Can't instantiate KenLM.  Please ensure your platform is supported." << std::endl;
    throw;
  }
}

EngineHandle ConstructModel(Engine &engine, const std::string &file_name, const Config &config) {
  if (config.messages) *config.messages << "Loading the language model from " << file_name << std::endl;
  return engine.Construct(file_name);
}

unsigned int CheckOrder(int order, const std::string &file_name) {
  UTIL_THROW_IF(order < 1, ModelLoadException, "The engine reported order " << order << " for " << file_name);
  return static_cast<unsigned int>(order);
}

} // namespace

Client::Client(const std::string &file_name, const Config &config)
  : config_(config),
    engine_(LoadOrComplain(config)),
    handle_(engine_, ConstructModel(*engine_, file_name, config)),
    order_(CheckOrder(engine_->Order(handle_.Get()), file_name)) {}

Client::Client(const boost::shared_ptr<Engine> &engine, const std::string &file_name, const Config &config)
  : config_(config),
    engine_(engine),
    handle_(engine_, ConstructModel(*engine_, file_name, config)),
    order_(CheckOrder(engine_->Order(handle_.Get()), file_name)) {}

Client::~Client() {
  if (handle_.Release() && config_.messages) {
    *config_.messages << "KenLM client was destroyed without Release(); releasing the model now." << std::endl;
  }
}

unsigned int Client::Order() const {
  handle_.Get();
  return order_;
}

bool Client::RegisterWord(const std::string &word, int id) {
  return engine_->RegisterWord(handle_.Get(), word, id);
}

float Client::Probability(const std::vector<int> &ids) const {
  EngineHandle handle = handle_.Get();
  UTIL_THROW_IF(ids.empty(), EmptySequenceException, "Probability needs at least one word");
  return engine_->Prob(handle, &ids[0], &ids[0] + ids.size());
}

float Client::Probability(const std::vector<std::string> &words) const {
  EngineHandle handle = handle_.Get();
  UTIL_THROW_IF(words.empty(), EmptySequenceException, "Probability needs at least one word");
  return engine_->ProbForString(handle, words);
}

float Client::ProbabilityOfSuffix(const std::vector<int> &ids, int start) const {
  EngineHandle handle = handle_.Get();
  UTIL_THROW_IF(ids.empty(), EmptySequenceException, "Suffix probability needs at least one word");
  UTIL_THROW_IF(start < 0 || static_cast<std::size_t>(start) > ids.size(), IndexException, "Suffix start " << start << " is outside [0, " << ids.size() << ']');
  return engine_->ProbString(handle, &ids[0], &ids[0] + ids.size(), static_cast<std::size_t>(start));
}

bool Client::IsKnownWord(const std::string &word) const {
  return engine_->IsKnownWord(handle_.Get(), word);
}

bool Client::IsOutOfVocabulary(int id) const {
  return engine_->IsLmOov(handle_.Get(), id);
}

ProbResult Client::ProbabilityOfRule(Pool &pool) const {
  handle_.Get();
  PoolLease lease(pool);
  return QueryRule(pool);
}

ProbResult Client::ProbabilityOfRule(Pool &pool, const std::vector<int64_t> &ids) const {
  // Check the client first so a released client reports that, not a busy pool.
  handle_.Get();
  PoolLease lease(pool);
  pool.WriteLeased(ids.empty() ? NULL : &ids[0], ids.empty() ? NULL : &ids[0] + ids.size());
  return QueryRule(pool);
}

float Client::EstimateRule(const std::vector<int64_t> &ids) const {
  EngineHandle handle = handle_.Get();
  UTIL_THROW_IF(ids.empty(), EmptySequenceException, "Rule estimate needs at least one id");
  return engine_->EstimateRule(handle, &ids[0], &ids[0] + ids.size());
}

void Client::Release() {
  handle_.Release();
}

ProbResult Client::QueryRule(Pool &pool) const {
  EngineHandle handle = handle_.Get();
  EnginePool engine_pool = pool.handle_.Get();
  UTIL_THROW_IF(pool.handle_.SharedEngine() != engine_, PoolMismatchException, "The pool was created on a different engine than this client");
  UTIL_THROW_IF(pool.Capacity() < order_ + 1, CapacityException, "Pool capacity " << pool.Capacity() << " is too small for a model of order " << order_);
  UTIL_THROW_IF(pool.count_ > order_, CapacityException, "Rule of " << pool.count_ << " ids is longer than the model order " << order_);
  UTIL_THROW_IF(!pool.count_, EmptySequenceException, "The pool holds no rule; call Pool::Write first");
  return UnpackResult(engine_->ProbRule(handle, engine_pool));
}

} // namespace kenclient
