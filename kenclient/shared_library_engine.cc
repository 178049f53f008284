#include "kenclient/shared_library_engine.hh"

#include "kenclient/exception.hh"

namespace kenclient {

namespace {
const std::size_t kErrorBufferSize = 1024;

template <class Function> void Resolve(void *library, const std::string &location, const char *symbol, Function &to) {
  try {
    util::DlSymOrThrow(library, symbol, to);
  } catch (const util::DlException &e) {
    UTIL_THROW(LibraryLoadException, location << " is not a KenLM engine library: " << e.what());
  }
}
} // namespace

SharedLibraryEngine::SharedLibraryEngine(void *library, const std::string &location)
  : library_(library), location_(location) {
  Resolve(library, location, KEN_CONSTRUCT_SYMBOL, construct_);
  Resolve(library, location, KEN_DESTROY_SYMBOL, destroy_);
  Resolve(library, location, KEN_ORDER_SYMBOL, order_);
  Resolve(library, location, KEN_REGISTER_WORD_SYMBOL, register_word_);
  Resolve(library, location, KEN_PROB_SYMBOL, prob_);
  Resolve(library, location, KEN_PROB_FOR_STRING_SYMBOL, prob_for_string_);
  Resolve(library, location, KEN_PROB_STRING_SYMBOL, prob_string_);
  Resolve(library, location, KEN_IS_KNOWN_WORD_SYMBOL, is_known_word_);
  Resolve(library, location, KEN_IS_LM_OOV_SYMBOL, is_lm_oov_);
  Resolve(library, location, KEN_CREATE_POOL_SYMBOL, create_pool_);
  Resolve(library, location, KEN_DESTROY_POOL_SYMBOL, destroy_pool_);
  Resolve(library, location, KEN_PROB_RULE_SYMBOL, prob_rule_);
  Resolve(library, location, KEN_ESTIMATE_RULE_SYMBOL, estimate_rule_);
}

SharedLibraryEngine::~SharedLibraryEngine() {}

EngineHandle SharedLibraryEngine::Construct(const std::string &file_name) {
  char error[kErrorBufferSize];
  error[0] = 0;
  EngineHandle ret = construct_(file_name.c_str(), error, kErrorBufferSize);
  // Don't trust the engine to terminate.
  error[kErrorBufferSize - 1] = 0;
  UTIL_THROW_IF(ret == kNoHandle, ModelLoadException, "The engine rejected " << file_name << ": " << (error[0] ? error : "no reason given"));
  return ret;
}

void SharedLibraryEngine::Destroy(EngineHandle handle) {
  destroy_(handle);
}

int SharedLibraryEngine::Order(EngineHandle handle) {
  return order_(handle);
}

bool SharedLibraryEngine::RegisterWord(EngineHandle handle, const std::string &word, int id) {
  return register_word_(handle, word.c_str(), id) != 0;
}

float SharedLibraryEngine::Prob(EngineHandle handle, const int *begin, const int *end) {
  return prob_(handle, begin, end - begin);
}

float SharedLibraryEngine::ProbForString(EngineHandle handle, const std::vector<std::string> &words) {
  std::vector<const char*> pointers;
  pointers.reserve(words.size());
  for (std::vector<std::string>::const_iterator i = words.begin(); i != words.end(); ++i) {
    pointers.push_back(i->c_str());
  }
  return prob_for_string_(handle, pointers.empty() ? NULL : &pointers[0], pointers.size());
}

float SharedLibraryEngine::ProbString(EngineHandle handle, const int *begin, const int *end, std::size_t start) {
  return prob_string_(handle, begin, end - begin, start);
}

bool SharedLibraryEngine::IsKnownWord(EngineHandle handle, const std::string &word) {
  return is_known_word_(handle, word.c_str()) != 0;
}

bool SharedLibraryEngine::IsLmOov(EngineHandle handle, int id) {
  return is_lm_oov_(handle, id) != 0;
}

EnginePool SharedLibraryEngine::CreatePool(int64_t *buffer, std::size_t slots) {
  EnginePool ret = create_pool_(buffer, slots);
  UTIL_THROW_IF(ret == kNoPool, util::Exception, "The engine in " << location_ << " failed to create a pool of " << slots << " slots");
  return ret;
}

void SharedLibraryEngine::DestroyPool(EnginePool pool) {
  destroy_pool_(pool);
}

uint64_t SharedLibraryEngine::ProbRule(EngineHandle handle, EnginePool pool) {
  return prob_rule_(handle, pool);
}

float SharedLibraryEngine::EstimateRule(EngineHandle handle, const int64_t *begin, const int64_t *end) {
  return estimate_rule_(handle, begin, end - begin);
}

} // namespace kenclient
