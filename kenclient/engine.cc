#include "kenclient/engine.hh"

namespace kenclient {

Engine::~Engine() {}

} // namespace kenclient
