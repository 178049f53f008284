#include "util/scoped.hh"

#include <cstdlib>

namespace util {

MallocException::MallocException(std::size_t requested) throw() {
  *this << "for " << requested << " bytes ";
}

MallocException::~MallocException() throw() {}

namespace {
void *InspectAddr(void *addr, std::size_t requested, const char *func_name) {
  UTIL_THROW_IF_ARG(!addr && requested, MallocException, (requested), "in " << func_name);
  return addr;
}
} // namespace

void *CallocOrThrow(std::size_t requested) {
  return InspectAddr(std::calloc(1, requested), requested, "calloc");
}

scoped_malloc::~scoped_malloc() {
  std::free(p_);
}

} // namespace util
