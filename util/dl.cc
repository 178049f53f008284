#include "util/dl.hh"

#include <cstdlib>
#include <iostream>

#include <dlfcn.h>

namespace util {

DlException::DlException() throw() {
  const char *message = dlerror();
  if (message) *this << message << ' ';
}

DlException::~DlException() throw() {}

scoped_dl::~scoped_dl() {
  if (handle_ && dlclose(handle_)) {
    std::cerr << "Could not close shared library: " << dlerror() << std::endl;
    std::abort();
  }
}

void *DlOpenOrThrow(const std::string &name) {
  // Clear any stale message so DlException reports this failure.
  dlerror();
  void *ret = dlopen(name.c_str(), RTLD_NOW | RTLD_LOCAL);
  UTIL_THROW_IF(!ret, DlException, "while opening " << name);
  return ret;
}

void *DlSymOrThrow(void *handle, const char *symbol) {
  dlerror();
  void *ret = dlsym(handle, symbol);
  UTIL_THROW_IF(!ret, DlException, "while looking up " << symbol);
  return ret;
}

} // namespace util
