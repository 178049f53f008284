#ifndef UTIL_DL_H
#define UTIL_DL_H

#include "util/exception.hh"

#include <string>

namespace util {

// Thrown when the dynamic linker fails.  The message includes dlerror().
class DlException : public Exception {
  public:
    DlException() throw();
    ~DlException() throw();
};

// Owns a handle returned by dlopen.
class scoped_dl {
  public:
    scoped_dl() : handle_(NULL) {}

    explicit scoped_dl(void *handle) : handle_(handle) {}

    ~scoped_dl();

    void reset(void *to = NULL) {
      scoped_dl other(handle_);
      handle_ = to;
    }

    void *get() const { return handle_; }

    void *release() {
      void *ret = handle_;
      handle_ = NULL;
      return ret;
    }

  private:
    void *handle_;

    scoped_dl(const scoped_dl &);
    scoped_dl &operator=(const scoped_dl &);
};

// dlopen with RTLD_NOW | RTLD_LOCAL.  name may be a path or a bare file name
// to search the dynamic linker's path.
void *DlOpenOrThrow(const std::string &name);

void *DlSymOrThrow(void *handle, const char *symbol);

// Typed lookup of a function pointer.
template <class Function> void DlSymOrThrow(void *handle, const char *symbol, Function &to) {
  // POSIX guarantees object and function pointers have the same
  // representation for dlsym.  Copy through a union so compilers don't warn.
  union {
    void *object;
    Function function;
  } convert;
  convert.object = DlSymOrThrow(handle, symbol);
  to = convert.function;
}

} // namespace util

#endif // UTIL_DL_H
