#ifndef UTIL_SCOPED_H
#define UTIL_SCOPED_H
/* Scoped objects in the style of scoped_ptr for memory handed to C code. */

#include "util/exception.hh"

#include <cstddef>
#include <limits>

namespace util {

class MallocException : public ErrnoException {
  public:
    explicit MallocException(std::size_t requested) throw();
    ~MallocException() throw();
};

void *CallocOrThrow(std::size_t requested);

// Zeroed array of count elements.  Throws MallocException on overflow too.
template <class T> T *CallocArrayOrThrow(std::size_t count) {
  UTIL_THROW_IF_ARG(count > std::numeric_limits<std::size_t>::max() / sizeof(T), MallocException, (std::numeric_limits<std::size_t>::max()), "counting " << count << " elements of size " << sizeof(T));
  return static_cast<T*>(CallocOrThrow(count * sizeof(T)));
}

class scoped_malloc {
  public:
    scoped_malloc() : p_(NULL) {}

    explicit scoped_malloc(void *p) : p_(p) {}

    ~scoped_malloc();

    void reset(void *p = NULL) {
      scoped_malloc other(p_);
      p_ = p;
    }

    void *get() { return p_; }
    const void *get() const { return p_; }

    template <class T> T *as() { return static_cast<T*>(p_); }
    template <class T> const T *as() const { return static_cast<const T*>(p_); }

  private:
    void *p_;

    scoped_malloc(const scoped_malloc &);
    scoped_malloc &operator=(const scoped_malloc &);
};

} // namespace util

#endif // UTIL_SCOPED_H
