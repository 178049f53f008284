#ifndef KENCLIENT_EXCEPTION_H
#define KENCLIENT_EXCEPTION_H

#include "util/exception.hh"

namespace kenclient {

// The engine or the model could not be loaded.  Fatal to that Client only.
class LoadException : public util::Exception {
  public:
    virtual ~LoadException() throw();

  protected:
    LoadException() throw();
};

// Can't find the engine: the library could not be resolved, opened, or is
// missing an entry point.
class LibraryLoadException : public LoadException {
  public:
    LibraryLoadException() throw();
    ~LibraryLoadException() throw();
};

// The engine rejected the model file: missing or malformed.
class ModelLoadException : public LoadException {
  public:
    ModelLoadException() throw();
    ~ModelLoadException() throw();
};

// A Client or Pool was used after release.  Always a caller bug.
class UseAfterReleaseException : public util::Exception {
  public:
    UseAfterReleaseException() throw();
    ~UseAfterReleaseException() throw();
};

class CapacityException : public util::Exception {
  public:
    CapacityException() throw();
    ~CapacityException() throw();
};

class IndexException : public util::Exception {
  public:
    IndexException() throw();
    ~IndexException() throw();
};

class EmptySequenceException : public util::Exception {
  public:
    EmptySequenceException() throw();
    ~EmptySequenceException() throw();
};

// Two callers tried to use one Pool at the same time.
class PoolBusyException : public util::Exception {
  public:
    PoolBusyException() throw();
    ~PoolBusyException() throw();
};

// The Pool was created on a different engine than the Client querying it.
class PoolMismatchException : public util::Exception {
  public:
    PoolMismatchException() throw();
    ~PoolMismatchException() throw();
};

} // namespace kenclient

#endif // KENCLIENT_EXCEPTION_H
