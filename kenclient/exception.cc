#include "kenclient/exception.hh"

namespace kenclient {

LoadException::LoadException() throw() {}
LoadException::~LoadException() throw() {}

LibraryLoadException::LibraryLoadException() throw() {}
LibraryLoadException::~LibraryLoadException() throw() {}

ModelLoadException::ModelLoadException() throw() {}
ModelLoadException::~ModelLoadException() throw() {}

UseAfterReleaseException::UseAfterReleaseException() throw() {}
UseAfterReleaseException::~UseAfterReleaseException() throw() {}

CapacityException::CapacityException() throw() {}
CapacityException::~CapacityException() throw() {}

IndexException::IndexException() throw() {}
IndexException::~IndexException() throw() {}

EmptySequenceException::EmptySequenceException() throw() {}
EmptySequenceException::~EmptySequenceException() throw() {}

PoolBusyException::PoolBusyException() throw() {}
PoolBusyException::~PoolBusyException() throw() {}

PoolMismatchException::PoolMismatchException() throw() {}
PoolMismatchException::~PoolMismatchException() throw() {}

} // namespace kenclient
