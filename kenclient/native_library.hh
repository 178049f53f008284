#ifndef KENCLIENT_NATIVE_LIBRARY_H
#define KENCLIENT_NATIVE_LIBRARY_H

#include <boost/shared_ptr.hpp>

#include <string>

namespace kenclient {

class Engine;
struct Config;

// Platform-qualified file name, e.g. libken.so on Linux or libken.dylib on
// macOS.  Throws LibraryLoadException on any other platform.
std::string PlatformLibraryName(const std::string &base);

// Where the packaged engine library is expected: library_directory joined
// with the platform-qualified name, or the bare name when no directory is
// configured.
std::string ResolveLocation(const Config &config);

/* Locate and open the engine library according to ResolveLocation.  If the
 * packaged file is missing and config.search_system_path is set, fall back to
 * the dynamic linker's search path.  Throws LibraryLoadException when the
 * library can't be found, can't be opened, or lacks an entry point.
 */
boost::shared_ptr<Engine> LoadEngine(const Config &config);

} // namespace kenclient

#endif // KENCLIENT_NATIVE_LIBRARY_H
