#ifndef KENCLIENT_CONFIG_H
#define KENCLIENT_CONFIG_H

/* Configuration for loading the engine and models.  Separate header to reduce
 * pollution.
 */

#include <iosfwd>
#include <string>

namespace kenclient {

struct Config {
  // Where to log messages.  Set to NULL for silence.
  std::ostream *messages;

  // Directory holding the packaged engine library.  Empty to rely on the
  // dynamic linker's search path alone.
  std::string library_directory;

  // Base name of the engine library.  The platform prefix and extension are
  // added, so "ken" becomes libken.so on Linux.
  std::string library_name;

  // When the packaged library is missing, fall back to the dynamic linker's
  // search path (LD_LIBRARY_PATH, ld.so.cache, ...).
  bool search_system_path;

  // Defaults.
  Config();
};

} // namespace kenclient

#endif // KENCLIENT_CONFIG_H
