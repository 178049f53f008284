#include "kenclient/native_library.hh"

#include "kenclient/config.hh"
#include "kenclient/exception.hh"
#include "kenclient/shared_library_engine.hh"
#include "util/dl.hh"

#include <ostream>

#include <sys/stat.h>

namespace kenclient {

namespace {

const char kLibraryPrefix[] = "lib";

bool IsRegularFile(const std::string &name) {
  struct stat info;
  return !stat(name.c_str(), &info) && S_ISREG(info.st_mode);
}

boost::shared_ptr<Engine> Open(const std::string &name) {
  void *library;
  try {
    library = util::DlOpenOrThrow(name);
  } catch (const util::DlException &e) {
    UTIL_THROW(LibraryLoadException, "Could not load the KenLM engine library " << name << ": " << e.what());
  }
  return boost::shared_ptr<Engine>(new SharedLibraryEngine(library, name));
}

} // namespace

std::string PlatformLibraryName(const std::string &base) {
#if defined(__APPLE__)
  return kLibraryPrefix + base + ".dylib";
#elif defined(__linux__)
  return kLibraryPrefix + base + ".so";
#else
  UTIL_THROW(LibraryLoadException, "Could not find kenlm binary for your platform");
#endif
}

std::string ResolveLocation(const Config &config) {
  std::string name(PlatformLibraryName(config.library_name));
  if (config.library_directory.empty()) return name;
  std::string ret(config.library_directory);
  if (ret[ret.size() - 1] != '/') ret += '/';
  return ret + name;
}

boost::shared_ptr<Engine> LoadEngine(const Config &config) {
  const std::string location(ResolveLocation(config));
  if (config.messages) *config.messages << "Location resolved to: " << location << std::endl;

  std::string open_name(location);
  if (config.library_directory.empty()) {
    UTIL_THROW_IF(!config.search_system_path, LibraryLoadException, "No library directory is configured and searching the system path is disabled");
  } else if (!IsRegularFile(location)) {
    UTIL_THROW_IF(!config.search_system_path, LibraryLoadException, "Cannot locate " << location << " and searching the system path is disabled");
    open_name = PlatformLibraryName(config.library_name);
    if (config.messages) *config.messages << "Cannot locate " << location << "; falling back to the system library path for " << open_name << std::endl;
  }

  boost::shared_ptr<Engine> ret(Open(open_name));
  if (config.messages) *config.messages << "Loading complete" << std::endl;
  return ret;
}

} // namespace kenclient
