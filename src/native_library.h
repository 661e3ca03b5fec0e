// native_library.h
#pragma once
#include <memory>
#include <string>
#include <utility>

namespace vrpeasy
{

enum class Platform
{
    kWindows,
    kLinux,
    kMac,
    kUnsupported
};

// Platform this binary was built for.
Platform current_platform();

// "Windows", "Linux" or "Darwin"; throws ModelError for kUnsupported.
std::string platform_dir_name(Platform platform);

// Default engine file name for the platform; throws ModelError for kUnsupported.
std::string engine_library_name(Platform platform);

// Loader search-path variable ("LD_LIBRARY_PATH" on Linux), empty where the
// loader has none we rely on.
std::string loader_path_variable(Platform platform);

// Handle to a loaded shared library. Handles are never closed: once a native
// library is mapped it stays for the lifetime of the process.
class SharedLibrary
{
public:
    // Returns nullptr on failure and fills *error with the loader's reason.
    // Opening a path again returns the handle loaded the first time.
    static std::shared_ptr<SharedLibrary> open(const std::string &path,
                                               bool global_symbols,
                                               std::string *error = nullptr);

    const std::string &path() const { return path_; }

    // nullptr when the symbol is absent.
    void *symbol(const char *name) const;

    SharedLibrary(const SharedLibrary &) = delete;
    SharedLibrary &operator=(const SharedLibrary &) = delete;

private:
    SharedLibrary(void *handle, std::string path) : handle_(handle), path_(std::move(path)) {}

    void *handle_;
    std::string path_;
};

// Directory of the binary (executable or shared object) holding this code.
std::string binding_directory();

} // namespace vrpeasy
