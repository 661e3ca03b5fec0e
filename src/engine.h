// engine.h
#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "native_library.h"

namespace vrpeasy
{

// C entry points of the engine library.
extern "C"
{
    typedef char *(*SolveModelFn)(const char *request);
    typedef void (*FreeMemoryFn)(char *response);
}

inline constexpr const char *kSolveSymbol = "solveModel";
inline constexpr const char *kFreeSymbol = "freeMemory";

// All fields optional; empty strings mean "derive the default".
struct EngineOptions
{
    // Root of the bundled native libraries: <root>/<Platform>/ holds the
    // engine, <root>/Dependencies its dependencies. Default: <binding dir>/../lib
    std::string library_root;

    // Engine file name; default depends on the platform.
    std::string library_name;

    // Alternate backend library loaded before the engine (Parameters::cplex_path).
    std::string cplex_path;

    // Linux only: re-exec once with a corrected LD_LIBRARY_PATH instead of
    // preloading the dependencies by absolute path.
    bool relaunch_for_loader_path = false;

    bool log_loading = false;
};

enum class EngineState
{
    kStart,
    kPlatformResolved,
    kEnvPrepared,
    kLibraryLoaded,
    kInvoked,
    kResponseReleased,
    kFailed
};

const char *to_string(EngineState state);

// Locations tried for the engine, in order: next to the binding, under the
// platform directory of the library root, then the bare name for the system loader.
std::vector<std::string> engine_candidates(const std::string &binding_dir,
                                           const std::string &library_root,
                                           Platform platform,
                                           const std::string &library_name);

using LibraryOpener = std::function<std::shared_ptr<SharedLibrary>(const std::string &path)>;

struct LoadedCandidate
{
    std::string path;
    std::shared_ptr<SharedLibrary> library;
};

// First candidate the opener accepts. Throws one ModelError(kLibraryNotFound)
// when every candidate fails.
LoadedCandidate load_first_candidate(const std::vector<std::string> &candidates,
                                     const LibraryOpener &open,
                                     bool log = false);

// Engine-owned response text. The release function runs exactly once, when
// the buffer goes out of scope.
class NativeBuffer
{
public:
    NativeBuffer(char *data, FreeMemoryFn release) : data_(data, release) {}

    explicit operator bool() const { return data_ != nullptr; }
    std::string text() const { return data_ ? std::string(data_.get()) : std::string(); }

private:
    std::unique_ptr<char, FreeMemoryFn> data_;
};

// Locates, loads and calls the engine. One request per solve() call; blocking.
class EngineBinding
{
public:
    explicit EngineBinding(EngineOptions options = EngineOptions());

    // Platform resolution, loader environment, alternate backend and engine
    // discovery. Does nothing once the engine is loaded.
    void load();

    // Sends the request text and returns a copy of the response text. A null
    // or empty response raises ModelError(kEngineInvocation).
    // Loads the engine first if needed.
    std::string solve(const std::string &request);

    EngineState state() const { return state_; }
    const std::string &library_path() const { return library_path_; }
    const std::string &library_root() const { return library_root_; }

private:
    EngineOptions options_;
    EngineState state_ = EngineState::kStart;
    Platform platform_ = Platform::kUnsupported;
    std::string library_root_;
    std::string library_path_;
    std::shared_ptr<SharedLibrary> library_;
    SolveModelFn solve_fn_ = nullptr;
    FreeMemoryFn free_fn_ = nullptr;
};

// Runs the loader environment step once, early in main(), so a Linux relaunch
// happens before any model state is built.
void prepare_engine_environment(const EngineOptions &options);

} // namespace vrpeasy
