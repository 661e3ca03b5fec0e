// loader_env.h
#pragma once
#include <string>
#include <vector>

#include "native_library.h"

namespace vrpeasy
{

// Set in the environment of a relaunched process so it never relaunches twice.
inline constexpr const char *kRelaunchMarker = "VRPEASY_RELAUNCHED";

// Engine dependencies, lowest level (numeric utilities) first.
const std::vector<std::string> &dependency_load_order();

// Entries of a ':' separated search path.
bool path_list_contains(const std::string &list, const std::string &dir);
std::string path_list_append(const std::string &list, const std::string &dir);

// Linux: files of dependency_load_order() present in dir, in load order.
// The first "<name>.so*" match in name order is taken for each dependency.
std::vector<std::string> find_dependency_files(const std::string &dir);

// macOS: the fixed "<name>.0.dylib" paths under dir, in load order. Every one
// of them is required.
std::vector<std::string> mac_dependency_files(const std::string &dir);

enum class LoaderPreparation
{
    kNotNeeded,        // platform has no preparation step
    kAlreadyConfigured, // search path already lists the dependency directory
    kPreloaded,        // dependencies were loaded by absolute path
    kSkipped           // no dependency directory; leave it to the system loader
};

// Makes the engine's dependencies resolvable before the engine is loaded.
// On Linux with relaunch set, a missing search-path entry re-executes the
// process with the corrected LD_LIBRARY_PATH and does not return.
// With the relaunch marker already set, Linux preloads instead of relaunching.
// macOS requires every dependency: a missing or unloadable one raises
// ModelError. On Linux only a present dependency that fails to load does.
LoaderPreparation prepare_loader_environment(Platform platform,
                                             const std::string &dependency_dir,
                                             bool relaunch,
                                             bool log);

// Re-executes the running program with variable=value and the relaunch marker
// set. Exits with status 1 if exec fails.
[[noreturn]] void relaunch_process(const std::string &variable, const std::string &value);

} // namespace vrpeasy
