#include "native_library.h"
#include "errors.h"

#include <filesystem>
#include <mutex>
#include <unordered_map>

#if defined(_WIN32)
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace fs = std::filesystem;

namespace vrpeasy
{

    Platform current_platform()
    {
#if defined(_WIN32)
        return Platform::kWindows;
#elif defined(__APPLE__)
        return Platform::kMac;
#elif defined(__linux__)
        return Platform::kLinux;
#else
        return Platform::kUnsupported;
#endif
    }

    std::string platform_dir_name(Platform platform)
    {
        switch (platform)
        {
        case Platform::kWindows:
            return "Windows";
        case Platform::kLinux:
            return "Linux";
        case Platform::kMac:
            return "Darwin";
        case Platform::kUnsupported:
            break;
        }
        throw ModelError(ModelErrorCode::kUnsupportedPlatform);
    }

    std::string engine_library_name(Platform platform)
    {
        switch (platform)
        {
        case Platform::kWindows:
            return "bapcod-shared.dll";
        case Platform::kLinux:
            return "libbapcod-shared.so";
        case Platform::kMac:
            return "libbapcod-shared.dylib";
        case Platform::kUnsupported:
            break;
        }
        throw ModelError(ModelErrorCode::kUnsupportedPlatform);
    }

    std::string loader_path_variable(Platform platform)
    {
        return platform == Platform::kLinux ? "LD_LIBRARY_PATH" : "";
    }

    // Loaded libraries by the path they were requested under. Shared by every
    // binding in the process.
    static std::mutex g_loaded_mutex;
    static std::unordered_map<std::string, std::shared_ptr<SharedLibrary>> g_loaded;

    std::shared_ptr<SharedLibrary> SharedLibrary::open(const std::string &path,
                                                       bool global_symbols,
                                                       std::string *error)
    {
        std::lock_guard<std::mutex> lock(g_loaded_mutex);
        auto it = g_loaded.find(path);
        if (it != g_loaded.end())
            return it->second;

        // Gives make_shared access to the private constructor.
        struct Enabler : SharedLibrary
        {
            Enabler(void *handle, std::string path) : SharedLibrary(handle, std::move(path)) {}
        };

        std::shared_ptr<SharedLibrary> library;
#if defined(_WIN32)
        (void)global_symbols;
        HMODULE handle = ::LoadLibraryA(path.c_str());
        if (!handle)
        {
            if (error)
                *error = path + ": LoadLibrary failed with error " + std::to_string(::GetLastError());
            return nullptr;
        }
        library = std::make_shared<Enabler>(reinterpret_cast<void *>(handle), path);
#else
        const int flags = RTLD_NOW | (global_symbols ? RTLD_GLOBAL : RTLD_LOCAL);
        void *handle = ::dlopen(path.c_str(), flags);
        if (!handle)
        {
            if (error)
            {
                const char *reason = ::dlerror();
                *error = reason ? reason : (path + ": dlopen failed");
            }
            return nullptr;
        }
        library = std::make_shared<Enabler>(handle, path);
#endif
        g_loaded.emplace(path, library);
        return library;
    }

    void *SharedLibrary::symbol(const char *name) const
    {
#if defined(_WIN32)
        return reinterpret_cast<void *>(::GetProcAddress(reinterpret_cast<HMODULE>(handle_), name));
#else
        return ::dlsym(handle_, name);
#endif
    }

    std::string binding_directory()
    {
#if defined(_WIN32)
        HMODULE self = nullptr;
        if (!::GetModuleHandleExA(GET_MODULE_HANDLE_EX_FLAG_FROM_ADDRESS |
                                      GET_MODULE_HANDLE_EX_FLAG_UNCHANGED_REFCOUNT,
                                  reinterpret_cast<LPCSTR>(&binding_directory), &self))
            return fs::current_path().string();
        char buffer[MAX_PATH];
        const DWORD n = ::GetModuleFileNameA(self, buffer, MAX_PATH);
        if (n == 0 || n == MAX_PATH)
            return fs::current_path().string();
        return fs::path(std::string(buffer, n)).parent_path().string();
#else
        Dl_info info{};
        if (::dladdr(reinterpret_cast<void *>(&binding_directory), &info) == 0 || !info.dli_fname)
            return fs::current_path().string();
        std::error_code ec;
        fs::path self = fs::canonical(fs::path(info.dli_fname), ec);
        if (ec)
            self = fs::absolute(fs::path(info.dli_fname));
        return self.parent_path().string();
#endif
    }

} // namespace vrpeasy
