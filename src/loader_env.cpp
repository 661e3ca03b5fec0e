#include "loader_env.h"
#include "errors.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace vrpeasy
{

    const std::vector<std::string> &dependency_load_order()
    {
        static const std::vector<std::string> order{"libCoinUtils", "libClp", "libOsi", "libOsiClp"};
        return order;
    }

    static std::vector<std::string> split_path_list(const std::string &list)
    {
        std::vector<std::string> out;
        std::stringstream ss(list);
        std::string item;
        while (std::getline(ss, item, ':'))
        {
            if (!item.empty())
                out.push_back(item);
        }
        return out;
    }

    static std::string normalized(const std::string &dir)
    {
        std::string s = fs::path(dir).lexically_normal().string();
        while (s.size() > 1 && s.back() == '/')
            s.pop_back();
        return s;
    }

    bool path_list_contains(const std::string &list, const std::string &dir)
    {
        const std::string wanted = normalized(dir);
        for (const auto &entry : split_path_list(list))
        {
            if (normalized(entry) == wanted)
                return true;
        }
        return false;
    }

    std::string path_list_append(const std::string &list, const std::string &dir)
    {
        if (list.empty())
            return dir;
        return list + ":" + dir;
    }

    std::vector<std::string> find_dependency_files(const std::string &dir)
    {
        std::vector<std::string> out;
        std::error_code ec;
        if (dir.empty() || !fs::is_directory(dir, ec))
            return out;

        for (const auto &base : dependency_load_order())
        {
            // libClp.so.1 must not be taken for libClpSolver.so
            std::vector<std::string> matches;
            const std::string prefix = base + ".so";
            for (const auto &entry : fs::directory_iterator(dir, ec))
            {
                const std::string name = entry.path().filename().string();
                if (name.compare(0, prefix.size(), prefix) == 0)
                    matches.push_back(entry.path().string());
            }
            if (!matches.empty())
            {
                std::sort(matches.begin(), matches.end());
                out.push_back(matches.front());
            }
        }
        return out;
    }

    std::vector<std::string> mac_dependency_files(const std::string &dir)
    {
        std::vector<std::string> out;
        for (const auto &base : dependency_load_order())
            out.push_back((fs::path(dir) / (base + ".0.dylib")).string());
        return out;
    }

    static void preload(const std::string &path, bool log)
    {
        std::error_code ec;
        if (!fs::exists(path, ec))
            throw ModelError(ModelErrorCode::kLibraryNotFound, "dependency " + path + " is missing");
        std::string error;
        if (!SharedLibrary::open(path, true, &error))
            throw ModelError(ModelErrorCode::kLibraryNotFound, "dependency " + error);
        if (log)
            std::cerr << "[loader] preloaded " << path << "\n";
    }

    LoaderPreparation prepare_loader_environment(Platform platform,
                                                 const std::string &dependency_dir,
                                                 bool relaunch,
                                                 bool log)
    {
        std::error_code ec;
        const bool have_dir = !dependency_dir.empty() && fs::is_directory(dependency_dir, ec);

        switch (platform)
        {
        case Platform::kWindows:
            return LoaderPreparation::kNotNeeded;

        case Platform::kMac:
            for (const auto &path : mac_dependency_files(dependency_dir))
                preload(path, log);
            return LoaderPreparation::kPreloaded;

        case Platform::kLinux:
        {
            const std::string var = loader_path_variable(platform);
            const char *current = std::getenv(var.c_str());
            const std::string list = current ? current : "";
            if (path_list_contains(list, dependency_dir))
                return LoaderPreparation::kAlreadyConfigured;
            if (!have_dir)
            {
                if (log)
                    std::cerr << "[loader] no dependency directory at " << dependency_dir << "\n";
                return LoaderPreparation::kSkipped;
            }
            if (relaunch)
            {
                if (!std::getenv(kRelaunchMarker))
                    relaunch_process(var, path_list_append(list, dependency_dir));
                std::cerr << "[loader] " << var << " still misses " << dependency_dir
                          << " after relaunch, preloading instead\n";
            }
            for (const auto &path : find_dependency_files(dependency_dir))
                preload(path, log);
            return LoaderPreparation::kPreloaded;
        }

        case Platform::kUnsupported:
            break;
        }
        throw ModelError(ModelErrorCode::kUnsupportedPlatform);
    }

    void relaunch_process(const std::string &variable, const std::string &value)
    {
#if defined(__linux__)
        std::ifstream in("/proc/self/cmdline", std::ios::binary);
        std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::vector<std::string> args;
        std::string cur;
        for (char c : raw)
        {
            if (c == '\0')
            {
                args.push_back(cur);
                cur.clear();
            }
            else
                cur.push_back(c);
        }
        if (!cur.empty())
            args.push_back(cur);

        std::vector<char *> argv;
        argv.reserve(args.size() + 1);
        for (auto &a : args)
            argv.push_back(&a[0]);
        argv.push_back(nullptr);

        ::setenv(variable.c_str(), value.c_str(), 1);
        ::setenv(kRelaunchMarker, "1", 1);
        std::cerr << "[loader] relaunching with " << variable << "=" << value << "\n";
        std::cerr.flush();
        std::cout.flush();

        ::execv("/proc/self/exe", argv.data());
        std::cerr << "[loader] failed re-exec: " << std::strerror(errno) << "\n";
#else
        std::cerr << "[loader] cannot relaunch to set " << variable << "=" << value
                  << " on this platform\n";
#endif
        std::exit(1);
    }

} // namespace vrpeasy
