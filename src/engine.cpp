#include "engine.h"
#include "errors.h"
#include "loader_env.h"

#include <filesystem>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace vrpeasy
{

    const char *to_string(EngineState state)
    {
        switch (state)
        {
        case EngineState::kStart:
            return "start";
        case EngineState::kPlatformResolved:
            return "platform resolved";
        case EngineState::kEnvPrepared:
            return "environment prepared";
        case EngineState::kLibraryLoaded:
            return "library loaded";
        case EngineState::kInvoked:
            return "invoked";
        case EngineState::kResponseReleased:
            return "response released";
        case EngineState::kFailed:
            return "failed";
        }
        return "unknown";
    }

    static std::string default_library_root(const std::string &binding_dir)
    {
        return (fs::path(binding_dir).parent_path() / "lib").string();
    }

    static std::string resolve_library_root(const EngineOptions &options, const std::string &binding_dir)
    {
        return options.library_root.empty() ? default_library_root(binding_dir) : options.library_root;
    }

    static std::string dependency_directory(const std::string &library_root)
    {
        return (fs::path(library_root) / "Dependencies").string();
    }

    std::vector<std::string> engine_candidates(const std::string &binding_dir,
                                               const std::string &library_root,
                                               Platform platform,
                                               const std::string &library_name)
    {
        std::vector<std::string> out;
        out.reserve(3);
        out.push_back((fs::path(binding_dir) / library_name).string());
        out.push_back((fs::path(library_root) / platform_dir_name(platform) / library_name).string());
        out.push_back(library_name);
        return out;
    }

    LoadedCandidate load_first_candidate(const std::vector<std::string> &candidates,
                                         const LibraryOpener &open,
                                         bool log)
    {
        for (const auto &candidate : candidates)
        {
            auto library = open(candidate);
            if (library)
            {
                if (log)
                    std::cerr << "[engine] loaded " << candidate << "\n";
                return {candidate, std::move(library)};
            }
        }

        std::ostringstream tried;
        tried << "tried";
        for (size_t i = 0; i < candidates.size(); ++i)
            tried << (i ? ", " : " ") << candidates[i];
        throw ModelError(ModelErrorCode::kLibraryNotFound, tried.str());
    }

    EngineBinding::EngineBinding(EngineOptions options) : options_(std::move(options)) {}

    void EngineBinding::load()
    {
        if (library_)
            return;

        try
        {
            platform_ = current_platform();
            const std::string name = options_.library_name.empty()
                                         ? engine_library_name(platform_)
                                         : options_.library_name;
            state_ = EngineState::kPlatformResolved;

            const std::string binding_dir = binding_directory();
            library_root_ = resolve_library_root(options_, binding_dir);
            prepare_loader_environment(platform_, dependency_directory(library_root_),
                                       options_.relaunch_for_loader_path, options_.log_loading);
            state_ = EngineState::kEnvPrepared;

            if (!options_.cplex_path.empty())
            {
                std::string error;
                const std::string path = fs::absolute(options_.cplex_path).lexically_normal().string();
                if (!SharedLibrary::open(path, true, &error))
                    throw ModelError(ModelErrorCode::kAlternateBackendLoad, error);
                if (options_.log_loading)
                    std::cerr << "[engine] loaded alternate backend " << path << "\n";
            }

            const bool log = options_.log_loading;
            const LibraryOpener opener = [log](const std::string &path)
            {
                std::string error;
                auto library = SharedLibrary::open(path, false, &error);
                if (!library && log)
                    std::cerr << "[engine] cannot load " << error << "\n";
                return library;
            };
            LoadedCandidate loaded = load_first_candidate(
                engine_candidates(binding_dir, library_root_, platform_, name), opener, log);

            auto solve_fn = reinterpret_cast<SolveModelFn>(loaded.library->symbol(kSolveSymbol));
            auto free_fn = reinterpret_cast<FreeMemoryFn>(loaded.library->symbol(kFreeSymbol));
            if (!solve_fn || !free_fn)
            {
                throw ModelError(ModelErrorCode::kLibraryNotFound,
                                 loaded.path + " does not export " + kSolveSymbol + "/" + kFreeSymbol);
            }

            solve_fn_ = solve_fn;
            free_fn_ = free_fn;
            library_ = std::move(loaded.library);
            library_path_ = loaded.path;
            state_ = EngineState::kLibraryLoaded;
        }
        catch (...)
        {
            state_ = EngineState::kFailed;
            throw;
        }
    }

    std::string EngineBinding::solve(const std::string &request)
    {
        load();

        char *raw = nullptr;
        try
        {
            raw = solve_fn_(request.c_str());
        }
        catch (const std::exception &e)
        {
            state_ = EngineState::kFailed;
            throw ModelError(ModelErrorCode::kEngineInvocation, e.what());
        }
        catch (...)
        {
            state_ = EngineState::kFailed;
            throw ModelError(ModelErrorCode::kEngineInvocation, "unknown exception from the engine");
        }
        state_ = EngineState::kInvoked;

        std::string text;
        {
            NativeBuffer response(raw, free_fn_);
            if (!response)
            {
                state_ = EngineState::kFailed;
                throw ModelError(ModelErrorCode::kEngineInvocation, "the engine returned no response");
            }
            text = response.text();
        }
        state_ = EngineState::kResponseReleased;
        if (text.empty())
        {
            state_ = EngineState::kFailed;
            throw ModelError(ModelErrorCode::kEngineInvocation, "the engine returned an empty response");
        }
        return text;
    }

    void prepare_engine_environment(const EngineOptions &options)
    {
        const Platform platform = current_platform();
        if (platform == Platform::kUnsupported)
            throw ModelError(ModelErrorCode::kUnsupportedPlatform);
        const std::string root = resolve_library_root(options, binding_directory());
        prepare_loader_environment(platform, dependency_directory(root),
                                   options.relaunch_for_loader_path, options.log_loading);
    }

} // namespace vrpeasy
