//
// Created by Giuseppe Francione on 22/10/25.
//

#include "../../include/ffmpeg_encoder.hpp"
#include "../../include/process_runner.hpp"
#include <cstdlib>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace audiopress {

    namespace {
        bool is_executable_file(const fs::path& p) {
            std::error_code ec;
            return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
        }
    } // namespace

    FfmpegEncoder::FfmpegEncoder(std::string executable)
        : executable_(std::move(executable)) {
    }

    bool FfmpegEncoder::is_available() const {
        return find_executable(executable_).has_value();
    }

    std::vector<std::string> FfmpegEncoder::build_arguments(const EncodeRequest& request) const {
        std::vector<std::string> args = {
            executable_,
            "-hide_banner",
            "-nostdin",
            "-loglevel", "error",
            "-y",
            "-i", request.input_path.string()
        };

        const std::string chain = render_filter_chain(request.filters);
        if (!chain.empty()) {
            args.emplace_back("-af");
            args.push_back(chain);
        }

        if (request.preserve_metadata) {
            args.emplace_back("-map_metadata");
            args.emplace_back("0");
        }

        args.emplace_back("-codec:a");
        args.emplace_back("libmp3lame");
        args.emplace_back("-q:a");
        args.push_back(std::to_string(request.quality));
        args.emplace_back("-threads");
        args.push_back(std::to_string(request.thread_budget));
        args.push_back(request.output_path.string());
        return args;
    }

    EncodeOutcome FfmpegEncoder::encode(const EncodeRequest& request) {
        const auto result = run_process(build_arguments(request));
        return EncodeOutcome{result.exit_code, result.diagnostics};
    }

    std::optional<fs::path> FfmpegEncoder::find_executable(const std::string& name) {
        if (name.empty()) {
            return std::nullopt;
        }
        if (name.find('/') != std::string::npos) {
            if (is_executable_file(name)) {
                return fs::path(name);
            }
            return std::nullopt;
        }

        const char* path_env = std::getenv("PATH");
        if (!path_env) {
            return std::nullopt;
        }

        std::istringstream dirs(path_env);
        std::string dir;
        while (std::getline(dirs, dir, ':')) {
            if (dir.empty()) {
                dir = ".";
            }
            fs::path candidate = fs::path(dir) / name;
            if (is_executable_file(candidate)) {
                return candidate;
            }
        }
        return std::nullopt;
    }

} // namespace audiopress
