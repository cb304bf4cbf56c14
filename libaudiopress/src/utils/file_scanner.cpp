//
// Created by Giuseppe Francione on 20/09/25.
//

#include "../../include/file_scanner.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace audiopress {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    name = to_lower(name);
    return name == ".ds_store" || name == "desktop.ini";
}

bool has_extension(const fs::path& p, const std::vector<std::string>& extensions) {
    const auto ext = to_lower(p.extension().string());
    return std::any_of(extensions.begin(), extensions.end(),
                       [&](const std::string& e) { return to_lower(e) == ext; });
}

} // namespace

std::vector<fs::path>
collect_audio_files(const fs::path& input_root,
                    const fs::path& exclude_root,
                    Logger& logger,
                    const std::vector<std::string>& extensions) {
    std::vector<fs::path> result;
    std::error_code ec;

    const fs::path canonical_exclude = exclude_root.empty() ? fs::path{} : fs::weakly_canonical(exclude_root, ec);
    if (ec) {
        logger.log(LogLevel::Warning, "Cannot resolve " + exclude_root.string() + ": " + ec.message(), "scanner");
    }

    fs::recursive_directory_iterator it(input_root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        logger.log(LogLevel::Error, "Cannot scan " + input_root.string() + ": " + ec.message(), "scanner");
        return result;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::path path = it->path();
        std::error_code type_ec;

        if (it->is_directory(type_ec)) {
            if (!canonical_exclude.empty() && fs::weakly_canonical(path, type_ec) == canonical_exclude) {
                logger.log(LogLevel::Debug, "Skipping output directory " + path.string(), "scanner");
                it.disable_recursion_pending();
            }
        } else if (it->is_regular_file(type_ec) && !is_junk(path) && has_extension(path, extensions)) {
            result.push_back(path);
        }

        it.increment(ec);
        if (ec) {
            logger.log(LogLevel::Warning, "Scan of " + input_root.string() + " stopped early: " + ec.message(), "scanner");
            break;
        }
    }

    std::sort(result.begin(), result.end());
    logger.log(LogLevel::Info,
               "Scanner collected " + std::to_string(result.size()) + " files",
               "scanner");
    return result;
}

} // namespace audiopress
