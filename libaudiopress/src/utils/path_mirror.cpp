//
// Created by Giuseppe Francione on 21/10/25.
//

#include "../../include/path_mirror.hpp"
#include "../../include/errors.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace audiopress {

    fs::path PathMirror::mirror(const fs::path& input_root,
                                const fs::path& output_root,
                                const fs::path& source_path) {
        fs::path root = input_root.lexically_normal();
        if (!root.has_filename() && root.has_relative_path()) {
            root = root.parent_path(); // "in/" -> "in"
        }
        const fs::path source = source_path.lexically_normal();
        const fs::path relative = source.lexically_relative(root);

        // an empty result or a leading ".." means source is not inside root
        if (relative.empty() || relative == "." || *relative.begin() == "..") {
            throw PathMirrorError("'" + source_path.string() + "' is not inside input directory '" +
                                  input_root.string() + "'");
        }
        return (output_root / relative).lexically_normal();
    }

    void PathMirror::ensure_parent_directory(const fs::path& dest_path) {
        const fs::path parent = dest_path.parent_path();
        if (parent.empty()) {
            return;
        }

        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw DirectoryCreateError("Failed to create directory '" + parent.string() + "': " + ec.message());
        }
        if (!fs::is_directory(parent, ec)) {
            throw DirectoryCreateError("Failed to create directory '" + parent.string() + "': not a directory");
        }
    }

    fs::path PathMirror::resolve(const fs::path& input_root,
                                 const fs::path& output_root,
                                 const fs::path& source_path) {
        auto dest = mirror(input_root, output_root, source_path);
        ensure_parent_directory(dest);
        return dest;
    }

} // namespace audiopress
