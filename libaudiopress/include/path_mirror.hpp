//
// Created by Giuseppe Francione on 21/10/25.
//

#ifndef AUDIOPRESS_PATH_MIRROR_HPP
#define AUDIOPRESS_PATH_MIRROR_HPP

#include <filesystem>

namespace audiopress {

    /**
     * @brief Maps files from the input tree onto the output tree.
     *
     * @details The relative path of a destination below the output root
     * is always the relative path of its source below the input root,
     * whatever the nesting depth.
     */
    class PathMirror {
    public:
        /**
         * @brief Compute the mirrored destination of @p source_path.
         *
         * Pure path arithmetic, nothing is created on disk.
         *
         * @throws PathMirrorError if @p source_path is not below @p input_root.
         */
        static std::filesystem::path mirror(const std::filesystem::path& input_root,
                                            const std::filesystem::path& output_root,
                                            const std::filesystem::path& source_path);

        /**
         * @brief Create every missing directory above @p dest_path.
         * @throws DirectoryCreateError if a directory cannot be created.
         */
        static void ensure_parent_directory(const std::filesystem::path& dest_path);

        /**
         * @brief mirror() followed by ensure_parent_directory().
         * @return The mirrored destination path.
         */
        static std::filesystem::path resolve(const std::filesystem::path& input_root,
                                             const std::filesystem::path& output_root,
                                             const std::filesystem::path& source_path);
    };

} // namespace audiopress

#endif // AUDIOPRESS_PATH_MIRROR_HPP
