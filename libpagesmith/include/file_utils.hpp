#ifndef PAGESMITH_FILE_UTILS_HPP
#define PAGESMITH_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pagesmith {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief RAII closer for FILE pointers.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Reads a whole file into memory.
     * @throws std::runtime_error if the file cannot be read.
     */
    std::vector<std::uint8_t> read_file(const std::filesystem::path &path);

    /**
     * @brief Returns a fresh, not yet existing path inside @p dir.
     * @param dir Directory (created if missing).
     * @param extension Extension including the dot (e.g. ".jpg").
     */
    std::filesystem::path make_temp_path(const std::filesystem::path &dir,
                                         std::string_view extension);

    /// @brief Creates the parent directory of @p path if it does not exist.
    void ensure_parent_dir_exists(const std::filesystem::path &path);

    /**
     * @brief Moves a finished temporary file over its destination.
     *
     * Retries on sharing violations, which happen on Windows while an
     * antivirus or indexer holds the destination open.
     * @throws std::runtime_error if the rename keeps failing.
     */
    void commit_temp_file(const std::filesystem::path &temp_file,
                          const std::filesystem::path &destination);

    /**
     * @brief Owns a file on disk and deletes it on destruction.
     */
    class TempFile {
    public:
        TempFile() = default;
        explicit TempFile(std::filesystem::path path) : path_(std::move(path)) {}
        ~TempFile();

        TempFile(const TempFile &) = delete;
        TempFile &operator=(const TempFile &) = delete;
        TempFile(TempFile &&other) noexcept : path_(std::exchange(other.path_, {})) {}
        TempFile &operator=(TempFile &&other) noexcept;

        [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

        /// @brief Gives up ownership without deleting the file.
        std::filesystem::path release() noexcept { return std::exchange(path_, {}); }

    private:
        void remove() noexcept;
        std::filesystem::path path_;
    };

} // namespace pagesmith

#endif // PAGESMITH_FILE_UTILS_HPP
