#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <chrono>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace pagesmith {

    FILE* open_file(const fs::path& path, const char* mode) {
#ifdef _WIN32
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = fs::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }
        // long path prefix bypasses MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<std::uint8_t> read_file(const fs::path& path) {
        unique_FILE f(open_file(path, "rb"));
        if (!f) {
            Logger::log(LogLevel::Error, "Cannot open file: " + path.string(), "file_utils");
            throw std::runtime_error("Cannot open file: " + path.string());
        }
        std::vector<std::uint8_t> data;
        std::uint8_t buf[64 * 1024];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), f.get())) > 0) {
            data.insert(data.end(), buf, buf + n);
        }
        if (std::ferror(f.get())) {
            throw std::runtime_error("Read error: " + path.string());
        }
        return data;
    }

    fs::path make_temp_path(const fs::path& dir, const std::string_view extension) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                        "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                        "file_utils");
            throw std::runtime_error("Failed to create temp dir: " + dir.string());
        }
        for (;;) {
            auto candidate = dir / ("pagesmith_" + RandomUtils::random_suffix() + std::string(extension));
            if (!fs::exists(candidate, ec)) {
                return candidate;
            }
        }
    }

    void ensure_parent_dir_exists(const fs::path& path) {
        const auto parent = path.parent_path();
        if (parent.empty()) return;
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    void commit_temp_file(const fs::path& temp_file, const fs::path& destination) {
        std::error_code ec;
        int retries = 10;
        while (retries > 0) {
            fs::rename(temp_file, destination, ec);
            if (!ec) return;

            if (ec.value() != 32 && ec.value() != 5 && ec.value() != 2) break;

            Logger::log(LogLevel::Debug, "Rename failed (sharing/lock violation), retrying in 250ms...",
                        "file_utils");
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            --retries;
        }

        // rename across devices is not possible, fall back to a copy
        std::error_code copy_ec;
        fs::copy_file(temp_file, destination, fs::copy_options::overwrite_existing, copy_ec);
        std::error_code rm_ec;
        fs::remove(temp_file, rm_ec);
        if (copy_ec) {
            Logger::log(LogLevel::Error, "Cannot write " + destination.string() + " (" + ec.message() + ")",
                        "file_utils");
            throw std::runtime_error("Cannot write " + destination.string() + ": " + copy_ec.message());
        }
    }

    TempFile::~TempFile() {
        remove();
    }

    TempFile& TempFile::operator=(TempFile&& other) noexcept {
        if (this != &other) {
            remove();
            path_ = std::exchange(other.path_, {});
        }
        return *this;
    }

    void TempFile::remove() noexcept {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp file: " + path_.string() + " (" + ec.message() + ")",
                        "file_utils");
        }
        path_.clear();
    }

} // namespace pagesmith
