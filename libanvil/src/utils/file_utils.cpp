#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <memory>
#include <stdexcept>
#include <system_error>

namespace anvil {

    namespace {
        struct FileCloser {
            void operator()(FILE *f) const { if (f) std::fclose(f); }
        };

        using unique_FILE = std::unique_ptr<FILE, FileCloser>;
    }

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts UTF-16 paths; the \\?\ prefix lifts MAX_PATH
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<uint8_t> read_file(const std::filesystem::path& path) {
        const unique_FILE f(open_file(path, "rb"));
        if (!f) {
            Logger::log(LogLevel::Error, "Cannot open input file: " + path.string(), "file_utils");
            throw std::runtime_error("cannot open " + path.string());
        }
        std::fseek(f.get(), 0, SEEK_END);
        const long size = std::ftell(f.get());
        std::fseek(f.get(), 0, SEEK_SET);
        if (size < 0) {
            throw std::runtime_error("cannot determine size of " + path.string());
        }
        std::vector<uint8_t> buf(static_cast<size_t>(size));
        if (size > 0 && std::fread(buf.data(), 1, buf.size(), f.get()) != buf.size()) {
            Logger::log(LogLevel::Error, "Short read on: " + path.string(), "file_utils");
            throw std::runtime_error("failed to read " + path.string());
        }
        return buf;
    }

    void write_file(const std::filesystem::path& path, const std::span<const uint8_t> data) {
        const auto tmp = path.parent_path() /
            (path.filename().string() + "." + RandomUtils::random_suffix() + ".tmp");
        {
            const unique_FILE f(open_file(tmp, "wb"));
            if (!f) {
                Logger::log(LogLevel::Error, "Cannot open output file: " + tmp.string(), "file_utils");
                throw std::runtime_error("cannot open " + tmp.string());
            }
            if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.get()) != data.size()) {
                std::error_code ec;
                std::filesystem::remove(tmp, ec);
                throw std::runtime_error("failed to write " + tmp.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            const std::string rename_error = ec.message();
            Logger::log(LogLevel::Error, "Rename failed: " + path.string() + " (" + rename_error + ")", "file_utils");
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("rename failed: " + rename_error);
        }
    }

} // namespace anvil
