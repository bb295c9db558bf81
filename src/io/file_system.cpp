#include "wslint/io/file_system.hpp"
#include "wslint/io/file_error.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <vector>

namespace wslint {

namespace fs = std::filesystem;

auto FileSystem::open_input(const std::string& path) -> std::unique_ptr<std::istream> {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw FileError("opening", path, std::strerror(EISDIR));
    }

    auto file = std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
    if (!file->is_open()) {
        throw FileError("opening", path, std::strerror(errno));
    }
    return file;
}

auto FileSystem::replace_atomically(const std::string& path,
                                    const std::function<void(std::ostream&)>& writer) -> void {
    auto temp_path = create_temp_beside(path);

    try {
        {
            std::ofstream output(temp_path, std::ios::out | std::ios::binary | std::ios::trunc);
            if (!output.is_open()) {
                throw FileError("creating", temp_path, std::strerror(errno));
            }

            writer(output);

            output.close();
            if (output.fail()) {
                throw FileError("writing", temp_path, "write failed");
            }
        }

        copy_permissions(path, temp_path);

        std::error_code ec;
        fs::rename(temp_path, path, ec);
        if (ec) {
            throw FileError("renaming", temp_path + " to " + path, ec.message());
        }
    } catch (...) {
        // Never leave a half-written temp file behind
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw;
    }
}

auto FileSystem::create_temp_beside(const std::string& path) -> std::string {
    // <path>.XXXXXX.tmp, unique even across parallel runs on the same file
    std::string pattern = path + ".XXXXXX.tmp";
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = ::mkstemps(name.data(), 4);
    if (fd < 0) {
        throw FileError("creating", pattern, std::strerror(errno));
    }
    ::close(fd);

    return std::string(name.data());
}

auto FileSystem::copy_permissions(const std::string& from, const std::string& to) -> void {
    std::error_code ec;
    auto status = fs::status(from, ec);
    if (ec) {
        throw FileError("reading permissions for", from, ec.message());
    }

    fs::permissions(to, status.permissions(), fs::perm_options::replace, ec);
    if (ec) {
        throw FileError("setting permissions for", to, ec.message());
    }
}

} // namespace wslint
