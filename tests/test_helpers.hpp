#pragma once

#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace test {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "mr_test_file_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (fd >= 0) {
            [[maybe_unused]] auto n = ::write(fd, content.data(), content.size());
            ::close(fd);
        }
    }

    ~TmpFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

// RAII temp directory, removed recursively.
struct TmpDir {
    std::string path;

    TmpDir() {
        path = std::filesystem::temp_directory_path() / "mr_test_dir_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        if (mkdtemp(tmpl.data())) path.assign(tmpl.data());
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string& name) const {
        return (std::filesystem::path(path) / name).string();
    }
};

} // namespace test
