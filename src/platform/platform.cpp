#include "buckle/platform.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace buckle {

namespace fs = std::filesystem;

namespace {

Result<void> write_failure(const std::string& path, const std::string& what) {
    return Result<void>::err(Error(ErrorCode::PERMISSION_ERROR, what).withPath(path));
}

#ifndef _WIN32

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

// Write all of content to fd, retrying short writes and EINTR
bool write_all(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

// Permission bits of path, or nullopt when it cannot be stat'ed
std::optional<mode_t> permission_bits(const std::string& path) {
    struct stat st;
    if (path.empty() || ::stat(path.c_str(), &st) != 0) return std::nullopt;
    return static_cast<mode_t>(st.st_mode & 07777);
}

bool sync_fd(int fd) {
#ifdef __APPLE__
    return ::fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return ::fsync(fd) == 0;
#endif
}

#endif

Result<std::vector<std::string>> listing_failure(const std::string& path, const std::string& what) {
    return Result<std::vector<std::string>>::err(Error(ErrorCode::IO_ERROR, what).withPath(path));
}

template<typename Keep>
Result<std::vector<std::string>> list_entries(const std::string& path, Keep keep) {
    std::vector<std::string> names;
    std::error_code ec;

    auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return Result<std::vector<std::string>>::ok(std::move(names));
    }
    if (ec) {
        return listing_failure(path, "failed to access directory: " + ec.message());
    }
    if (!fs::is_directory(status)) {
        return listing_failure(path, "expected a directory");
    }

    fs::directory_iterator it(path, ec);
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (keep(name, it->path())) {
            names.push_back(std::move(name));
        }
    }
    if (ec) {
        return listing_failure(path, "failed to list directory: " + ec.message());
    }

    std::sort(names.begin(), names.end());
    return Result<std::vector<std::string>>::ok(std::move(names));
}

} // namespace

// ============================================================================
// File Writes
// ============================================================================

Result<void> atomic_write_file(const std::string& path,
                               const std::string& content,
                               const std::string& mode_source) {
    std::string temp_path = path + ".buckle-" + generate_uuid();

#ifdef _WIN32
    (void)mode_source;
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return write_failure(path, "failed to create temporary file");
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            DeleteFileA(temp_path.c_str());
            return write_failure(path, "failed to write temporary file");
        }
    }

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        return write_failure(path, "failed to replace destination (error " +
                                   std::to_string(GetLastError()) + ")");
    }
#else
    auto mode = permission_bits(path);
    if (!mode) mode = permission_bits(mode_source);
    if (!mode) mode = static_cast<mode_t>(0644);

    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return write_failure(path, errno_text("failed to create temporary file"));
    }

    std::string failure;
    if (::fchmod(fd, *mode) != 0) {
        failure = errno_text("failed to set permissions on temporary file");
    } else if (!write_all(fd, content)) {
        failure = errno_text("failed to write temporary file");
    } else if (!sync_fd(fd)) {
        failure = errno_text("failed to flush temporary file");
    }
    ::close(fd);

    if (failure.empty() && ::rename(temp_path.c_str(), path.c_str()) != 0) {
        failure = errno_text("failed to replace destination");
    }
    if (!failure.empty()) {
        ::unlink(temp_path.c_str());
        return write_failure(path, failure);
    }

    // Persist the rename itself; the content is already in place if this fails
    std::string parent = get_parent_directory(path);
    int dir_fd = ::open(parent.empty() ? "." : parent.c_str(), O_RDONLY | O_CLOEXEC);
    if (dir_fd >= 0) {
        sync_fd(dir_fd);
        ::close(dir_fd);
    }
#endif

    return Result<void>::ok();
}

std::optional<std::string> create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) return ec.message();
    return std::nullopt;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// ============================================================================
// Paths
// ============================================================================

std::string to_portable_path(const std::string& path) {
    std::string portable = path;
    std::replace(portable.begin(), portable.end(), '\\', '/');
    return portable;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    return to_portable_path((fs::path(base) / rel).string());
}

std::string rebase_path(const std::string& root, const std::string& path) {
    if (root.empty()) return path;
    return join_path(root, fs::path(path).relative_path().string());
}

// ============================================================================
// Directory Listing
// ============================================================================

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

Result<std::vector<std::string>> list_regular_files(const std::string& path) {
    return list_entries(path, [](const std::string& name, const fs::path& entry) {
        std::error_code ec;
        return name[0] != '.' && fs::is_regular_file(entry, ec);
    });
}

Result<std::vector<std::string>> list_subdirectories(const std::string& path) {
    return list_entries(path, [](const std::string&, const fs::path& entry) {
        std::error_code ec;
        return fs::is_directory(entry, ec);
    });
}

// ============================================================================
// Process Environment
// ============================================================================

namespace {

void add_env_entry(std::unordered_map<std::string, std::string>& env, const std::string& entry) {
    // Windows keeps per-drive entries such as "=C:=C:\" that start with '='
    size_t eq = entry.find('=', 1);
    if (eq == std::string::npos) return;
    env[entry.substr(0, eq)] = entry.substr(eq + 1);
}

} // namespace

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

#ifdef _WIN32
    char* block = GetEnvironmentStringsA();
    if (!block) return env;
    for (const char* p = block; *p; p += std::strlen(p) + 1) {
        if (*p != '=') add_env_entry(env, p);
    }
    FreeEnvironmentStringsA(block);
#else
    for (char** entry = environ; *entry; ++entry) {
        add_env_entry(env, *entry);
    }
#endif

    return env;
}

std::optional<std::string> find_executable(const std::string& name, const std::string& path_value) {
#ifdef _WIN32
    const char separator = ';';
    auto runnable = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec);
    };
#else
    const char separator = ':';
    auto runnable = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };
#endif

    if (name.find_first_of("/\\") != std::string::npos) {
        if (runnable(fs::path(name))) return name;
        return std::nullopt;
    }

    size_t start = 0;
    while (start <= path_value.size()) {
        size_t end = path_value.find(separator, start);
        if (end == std::string::npos) end = path_value.size();
        std::string dir = path_value.substr(start, end - start);
        start = end + 1;

        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        if (runnable(candidate)) return candidate.string();
#ifdef _WIN32
        candidate += ".exe";
        if (runnable(candidate)) return candidate.string();
#endif
    }

    return std::nullopt;
}

std::string generate_uuid() {
    static constexpr char HEX[] = "0123456789abcdef";

    std::random_device rd;
    std::uniform_int_distribution<int> byte(0, 255);
    std::array<uint8_t, 16> bytes;
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(byte(rd));
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string uuid;
    uuid.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) uuid += '-';
        uuid += HEX[bytes[i] >> 4];
        uuid += HEX[bytes[i] & 0x0F];
    }
    return uuid;
}

} // namespace buckle
