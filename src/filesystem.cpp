#include "filesystem.hpp"
#include <filesystem>
#include <system_error>
#include "lib.hpp"

namespace fs = std::filesystem;

namespace {

    std::string local_path(std::string location) {
        if (location.rfind("file://", 0) == 0) {
            location = location.substr(7);
        } else if (location.rfind("file:", 0) == 0) {
            location = location.substr(5);
        }
        while (location.size() > 1 && location.back() == '/') {
            location.pop_back();
        }
        return location;
    }
}

std::string perm_str(Permission perm) {
    const char* flags = "rwxrwxrwx";
    std::string out(9, '-');
    for (int i = 0; i < 9; ++i) {
        if (perm & (1u << (8 - i))) out[i] = flags[i];
    }
    return out;
}

Permission LocalFileSystem::stat_permission(const std::string& path) {
    std::error_code ec;
    auto st = fs::status(local_path(path), ec);
    if (ec || !fs::exists(st)) {
        THROW_AS(ErrKind::FileSystem, "cannot stat %s: %s", path.c_str(), ec ? ec.message().c_str() : "not found");
    }
    return static_cast<Permission>(st.permissions() & fs::perms::mask);
}

bool LocalFileSystem::mkdirs(const std::string& path, Permission perm) {
    std::error_code ec;
    auto p = local_path(path);
    fs::create_directories(p, ec);
    if (ec) {
        LOG_ERROR("mkdirs %s failed: %s", path.c_str(), ec.message().c_str());
        return false;
    }
    if (!fs::is_directory(p, ec)) return false;
    fs::permissions(p, static_cast<fs::perms>(perm), fs::perm_options::replace, ec);
    return !ec;
}

void LocalFileSystem::set_permission(const std::string& path, Permission perm) {
    std::error_code ec;
    fs::permissions(local_path(path), static_cast<fs::perms>(perm), fs::perm_options::replace, ec);
    if (ec) THROW_AS(ErrKind::FileSystem, "cannot set permission %s on %s: %s",
        perm_str(perm).c_str(), path.c_str(), ec.message().c_str());
}

bool LocalFileSystem::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(local_path(path), ec);
}

void LocalFileSystem::move(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::path dst(local_path(to));
    if (dst.has_parent_path()) fs::create_directories(dst.parent_path(), ec);
    if (ec) THROW_AS(ErrKind::FileSystem, "cannot create parent of %s: %s", to.c_str(), ec.message().c_str());
    fs::rename(local_path(from), dst, ec);
    if (ec) THROW_AS(ErrKind::FileSystem, "cannot move %s to %s: %s", from.c_str(), to.c_str(), ec.message().c_str());
}

void LocalFileSystem::remove_all(const std::string& path) {
    std::error_code ec;
    fs::remove_all(local_path(path), ec);
    if (ec) THROW_AS(ErrKind::FileSystem, "cannot delete %s: %s", path.c_str(), ec.message().c_str());
}
