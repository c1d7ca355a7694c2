#pragma once
#include <memory>
#include <string>

using Permission = unsigned; // posix mode bits, e.g. 0755

class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual Permission stat_permission(const std::string& path) = 0;
    // false when the directory could not be created; an existing directory is success
    virtual bool mkdirs(const std::string& path, Permission perm) = 0;
    virtual void set_permission(const std::string& path, Permission perm) = 0;
    virtual bool exists(const std::string& path) = 0;

    // publish phase only
    virtual void move(const std::string& from, const std::string& to) = 0;
    virtual void remove_all(const std::string& path) = 0;
};

using PFileSystem = std::shared_ptr<FileSystem>;

// std::filesystem driver; accepts plain paths and file:// urls
class LocalFileSystem final : public FileSystem {
public:
    Permission stat_permission(const std::string& path) override;
    bool mkdirs(const std::string& path, Permission perm) override;
    void set_permission(const std::string& path, Permission perm) override;
    bool exists(const std::string& path) override;
    void move(const std::string& from, const std::string& to) override;
    void remove_all(const std::string& path) override;
};

std::string perm_str(Permission perm); // 0755 -> "rwxr-xr-x"
