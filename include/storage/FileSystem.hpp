#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace rh::storage {

class FileSystem {
public:
    virtual ~FileSystem() = default;

    // false when absent; throws when the path cannot be inspected.
    virtual bool exists(const std::filesystem::path& path) const = 0;

    // nullopt when the file does not exist; throws on any other I/O failure.
    virtual std::optional<std::string> readFile(const std::filesystem::path& path) const = 0;

    // Creates or truncates.
    virtual void writeFile(const std::filesystem::path& path, const std::string& data) = 0;

    virtual void rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;

    // false when nothing was there to remove; throws on any other failure.
    virtual bool remove(const std::filesystem::path& path) = 0;

    virtual void ensureDir(const std::filesystem::path& path) = 0;
};

class LocalFileSystem final : public FileSystem {
public:
    bool exists(const std::filesystem::path& path) const override;
    std::optional<std::string> readFile(const std::filesystem::path& path) const override;
    void writeFile(const std::filesystem::path& path, const std::string& data) override;
    void rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
    bool remove(const std::filesystem::path& path) override;
    void ensureDir(const std::filesystem::path& path) override;
};

}
