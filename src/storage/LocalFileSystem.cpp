#include "storage/FileSystem.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

using namespace rh::storage;
namespace fs = std::filesystem;

bool LocalFileSystem::exists(const fs::path& path) const {
    std::error_code ec;
    const bool found = fs::exists(path, ec);
    // ENOENT and ENOTDIR clear ec; anything left is a real I/O failure.
    if (ec) throw fs::filesystem_error("Failed to stat file", path, ec);
    return found;
}

std::optional<std::string> LocalFileSystem::readFile(const fs::path& path) const {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        // A concurrent cleanup may remove the file between the caller's check and this open.
        std::error_code ec;
        if (!fs::exists(path, ec) && !ec) return std::nullopt;
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

void LocalFileSystem::writeFile(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path.string());
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

void LocalFileSystem::rename(const fs::path& from, const fs::path& to) {
    fs::rename(from, to);
}

bool LocalFileSystem::remove(const fs::path& path) {
    return fs::remove(path);
}

void LocalFileSystem::ensureDir(const fs::path& path) {
    if (!fs::exists(path)) fs::create_directories(path);
}
