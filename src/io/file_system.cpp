#include "phonemask/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace phonemask {

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

auto FileSystem::read_bytes(const std::string& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FileSystemError("Cannot open file: " + path);
    }

    std::string bytes{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw FileSystemError("Cannot read file: " + path);
    }
    return bytes;
}

auto FileSystem::write_bytes(const std::string& path, const std::string& bytes) -> void {
    // Write to temporary file first for atomic operation
    std::string temp_path = temp_path_for(path);

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw FileSystemError("Cannot write to file: " + temp_path);
        }

        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (file.fail()) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw FileSystemError("Cannot write to file: " + temp_path);
        }
    } // File automatically closed here

    // Atomically replace the destination
    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw FileSystemError("Cannot replace " + path + ": " + ec.message());
    }
}

auto FileSystem::temp_path_for(const std::string& path) -> std::string {
    return path + ".tmp";
}

} // namespace phonemask
