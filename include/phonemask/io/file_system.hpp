#pragma once

#include "phonemask/interfaces.hpp"
#include <stdexcept>
#include <string>

namespace phonemask {

class FileSystemError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FileSystem : public IFileSystem {
public:
    auto file_exists(const std::string& path) -> bool override;
    auto read_bytes(const std::string& path) -> std::string override;
    auto write_bytes(const std::string& path, const std::string& bytes) -> void override;

private:
    static auto temp_path_for(const std::string& path) -> std::string;
};

} // namespace phonemask
