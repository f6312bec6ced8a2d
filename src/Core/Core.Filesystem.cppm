module;
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

export module Core:Filesystem;

import :Error;
import :Logging;

export namespace Core::Filesystem {

    inline std::filesystem::path GetRoot() {
        // 1. Check if "assets" exists in current working directory (Production/Binary Release)
        if (std::filesystem::exists("assets")) {
            return std::filesystem::current_path();
        }

        // 2. Check if we are in "bin" and need to go up (Common dev scenario)
        if (std::filesystem::exists("../assets")) {
            return std::filesystem::current_path().parent_path();
        }

        // 3. Fallback: the source tree CMake configured from
#ifdef LEASEHOLD_ROOT_DIR
        return std::filesystem::path(LEASEHOLD_ROOT_DIR);
#else
        return std::filesystem::current_path();
#endif
    }

    inline std::filesystem::path GetAssetPath(const std::string& relativePath) {
        return GetRoot() / "assets" / relativePath;
    }

    // Whole-file read in 32-bit words (SPIR-V). Size must be a multiple of 4.
    inline Expected<std::vector<uint32_t>> ReadWords(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::ate | std::ios::binary);
        if (!file.is_open()) {
            Log::Error("Failed to open file: {}", path.string());
            return std::unexpected(ErrorCode::FileNotFound);
        }

        const auto fileSize = static_cast<size_t>(file.tellg());
        if (fileSize == 0 || fileSize % sizeof(uint32_t) != 0) {
            Log::Error("File {} is {} bytes, not a whole number of 32-bit words", path.string(), fileSize);
            return std::unexpected(ErrorCode::InvalidData);
        }

        std::vector<uint32_t> words(fileSize / sizeof(uint32_t));
        file.seekg(0);
        if (!file.read(reinterpret_cast<char*>(words.data()), static_cast<std::streamsize>(fileSize))) {
            return std::unexpected(ErrorCode::FileReadError);
        }
        return words;
    }
}
