#include "canon/SourceFile.hpp"

#include "spdlog/spdlog.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace canon {

SourceFile::SourceFile(std::string path): m_path(std::move(path)), m_codeSize(0) {}

bool SourceFile::read() {
    fs::path filePath(m_path);
    std::error_code error;
    if (!fs::exists(filePath, error)) {
        if (error) {
            SPDLOG_ERROR("File: '{}' status error: {}", m_path, error.message());
        } else {
            SPDLOG_ERROR("File: '{}' not found", m_path);
        }
        return false;
    }

    auto fileSize = fs::file_size(filePath, error);
    if (error) {
        SPDLOG_ERROR("File: '{}' size error: {}", m_path, error.message());
        return false;
    }
    // Regions address the code with 32-bit offsets.
    if (fileSize > std::numeric_limits<uint32_t>::max()) {
        SPDLOG_ERROR("File: '{}' is too large at {} bytes", m_path, fileSize);
        return false;
    }

    m_codeSize = static_cast<size_t>(fileSize);
    m_code = std::make_unique<char[]>(m_codeSize + 1);
    m_code[m_codeSize] = '\0';
    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' open error", m_path);
        return false;
    }
    inFile.read(m_code.get(), m_codeSize);
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' read error", m_path);
        return false;
    }

    return true;
}

} // namespace canon
