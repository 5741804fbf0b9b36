#ifndef SRC_CANON_SOURCE_FILE_HPP_
#define SRC_CANON_SOURCE_FILE_HPP_

#include <memory>
#include <string>
#include <string_view>

namespace canon {

// A file of source code read entirely into memory. Regions handed to the IdentStore are byte offsets into codeView().
class SourceFile {
public:
    SourceFile() = delete;
    explicit SourceFile(std::string path);
    ~SourceFile() = default;

    bool read();

    const std::string& path() const { return m_path; }
    size_t size() const { return m_codeSize; }
    std::string_view codeView() const { return std::string_view(m_code.get(), m_codeSize); }

private:
    std::string m_path;
    size_t m_codeSize;
    std::unique_ptr<char[]> m_code;
};

} // namespace canon

#endif // SRC_CANON_SOURCE_FILE_HPP_
