#ifndef SRC_CANON_STORE_DUMP_JSON_HPP_
#define SRC_CANON_STORE_DUMP_JSON_HPP_

#include <memory>
#include <string_view>

namespace canon {

class IdentStore;

// Encodes every occurrence in an IdentStore as JSON, for diagnostic tooling. To avoid copying strings around this class
// wraps the string and provides access to it via the json() accessor.
class StoreDumpJSON {
public:
    StoreDumpJSON();
    ~StoreDumpJSON();

    bool dump(const IdentStore& store, bool prettyPrint);

    std::string_view json() const;

private:
    // pImpl pattern to protect including headers from contaminating json
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace canon

#endif // SRC_CANON_STORE_DUMP_JSON_HPP_
