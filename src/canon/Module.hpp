#ifndef SRC_CANON_MODULE_HPP_
#define SRC_CANON_MODULE_HPP_

#include <cstdint>

namespace canon {

// Index of a module import, assigned by the module registry. Index 0 is reserved for the module currently being
// compiled.
enum ModuleIdx : uint32_t {
    kPrimaryModule = 0
};

} // namespace canon

#endif // SRC_CANON_MODULE_HPP_
