#include "depsolve/key.hpp"
#include "depsolve/exceptions.hpp"

#include <string>

namespace depsolve {

std::string key::to_string() const {
    std::string out = internal::demangle(type);
    if (!name.empty()) {
        out += " (key=\"" + name + "\")";
    }
    return out;
}

} // namespace depsolve
