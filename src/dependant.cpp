#include "depsolve/builder.hpp"
#include "depsolve/dependant.hpp"
#include "depsolve/exceptions.hpp"

#include <stdexcept>
#include <string>

namespace depsolve {

const instance& argument_list::at(std::size_t i) const {
    if (i >= values_.size()) {
        throw std::out_of_range("argument index " + std::to_string(i)
                                + " out of range (" + std::to_string(values_.size())
                                + " arguments)");
    }
    return values_[i];
}

namespace detail {

void attach_defaults(std::vector<parameter>& params,
                     const std::vector<dependant_ptr>& defaults,
                     const key& owner) {
    for (const auto& def : defaults) {
        if (!def) {
            throw di_error("Null default dependant given for " + owner.to_string());
        }
        bool matched = false;
        for (auto& p : params) {
            if (p.target == def->id) {
                p.fallback = def;
                matched = true;
            }
        }
        if (!matched) {
            throw di_error("Default " + def->id.to_string()
                           + " matches no parameter of " + owner.to_string());
        }
    }
}

} // namespace detail

} // namespace depsolve
