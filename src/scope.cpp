#include "smartcalc/scope.hpp"
#include "smartcalc/error.hpp"

namespace smartcalc {

std::int64_t VariableScope::get(std::string_view name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) throw Error(ErrorKind::UnknownVariable, "Unknown variable: " + std::string(name));
    return it->second;
}

void VariableScope::set(std::string_view name, std::int64_t value) {
    auto it = vars_.find(name);
    if (it != vars_.end()) {
        it->second = value;
        return;
    }
    vars_.emplace(std::string(name), value);
}

} // namespace smartcalc
