#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace smartcalc {

// Variable names are made of ASCII letters only.
inline bool is_name_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

/// Variable name -> integer value for one session.
/// Names are not validated here; callers check them first.
class VariableScope {
public:
    using Map = std::map<std::string, std::int64_t, std::less<>>;

    /// Throws Error(UnknownVariable) if the name is unbound.
    std::int64_t get(std::string_view name) const;
    void set(std::string_view name, std::int64_t value);

    bool contains(std::string_view name) const { return vars_.find(name) != vars_.end(); }
    std::size_t size() const noexcept { return vars_.size(); }

    Map::const_iterator begin() const { return vars_.begin(); }
    Map::const_iterator end() const { return vars_.end(); }

private:
    Map vars_;
};

} // namespace smartcalc
