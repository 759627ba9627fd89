#pragma once
#include <smartcalc/error.hpp>
#include <string>

namespace smartcalc_test {

// Runs f and returns the fixed message of the smartcalc::Error it throws,
// or "no error".
template <class F>
std::string failure_of(F&& f) {
    try {
        f();
    } catch (const smartcalc::Error& e) {
        return smartcalc::message(e.kind());
    }
    return "no error";
}

inline std::string msg(smartcalc::ErrorKind k) { return smartcalc::message(k); }

} // namespace smartcalc_test
