#pragma once
#include <cstdint>
#include <string_view>
#include <vector>
#include "smartcalc/scope.hpp"
#include "smartcalc/token.hpp"

namespace smartcalc {

/// normalize -> to_postfix -> eval_postfix. The scope is only read.
std::int64_t evaluate(std::string_view line, const VariableScope& scope);

/// Same pipeline, but stops after conversion and returns the postfix form.
std::vector<Token> compile(std::string_view line, const VariableScope& scope);

// Nonempty and ASCII letters only.
bool is_valid_identifier(std::string_view name);

bool is_assignment(std::string_view line);

// Strips leading and trailing whitespace.
std::string_view trim(std::string_view s);

/// Handle "name = literal" or "name = other". Throws Error with
/// InvalidIdentifier, InvalidAssignment or UnknownVariable.
void assign(std::string_view line, VariableScope& scope);

} // namespace smartcalc
