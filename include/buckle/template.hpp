#pragma once

#include "buckle/error.hpp"

#include <string>
#include <unordered_map>

namespace buckle {

// ============================================================================
// Expressions
// ============================================================================

// What a single {{ ... }} action asks for, once delimiters and trim markers
// have been removed.
enum class ActionKind {
    Field,    // .NAME
    Literal,  // "text"
    Comment,  // /* ... */
};

struct Action {
    ActionKind kind = ActionKind::Literal;
    std::string text;  // field name or unquoted literal; empty for comments
};

struct ActionParseResult {
    bool ok = false;
    Action action;
    std::string error;
};

// Parse the body of an action. Anything outside the grammar above is a
// syntax error described in error.
ActionParseResult parse_action(const std::string& body);

// ============================================================================
// Template Rendering
// ============================================================================

// Render content against vars.
//
// Supports a subset of Go text/template: {{ .NAME }} field references,
// "{{- " and " -}}" whitespace trim markers, comment actions and quoted
// string literals. The same inputs always produce the same output.
//
// An undefined variable or a syntax error is a TEMPLATE_ERROR carrying
// source_path and the line on which the offending action starts.
Result<std::string> render_template(const std::string& content,
                                    const std::unordered_map<std::string, std::string>& vars,
                                    const std::string& source_path = "");

} // namespace buckle
