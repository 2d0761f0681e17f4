#include "buckle/template.hpp"

#include <cctype>

namespace buckle {

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

ActionParseResult fail(const std::string& message) {
    ActionParseResult result;
    result.ok = false;
    result.error = message;
    return result;
}

ActionParseResult parse_field(const std::string& body) {
    // body[0] == '.'
    if (body.size() == 1) {
        return fail("'.' without a field name is not supported");
    }
    if (!is_ident_start(body[1])) {
        return fail("bad character '" + std::string(1, body[1]) + "' after '.'");
    }

    size_t end = 1;
    while (end < body.size() && is_ident_char(body[end])) end++;
    if (end != body.size()) {
        return fail("unexpected '" + body.substr(end) + "' after field '" + body.substr(0, end) + "'");
    }

    ActionParseResult result;
    result.ok = true;
    result.action.kind = ActionKind::Field;
    result.action.text = body.substr(1);
    return result;
}

ActionParseResult parse_literal(const std::string& body) {
    // body[0] == '"'
    std::string value;
    size_t i = 1;
    while (i < body.size()) {
        char c = body[i];
        if (c == '"') break;
        if (c == '\n') {
            return fail("newline in string literal");
        }
        if (c == '\\') {
            if (i + 1 >= body.size()) break;
            char esc = body[i + 1];
            switch (esc) {
                case '"': value += '"'; break;
                case '\\': value += '\\'; break;
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                default:
                    return fail("unknown escape sequence '\\" + std::string(1, esc) + "'");
            }
            i += 2;
            continue;
        }
        value += c;
        i++;
    }

    if (i >= body.size()) {
        return fail("unterminated quoted string");
    }
    if (i + 1 != body.size()) {
        return fail("unexpected '" + trim(body.substr(i + 1)) + "' after string literal");
    }

    ActionParseResult result;
    result.ok = true;
    result.action.kind = ActionKind::Literal;
    result.action.text = std::move(value);
    return result;
}

} // namespace

ActionParseResult parse_action(const std::string& raw_body) {
    std::string body = trim(raw_body);

    if (body.empty()) {
        return fail("missing value for command");
    }

    if (body.size() >= 4 && body.compare(0, 2, "/*") == 0 &&
        body.compare(body.size() - 2, 2, "*/") == 0) {
        ActionParseResult result;
        result.ok = true;
        result.action.kind = ActionKind::Comment;
        return result;
    }

    if (body[0] == '.') {
        return parse_field(body);
    }
    if (body[0] == '"') {
        return parse_literal(body);
    }

    return fail("unsupported action '" + body + "'");
}

} // namespace buckle
