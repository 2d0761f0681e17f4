#include "buckle/template.hpp"

#include <cctype>

namespace buckle {

namespace {

constexpr const char* LEFT_DELIM = "{{";
constexpr const char* RIGHT_DELIM = "}}";
constexpr size_t DELIM_LEN = 2;

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void trim_trailing_space(std::string& s) {
    while (!s.empty() && is_space(s.back())) s.pop_back();
}

struct CloseScan {
    size_t close = std::string::npos;  // index of the right delimiter
    const char* error = nullptr;
};

// Find the right delimiter of the action whose body starts at from, skipping
// over quoted strings and comments.
CloseScan find_action_close(const std::string& content, size_t from) {
    CloseScan scan;
    bool in_string = false;
    bool in_comment = false;

    size_t i = from;
    while (i < content.size()) {
        if (in_comment) {
            if (content.compare(i, 2, "*/") == 0) {
                in_comment = false;
                i += 2;
                continue;
            }
            i++;
            continue;
        }
        if (in_string) {
            if (content[i] == '\\') {
                i += 2;
                continue;
            }
            if (content[i] == '"') in_string = false;
            i++;
            continue;
        }
        if (content.compare(i, DELIM_LEN, RIGHT_DELIM) == 0) {
            scan.close = i;
            return scan;
        }
        if (content.compare(i, 2, "/*") == 0) {
            in_comment = true;
            i += 2;
            continue;
        }
        if (content[i] == '"') in_string = true;
        i++;
    }

    if (in_comment) {
        scan.error = "unclosed comment";
    } else if (in_string) {
        scan.error = "unterminated quoted string";
    } else {
        scan.error = "unclosed action";
    }
    return scan;
}

Error template_error(const std::string& message, const std::string& source_path, int line) {
    Error error(ErrorCode::TEMPLATE_ERROR, message);
    if (!source_path.empty()) error.withPath(source_path);
    error.withLine(line);
    return error;
}

} // namespace

Result<std::string> render_template(const std::string& content,
                                    const std::unordered_map<std::string, std::string>& vars,
                                    const std::string& source_path) {
    std::string output;
    output.reserve(content.size());

    int line = 1;
    size_t line_counted_to = 0;
    auto line_at = [&](size_t pos) {
        for (; line_counted_to < pos; ++line_counted_to) {
            if (content[line_counted_to] == '\n') line++;
        }
        return line;
    };

    size_t pos = 0;
    while (pos < content.size()) {
        size_t open = content.find(LEFT_DELIM, pos);
        if (open == std::string::npos) {
            output.append(content, pos, std::string::npos);
            break;
        }
        output.append(content, pos, open - pos);

        int action_line = line_at(open);
        size_t body_start = open + DELIM_LEN;

        // "{{- " trims whitespace before the action
        if (body_start + 1 < content.size() && content[body_start] == '-' &&
            is_space(content[body_start + 1])) {
            trim_trailing_space(output);
            body_start++;
        }

        CloseScan scan = find_action_close(content, body_start);
        if (scan.close == std::string::npos) {
            return Result<std::string>::err(template_error(scan.error, source_path, action_line));
        }

        size_t body_end = scan.close;
        bool trim_after = false;
        // " -}}" trims whitespace after the action
        if (body_end >= body_start + 2 && content[body_end - 1] == '-' &&
            is_space(content[body_end - 2])) {
            trim_after = true;
            body_end--;
        }

        ActionParseResult parsed = parse_action(content.substr(body_start, body_end - body_start));
        if (!parsed.ok) {
            return Result<std::string>::err(template_error(parsed.error, source_path, action_line));
        }

        switch (parsed.action.kind) {
            case ActionKind::Field: {
                auto it = vars.find(parsed.action.text);
                if (it == vars.end()) {
                    return Result<std::string>::err(template_error(
                        "undefined variable '" + parsed.action.text + "'", source_path, action_line));
                }
                output += it->second;
                break;
            }
            case ActionKind::Literal:
                output += parsed.action.text;
                break;
            case ActionKind::Comment:
                break;
        }

        pos = scan.close + DELIM_LEN;
        if (trim_after) {
            while (pos < content.size() && is_space(content[pos])) pos++;
        }
    }

    return Result<std::string>::ok(std::move(output));
}

} // namespace buckle
