#include <taskq/common/error.hpp>

#include <cstdio>
#include <string>

namespace taskq::common {

namespace {

void append_error(std::string& out, const Error& error, int depth) {
    char code[8];
    std::snprintf(code, sizeof(code), "%04X", static_cast<unsigned>(error.code()) & 0xFFFFu);

    out += '[';
    out += category_name(error.category());
    out += "] ";
    out += error_name(error.code());
    out += " (0x";
    out += code;
    out += ')';
    if (!error.message().empty()) {
        out += ": ";
        out += error.message();
    }

    const std::string indent(static_cast<size_t>(depth) * 2 + 4, ' ');

    const auto& loc = error.location();
    if (loc.is_valid()) {
        out += '\n';
        out += indent;
        out += "at ";
        out += loc.file;
        out += ':';
        out += std::to_string(loc.line);
        if (loc.function[0] != '\0') {
            out += " in ";
            out += loc.function;
        }
    }

    for (const auto& [key, value] : error.context()) {
        out += '\n';
        out += indent;
        out += key;
        out += ": ";
        out += value;
    }

    if (const Error* cause = error.cause()) {
        out += '\n';
        out.append(static_cast<size_t>(depth) * 2 + 2, ' ');
        out += "Caused by: ";
        append_error(out, *cause, depth + 1);
    }
}

}  // namespace

std::string Error::to_string() const {
    std::string out;
    append_error(out, *this, 0);
    return out;
}

Error& Error::with_context(std::string_view key, std::string_view value) {
    context_.emplace_back(key, value);
    return *this;
}

}  // namespace taskq::common
