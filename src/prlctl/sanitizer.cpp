#include "prlctl/sanitizer.hpp"

namespace prlctl {

namespace {

bool isAsciiAlnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool isHexDigit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

} // namespace

bool isIdentifierChar(char c) {
    return isAsciiAlnum(c) || c == '-' || c == '_' || c == '{' || c == '}';
}

std::string sanitizeIdentifier(const std::string& input) {
    std::string output;
    output.reserve(input.size());
    for (char c : input) {
        if (isIdentifierChar(c)) {
            output.push_back(c);
        }
    }
    return output;
}

bool isSanitizedIdentifier(const std::string& value) {
    for (char c : value) {
        if (!isIdentifierChar(c)) {
            return false;
        }
    }
    return true;
}

bool isValidUuid(const std::string& value) {
    // 1 + 8 + 1 + 4 + 1 + 4 + 1 + 4 + 1 + 12 + 1
    if (value.size() != 38 || value.front() != '{' || value.back() != '}') {
        return false;
    }
    for (size_t i = 1; i < value.size() - 1; ++i) {
        const bool separator = (i == 9 || i == 14 || i == 19 || i == 24);
        if (separator ? value[i] != '-' : !isHexDigit(value[i])) {
            return false;
        }
    }
    return true;
}

std::string sanitizeHostname(const std::string& input) {
    std::string output;
    output.reserve(input.size());
    for (char c : input) {
        if (isAsciiAlnum(c) || c == '.' || c == '-') {
            output.push_back(c);
        }
    }
    return output;
}

bool isValidHostname(const std::string& value) {
    if (value.empty() || value.size() > 253) {
        return false;
    }
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find('.', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        const std::string label = value.substr(start, end - start);
        if (label.empty() || label.size() > 63 || label.front() == '-' || label.back() == '-' ||
            label.find("--") != std::string::npos) {
            return false;
        }
        for (char c : label) {
            if (!isAsciiAlnum(c) && c != '-') {
                return false;
            }
        }
        start = end + 1;
    }
    return true;
}

bool isValidUsername(const std::string& value) {
    if (value.empty() || value.size() > 32) {
        return false;
    }
    if (!((value[0] >= 'a' && value[0] <= 'z') || value[0] == '_')) {
        return false;
    }
    for (char c : value) {
        const bool allowed = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

std::string quoteForShell(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace prlctl
