#pragma once

#include <string>

namespace prlctl {

// Removes every character outside [A-Za-z0-9-_{}]. Never throws, runs in
// linear time, and is idempotent. A braced UUID comes back unchanged.
std::string sanitizeIdentifier(const std::string& input);

bool isIdentifierChar(char c);
bool isSanitizedIdentifier(const std::string& value);

// {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}, hex digits in either case.
bool isValidUuid(const std::string& value);

// Keeps [A-Za-z0-9.-] so fully qualified names survive.
std::string sanitizeHostname(const std::string& input);

// RFC 1123: dot-separated labels of 1..63 letters, digits and hyphens, no
// label starting or ending with a hyphen, no "--", 253 characters overall.
bool isValidHostname(const std::string& value);

// Guest account names: [a-z_][a-z0-9_-]*, at most 32 characters.
bool isValidUsername(const std::string& value);

// Single-quotes value for a POSIX shell. Only for text that prlctl exec hands
// to the guest shell.
std::string quoteForShell(const std::string& value);

} // namespace prlctl
