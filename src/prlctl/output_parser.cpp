#include "prlctl/output_parser.hpp"
#include "common/logger.hpp"
#include <cctype>
#include <utility>

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(text[begin])) {
        ++begin;
    }
    while (end > begin && isSpace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        lines.push_back(trim(text.substr(start, end - start)));
        start = end + 1;
    }
    return lines;
}

// Reads the next whitespace-delimited field starting at pos and leaves pos on
// the first character after the whitespace that follows it.
std::string nextField(const std::string& line, size_t& pos) {
    size_t begin = pos;
    while (pos < line.size() && !isSpace(line[pos])) {
        ++pos;
    }
    std::string field = line.substr(begin, pos - begin);
    while (pos < line.size() && isSpace(line[pos])) {
        ++pos;
    }
    return field;
}

// {...} with at least one character inside and no inner closing brace.
bool isBracedToken(const std::string& token) {
    return token.size() >= 3 && token.front() == '{' && token.find('}') == token.size() - 1;
}

bool isHeaderLine(const std::string& line) {
    return !line.empty() && line.front() != '{' && line.find("UUID") != std::string::npos;
}

} // namespace

namespace prlctl {

std::vector<VmRecord> parseVmList(const std::string& output) {
    std::vector<VmRecord> vms;
    bool firstLine = true;
    size_t skipped = 0;

    for (const auto& line : splitLines(output)) {
        if (line.empty()) {
            continue;
        }
        if (firstLine) {
            firstLine = false;
            if (isHeaderLine(line)) {
                continue;
            }
        }

        size_t pos = 0;
        std::string uuid = nextField(line, pos);
        std::string status = nextField(line, pos);
        if (!isBracedToken(uuid) || status.empty()) {
            ++skipped;
            continue;
        }
        std::string ip = nextField(line, pos);

        VmRecord vm;
        vm.uuid = uuid;
        vm.status = parseVmStatus(status);
        vm.statusText = status;
        if (!ip.empty() && ip != "-") {
            vm.ipAddress = ip;
        }
        vm.name = line.substr(pos);
        vms.push_back(std::move(vm));
    }

    if (skipped > 0) {
        Logger::debug("parseVmList skipped " + std::to_string(skipped) + " malformed line(s)");
    }
    return vms;
}

std::vector<SnapshotRecord> parseSnapshotList(const std::string& output) {
    std::vector<SnapshotRecord> snapshots;
    bool currentSeen = false;
    size_t skipped = 0;

    for (const auto& line : splitLines(output)) {
        if (line.empty()) {
            continue;
        }

        size_t pos = 0;
        while (pos < line.size() && !isSpace(line[pos])) {
            ++pos;
        }
        std::string id = line.substr(0, pos);
        if (!isBracedToken(id) || pos == line.size()) {
            ++skipped;
            continue;
        }
        while (pos < line.size() && isSpace(line[pos])) {
            ++pos;
        }

        bool marked = false;
        if (pos < line.size() && line[pos] == '*') {
            marked = true;
            ++pos;
            while (pos < line.size() && isSpace(line[pos])) {
                ++pos;
            }
        }

        if (pos >= line.size() || line[pos] != '"') {
            ++skipped;
            continue;
        }
        ++pos;

        std::string name;
        bool closed = false;
        while (pos < line.size()) {
            char c = line[pos++];
            if (c == '\\' && pos < line.size()) {
                name.push_back(line[pos++]);
            } else if (c == '"') {
                closed = true;
                break;
            } else {
                name.push_back(c);
            }
        }

        // The closing quote must be followed by whitespace and a date.
        if (!closed || pos >= line.size() || !isSpace(line[pos])) {
            ++skipped;
            continue;
        }
        std::string date = trim(line.substr(pos));
        if (date.empty()) {
            ++skipped;
            continue;
        }

        SnapshotRecord snapshot;
        snapshot.id = id;
        snapshot.name = name;
        snapshot.date = date;
        // First marker wins; later markers are ignored.
        snapshot.current = marked && !currentSeen;
        currentSeen = currentSeen || marked;
        snapshots.push_back(std::move(snapshot));
    }

    if (skipped > 0) {
        Logger::debug("parseSnapshotList skipped " + std::to_string(skipped) + " malformed line(s)");
    }
    return snapshots;
}

std::optional<VmRecord> findVm(const std::vector<VmRecord>& vms, const std::string& nameOrUuid) {
    for (const auto& vm : vms) {
        if (vm.name == nameOrUuid || vm.uuid == nameOrUuid) {
            return vm;
        }
    }
    return std::nullopt;
}

} // namespace prlctl
