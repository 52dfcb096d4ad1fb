#include "rootcache/checksum.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace rootcache {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;
    return s.substr(start, end - start);
}

// Split into lines, dropping a trailing '\r' from each
std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream ss(content);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

ChecksumParseResult parse_failure(const std::string& what) {
    ChecksumParseResult result;
    result.kind = ErrorKind::ChecksumParse;
    result.error = "failed to parse checksum file: " + what;
    return result;
}

ChecksumParseResult parse_single_entry(const std::string& content) {
    auto lines = split_lines(content);
    if (lines.empty()) {
        return parse_failure("empty content");
    }

    const std::string& first = lines.front();
    size_t start = 0;
    while (start < first.size() && is_space(first[start])) ++start;
    size_t end = start;
    while (end < first.size() && !is_space(first[end])) ++end;

    if (start == end) {
        return parse_failure("first line has no hash token");
    }

    ChecksumParseResult result;
    result.hash = to_lower(first.substr(start, end - start));
    result.ok = true;
    return result;
}

ChecksumParseResult parse_gnu_coreutils(const std::string& content, const std::string& filename) {
    for (const auto& line : split_lines(content)) {
        if (!line.empty() && line[0] == '#') {
            continue;
        }

        // Split on the first whitespace run into (hash, remainder)
        size_t ws = 0;
        while (ws < line.size() && !is_space(line[ws])) ++ws;
        if (ws == 0 || ws == line.size()) {
            continue;
        }

        std::string hash = line.substr(0, ws);
        size_t name_start = ws;
        while (name_start < line.size() && is_space(line[name_start])) ++name_start;
        // Binary-mode marker
        while (name_start < line.size() && line[name_start] == '*') ++name_start;

        if (line.compare(name_start, std::string::npos, filename) == 0) {
            ChecksumParseResult result;
            result.hash = to_lower(hash);
            result.ok = true;
            return result;
        }
    }
    return parse_failure("no entry for " + filename);
}

ChecksumParseResult parse_bsd(const std::string& content, const std::string& filename) {
    for (const auto& line : split_lines(content)) {
        // Lines start with an algorithm name such as SHA256 or SHA512
        if (line.rfind("SHA", 0) != 0) {
            continue;
        }

        auto open = line.find('(');
        auto close = line.rfind(')');
        if (open == std::string::npos || close == std::string::npos || close < open) {
            continue;
        }

        if (line.compare(open + 1, close - open - 1, filename) != 0) {
            continue;
        }

        auto eq = line.rfind('=');
        if (eq == std::string::npos || eq < close) {
            return parse_failure("missing '=' for " + filename);
        }

        std::string hash = trim(line.substr(eq + 1));
        if (hash.empty()) {
            return parse_failure("empty hash for " + filename);
        }

        ChecksumParseResult result;
        result.hash = to_lower(hash);
        result.ok = true;
        return result;
    }
    return parse_failure("no entry for " + filename);
}

} // namespace

const char* checksum_format_to_string(ChecksumFormat f) {
    switch (f) {
        case ChecksumFormat::SingleEntry: return "single_entry";
        case ChecksumFormat::GnuCoreutils: return "gnu_coreutils";
        case ChecksumFormat::Bsd: return "bsd";
        default: return "unknown";
    }
}

ChecksumParseResult parse_checksum_file(ChecksumFormat format,
                                        const std::string& content,
                                        const std::string& filename) {
    switch (format) {
        case ChecksumFormat::SingleEntry:
            return parse_single_entry(content);
        case ChecksumFormat::GnuCoreutils:
            return parse_gnu_coreutils(content, filename);
        case ChecksumFormat::Bsd:
            return parse_bsd(content, filename);
    }
    return parse_failure("unknown checksum format");
}

} // namespace rootcache
