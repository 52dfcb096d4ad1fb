#pragma once

#include "rootcache/types.hpp"

#include <string>

namespace rootcache {

// ============================================================================
// Checksum File Grammars
// ============================================================================

enum class ChecksumFormat {
    // First whitespace-delimited token of the first line. The filename
    // argument is ignored. Used by Alpine ("<hash>  <filename>\n").
    SingleEntry,
    // GNU coreutils: "<hash>  <filename>" or "<hash> *<filename>" per line,
    // matched on the exact filename. Used by Ubuntu and Debian.
    GnuCoreutils,
    // BSD: "SHA256 (<filename>) = <hash>" per line, exact filename.
    // Used by Fedora.
    Bsd,
};

const char* checksum_format_to_string(ChecksumFormat f);

struct ChecksumParseResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string hash;       // Lowercase hex
};

// Extract the expected hash for `filename` from checksum file content.
// A filename that is only a suffix of a listed filename never matches.
ChecksumParseResult parse_checksum_file(ChecksumFormat format,
                                        const std::string& content,
                                        const std::string& filename);

} // namespace rootcache
