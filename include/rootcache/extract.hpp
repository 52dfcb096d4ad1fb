#pragma once

#include "rootcache/types.hpp"

#include <cstddef>
#include <string>

namespace rootcache {

// ============================================================================
// Archive Extraction
// ============================================================================

enum class ArchiveFormat {
    TarGz,      // .tar.gz, .tgz
    TarXz,      // .tar.xz, .txz
};

const char* archive_format_to_string(ArchiveFormat format);

struct FormatDetectResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    ArchiveFormat format = ArchiveFormat::TarGz;
};

// Detect from the file name alone; never touches the filesystem
FormatDetectResult detect_archive_format(const std::string& archive_path);

struct ExtractResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    size_t entries = 0;         // Tar entries materialized
};

// Stream `archive_path` through the decompressor into a tar reader that
// unpacks under `target_dir` (created if missing). Entry paths that are
// absolute or escape the target via ".." fail the extraction.
ExtractResult extract_archive(const std::string& archive_path,
                              const std::string& target_dir,
                              ArchiveFormat format);

} // namespace rootcache
