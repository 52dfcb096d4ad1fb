#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rootcache {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// Readers never observe a partially written file under `path`.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// ============================================================================
// Path Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path);

std::string get_filename(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

// Create directories recursively; false on failure
bool create_directories(const std::string& path);

// Remove a directory recursively; false if anything could not be removed
bool remove_directory(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Current time as decimal Unix epoch seconds ("1760000000")
std::string get_epoch_seconds();

// Random UUID v4 string
std::string generate_uuid();

} // namespace rootcache
