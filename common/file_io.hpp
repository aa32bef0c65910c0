#pragma once

// ============================================================
// file_io.hpp -- Output path resolution and file writing
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// Absolute, normalised form of an output directory (created if missing).
// Symlinks in the directory itself are resolved once here.
fs::path prepare_output_root(const std::string& dir);

// Resolve a name received from the wire against root_dir.
// root_dir must come from prepare_output_root().
// Throws UnsafePathError for absolute names, names that normalise to
// root_dir itself, and names whose normalised form leaves root_dir.
fs::path resolve_output_path(const fs::path& root_dir, const std::string& name);

// Create parent directories if they don't exist, then check that the
// real (symlink-resolved) parent is still inside root_dir.
void ensure_parent_dirs(const fs::path& root_dir, const fs::path& target);

// Write data to target through a unique temporary sibling and rename it
// into place, so readers never see a partially written file.
// Throws runtime_error on any I/O failure (the temporary is removed).
void write_file_atomic(const fs::path& target, const std::vector<u8>& data);

// Name sent on the wire for a local file: its final path component
std::string wire_name(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

} // namespace file_io
