#pragma once
/*
===============================================================================
Atomic File Replacement
File: atomic_file.hpp
===============================================================================

write_file_atomic() writes `<path>.tmp-<pid>`, flushes it to stable storage
and renames it over `path`. Readers see either the previous file or the new
one, never a partial write. On any failure the temp file is removed, the
previous file is left as it was, and FilesystemError is thrown.
===============================================================================
*/

#include <optional>
#include <string>
#include <string_view>

namespace devcfg::normalize {

void write_file_atomic(const std::string& path, std::string_view data);

// Whole-file read. Throws FilesystemError.
std::string read_file(const std::string& path);

// nullopt when the file does not exist; throws FilesystemError on other
// failures.
std::optional<std::string> read_file_if_exists(const std::string& path);

// Best-effort unlink; returns false (and logs) when the file could not be
// removed for a reason other than not existing.
bool remove_file(const std::string& path);

} // namespace devcfg::normalize
