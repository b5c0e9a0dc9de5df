#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace refundledger::util {

// Atomically replace `path` with `data` by writing a temp file in the same
// directory and renaming it into place. Missing parent directories are
// created.
bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error = nullptr);

// Read the whole file into `out`.
bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   std::string* error = nullptr);

// Append `line` plus a newline and flush before returning.
bool AppendLine(const std::filesystem::path& path, std::string_view line,
                std::string* error = nullptr);

}  // namespace refundledger::util
