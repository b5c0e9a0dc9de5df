#include "util/atomic_file.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

namespace refundledger::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::string tmp_name =
      target.filename().string() + ".tmp." + std::to_string(now) + "." + std::to_string(nonce);
  return target.parent_path() / tmp_name;
}

bool EnsureParentDirectory(const std::filesystem::path& path, std::string* error) {
  const auto parent = path.parent_path();
  if (parent.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    if (error) {
      *error = "create_directories failed: " + ec.message();
    }
    return false;
  }
  return true;
}

bool ReplaceFile(const std::filesystem::path& from, const std::filesystem::path& to,
                 std::string* error) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (!ec) {
    return true;
  }
  // Some standard library implementations refuse to replace an existing
  // destination; fall back to an explicit remove+rename.
  std::filesystem::remove(to, ec);
  ec.clear();
  std::filesystem::rename(from, to, ec);
  if (ec) {
    if (error) {
      *error = "rename failed: " + ec.message();
    }
    return false;
  }
  return true;
}

}  // namespace

bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error) {
  if (!EnsureParentDirectory(path, error)) {
    return false;
  }
  const auto tmp_path = MakeTempPath(path);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      if (error) {
        *error = "failed to open temp file for write";
      }
      return false;
    }
    if (!data.empty()) {
      out.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(tmp_path, ec);
      if (error) {
        *error = "write failed";
      }
      return false;
    }
  }
  if (!ReplaceFile(tmp_path, path, error)) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    return false;
  }
  return true;
}

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   std::string* error) {
  if (!out) {
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) {
      *error = "failed to open " + path.string();
    }
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    if (error) {
      *error = "read failed: " + path.string();
    }
    return false;
  }
  return true;
}

bool AppendLine(const std::filesystem::path& path, std::string_view line, std::string* error) {
  if (!EnsureParentDirectory(path, error)) {
    return false;
  }
  std::ofstream out(path, std::ios::app);
  if (!out.is_open()) {
    if (error) {
      *error = "failed to open " + path.string() + " for append";
    }
    return false;
  }
  out << line << '\n';
  out.flush();
  if (!out.good()) {
    if (error) {
      *error = "append failed: " + path.string();
    }
    return false;
  }
  return true;
}

}  // namespace refundledger::util
