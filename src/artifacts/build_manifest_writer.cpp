#include "artifacts/build_manifest_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace sitebuild::artifacts {

namespace {

constexpr std::uint64_t kFnv1a64OffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnv1a64Prime = 1099511628211ULL;

struct ManifestEntry {
  std::string relative_path;
  std::uintmax_t size_bytes = 0;
  std::string hash_hex;
};

bool ComputeFileFnv1a64(const fs::path& file_path, std::string& hash_hex, std::string& error) {
  std::ifstream in_file(file_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open file for hashing: " + file_path.string();
    return false;
  }

  std::uint64_t hash = kFnv1a64OffsetBasis;
  char buffer[4096];
  while (in_file.good()) {
    in_file.read(buffer, sizeof(buffer));
    const std::streamsize read_count = in_file.gcount();
    for (std::streamsize i = 0; i < read_count; ++i) {
      hash ^= static_cast<std::uint64_t>(static_cast<std::uint8_t>(buffer[i]));
      hash *= kFnv1a64Prime;
    }
  }

  if (!in_file.eof()) {
    error = "failed while reading file for hashing: " + file_path.string();
    return false;
  }

  std::ostringstream out;
  out << std::hex << std::nouppercase << std::setw(16) << std::setfill('0') << hash;
  hash_hex = out.str();
  return true;
}

} // namespace

bool WriteBuildManifestJson(const staging::BuildStats& stats, const fs::path& output_root,
                            const fs::path& manifest_path, std::string& error) {
  if (manifest_path.empty()) {
    error = "manifest path cannot be empty";
    return false;
  }
  if (output_root.empty()) {
    error = "output root cannot be empty";
    return false;
  }

  std::vector<ManifestEntry> entries;
  entries.reserve(stats.Files().size());
  for (const auto& file : stats.Files()) {
    ManifestEntry entry;
    entry.relative_path = file.path;
    entry.size_bytes = file.size;
    if (!ComputeFileFnv1a64(output_root / fs::path(file.path), entry.hash_hex, error)) {
      return false;
    }
    entries.push_back(std::move(entry));
  }

  std::sort(entries.begin(), entries.end(), [](const ManifestEntry& lhs, const ManifestEntry& rhs) {
    return lhs.relative_path < rhs.relative_path;
  });

  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\":\"1.0\",\n"
      << "  \"hash_algorithm\":\"fnv1a_64\",\n"
      << "  \"files_processed\":" << stats.FilesProcessed() << ",\n"
      << "  \"total_size_bytes\":" << stats.TotalSize() << ",\n"
      << "  \"directories_created\":" << stats.Directories().size() << ",\n"
      << "  \"files\":[";

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto& entry = entries[i];
    if (i != 0U) {
      out << ",";
    }
    out << "\n    {" << core::JsonStringField("path", entry.relative_path) << ","
        << "\"size_bytes\":" << entry.size_bytes << ","
        << core::JsonStringField("hash", entry.hash_hex) << "}";
  }
  out << "\n  ],\n"
      << "  \"warnings\":[";

  for (std::size_t i = 0; i < stats.Warnings().size(); ++i) {
    if (i != 0U) {
      out << ",";
    }
    out << "\n    \"" << core::EscapeJson(stats.Warnings()[i]) << "\"";
  }
  out << "\n  ],\n"
      << "  \"errors\":[";

  for (std::size_t i = 0; i < stats.Errors().size(); ++i) {
    if (i != 0U) {
      out << ",";
    }
    out << "\n    " << staging::ToJson(stats.Errors()[i]);
  }
  out << "\n  ]\n"
      << "}\n";

  return core::WriteTextFileAtomic(manifest_path, out.str(), error);
}

} // namespace sitebuild::artifacts
