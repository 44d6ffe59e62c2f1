#include "staging/file_copier.hpp"

#include "common/assertions.hpp"
#include "common/site_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "core/fs_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <variant>

namespace fs = std::filesystem;
using namespace sitebuild::staging;
using sitebuild::tests::common::CapturedBuild;
using sitebuild::tests::common::MakeTestConfig;
using sitebuild::tests::common::ReadFileToString;
using sitebuild::tests::common::ScopedTempDir;
using sitebuild::tests::common::WriteFixtureFile;
using sitebuild::tests::common::WriteSizedFixture;

TEST_CASE("CopyFile copies bytes and records the file", "[staging][file_copier]") {
  ScopedTempDir temp("sitebuild-copy-ok");
  CapturedBuild build(MakeTestConfig(temp.path()));
  const fs::path source = temp.path() / "src" / "js" / "app.js";
  const fs::path destination = temp.path() / "dist" / "js" / "app.js";
  const std::string content = WriteSizedFixture(source, 2048);

  const StepResult result = CopyFile(build.context(), source, destination);

  REQUIRE(result.ok());
  REQUIRE(ReadFileToString(destination) == content);
  REQUIRE((fs::status(destination).permissions() & fs::perms::mask) ==
          sitebuild::core::kFilePerms);

  const BuildStats& stats = build.context().stats;
  REQUIRE(stats.FilesProcessed() == 1U);
  REQUIRE(stats.TotalSize() == 2048U);
  REQUIRE(stats.Files().front().path == "js/app.js");
  REQUIRE(stats.Files().front().formatted_size == "2 KB");
  // dist/ and dist/js/ were created in one step; only the requested path is
  // recorded.
  REQUIRE(stats.Directories().size() == 1U);
  REQUIRE(build.StdoutText().find("Copied: js/app.js (2 KB)") != std::string::npos);
}

TEST_CASE("CopyFile preserves binary content", "[staging][file_copier]") {
  ScopedTempDir temp("sitebuild-copy-binary");
  CapturedBuild build(MakeTestConfig(temp.path()));
  const fs::path source = temp.path() / "src" / "logo.png";
  const fs::path destination = temp.path() / "dist" / "logo.png";
  const std::string content("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16);
  WriteFixtureFile(source, content);

  REQUIRE(CopyFile(build.context(), source, destination).ok());
  REQUIRE(ReadFileToString(destination) == content);
  REQUIRE(build.context().stats.TotalSize() == 16U);
}

TEST_CASE("CopyFile records a missing source and continues", "[staging][file_copier]") {
  ScopedTempDir temp("sitebuild-copy-missing");
  CapturedBuild build(MakeTestConfig(temp.path()));
  const fs::path source = temp.path() / "src" / "missing.css";
  const fs::path destination = temp.path() / "dist" / "missing.css";

  const StepResult result = CopyFile(build.context(), source, destination);

  REQUIRE(result.status == StepStatus::kRecorded);
  const BuildStats& stats = build.context().stats;
  REQUIRE(stats.FilesProcessed() == 0U);
  REQUIRE(stats.Errors().size() == 1U);
  const auto& record = std::get<FileCopyError>(stats.Errors().front());
  REQUIRE(record.source == source);
  REQUIRE(record.destination == destination);
  REQUIRE_FALSE(record.message.empty());
  REQUIRE(build.StderrText().find("Failed to copy file: " + source.string()) !=
          std::string::npos);
}

TEST_CASE("CopyFile records a destination that cannot be written", "[staging][file_copier]") {
  ScopedTempDir temp("sitebuild-copy-unwritable");
  CapturedBuild build(MakeTestConfig(temp.path()));
  const fs::path source = temp.path() / "src" / "index.html";
  const fs::path destination = temp.path() / "dist" / "index.html";
  WriteSizedFixture(source, 100);
  fs::create_directories(destination);

  const StepResult result = CopyFile(build.context(), source, destination);

  REQUIRE(result.status == StepStatus::kRecorded);
  REQUIRE(build.context().stats.Errors().size() == 1U);
  REQUIRE(std::holds_alternative<FileCopyError>(build.context().stats.Errors().front()));
  REQUIRE(build.context().stats.Files().empty());
}

TEST_CASE("CopyFile escalates a parent directory failure", "[staging][file_copier]") {
  ScopedTempDir temp("sitebuild-copy-parent");
  CapturedBuild build(MakeTestConfig(temp.path()));
  const fs::path source = temp.path() / "src" / "a.txt";
  WriteSizedFixture(source, 5);
  WriteFixtureFile(temp.path() / "dist", "not a directory");
  const fs::path destination = temp.path() / "dist" / "sub" / "a.txt";

  const StepResult result = CopyFile(build.context(), source, destination);

  REQUIRE(result.fatal());
  const auto& errors = build.context().stats.Errors();
  REQUIRE(errors.size() == 2U);
  REQUIRE(std::holds_alternative<DirectoryCreateError>(errors[0]));
  REQUIRE(std::holds_alternative<FileCopyError>(errors[1]));
  REQUIRE(build.context().stats.FilesProcessed() == 0U);
}

TEST_CASE("CopyFile records a source that cannot be read as a file", "[staging][file_copier]") {
  ScopedTempDir temp("sitebuild-copy-dir-source");
  CapturedBuild build(MakeTestConfig(temp.path()));
  const fs::path source = temp.path() / "src" / "index.html";
  const fs::path destination = temp.path() / "dist" / "index.html";
  fs::create_directories(source);

  const StepResult result = CopyFile(build.context(), source, destination);

  REQUIRE(result.status == StepStatus::kRecorded);
  REQUIRE(build.context().stats.Errors().size() == 1U);
  REQUIRE(std::get<FileCopyError>(build.context().stats.Errors().front()).source == source);
  REQUIRE(build.context().stats.Files().empty());
}
