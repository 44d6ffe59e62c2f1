#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/site_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using sitebuild::tests::common::AssertContains;
using sitebuild::tests::common::AssertNotContains;
using sitebuild::tests::common::DispatchCaptured;
using sitebuild::tests::common::DispatchOutput;
using sitebuild::tests::common::Fail;
using sitebuild::tests::common::ReadFileToString;
using sitebuild::tests::common::WriteFixtureFile;

namespace {

void ExpectExit(const DispatchOutput& output, int expected, const std::string& label) {
  if (output.exit_code != expected) {
    std::cerr << "stdout:\n" << output.stdout_text << "\nstderr:\n" << output.stderr_text << '\n';
    Fail(label + ": expected exit " + std::to_string(expected) + ", got " +
         std::to_string(output.exit_code));
  }
}

} // namespace

int main() {
  const fs::path root = sitebuild::tests::common::CreateUniqueTempDir("sitebuild-cli-smoke");
  WriteFixtureFile(root / "src" / "index.html", "<!doctype html><title>quote</title>\n");
  WriteFixtureFile(root / "src" / "css" / "style.css", "body{margin:0}\n");
  WriteFixtureFile(root / "src" / "js" / "app.js", "console.log(1);\n");
  WriteFixtureFile(root / "src" / "images" / "icons" / "star.svg", "<svg/>");

  // Default asset list and HTML file, resolved under --root.
  DispatchOutput output = DispatchCaptured(
      {"sitebuild", "build", "--root", root.string(), "--manifest", "reports/manifest.json"});
  ExpectExit(output, 0, "default build");
  if (ReadFileToString(root / "dist" / "images" / "icons" / "star.svg") != "<svg/>") {
    Fail("nested asset was not staged");
  }
  AssertContains(output.stdout_text, "msg=\"Files Processed: 4\"");
  AssertContains(output.stdout_text, "Directory not found: " + (root / "src" / "fonts").string());
  AssertContains(output.stdout_text, "Build completed successfully!");
  AssertContains(ReadFileToString(root / "reports" / "manifest.json"), "\"files_processed\":4");

  // Explicit lists replace the defaults.
  output = DispatchCaptured({"sitebuild", "build", "--root", root.string(), "--out", "public",
                             "--asset-dir", "css", "--html", "index.html", "--log-level",
                             "warn"});
  ExpectExit(output, 0, "explicit lists");
  if (fs::exists(root / "public" / "js")) {
    Fail("js/ staged although only css/ was requested");
  }
  AssertNotContains(output.stdout_text, "level=INFO");

  // Missing HTML file and no assets: nothing processed.
  output = DispatchCaptured({"sitebuild", "build", "--root", root.string(), "--asset-dir",
                             "fonts", "--html", "missing.html"});
  ExpectExit(output, 1, "empty build");
  AssertContains(output.stdout_text, "HTML file not found: missing.html");

  // Output root that would wipe the sources is rejected before any I/O.
  output = DispatchCaptured({"sitebuild", "build", "--root", root.string(), "--out", "."});
  ExpectExit(output, 2, "output contains source");
  AssertContains(output.stderr_text, "invalid build configuration");
  if (!fs::exists(root / "src" / "index.html")) {
    Fail("sources were touched by a rejected build");
  }

  output = DispatchCaptured({"sitebuild", "build", "--bogus"});
  ExpectExit(output, 2, "unknown flag");
  AssertContains(output.stderr_text, "error: unknown option: --bogus");

  output = DispatchCaptured({"sitebuild", "build", "--out"});
  ExpectExit(output, 2, "missing value");
  AssertContains(output.stderr_text, "error: missing value for --out");

  output = DispatchCaptured({"sitebuild", "version"});
  ExpectExit(output, 0, "version");
  AssertContains(output.stdout_text, "sitebuild 0.1.0");

  output = DispatchCaptured({"sitebuild", "deploy"});
  ExpectExit(output, 2, "unknown subcommand");

  sitebuild::tests::common::RemovePathBestEffort(root);
  std::cout << "build_cli_smoke: ok\n";
  return 0;
}
