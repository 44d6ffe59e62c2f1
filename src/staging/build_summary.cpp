#include "staging/build_summary.hpp"

#include "core/size_format.hpp"
#include "core/time_utils.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>

namespace sitebuild::staging {

namespace {

constexpr std::size_t kRuleWidth = 60;
constexpr int kPathColumnWidth = 40;
constexpr int kSizeColumnWidth = 10;

std::string NumberedLine(std::size_t index, const std::string& text) {
  return "  " + std::to_string(index + 1U) + ". " + text;
}

std::string FileTableRow(const FileRecord& file) {
  std::ostringstream row;
  row << "  " << std::left << std::setw(kPathColumnWidth) << file.path << ' ' << std::right
      << std::setw(kSizeColumnWidth) << file.formatted_size;
  return row.str();
}

} // namespace

void LogBuildSummary(const BuildContext& context) {
  const BuildStats& stats = context.stats;
  const std::string heavy_rule(kRuleWidth, '=');
  const std::string light_rule(kRuleWidth, '-');
  core::logging::Logger& logger = context.logger;

  const auto elapsed = std::chrono::steady_clock::now() - context.config.start_time;

  logger.Print("");
  logger.Print(heavy_rule);
  logger.Info("BUILD SUMMARY");
  logger.Print(heavy_rule);

  logger.Info("Build Time: " + core::FormatElapsedSeconds(elapsed));
  logger.Info("Files Processed: " + std::to_string(stats.FilesProcessed()));
  logger.Info("Total Size: " + core::FormatSize(stats.TotalSize()));
  logger.Info("Directories Created: " + std::to_string(stats.Directories().size()));

  if (!stats.Warnings().empty()) {
    logger.Print("");
    logger.Print(light_rule);
    logger.Warn("Warnings: " + std::to_string(stats.Warnings().size()));
    for (std::size_t i = 0; i < stats.Warnings().size(); ++i) {
      logger.Print(NumberedLine(i, stats.Warnings()[i]));
    }
  }

  if (!stats.Errors().empty()) {
    logger.Print("", core::logging::LogLevel::kError);
    logger.Print(light_rule, core::logging::LogLevel::kError);
    logger.Error("Errors: " + std::to_string(stats.Errors().size()));
    for (std::size_t i = 0; i < stats.Errors().size(); ++i) {
      logger.Print(NumberedLine(i, ToJson(stats.Errors()[i])), core::logging::LogLevel::kError);
    }
  }

  if (!stats.Files().empty()) {
    logger.Print("");
    logger.Print(light_rule);
    logger.Info("Files in " + context.config.output_root.filename().string() + "/");
    logger.Print(light_rule);
    for (const auto& file : stats.Files()) {
      logger.Print(FileTableRow(file));
    }
  }

  logger.Print(heavy_rule);
  logger.Print("");
}

} // namespace sitebuild::staging
