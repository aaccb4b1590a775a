// Ticket: 0004_track_pipeline

#ifndef HURDAT_TRACK_TRACK_PIPELINE_HPP
#define HURDAT_TRACK_TRACK_PIPELINE_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "hurdat-track/src/Extraction/RecordExtractor.hpp"
#include "hurdat-track/src/Normalization/Normalizer.hpp"
#include "hurdat-track/src/Normalization/TrackTypes.hpp"

namespace hurdat_track
{

/**
 * @brief A source file that was rejected under continue-on-error
 */
struct FileFailure
{
  std::filesystem::path path;
  std::string message;
};

/**
 * @brief Result of processing several source files
 *
 * track holds the successful files concatenated in input order.
 */
struct PipelineResult
{
  NormalizedTrack track;
  std::vector<FileFailure> failures;

  bool succeeded() const
  {
    return failures.empty();
  }
};

/**
 * @brief Runs extraction and normalization over HURDAT2 source files
 *
 * Each file is processed independently and is all-or-nothing. Results are
 * concatenated in the order the files were given, whether or not they were
 * processed in parallel, so identical inputs always give identical output.
 * An event id seen in an earlier file rejects the later file.
 *
 * Usage:
 * @code
 * TrackPipeline::Config config;
 * config.sourcePaths = {"hurdat2-atlantic.txt", "hurdat2-nepac.txt"};
 * TrackPipeline pipeline{config};
 * auto result = pipeline.run();
 * auto records = toRecords(result.track);
 * @endcode
 */
class TrackPipeline
{
public:
  /**
   * @brief Configuration for TrackPipeline behavior
   */
  struct Config
  {
    std::vector<std::filesystem::path> sourcePaths;
    bool stopOnError{true};  // Rethrow the first failure
    bool parallel{false};    // One thread per source file
    std::string loggerName{"hurdat"};
    spdlog::level::level_enum logLevel{spdlog::level::info};
  };

  /**
   * @brief Construct with a named stderr logger from the configuration
   *
   * Reuses the logger if one with loggerName is already registered.
   */
  explicit TrackPipeline(Config config);

  /**
   * @brief Construct with an explicit logger (e.g. a null sink in tests)
   */
  TrackPipeline(Config config, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Extract and normalize a single file
   * @throws std::runtime_error if the file cannot be opened
   * @throws TrackError subclasses on malformed content
   */
  NormalizedTrack processFile(const std::filesystem::path& path) const;

  /**
   * @brief Process the given files and concatenate their tracks
   *
   * With Config::stopOnError the first failing file (in input order) is
   * rethrown. Otherwise failures are logged, collected in the result, and
   * the remaining files are still processed.
   */
  PipelineResult processFiles(
    const std::vector<std::filesystem::path>& paths) const;

  /// processFiles(config.sourcePaths)
  PipelineResult run() const;

  const Config& getConfig() const
  {
    return config_;
  }

  std::shared_ptr<spdlog::logger> getLogger() const
  {
    return logger_;
  }

private:
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  RecordExtractor extractor_;
  Normalizer normalizer_;
};

/**
 * @brief Fetch or create a colored stderr logger
 *
 * @param name Logger registry name
 * @param level Level applied to the logger
 */
std::shared_ptr<spdlog::logger> buildLogger(const std::string& name,
                                            spdlog::level::level_enum level);

}  // namespace hurdat_track

#endif  // HURDAT_TRACK_TRACK_PIPELINE_HPP
