// Ticket: 0004_track_pipeline

#include "hurdat-track/src/TrackPipeline.hpp"

#include <exception>
#include <format>
#include <optional>
#include <thread>
#include <unordered_set>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "hurdat-track/src/TrackErrors.hpp"

namespace hurdat_track
{

namespace
{

/// Outcome of one file: exactly one of track / error is set.
struct FileOutcome
{
  std::optional<NormalizedTrack> track;
  std::exception_ptr error;
};

std::string failureMessage(const std::exception_ptr& error)
{
  try
  {
    std::rethrow_exception(error);
  }
  catch (const std::exception& e)
  {
    return e.what();
  }
}

void append(NormalizedTrack& into, NormalizedTrack&& from)
{
  into.storms.insert(into.storms.end(),
                     std::make_move_iterator(from.storms.begin()),
                     std::make_move_iterator(from.storms.end()));
  into.observations.insert(into.observations.end(),
                           std::make_move_iterator(from.observations.begin()),
                           std::make_move_iterator(from.observations.end()));
}

}  // namespace

std::shared_ptr<spdlog::logger> buildLogger(const std::string& name,
                                            spdlog::level::level_enum level)
{
  auto logger = spdlog::get(name);
  if (!logger)
  {
    logger = spdlog::stderr_color_mt(name);
  }
  logger->set_level(level);
  return logger;
}

TrackPipeline::TrackPipeline(Config config)
  : TrackPipeline{config, buildLogger(config.loggerName, config.logLevel)}
{
}

TrackPipeline::TrackPipeline(Config config,
                             std::shared_ptr<spdlog::logger> logger)
  : config_{std::move(config)},
    logger_{std::move(logger)},
    extractor_{logger_},
    normalizer_{logger_}
{
}

NormalizedTrack TrackPipeline::processFile(
  const std::filesystem::path& path) const
{
  const ExtractedTrack extracted = extractor_.extractFile(path);
  return normalizer_.normalize(extracted);
}

PipelineResult TrackPipeline::processFiles(
  const std::vector<std::filesystem::path>& paths) const
{
  std::vector<FileOutcome> outcomes(paths.size());

  auto processInto = [this](const std::filesystem::path& path,
                            FileOutcome& outcome)
  {
    try
    {
      outcome.track = processFile(path);
    }
    catch (const std::exception&)
    {
      outcome.error = std::current_exception();
    }
  };

  if (config_.parallel && paths.size() > 1)
  {
    logger_->debug("Processing {} files in parallel", paths.size());
    std::vector<std::jthread> workers;
    workers.reserve(paths.size());
    for (std::size_t i = 0; i < paths.size(); ++i)
    {
      workers.emplace_back(processInto, std::cref(paths[i]),
                           std::ref(outcomes[i]));
    }
    // jthread joins on destruction
  }
  else
  {
    for (std::size_t i = 0; i < paths.size(); ++i)
    {
      processInto(paths[i], outcomes[i]);
      if (outcomes[i].error && config_.stopOnError)
      {
        break;
      }
    }
  }

  // Merge in input order; event ids must stay unique across files
  PipelineResult result;
  std::unordered_set<std::string> eventIds;
  for (std::size_t i = 0; i < paths.size(); ++i)
  {
    FileOutcome& outcome = outcomes[i];
    if (!outcome.error)
    {
      for (const auto& storm : outcome.track->storms)
      {
        if (eventIds.contains(storm.eventId))
        {
          outcome.error = std::make_exception_ptr(MalformedRecordError{
            paths[i].string(),
            0,
            std::format("Event id {} already seen in an earlier file",
                        storm.eventId)});
          break;
        }
      }
    }

    if (outcome.error)
    {
      logger_->error("Failed to process {}: {}",
                     paths[i].string(),
                     failureMessage(outcome.error));
      if (config_.stopOnError)
      {
        std::rethrow_exception(outcome.error);
      }
      logger_->warn("Skipping {}, continuing with remaining files",
                    paths[i].string());
      result.failures.push_back({paths[i], failureMessage(outcome.error)});
      continue;
    }

    for (const auto& storm : outcome.track->storms)
    {
      eventIds.insert(storm.eventId);
    }
    append(result.track, std::move(*outcome.track));
  }

  logger_->info("Processed {} files: {} storms, {} observations, {} failed",
                paths.size(),
                result.track.storms.size(),
                result.track.observations.size(),
                result.failures.size());
  return result;
}

PipelineResult TrackPipeline::run() const
{
  return processFiles(config_.sourcePaths);
}

}  // namespace hurdat_track
