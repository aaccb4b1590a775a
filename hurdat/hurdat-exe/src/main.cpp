// Ticket: 0004_track_pipeline

#include <cmath>
#include <exception>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "hurdat-track/src/TrackPipeline.hpp"
#include "hurdat-track/src/Transfer/TrackRecords.hpp"
#include "hurdat-utils/src/PathUtils.hpp"

namespace
{

// Default HURDAT2 releases, looked up next to the executable
constexpr std::string_view kAtlanticFile =
  "resources/hurdat2-1851-2019-052520.txt";
constexpr std::string_view kPacificFile =
  "resources/hurdat2-nepac-1949-2019-042320.txt";

struct Options
{
  hurdat_track::TrackPipeline::Config config;
  bool printObservations{false};
  bool printCodes{false};
};

void printUsage(std::ostream& out)
{
  out << "Usage: hurdat-exe [options] [file...]\n"
         "\n"
         "Extract and normalize HURDAT2 best-track files. Without files the\n"
         "Atlantic and Northeast Pacific releases under resources/ are used.\n"
         "\n"
         "Options:\n"
         "  --continue-on-error  Skip failing files instead of aborting\n"
         "  --parallel           Process files on separate threads\n"
         "  --observations       Also print the observation table\n"
         "  --codes              Also print the identifier and status tables\n"
         "  --verbose            Debug logging\n"
         "  --help               Show this message\n";
}

std::string nullable(double value)
{
  return std::isnan(value) ? "NULL" : std::format("{}", value);
}

void printRecords(const hurdat_track::TrackRecords& records,
                  const Options& options)
{
  std::cout << "storm_id\tevent_id\tbasin\tname\tstart_time\tpath\n";
  for (const auto& storm : records.storms)
  {
    std::cout << std::format("{}\t{}\t{}\t{}\t{}\t{}\n",
                             storm.id,
                             storm.event_id,
                             storm.basin,
                             storm.name,
                             storm.start_time,
                             storm.path);
  }

  if (options.printObservations)
  {
    std::cout << "\npoint_id\tstorm_id\tevent_id\tpoint_time\tidentifier"
                 "\tstatus\tlocation\tmax_wind_knots\tmin_pressure_mb"
                 "\tradii_34kt_ne_se_sw_nw\tradii_50kt_ne_se_sw_nw"
                 "\tradii_64kt_ne_se_sw_nw\n";
    for (const auto& obs : records.observations)
    {
      std::cout << std::format(
        "{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{} {} {} {}\t{} {} {} {}"
        "\t{} {} {} {}\n",
        obs.id,
        obs.storm.id,
        obs.event_id,
        obs.point_time,
        nullable(obs.identifier),
        nullable(obs.status),
        obs.location,
        nullable(obs.max_wind_knots),
        nullable(obs.min_pressure_mb),
        nullable(obs.ne_34kt_radii_max_nm),
        nullable(obs.se_34kt_radii_max_nm),
        nullable(obs.sw_34kt_radii_max_nm),
        nullable(obs.nw_34kt_radii_max_nm),
        nullable(obs.ne_50kt_radii_max_nm),
        nullable(obs.se_50kt_radii_max_nm),
        nullable(obs.sw_50kt_radii_max_nm),
        nullable(obs.nw_50kt_radii_max_nm),
        nullable(obs.ne_64kt_radii_max_nm),
        nullable(obs.se_64kt_radii_max_nm),
        nullable(obs.sw_64kt_radii_max_nm),
        nullable(obs.nw_64kt_radii_max_nm));
    }
  }

  if (options.printCodes)
  {
    std::cout << "\nrecord_id\tcode\tdescription\n";
    for (const auto& code : records.identifiers)
    {
      std::cout << std::format(
        "{}\t{}\t{}\n", code.code_id, code.code, code.description);
    }
    std::cout << "\nstatus_id\tcode\tdescription\n";
    for (const auto& code : records.statuses)
    {
      std::cout << std::format(
        "{}\t{}\t{}\n", code.code_id, code.code, code.description);
    }
  }
}

}  // namespace

int main(int argc, char** argv)
{
  Options options;
  std::vector<std::string> files;

  for (int i = 1; i < argc; ++i)
  {
    const std::string_view arg{argv[i]};
    if (arg == "--continue-on-error")
    {
      options.config.stopOnError = false;
    }
    else if (arg == "--parallel")
    {
      options.config.parallel = true;
    }
    else if (arg == "--observations")
    {
      options.printObservations = true;
    }
    else if (arg == "--codes")
    {
      options.printCodes = true;
    }
    else if (arg == "--verbose")
    {
      options.config.logLevel = spdlog::level::debug;
    }
    else if (arg == "--help" || arg == "-h")
    {
      printUsage(std::cout);
      return 0;
    }
    else if (arg.starts_with("--"))
    {
      std::cerr << "Unknown option: " << arg << "\n\n";
      printUsage(std::cerr);
      return 2;
    }
    else
    {
      files.emplace_back(arg);
    }
  }

  if (files.empty())
  {
    files = {std::string{kAtlanticFile}, std::string{kPacificFile}};
  }

  try
  {
    for (const auto& file : files)
    {
      options.config.sourcePaths.push_back(
        hurdat_utils::resolveDataPath(file));
    }

    hurdat_track::TrackPipeline pipeline{options.config};

    const auto result = pipeline.run();
    const auto records = hurdat_track::toRecords(result.track);
    printRecords(records, options);

    for (const auto& failure : result.failures)
    {
      std::cerr << std::format(
        "Failed: {}: {}\n", failure.path.string(), failure.message);
    }
    return result.succeeded() ? 0 : 1;
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
