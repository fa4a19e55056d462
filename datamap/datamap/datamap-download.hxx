#pragma once

#include <string>
#include <ostream>
#include <optional>
#include <filesystem>

#include <boost/asio.hpp>

#include <datamap/datamap-settings.hxx>
#include <datamap/datamap-progress.hxx>

#include <datamap/api/api-client.hxx>
#include <datamap/download/download.hxx>

namespace datamap
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Process exit codes.
  //
  enum exit_status
  {
    exit_success     = 0,
    exit_partial     = 1, // Also usage and configuration errors.
    exit_failure     = 2,
    exit_interrupted = 130
  };

  int
  exit_code (const batch_report&, bool interrupted) noexcept;

  // Print one line per file that did not complete (plus the attempt log if
  // verbose) and a summary line.
  //
  void
  print_report (std::ostream&, const batch_report&, bool verbose);

  // Download command driver: turns metadata into a batch, runs it, and
  // reports the outcome.
  //
  class download_coordinator
  {
  public:
    download_coordinator (asio::io_context&, const settings&);

    download_coordinator (const download_coordinator&) = delete;
    download_coordinator& operator= (const download_coordinator&) = delete;

    // Download one file of a version to output (./<file name> by default).
    //
    asio::awaitable<int>
    download_file (const std::string& dataset_id,
                   const std::string& version_name,
                   const std::string& file_id,
                   std::optional<fs::path> output);

    // Download every file of a version into the output directory
    // (./<version name> by default).
    //
    asio::awaitable<int>
    download_version (const std::string& dataset_id,
                      const std::string& version_name,
                      std::optional<fs::path> output);

    asio::awaitable<int>
    health ();

    // Interrupt the running batch.
    //
    void
    cancel ();

  private:
    asio::awaitable<int>
    run (std::vector<download_request>, const fs::path& root);

  private:
    settings settings_;
    api_client api_;
    progress_coordinator progress_;
    download_manager manager_;
  };
}
