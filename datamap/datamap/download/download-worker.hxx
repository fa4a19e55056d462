#pragma once

#include <chrono>
#include <string>
#include <cstdint>
#include <optional>
#include <exception>
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>

#include <datamap/api/api-types.hxx>
#include <datamap/http/http-types.hxx>
#include <datamap/download/download-task.hxx>
#include <datamap/download/download-types.hxx>

namespace datamap
{
  namespace asio = boost::asio;
  namespace fs   = std::filesystem;

  // Download worker traits.
  //
  // The filesystem probes are traits functions so that tests can pretend
  // the disk is full.
  //
  struct download_worker_traits
  {
    // Space available to us on the filesystem holding the directory or
    // nullopt if it cannot be determined.
    //
    static std::optional<std::uint64_t>
    available_space (const fs::path& dir);

    // Compute the lower-case hex digest of the file contents. Return an
    // empty string if the file cannot be read or hashing fails.
    //
    static std::string
    compute_hash (const fs::path& file, checksum_algorithm);
  };

  // File transfer worker.
  //
  // Drives one task through the state machine: checks the destination,
  // resolves a fresh URL for every attempt, streams the body into the
  // temporary file (resuming from its length), verifies the digest, and
  // atomically renames the result into place. Never throws: every failure
  // ends up in the task result.
  //
  template <typename A, typename T = download_worker_traits>
  class basic_download_worker
  {
  public:
    using api_type      = A;
    using traits_type   = T;
    using response_type = typename api_type::response_type;

    basic_download_worker (asio::io_context& ioc,
                           api_type& api,
                           const download_options& opts)
      : ioc_ (ioc), api_ (api), opts_ (opts) {}

    // Called when a task fails with an authentication error.
    //
    std::function<void ()> on_auth_failure;

    asio::awaitable<void>
    run (download_task&);

  private:
    asio::awaitable<void>
    execute (download_task&);

    asio::awaitable<void>
    transfer (download_task&, const download_url&);

    // Return true if the destination already holds the file.
    //
    bool
    already_complete (download_task&);

    void
    verify_and_commit (download_task&);

    void
    fail (download_task&, download_error);

    // Handle a cancellation request.
    //
    void
    stop (download_task&);

    // Sleep in short slices so that a cancellation is noticed promptly.
    //
    asio::awaitable<void>
    sleep (download_task&, std::chrono::milliseconds);

    static download_error
    classify (std::exception_ptr);

  private:
    asio::io_context& ioc_;
    api_type& api_;
    download_options opts_;
  };

  // Return true if path is inside root. Both are expected to be normalized.
  //
  bool
  path_contained (const fs::path& root, const fs::path& path);
}

#include <datamap/download/download-worker.txx>
