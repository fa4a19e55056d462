#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <stdexcept>
#include <filesystem>

namespace datamap
{
  namespace fs = std::filesystem;

  // Download task state.
  //
  // pending -> resolving -> transferring -> verifying -> completed
  //
  // Failed is reachable from resolving, transferring, and verifying. Paused
  // is reachable from transferring (cancellation). Completed is also
  // reachable directly from pending when the destination already holds the
  // file.
  //
  enum class download_state
  {
    pending,
    resolving,
    transferring,
    verifying,
    completed,
    failed,
    paused
  };

  inline std::ostream&
  operator<< (std::ostream& os, download_state s)
  {
    switch (s)
    {
    case download_state::pending:      return os << "pending";
    case download_state::resolving:    return os << "resolving";
    case download_state::transferring: return os << "transferring";
    case download_state::verifying:    return os << "verifying";
    case download_state::completed:    return os << "completed";
    case download_state::failed:       return os << "failed";
    case download_state::paused:       return os << "paused";
    }
    return os;
  }

  inline bool
  terminal (download_state s) noexcept
  {
    return s == download_state::completed ||
           s == download_state::failed    ||
           s == download_state::paused;
  }

  bool
  valid_transition (download_state from, download_state to) noexcept;

  // Reason of a task failure.
  //
  enum class failure_kind
  {
    auth,
    not_found,
    rate_limit,
    transient_network,
    checksum,
    insufficient_space,
    path,               // Permission or path error, including path escapes.
    validation,
    api                 // Any other error response.
  };

  std::ostream&
  operator<< (std::ostream&, failure_kind);

  struct download_error
  {
    failure_kind                 kind;
    std::string                  message;
    std::optional<std::uint16_t> http_status;

    download_error (failure_kind k,
                    std::string m,
                    std::optional<std::uint16_t> s = std::nullopt)
      : kind (k), message (std::move (m)), http_status (s) {}
  };

  inline std::ostream&
  operator<< (std::ostream& os, const download_error& e)
  {
    os << e.kind << ": " << e.message;

    if (e.http_status)
      os << " [HTTP " << *e.http_status << "]";

    return os;
  }

  // One transfer attempt as reported in verbose mode.
  //
  struct attempt_record
  {
    std::uint32_t                number;
    std::optional<std::uint16_t> http_status;
    std::string                  message;
  };

  enum class verification_status
  {
    verified,
    skipped,  // No checksum published for the file.
    disabled  // Verification turned off by the user.
  };

  inline std::ostream&
  operator<< (std::ostream& os, verification_status v)
  {
    switch (v)
    {
    case verification_status::verified: return os << "verified";
    case verification_status::skipped:  return os << "skipped";
    case verification_status::disabled: return os << "disabled";
    }
    return os;
  }

  enum class download_outcome
  {
    completed,
    failed,
    paused,    // Cancelled while active, partial file kept.
    cancelled  // Never started because of a cancellation.
  };

  inline std::ostream&
  operator<< (std::ostream& os, download_outcome o)
  {
    switch (o)
    {
    case download_outcome::completed: return os << "completed";
    case download_outcome::failed:    return os << "failed";
    case download_outcome::paused:    return os << "paused";
    case download_outcome::cancelled: return os << "cancelled";
    }
    return os;
  }

  enum class batch_outcome
  {
    all_succeeded,
    partial_failure,
    all_failed
  };

  inline std::ostream&
  operator<< (std::ostream& os, batch_outcome o)
  {
    switch (o)
    {
    case batch_outcome::all_succeeded:   return os << "all succeeded";
    case batch_outcome::partial_failure: return os << "partial failure";
    case batch_outcome::all_failed:      return os << "all failed";
    }
    return os;
  }

  // Batch-level transfer options.
  //
  struct download_options
  {
    std::size_t concurrency = 3;
    std::size_t chunk_size  = 8192;
    bool        resume      = false;
    bool        verify      = true;
  };

  // Two or more requests of a batch resolve to the same destination.
  //
  class duplicate_destination_error: public std::invalid_argument
  {
  public:
    explicit
    duplicate_destination_error (std::vector<fs::path> ps)
      : std::invalid_argument (describe (ps)), paths (std::move (ps)) {}

    std::vector<fs::path> paths;

  private:
    static std::string
    describe (const std::vector<fs::path>&);
  };
}
