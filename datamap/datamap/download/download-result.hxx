#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <filesystem>

#include <datamap/api/api-types.hxx>
#include <datamap/download/download-types.hxx>

namespace datamap
{
  namespace fs = std::filesystem;

  // Final result of one task.
  //
  struct download_result
  {
    std::string                        task_id;
    file_descriptor                    file;
    fs::path                           destination;
    download_outcome                   outcome = download_outcome::failed;
    std::optional<download_error>      error;
    std::optional<verification_status> verification;
    std::uint64_t                      bytes_transferred = 0;
    std::uint32_t                      attempts = 0;
    std::vector<attempt_record>        attempt_log;

    bool
    completed () const noexcept
    {
      return outcome == download_outcome::completed;
    }
  };

  // Report of a whole batch: one result per request, in request order.
  //
  struct batch_report
  {
    std::vector<download_result> results;
    batch_outcome                outcome = batch_outcome::all_succeeded;

    std::size_t
    count (download_outcome) const noexcept;
  };

  // An empty batch or one where everything completed has succeeded. One
  // where nothing completed has failed.
  //
  batch_outcome
  rollup (const std::vector<download_result>&) noexcept;
}
