#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include <datamap/download/download-types.hxx>

namespace datamap
{
  using time_point = std::chrono::steady_clock::time_point;

  // Progress event emitted by a download worker. Each task has exactly one
  // producer.
  //
  struct progress_event
  {
    std::string    task_id;
    std::string    name;
    std::uint64_t  bytes_done  = 0;
    std::uint64_t  total_bytes = 0;
    time_point     timestamp;
    download_state state = download_state::pending;
  };

  // Last known state of a single task.
  //
  struct task_progress
  {
    std::string    task_id;
    std::string    name;
    std::uint64_t  bytes_done  = 0;
    std::uint64_t  total_bytes = 0;
    download_state state = download_state::pending;
  };

  // Aggregate snapshot handed to the display.
  //
  struct progress_snapshot
  {
    std::uint64_t bytes_done  = 0;
    std::uint64_t total_bytes = 0;
    std::size_t   active      = 0;
    std::size_t   completed   = 0;
    std::size_t   failed      = 0;
    std::size_t   paused      = 0;
    float         speed       = 0.0f; // Bytes per second.
    time_point    timestamp;

    std::vector<task_progress> tasks;

    float
    progress_ratio () const noexcept
    {
      if (total_bytes == 0)
        return 0.0f;

      return static_cast<float> (bytes_done) /
             static_cast<float> (total_bytes);
    }

    int
    eta_seconds () const noexcept
    {
      if (speed <= 0.0f || total_bytes <= bytes_done)
        return 0;

      return static_cast<int> ((total_bytes - bytes_done) / speed);
    }
  };
}
