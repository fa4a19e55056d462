#pragma once

#include <chrono>
#include <string>
#include <cstddef>
#include <cstdint>

#include <datamap/progress/progress-types.hxx>

namespace datamap
{
  // Traits for progress tracking customization.
  //
  template <typename S = std::string>
  struct progress_tracker_traits
  {
    using string_type = S;

    // EWMA alpha factor for speed calculation (0.0-1.0). Higher means more
    // weight on recent samples.
    //
    static constexpr float ewma_alpha = 0.2f;

    // Minimum interval between two speed samples in milliseconds.
    //
    static constexpr int min_sample_interval_ms = 250;

    // Format bytes to human-readable string (binary units).
    //
    static string_type
    format_bytes (std::uint64_t bytes);

    static string_type
    format_speed (float bytes_per_sec);

    // Format duration as 13s, 2m05s, or 1h02m.
    //
    static string_type
    format_duration (int seconds);

    // Format progress bar of the specified inner width.
    //
    static string_type
    format_bar (float progress, int width);
  };

  // Transfer speed tracker (exponentially weighted moving average).
  //
  // Not thread-safe: it is only updated by the aggregator.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_progress_tracker () = default;

    // Record the cumulative byte count observed at the specified time.
    //
    void
    update (std::uint64_t bytes, time_point now) noexcept;

    // Bytes per second.
    //
    float
    speed () const noexcept
    {
      return speed_;
    }

    void
    reset () noexcept
    {
      started_ = false;
      speed_ = 0.0f;
    }

    string_type
    speed_string () const
    {
      return traits_type::format_speed (speed_);
    }

  private:
    bool          started_ = false;
    std::uint64_t last_bytes_ = 0;
    time_point    last_time_;
    float         speed_ = 0.0f;
  };

  using progress_tracker = basic_progress_tracker<>;
}

#include <datamap/progress/progress-tracker.txx>
