#include <cstdio>
#include <algorithm>

namespace datamap
{
  template <typename S>
  S progress_tracker_traits<S>::
  format_bytes (std::uint64_t bytes)
  {
    static const char* const units[] = {"B", "KiB", "MiB", "GiB", "TiB"};

    if (bytes < 1024)
      return S (std::to_string (bytes) + " B");

    double v (static_cast<double> (bytes));
    std::size_t u (0);

    while (v >= 1024.0 && u + 1 < sizeof (units) / sizeof (units[0]))
    {
      v /= 1024.0;
      ++u;
    }

    char buf[32];
    std::snprintf (buf, sizeof (buf), "%.1f %s", v, units[u]);
    return S (buf);
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_speed (float bytes_per_sec)
  {
    if (bytes_per_sec <= 0.0f)
      return S ("-- B/s");

    return format_bytes (static_cast<std::uint64_t> (bytes_per_sec)) + "/s";
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_duration (int seconds)
  {
    if (seconds < 0)
      seconds = 0;

    char buf[32];

    if (seconds < 60)
      std::snprintf (buf, sizeof (buf), "%ds", seconds);
    else if (seconds < 3600)
      std::snprintf (buf, sizeof (buf), "%dm%02ds", seconds / 60, seconds % 60);
    else
      std::snprintf (buf, sizeof (buf),
                     "%dh%02dm", seconds / 3600, (seconds % 3600) / 60);

    return S (buf);
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bar (float progress, int width)
  {
    progress = std::clamp (progress, 0.0f, 1.0f);

    if (width < 1)
      width = 1;

    int filled (static_cast<int> (progress * static_cast<float> (width)));

    S r ("[");

    for (int i (0); i != width; ++i)
    {
      if (i < filled)
        r += '=';
      else if (i == filled && filled != width)
        r += '>';
      else
        r += ' ';
    }

    r += ']';
    return r;
  }

  template <typename T>
  void basic_progress_tracker<T>::
  update (std::uint64_t bytes, time_point now) noexcept
  {
    using namespace std::chrono;

    if (!started_)
    {
      started_ = true;
      last_bytes_ = bytes;
      last_time_ = now;
      return;
    }

    auto dt (duration_cast<milliseconds> (now - last_time_).count ());

    if (dt < traits_type::min_sample_interval_ms)
      return;

    // A restarted transfer can make the count go backwards.
    //
    std::uint64_t db (bytes > last_bytes_ ? bytes - last_bytes_ : 0);

    float s (static_cast<float> (db) * 1000.0f / static_cast<float> (dt));

    speed_ = speed_ == 0.0f
      ? s
      : traits_type::ewma_alpha * s + (1.0f - traits_type::ewma_alpha) * speed_;

    last_bytes_ = bytes;
    last_time_ = now;
  }
}
