#pragma once

#include <map>
#include <mutex>
#include <chrono>
#include <vector>
#include <cstddef>
#include <functional>

#include <boost/asio.hpp>

#include <datamap/progress/progress-types.hxx>
#include <datamap/progress/progress-tracker.hxx>

namespace datamap
{
  namespace asio = boost::asio;

  // Progress aggregator.
  //
  // Workers push events from wherever they run. The events are queued and
  // drained on the io_context (single consumer) where the aggregate state is
  // recomputed and handed to the sink as a snapshot: at most one per
  // interval, except that a terminal state change is emitted right away. An
  // event that got throttled is not lost: a trailing snapshot follows at the
  // end of the interval.
  //
  // Must outlive the io_context run.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_aggregator
  {
  public:
    using traits_type  = T;
    using tracker_type = basic_progress_tracker<traits_type>;

    using snapshot_callback = std::function<void (const progress_snapshot&)>;

    basic_progress_aggregator (
      asio::io_context&,
      snapshot_callback,
      std::chrono::milliseconds interval = std::chrono::milliseconds (100));

    basic_progress_aggregator (const basic_progress_aggregator&) = delete;
    basic_progress_aggregator& operator= (const basic_progress_aggregator&) = delete;

    // Queue an event. Thread-safe.
    //
    void
    push (const progress_event&);

    // Process what is still queued and emit the final snapshot. Further
    // events are ignored.
    //
    void
    close ();

    // Current aggregate state. Must be called on the io_context.
    //
    progress_snapshot
    snapshot () const;

    std::size_t
    emitted () const noexcept
    {
      return emitted_;
    }

  private:
    void
    drain ();

    // Return true if the event is a terminal state change.
    //
    bool
    apply (const progress_event&);

    void
    emit ();

    void
    schedule_trailing ();

  private:
    asio::io_context& ioc_;
    snapshot_callback sink_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::vector<progress_event> queue_;
    bool posted_ = false;

    // Task state in the order first seen.
    //
    std::vector<task_progress> tasks_;
    std::map<std::string, std::size_t> index_;

    tracker_type tracker_;
    time_point last_emit_;
    bool emitted_once_ = false;
    bool dirty_ = false;
    bool closed_ = false;
    std::size_t emitted_ = 0;

    asio::steady_timer trailing_;
    bool trailing_armed_ = false;
  };

  using progress_aggregator = basic_progress_aggregator<>;
}

#include <datamap/progress/progress-aggregator.txx>
