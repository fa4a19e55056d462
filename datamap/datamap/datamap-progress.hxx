#pragma once

#include <string>
#include <cstddef>

#include <boost/asio.hpp>

#include <datamap/progress/progress-types.hxx>
#include <datamap/progress/progress-aggregator.hxx>

namespace datamap
{
  namespace asio = boost::asio;

  // Terminal progress display.
  //
  // Feeds the worker events into the aggregator and redraws a single status
  // line on stderr for every snapshot. Does nothing unless enabled and
  // stderr is a terminal.
  //
  class progress_coordinator
  {
  public:
    using aggregator_type = progress_aggregator;

    progress_coordinator (asio::io_context&, bool enabled);

    progress_coordinator (const progress_coordinator&) = delete;
    progress_coordinator& operator= (const progress_coordinator&) = delete;

    void
    push (const progress_event&);

    // Flush the final state and terminate the status line.
    //
    void
    close ();

    bool
    enabled () const noexcept
    {
      return enabled_;
    }

  private:
    void
    render (const progress_snapshot&);

  private:
    bool enabled_;
    std::size_t width_ = 0;
    aggregator_type aggregator_;
  };

  // [====>   ] 12.3 MiB / 40.0 MiB (30.7%) @ 2.1 MiB/s, ETA 13s, 2 active
  //
  std::string
  format_status (const progress_snapshot&, int bar_width = 20);
}
