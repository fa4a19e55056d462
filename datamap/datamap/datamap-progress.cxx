#include <datamap/datamap-progress.hxx>

#include <cstdio>
#include <iostream>

#include <unistd.h>

#include <datamap/progress/progress-tracker.hxx>

using namespace std;

namespace datamap
{
  progress_coordinator::
  progress_coordinator (asio::io_context& ioc, bool enabled)
    : enabled_ (enabled && isatty (STDERR_FILENO) == 1),
      aggregator_ (ioc, [this] (const progress_snapshot& s) {render (s);})
  {
  }

  void progress_coordinator::
  push (const progress_event& e)
  {
    if (enabled_)
      aggregator_.push (e);
  }

  void progress_coordinator::
  close ()
  {
    if (!enabled_)
      return;

    aggregator_.close ();

    if (width_ != 0)
    {
      cerr << endl;
      width_ = 0;
    }
  }

  void progress_coordinator::
  render (const progress_snapshot& s)
  {
    string l (format_status (s));

    // Pad over whatever is left of a longer previous line.
    //
    size_t n (l.size ());
    if (n < width_)
      l.append (width_ - n, ' ');

    width_ = n;

    cerr << '\r' << l << flush;
  }

  string
  format_status (const progress_snapshot& s, int bar_width)
  {
    using traits = progress_tracker_traits<>;

    float r (s.progress_ratio ());

    char pct[16];
    snprintf (pct, sizeof (pct), "%.1f%%", r * 100.0f);

    string l (traits::format_bar (r, bar_width));

    l += ' ';
    l += traits::format_bytes (s.bytes_done);
    l += " / ";
    l += traits::format_bytes (s.total_bytes);
    l += " (";
    l += pct;
    l += ") @ ";
    l += traits::format_speed (s.speed);

    if (s.speed > 0.0f && s.bytes_done < s.total_bytes)
    {
      l += ", ETA ";
      l += traits::format_duration (s.eta_seconds ());
    }

    l += ", ";
    l += to_string (s.active);
    l += " active";

    return l;
  }
}
