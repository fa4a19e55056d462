#include <datamap/progress/progress-aggregator.hxx>

#include <cmath>
#include <chrono>
#include <string>
#include <vector>
#include <cassert>

#include <boost/asio.hpp>

using namespace std;
using namespace datamap;

using chrono::milliseconds;

static progress_event
event (const string& id,
       uint64_t done,
       uint64_t total,
       download_state s = download_state::transferring)
{
  progress_event e;
  e.task_id = id;
  e.name = id;
  e.bytes_done = done;
  e.total_bytes = total;
  e.timestamp = chrono::steady_clock::now ();
  e.state = s;
  return e;
}

static void
pump (asio::io_context& ioc)
{
  ioc.restart ();
  ioc.poll ();
}

static void
test_formatting ()
{
  using traits = progress_tracker_traits<>;

  assert (traits::format_bytes (512) == "512 B");
  assert (traits::format_bytes (1536) == "1.5 KiB");
  assert (traits::format_bytes (10 * 1024 * 1024) == "10.0 MiB");

  assert (traits::format_speed (0.0f) == "-- B/s");
  assert (traits::format_speed (2048.0f) == "2.0 KiB/s");

  assert (traits::format_duration (13) == "13s");
  assert (traits::format_duration (125) == "2m05s");
  assert (traits::format_duration (3720) == "1h02m");

  assert (traits::format_bar (0.5f, 10) == "[=====>    ]");
  assert (traits::format_bar (1.0f, 4) == "[====]");
  assert (traits::format_bar (0.0f, 3) == "[>  ]");
}

static void
test_tracker ()
{
  progress_tracker t;
  auto t0 (chrono::steady_clock::now ());

  t.update (0, t0);
  assert (t.speed () == 0.0f);
  assert (t.speed_string () == "-- B/s");

  t.update (1000, t0 + milliseconds (1000));
  assert (fabs (t.speed () - 1000.0f) < 0.5f);

  // Too close to the previous sample.
  //
  t.update (5000, t0 + milliseconds (1100));
  assert (fabs (t.speed () - 1000.0f) < 0.5f);

  t.update (3000, t0 + milliseconds (2000));
  assert (fabs (t.speed () - 1200.0f) < 0.5f);

  t.reset ();
  assert (t.speed () == 0.0f);
}

// Bursts of byte updates are coalesced into at most one snapshot per
// interval with a trailing one carrying the latest state.
//
static void
test_throttle ()
{
  asio::io_context ioc;
  vector<progress_snapshot> ss;

  progress_aggregator a (ioc,
                         [&ss] (const progress_snapshot& s) {ss.push_back (s);},
                         milliseconds (100));

  a.push (event ("a", 0, 1000));
  pump (ioc);
  assert (ss.size () == 1);
  assert (ss[0].active == 1);

  for (uint64_t i (1); i <= 10; ++i)
  {
    a.push (event ("a", i * 10, 1000));
    pump (ioc);
  }

  assert (ss.size () == 1);

  // Wait for the trailing snapshot.
  //
  ioc.restart ();
  ioc.run ();

  assert (ss.size () == 2);
  assert (ss[1].bytes_done == 100);
  assert (a.emitted () == 2);
}

// Terminal state changes are reported right away.
//
static void
test_terminal ()
{
  asio::io_context ioc;
  vector<progress_snapshot> ss;

  progress_aggregator a (ioc,
                         [&ss] (const progress_snapshot& s) {ss.push_back (s);},
                         milliseconds (10000));

  a.push (event ("a", 0, 100));
  a.push (event ("b", 0, 200));
  pump (ioc);
  assert (ss.size () == 1);

  a.push (event ("a", 100, 100, download_state::completed));
  pump (ioc);
  assert (ss.size () == 2);

  a.push (event ("b", 50, 200, download_state::failed));
  pump (ioc);
  assert (ss.size () == 3);

  const progress_snapshot& s (ss.back ());
  assert (s.completed == 1);
  assert (s.failed == 1);
  assert (s.active == 0);
  assert (s.bytes_done == 150);
  assert (s.total_bytes == 300);

  // Tasks are kept in the order first seen.
  //
  assert (s.tasks.size () == 2);
  assert (s.tasks[0].task_id == "a");
  assert (s.tasks[1].task_id == "b");

  // A task whose first event is already terminal (say, a file found in
  // place) is reported immediately as well.
  //
  a.push (event ("c", 300, 300, download_state::completed));
  pump (ioc);
  assert (ss.size () == 4);
  assert (ss.back ().completed == 2);
  assert (ss.back ().tasks.size () == 3);
}

// Close flushes what is still queued and emits the final snapshot.
//
static void
test_close ()
{
  asio::io_context ioc;
  vector<progress_snapshot> ss;

  progress_aggregator a (ioc,
                         [&ss] (const progress_snapshot& s) {ss.push_back (s);},
                         milliseconds (10000));

  a.push (event ("a", 0, 100));
  pump (ioc);

  a.push (event ("a", 40, 100));
  a.push (event ("b", 10, 50, download_state::paused));
  a.close ();

  assert (ss.size () == 2);
  assert (ss[1].bytes_done == 50);
  assert (ss[1].paused == 1);
  assert (ss[1].active == 1);

  // Ignored after close.
  //
  a.push (event ("a", 100, 100, download_state::completed));
  pump (ioc);
  assert (ss.size () == 2);

  progress_snapshot s (a.snapshot ());
  assert (s.completed == 0);
  assert (s.progress_ratio () == 50.0f / 150.0f);
}

static void
test_snapshot ()
{
  progress_snapshot s;
  assert (s.progress_ratio () == 0.0f);
  assert (s.eta_seconds () == 0);

  s.bytes_done = 50;
  s.total_bytes = 100;
  s.speed = 10.0f;

  assert (s.progress_ratio () == 0.5f);
  assert (s.eta_seconds () == 5);
}

int
main ()
{
  test_formatting ();
  test_tracker ();
  test_throttle ();
  test_terminal ();
  test_close ();
  test_snapshot ();
}
