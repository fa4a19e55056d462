#include <datamap/datamap-download.hxx>
#include <datamap/datamap-progress.hxx>

#include <string>
#include <sstream>
#include <cassert>

using namespace std;
using namespace datamap;

static download_result
result (const string& name, download_outcome o, uint64_t size = 2048)
{
  download_result r;
  r.task_id = name;
  r.file.name = name;
  r.file.size_bytes = size;
  r.destination = "/out/" + name;
  r.outcome = o;

  if (o == download_outcome::completed)
  {
    r.bytes_transferred = size;
    r.verification = verification_status::verified;
    r.attempts = 1;
  }

  return r;
}

static void
test_exit_code ()
{
  batch_report r;

  r.outcome = batch_outcome::all_succeeded;
  assert (exit_code (r, false) == 0);

  r.outcome = batch_outcome::partial_failure;
  assert (exit_code (r, false) == 1);

  r.outcome = batch_outcome::all_failed;
  assert (exit_code (r, false) == 2);

  // Interrupt wins over whatever the batch did.
  //
  assert (exit_code (r, true) == 130);
}

static void
test_report ()
{
  batch_report r;
  r.results.push_back (result ("a.csv", download_outcome::completed));

  download_result f (result ("b.csv", download_outcome::failed));
  f.error = download_error (failure_kind::transient_network,
                            "connection reset by peer",
                            503);
  f.attempts = 2;
  f.attempt_log.push_back (attempt_record {1, 503, "storage error"});
  f.attempt_log.push_back (attempt_record {2, nullopt, "connection reset"});
  r.results.push_back (f);

  download_result p (result ("c.csv", download_outcome::paused));
  p.bytes_transferred = 1024;
  r.results.push_back (p);

  r.outcome = rollup (r.results);
  assert (r.outcome == batch_outcome::partial_failure);

  {
    ostringstream os;
    print_report (os, r, false);
    string s (os.str ());

    assert (s.find ("completed: /out/a.csv") == string::npos);
    assert (s.find ("failed: b.csv: network error: connection reset") !=
            string::npos);
    assert (s.find ("[HTTP 503]") != string::npos);
    assert (s.find ("paused: c.csv (1024 of 2048 bytes kept") != string::npos);
    assert (s.find ("attempt 1") == string::npos);
    assert (s.find ("1 of 3 file(s) downloaded") != string::npos);
    assert (s.find ("partial failure") != string::npos);
  }

  {
    ostringstream os;
    print_report (os, r, true);
    string s (os.str ());

    assert (s.find ("completed: /out/a.csv (checksum verified)") !=
            string::npos);
    assert (s.find ("  attempt 1 [HTTP 503]: storage error") != string::npos);
    assert (s.find ("  attempt 2: connection reset") != string::npos);
  }
}

static void
test_status ()
{
  progress_snapshot s;
  s.bytes_done = 512;
  s.total_bytes = 1024;
  s.active = 2;

  string l (format_status (s, 10));
  assert (l == "[=====>    ] 512 B / 1.0 KiB (50.0%) @ -- B/s, 2 active");

  s.speed = 256.0f;
  l = format_status (s, 10);
  assert (l.find ("@ 256 B/s, ETA 2s, 2 active") != string::npos);
}

int
main ()
{
  test_exit_code ();
  test_report ();
  test_status ();
}
