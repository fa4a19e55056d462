#include <datamap/download/download-manager.hxx>
#include <datamap/download/download.test.hxx>

#include <set>
#include <string>
#include <vector>
#include <cassert>
#include <filesystem>

#include <boost/asio.hpp>

#include <datamap/diagnostics.hxx>

using namespace std;
using namespace datamap;
using namespace datamap::test;

using manager = basic_download_manager<fake_api, space_traits>;

static download_request
request (fake_api& api,
         const string& id,
         const string& content,
         const fs::path& target)
{
  api.files[id] = content;

  file_descriptor f;
  f.id = id;
  f.name = target.filename ().string ();
  f.size_bytes = content.size ();

  return download_request (file_ref {"ds", "v1", id}, move (f), target);
}

static download_options
options (size_t n, size_t chunk = 1024)
{
  download_options o;
  o.concurrency = n;
  o.chunk_size = chunk;
  return o;
}

// Track the number of tasks in an active state at any instant.
//
struct activity
{
  set<string> active;
  size_t max_active = 0;

  void
  operator() (const progress_event& e)
  {
    switch (e.state)
    {
    case download_state::resolving:
    case download_state::transferring:
    case download_state::verifying:
      active.insert (e.task_id);
      break;
    default:
      active.erase (e.task_id);
    }

    max_active = max (max_active, active.size ());
  }
};

// Mixed sizes including an empty file.
//
static void
test_batch ()
{
  scratch s ("datamap-manager-batch");
  asio::io_context ioc;
  fake_api api (ioc);

  string big (make_content (10 * 1024 * 1024, 1));
  string small (make_content (1024, 2));

  vector<download_request> rs {
    request (api, "f1", big, "big.bin"),
    request (api, "f2", "", "empty.txt"),
    request (api, "f3", small, "nested/small.bin")};

  manager m (ioc, api, options (2, 65536));

  activity a;
  m.on_progress = [&a] (const progress_event& e) {a (e);};

  batch_report r (run (ioc, m.download (move (rs), s.path)));

  assert (r.outcome == batch_outcome::all_succeeded);
  assert (r.results.size () == 3);
  assert (r.count (download_outcome::completed) == 3);

  assert (r.results[0].task_id == "big.bin");
  assert (r.results[1].task_id == "empty.txt");
  assert (r.results[2].task_id == "nested/small.bin");

  assert (read_file (s.path / "big.bin") == big);
  assert (fs::file_size (s.path / "empty.txt") == 0);
  assert (read_file (s.path / "nested" / "small.bin") == small);

  // The empty file was never fetched.
  //
  assert (api.resolves.count ("f2") == 0);

  assert (a.max_active <= 2);
  assert (api.max_active <= 2);
}

// No more than the configured number of transfers at once, and the limit
// is actually reached.
//
static void
test_concurrency ()
{
  scratch s ("datamap-manager-concurrency");
  asio::io_context ioc;
  fake_api api (ioc);
  api.chunk_delay = chrono::milliseconds (2);

  vector<download_request> rs;
  for (unsigned i (0); i != 7; ++i)
  {
    string n ("f" + to_string (i));
    rs.push_back (request (api, n, make_content (8192, i), n + ".bin"));
  }

  manager m (ioc, api, options (3));

  activity a;
  m.on_progress = [&a] (const progress_event& e) {a (e);};

  batch_report r (run (ioc, m.download (move (rs), s.path)));

  assert (r.outcome == batch_outcome::all_succeeded);
  assert (a.max_active == 3);
  assert (api.max_active <= 3);
  assert (a.active.empty ());
}

// Duplicate destinations reject the batch before anything happens.
//
static void
test_duplicates ()
{
  scratch s ("datamap-manager-duplicates");
  asio::io_context ioc;
  fake_api api (ioc);

  vector<download_request> rs {
    request (api, "f1", "aaa", "x/a.csv"),
    request (api, "f2", "bbb", "b.csv"),
    request (api, "f3", "ccc", "x/../x/a.csv")};

  manager m (ioc, api, options (2));

  try
  {
    run (ioc, m.download (move (rs), s.path));
    assert (false);
  }
  catch (const duplicate_destination_error& e)
  {
    assert (e.paths.size () == 1);
    assert (e.paths[0].filename () == "a.csv");
  }

  assert (api.calls () == 0);
  assert (!fs::exists (s.path / "b.csv"));
  assert (!fs::exists (s.path / "x"));
}

// One failure does not affect the others.
//
static void
test_partial_failure ()
{
  scratch s ("datamap-manager-partial");
  asio::io_context ioc;
  fake_api api (ioc);

  vector<download_request> rs {
    request (api, "f1", make_content (3000, 1), "a.bin"),
    request (api, "f2", make_content (3000, 2), "b.bin"),
    request (api, "f3", make_content (3000, 3), "c.bin"),
    request (api, "f4", make_content (10, 4), "../escape.bin")};

  api.resolve_faults["f2"].push_back (fault {fault::not_found});

  manager m (ioc, api, options (2));
  batch_report r (run (ioc, m.download (move (rs), s.path)));

  assert (r.outcome == batch_outcome::partial_failure);

  assert (r.results[0].completed ());
  assert (r.results[1].outcome == download_outcome::failed);
  assert (r.results[1].error->kind == failure_kind::not_found);
  assert (r.results[2].completed ());
  assert (r.results[3].error->kind == failure_kind::path);

  assert (r.count (download_outcome::completed) == 2);
  assert (r.count (download_outcome::failed) == 2);

  assert (fs::exists (s.path / "a.bin"));
  assert (!fs::exists (s.path / "b.bin"));
  assert (fs::exists (s.path / "c.bin"));
  assert (!fs::exists (s.path.parent_path () / "escape.bin"));
  assert (!m.aborted ());
}

// Authentication failure aborts the whole batch.
//
static void
test_auth_abort ()
{
  for (size_t n: {size_t (1), size_t (3)})
  {
    scratch s ("datamap-manager-auth");
    asio::io_context ioc;
    fake_api api (ioc);

    vector<download_request> rs {
      request (api, "f1", make_content (2000, 1), "a.bin"),
      request (api, "f2", make_content (2000, 2), "b.bin"),
      request (api, "f3", make_content (2000, 3), "c.bin")};

    api.resolve_faults["f1"].push_back (fault {fault::auth});

    manager m (ioc, api, options (n));
    batch_report r (run (ioc, m.download (move (rs), s.path)));

    assert (m.aborted ());
    assert (r.outcome == batch_outcome::all_failed);

    for (const download_result& x: r.results)
    {
      assert (x.outcome == download_outcome::failed);
      assert (x.error->kind == failure_kind::auth);
    }

    assert (api.calls () == 1);
  }
}

// Interrupt: the active task pauses, the rest are never started.
//
static void
test_cancel ()
{
  scratch s ("datamap-manager-cancel");
  asio::io_context ioc;
  fake_api api (ioc);

  string c (make_content (8192, 1));

  vector<download_request> rs {
    request (api, "f1", c, "a.bin"),
    request (api, "f2", make_content (8192, 2), "b.bin"),
    request (api, "f3", make_content (8192, 3), "c.bin")};

  manager m (ioc, api, options (1));

  api.on_delivered = [&m] (const string&, uint64_t n)
  {
    if (n >= 3072)
      m.cancel_all ();
  };

  batch_report r (run (ioc, m.download (rs, s.path)));

  assert (m.cancelled ());
  assert (r.outcome == batch_outcome::all_failed);
  assert (r.results[0].outcome == download_outcome::paused);
  assert (r.results[0].bytes_transferred == 3072);
  assert (r.results[1].outcome == download_outcome::cancelled);
  assert (r.results[2].outcome == download_outcome::cancelled);

  assert (api.resolves.count ("f2") == 0);
  assert (fs::file_size (s.path / "a.bin.part") == 3072);

  // A resumed batch finishes the job.
  //
  api.on_delivered = nullptr;

  download_options o (options (2));
  o.resume = true;

  manager m2 (ioc, api, o);
  batch_report r2 (run (ioc, m2.download (move (rs), s.path)));

  assert (r2.outcome == batch_outcome::all_succeeded);
  assert (read_file (s.path / "a.bin") == c);
}

static void
test_misc ()
{
  scratch s ("datamap-manager-misc");
  asio::io_context ioc;
  fake_api api (ioc);

  // Empty batch.
  //
  {
    manager m (ioc, api, options (2));
    batch_report r (run (ioc, m.download ({}, s.path)));

    assert (r.results.empty ());
    assert (r.outcome == batch_outcome::all_succeeded);
    assert (api.calls () == 0);
  }

  // Invalid options.
  //
  try
  {
    manager m (ioc, api, options (0));
    assert (false);
  }
  catch (const invalid_argument&) {}

  // Rollup.
  //
  {
    vector<download_result> rs (2);
    rs[0].outcome = download_outcome::completed;
    rs[1].outcome = download_outcome::paused;

    assert (rollup (rs) == batch_outcome::partial_failure);

    rs[1].outcome = download_outcome::completed;
    assert (rollup (rs) == batch_outcome::all_succeeded);

    rs[0].outcome = download_outcome::failed;
    rs[1].outcome = download_outcome::cancelled;
    assert (rollup (rs) == batch_outcome::all_failed);
  }
}

int
main ()
{
  verb = 0;

  test_batch ();
  test_concurrency ();
  test_duplicates ();
  test_partial_failure ();
  test_auth_abort ();
  test_cancel ();
  test_misc ();
}
