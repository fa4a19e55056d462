#include <datamap/datamap-download.hxx>

#include <iostream>

#include <datamap/diagnostics.hxx>
#include <datamap/progress/progress-tracker.hxx>

using namespace std;

namespace datamap
{
  int
  exit_code (const batch_report& r, bool interrupted) noexcept
  {
    if (interrupted)
      return exit_interrupted;

    switch (r.outcome)
    {
    case batch_outcome::all_succeeded:   return exit_success;
    case batch_outcome::partial_failure: return exit_partial;
    case batch_outcome::all_failed:      return exit_failure;
    }

    return exit_failure;
  }

  void
  print_report (ostream& o, const batch_report& r, bool verbose)
  {
    uint64_t bytes (0);

    for (const download_result& x: r.results)
    {
      bytes += x.bytes_transferred;

      switch (x.outcome)
      {
      case download_outcome::completed:
        {
          if (verbose)
          {
            o << "completed: " << x.destination.string ();

            if (x.verification)
              o << " (checksum " << *x.verification << ')';

            o << '\n';
          }
          break;
        }
      case download_outcome::failed:
        {
          o << "failed: " << x.file.name;

          if (x.error)
            o << ": " << *x.error;

          o << '\n';
          break;
        }
      case download_outcome::paused:
        {
          o << "paused: " << x.file.name << " (" << x.bytes_transferred
            << " of " << x.file.size_bytes << " bytes kept, use --resume)"
            << '\n';
          break;
        }
      case download_outcome::cancelled:
        {
          o << "cancelled: " << x.file.name << '\n';
          break;
        }
      }

      if (verbose && !x.attempt_log.empty ())
      {
        for (const attempt_record& a: x.attempt_log)
        {
          o << "  attempt " << a.number;

          if (a.http_status)
            o << " [HTTP " << *a.http_status << ']';

          o << ": " << a.message << '\n';
        }
      }
    }

    o << r.count (download_outcome::completed) << " of " << r.results.size ()
      << " file(s) downloaded ("
      << progress_tracker_traits<>::format_bytes (bytes) << "), "
      << r.outcome << '\n';
  }

  download_coordinator::
  download_coordinator (asio::io_context& ioc, const settings& s)
    : settings_ (s),
      api_ (ioc, s.endpoint (), s.credentials (), s.retry ()),
      progress_ (ioc, s.verbosity != 0),
      manager_ (ioc, api_, s.download ())
  {
    manager_.on_progress = [this] (const progress_event& e)
    {
      progress_.push (e);
    };
  }

  asio::awaitable<int> download_coordinator::
  download_file (const string& dataset_id,
                 const string& version_name,
                 const string& file_id,
                 optional<fs::path> output)
  {
    if (!valid_uuid (file_id))
      throw validation_error ("invalid file id '" + file_id + "'");

    version v (co_await api_.fetch_version (dataset_id, version_name));

    const file_descriptor* f (v.find_file (file_id));

    if (f == nullptr)
      throw not_found_error ("file with ID '" + file_id +
                             "' not found in version '" + version_name + "'");

    fs::path p (output ? *output : fs::path (f->name));
    p = fs::absolute (p);

    vector<download_request> rs;
    rs.emplace_back (file_ref {dataset_id, version_name, file_id},
                     *f,
                     p.filename ());

    co_return co_await run (move (rs), p.parent_path ());
  }

  asio::awaitable<int> download_coordinator::
  download_version (const string& dataset_id,
                    const string& version_name,
                    optional<fs::path> output)
  {
    version v (co_await api_.fetch_version (dataset_id, version_name));

    fs::path root (output ? *output : fs::path (version_name));
    root = fs::absolute (root);

    fs::create_directories (root);

    info () << "version " << v.name << ": " << v.file_count ()
            << " file(s), "
            << progress_tracker_traits<>::format_bytes (v.total_size ());

    vector<download_request> rs;
    rs.reserve (v.files.size ());

    for (const file_descriptor& f: v.files)
      rs.emplace_back (file_ref {dataset_id, version_name, f.id},
                       f,
                       fs::path (f.name));

    co_return co_await run (move (rs), root);
  }

  asio::awaitable<int> download_coordinator::
  run (vector<download_request> rs, const fs::path& root)
  {
    batch_report r (co_await manager_.download (move (rs), root));

    progress_.close ();

    print_report (cout, r, verb >= 2);

    co_return exit_code (r, manager_.cancelled ());
  }

  asio::awaitable<int> download_coordinator::
  health ()
  {
    bool ok (co_await api_.health_check ());

    cout << settings_.api_base_url << ": " << (ok ? "ok" : "unavailable")
         << '\n';

    co_return ok ? exit_success : exit_partial;
  }

  void download_coordinator::
  cancel ()
  {
    manager_.cancel_all ();
  }
}
