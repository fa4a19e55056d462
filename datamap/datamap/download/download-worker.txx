#include <cerrno>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <datamap/diagnostics.hxx>
#include <datamap/api/api-error.hxx>

namespace datamap
{
  template <typename A, typename T>
  asio::awaitable<void> basic_download_worker<A, T>::
  run (download_task& t)
  {
    std::exception_ptr ep;

    try
    {
      co_await execute (t);
    }
    catch (const std::exception&)
    {
      ep = std::current_exception ();
    }

    // Anything that escaped the attempt loop is terminal for this task (but
    // never for its siblings).
    //
    if (ep)
    {
      download_error e (classify (ep));

      t.result.attempt_log.push_back (
        attempt_record {t.attempt_count.load (), e.http_status, e.message});

      fail (t, e);

      if (e.kind == failure_kind::auth && on_auth_failure)
        on_auth_failure ();
    }

    t.result.bytes_transferred = t.bytes_transferred.load ();
    t.result.attempts = t.attempt_count.load ();
  }

  template <typename A, typename T>
  asio::awaitable<void> basic_download_worker<A, T>::
  execute (download_task& t)
  {
    using std::chrono::milliseconds;

    const file_descriptor& f (t.request.file);
    const fs::path tmp (t.temp_path ());

    if (!t.request.valid ())
    {
      fail (t, download_error (failure_kind::validation,
                               "invalid download request for '" + f.name +
                               "'"));
      co_return;
    }

    if (!path_contained (t.root, t.destination))
    {
      fail (t, download_error (failure_kind::path,
                               "destination " + t.destination.string () +
                               " is outside of " + t.root.string ()));
      co_return;
    }

    if (t.should_cancel ())
    {
      stop (t);
      co_return;
    }

    if (already_complete (t))
    {
      info () << f.name << ": already downloaded";

      t.update_progress (f.size_bytes);
      t.advance (download_state::completed);
      t.result.outcome = download_outcome::completed;
      co_return;
    }

    t.advance (download_state::resolving);

    fs::create_directories (t.destination.parent_path ());

    // See what is left of a previous run. Without resume we start over.
    //
    std::uint64_t have (0);

    if (fs::exists (tmp))
    {
      if (opts_.resume)
      {
        have = fs::file_size (tmp);

        if (have > f.size_bytes)
        {
          warn () << f.name << ": partial file is larger than expected, "
                  << "restarting from zero";

          fs::resize_file (tmp, 0);
          have = 0;
        }
        else if (have != 0)
          info () << f.name << ": resuming at byte " << have;
      }
      else
        fs::resize_file (tmp, 0);
    }

    t.update_progress (have);

    // Make sure the rest fits before making any request.
    //
    std::uint64_t need (f.size_bytes - have);

    if (auto a = traits_type::available_space (t.destination.parent_path ());
        a && *a < need)
    {
      fail (t, download_error (failure_kind::insufficient_space,
                               "need " + std::to_string (need) +
                               " bytes but only " + std::to_string (*a) +
                               " available in " +
                               t.destination.parent_path ().string ()));
      co_return;
    }

    if (have == f.size_bytes)
    {
      // Nothing left to fetch (empty file or complete partial file).
      //
      t.advance (download_state::transferring);
    }
    else
    {
      const std::uint32_t n (api_.retry ().max_attempts ());

      for (std::uint32_t a (0);; ++a)
      {
        if (t.should_cancel ())
        {
          stop (t);
          co_return;
        }

        t.attempt_count.store (a + 1);

        // The URL may expire so it is resolved anew for every attempt.
        //
        download_url u (co_await api_.resolve_download_url (t.request.ref));

        if (t.state.load () == download_state::resolving)
          t.advance (download_state::transferring);

        std::optional<download_error> e;
        milliseconds wait (0);

        try
        {
          co_await transfer (t, u);
        }
        catch (const rate_limit_error& x)
        {
          e = download_error (failure_kind::rate_limit, x.what (), 429);
          wait = api_.backoff (a);

          if (x.retry_after)
            wait = std::max (wait, milliseconds (*x.retry_after));
        }
        catch (const transient_network_error& x)
        {
          e = download_error (failure_kind::transient_network,
                              x.what (),
                              x.status);
          wait = api_.backoff (a);
        }

        if (!e)
          break;

        t.result.attempt_log.push_back (
          attempt_record {a + 1, e->http_status, e->message});

        info () << f.name << ": attempt " << a + 1 << '/' << n << " failed: "
                << e->message;

        if (a + 1 >= n)
        {
          fail (t, *e);
          co_return;
        }

        trace () << f.name << ": retrying in " << wait.count () << "ms";
        co_await sleep (t, wait);
      }

      if (t.should_cancel () && t.bytes_transferred.load () < f.size_bytes)
      {
        stop (t);
        co_return;
      }
    }

    verify_and_commit (t);
  }

  // One transfer attempt.
  //
  // Appends to the temporary file starting at its current length. If the
  // server ignores the range (200 instead of 206) the body is written from
  // zero. A 206 that does not start at the requested offset is dropped
  // unread: the temporary file is truncated and the attempt fails so that
  // the next one asks for the whole file.
  //
  template <typename A, typename T>
  asio::awaitable<void> basic_download_worker<A, T>::
  transfer (download_task& t, const download_url& u)
  {
    const std::uint64_t size (t.request.file.size_bytes);
    const fs::path tmp (t.temp_path ());

    std::error_code ec;
    std::uint64_t have (fs::exists (tmp, ec) ? fs::file_size (tmp) : 0);

    std::optional<std::uint64_t> offset;
    if (have != 0)
      offset = have;

    std::ofstream ofs;
    bool bad_range (false);

    auto on_head = [&] (const response_type& r) -> bool
    {
      if (r.status == http_status::partial_content)
      {
        auto s (r.content_range_start ());

        if (!offset || !s || *s != *offset)
        {
          bad_range = true;
          return false;
        }
      }
      else if (offset)
      {
        info () << t.request.file.name << ": server did not honor the "
                << "byte range, restarting from zero";
        have = 0;
      }

      if (auto n = r.content_length (); n && have + *n > size)
        throw validation_error ("server announced " +
                                std::to_string (have + *n) +
                                " bytes, expected " + std::to_string (size));

      ofs.open (tmp,
                std::ios::binary | std::ios::out |
                (have != 0 ? std::ios::app : std::ios::trunc));

      if (!ofs.is_open ())
        throw fs::filesystem_error ("unable to open file",
                                    tmp,
                                    std::error_code (errno,
                                                     std::generic_category ()));

      t.update_progress (have);
      return true;
    };

    auto on_chunk = [&] (const char* d, std::size_t n) -> bool
    {
      if (t.should_cancel ())
        return false;

      if (have + n > size)
        throw validation_error ("received more than the expected " +
                                std::to_string (size) + " bytes");

      // Flush every chunk: the file length is what we resume from.
      //
      ofs.write (d, static_cast<std::streamsize> (n));
      ofs.flush ();

      if (!ofs)
        throw fs::filesystem_error ("unable to write file",
                                    tmp,
                                    std::error_code (errno,
                                                     std::generic_category ()));

      have += n;
      t.update_progress (have);

      return !t.should_cancel ();
    };

    co_await api_.fetch (u.url, offset, on_head, on_chunk, opts_.chunk_size);

    if (ofs.is_open ())
      ofs.close ();

    if (bad_range)
    {
      if (fs::exists (tmp))
        fs::resize_file (tmp, 0);

      t.update_progress (0);

      throw transient_network_error ("server answered with an unexpected "
                                     "byte range, restarting from zero",
                                     206);
    }

    if (t.should_cancel ())
      co_return;

    if (have != size)
      throw transient_network_error ("connection closed after " +
                                     std::to_string (have) + " of " +
                                     std::to_string (size) + " bytes");
  }

  template <typename A, typename T>
  bool basic_download_worker<A, T>::
  already_complete (download_task& t)
  {
    const file_descriptor& f (t.request.file);

    std::error_code ec;
    if (!fs::is_regular_file (t.destination, ec))
      return false;

    std::uint64_t n (fs::file_size (t.destination, ec));
    if (ec || n != f.size_bytes)
      return false;

    if (!opts_.verify)
    {
      t.result.verification = verification_status::disabled;
      return true;
    }

    if (!f.checksum)
    {
      t.result.verification = verification_status::skipped;
      return true;
    }

    if (traits_type::compute_hash (t.destination, f.checksum->algorithm) ==
        f.checksum->value)
    {
      t.result.verification = verification_status::verified;
      return true;
    }

    warn () << f.name << ": existing " << t.destination.string ()
            << " does not match its checksum, downloading again";
    return false;
  }

  template <typename A, typename T>
  void basic_download_worker<A, T>::
  verify_and_commit (download_task& t)
  {
    const file_descriptor& f (t.request.file);
    const fs::path tmp (t.temp_path ());

    t.advance (download_state::verifying);

    // Empty files are never fetched so there may be nothing on disk yet.
    //
    if (!fs::exists (tmp))
    {
      std::ofstream ofs (tmp, std::ios::binary | std::ios::out);

      if (!ofs.is_open ())
        throw fs::filesystem_error ("unable to create file",
                                    tmp,
                                    std::error_code (errno,
                                                     std::generic_category ()));
    }

    std::uint64_t n (fs::file_size (tmp));
    if (n != f.size_bytes)
    {
      fail (t, download_error (failure_kind::validation,
                               "size mismatch: expected " +
                               std::to_string (f.size_bytes) + " bytes, got " +
                               std::to_string (n)));
      return;
    }

    verification_status vs (verification_status::verified);

    if (!opts_.verify)
      vs = verification_status::disabled;
    else if (!f.checksum)
    {
      info () << f.name << ": no checksum published, verification skipped";
      vs = verification_status::skipped;
    }
    else
    {
      std::string h (traits_type::compute_hash (tmp, f.checksum->algorithm));

      if (h.empty ())
      {
        fail (t, download_error (failure_kind::path,
                                 "unable to compute " +
                                 to_string (f.checksum->algorithm) +
                                 " digest of " + tmp.string ()));
        return;
      }

      if (h != f.checksum->value)
      {
        // The bytes are bad so there is nothing to resume from.
        //
        std::error_code ec;
        fs::remove (tmp, ec);

        fail (t, download_error (failure_kind::checksum,
                                 to_string (f.checksum->algorithm) +
                                 " mismatch: expected " + f.checksum->value +
                                 ", got " + h));
        return;
      }
    }

    t.result.verification = vs;

    // Only now does the file appear at its final path.
    //
    fs::rename (tmp, t.destination);

    t.advance (download_state::completed);
    t.result.outcome = download_outcome::completed;
  }

  template <typename A, typename T>
  void basic_download_worker<A, T>::
  fail (download_task& t, download_error e)
  {
    if (t.state.load () == download_state::pending)
      t.advance (download_state::resolving);

    error () << t.request.file.name << ": " << e;

    t.result.error = std::move (e);
    t.result.outcome = download_outcome::failed;

    if (!terminal (t.state.load ()))
      t.advance (download_state::failed);
  }

  template <typename A, typename T>
  void basic_download_worker<A, T>::
  stop (download_task& t)
  {
    if (t.reason () == cancel_reason::auth)
    {
      fail (t, download_error (failure_kind::auth,
                               "batch aborted after an authentication "
                               "failure"));
      return;
    }

    // Paused is only reachable while transferring. Before that there is
    // nothing to keep.
    //
    if (t.state.load () == download_state::transferring)
    {
      t.advance (download_state::paused);
      t.result.outcome = download_outcome::paused;
    }
    else
      t.result.outcome = download_outcome::cancelled;
  }

  template <typename A, typename T>
  asio::awaitable<void> basic_download_worker<A, T>::
  sleep (download_task& t, std::chrono::milliseconds d)
  {
    using namespace std::chrono;

    const milliseconds slice (100);
    auto end (steady_clock::now () + d);

    asio::steady_timer timer (ioc_);

    for (auto now (steady_clock::now ());
         now < end && !t.should_cancel ();
         now = steady_clock::now ())
    {
      timer.expires_after (std::min<steady_clock::duration> (end - now, slice));
      co_await timer.async_wait (asio::use_awaitable);
    }
  }

  template <typename A, typename T>
  download_error basic_download_worker<A, T>::
  classify (std::exception_ptr ep)
  {
    using k = failure_kind;

    try
    {
      std::rethrow_exception (ep);
    }
    catch (const auth_error& e)              {return {k::auth, e.what (), e.status};}
    catch (const not_found_error& e)         {return {k::not_found, e.what (), e.status};}
    catch (const rate_limit_error& e)        {return {k::rate_limit, e.what (), e.status};}
    catch (const transient_network_error& e) {return {k::transient_network, e.what (), e.status};}
    catch (const validation_error& e)        {return {k::validation, e.what (), e.status};}
    catch (const api_error& e)               {return {k::api, e.what (), e.status};}
    catch (const std::system_error& e)       {return {k::path, e.what ()};}
    catch (const std::exception& e)          {return {k::api, e.what ()};}
  }
}
