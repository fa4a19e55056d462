#include <set>
#include <map>
#include <chrono>
#include <utility>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <datamap/diagnostics.hxx>

namespace datamap
{
  template <typename A, typename T>
  basic_download_manager<A, T>::
  basic_download_manager (asio::io_context& ioc,
                          api_type& api,
                          const download_options& opts)
      : ioc_ (ioc), opts_ (opts), worker_ (ioc, api, opts_)
  {
    if (opts_.concurrency == 0)
      throw std::invalid_argument ("download concurrency must be positive");

    if (opts_.chunk_size == 0)
      throw std::invalid_argument ("download chunk size must be positive");

    worker_.on_auth_failure = [this] () {abort ();};
  }

  template <typename A, typename T>
  std::vector<std::shared_ptr<download_task>> basic_download_manager<A, T>::
  make_tasks (std::vector<download_request>& rs, const fs::path& root) const
  {
    std::vector<std::shared_ptr<task_type>> r;
    r.reserve (rs.size ());

    // Normalize every destination first so that a/../b and b collide.
    //
    std::vector<fs::path> ds;
    ds.reserve (rs.size ());

    std::map<fs::path, std::size_t> seen;
    std::set<fs::path> dups;

    for (const download_request& q: rs)
    {
      fs::path d (fs::weakly_canonical (root / q.target));

      if (!seen.emplace (d, ds.size ()).second)
        dups.insert (d);

      ds.push_back (std::move (d));
    }

    if (!dups.empty ())
      throw duplicate_destination_error (
        std::vector<fs::path> (dups.begin (), dups.end ()));

    for (std::size_t i (0); i != rs.size (); ++i)
    {
      std::string id (rs[i].target.generic_string ());

      auto t (std::make_shared<task_type> (std::move (id),
                                           std::move (rs[i]),
                                           root,
                                           std::move (ds[i])));
      t->on_progress = on_progress;
      r.push_back (std::move (t));
    }

    return r;
  }

  template <typename A, typename T>
  asio::awaitable<batch_report> basic_download_manager<A, T>::
  download (std::vector<download_request> rs, const fs::path& root)
  {
    fs::path r (fs::weakly_canonical (fs::absolute (root)));

    tasks_ = make_tasks (rs, r);
    active_ = 0;

    info () << "downloading " << tasks_.size () << " file(s) into "
            << r.string () << " (" << opts_.concurrency << " at a time)";

    std::size_t next (0);

    for (;;)
    {
      if (cancelled_ || aborted_)
      {
        for (; next != tasks_.size (); ++next)
          skip (*tasks_[next]);
      }

      while (next != tasks_.size () && active_ < opts_.concurrency)
      {
        ++active_;

        asio::co_spawn (ioc_,
                        run_task (tasks_[next++]),
                        asio::detached);
      }

      if (active_ == 0 && next == tasks_.size ())
        break;

      asio::steady_timer timer (ioc_, std::chrono::milliseconds (50));
      co_await timer.async_wait (asio::use_awaitable);
    }

    batch_report br;
    br.results.reserve (tasks_.size ());

    for (const std::shared_ptr<task_type>& t: tasks_)
      br.results.push_back (std::move (t->result));

    br.outcome = rollup (br.results);

    // The results are all that is left of the tasks.
    //
    tasks_.clear ();

    co_return br;
  }

  template <typename A, typename T>
  asio::awaitable<void> basic_download_manager<A, T>::
  run_task (std::shared_ptr<task_type> t)
  {
    // A task that got here after the batch was stopped (it was admitted in
    // the same pass) is still given to the worker: it notices the
    // cancellation before doing any I/O.
    //
    if (cancelled_)
      t->cancel (cancel_reason::interrupt);
    else if (aborted_)
      t->cancel (cancel_reason::auth);

    try
    {
      co_await worker_.run (*t);
    }
    catch (const std::exception& e)
    {
      // Only a broken state machine ends up here.
      //
      error () << t->id << ": " << e.what ();

      t->result.error = download_error (failure_kind::api, e.what ());
      t->result.outcome = download_outcome::failed;
    }

    --active_;
  }

  template <typename A, typename T>
  void basic_download_manager<A, T>::
  cancel_all ()
  {
    if (cancelled_.exchange (true))
      return;

    info () << "cancelling downloads";

    for (const std::shared_ptr<task_type>& t: tasks_)
      t->cancel (cancel_reason::interrupt);
  }

  template <typename A, typename T>
  void basic_download_manager<A, T>::
  abort ()
  {
    if (aborted_.exchange (true))
      return;

    error () << "authentication failed, aborting the remaining downloads";

    for (const std::shared_ptr<task_type>& t: tasks_)
      t->cancel (cancel_reason::auth);
  }

  template <typename A, typename T>
  void basic_download_manager<A, T>::
  skip (task_type& t)
  {
    if (aborted_)
    {
      t.advance (download_state::resolving);

      t.result.error = download_error (
        failure_kind::auth,
        "not attempted: batch aborted after an authentication failure");
      t.result.outcome = download_outcome::failed;

      t.advance (download_state::failed);
    }
    else
      t.result.outcome = download_outcome::cancelled;
  }
}
