#pragma once

#include <memory>
#include <vector>
#include <atomic>
#include <cstddef>
#include <filesystem>

#include <boost/asio.hpp>

#include <datamap/download/download-task.hxx>
#include <datamap/download/download-types.hxx>
#include <datamap/download/download-result.hxx>
#include <datamap/download/download-worker.hxx>
#include <datamap/download/download-request.hxx>

namespace datamap
{
  namespace asio = boost::asio;
  namespace fs   = std::filesystem;

  // Download manager (scheduler).
  //
  // Runs a batch of requests with at most concurrency tasks active at any
  // time, admitting the rest in input order as slots free up. The failure
  // of one task never affects its siblings except for authentication
  // errors which abort the whole batch.
  //
  // Must be driven by a single-threaded io_context.
  //
  template <typename A, typename T = download_worker_traits>
  class basic_download_manager
  {
  public:
    using api_type    = A;
    using traits_type = T;
    using worker_type = basic_download_worker<api_type, traits_type>;
    using task_type   = download_task;

    using progress_callback = typename task_type::progress_callback;

    basic_download_manager (asio::io_context&,
                            api_type&,
                            const download_options&);

    basic_download_manager (const basic_download_manager&) = delete;
    basic_download_manager& operator= (const basic_download_manager&) = delete;

    // Sink for the progress events of every task.
    //
    progress_callback on_progress;

    // Download the batch into root returning one result per request, in
    // request order.
    //
    // Throw duplicate_destination_error if two requests resolve to the same
    // destination. Nothing is started in this case.
    //
    asio::awaitable<batch_report>
    download (std::vector<download_request>, const fs::path& root);

    // Stop the batch: active tasks pause (keeping their partial files) and
    // tasks not yet started are reported as cancelled. Safe to call from a
    // signal handler running on the same io_context.
    //
    void
    cancel_all ();

    bool
    cancelled () const noexcept
    {
      return cancelled_.load ();
    }

    bool
    aborted () const noexcept
    {
      return aborted_.load ();
    }

    const download_options&
    options () const noexcept
    {
      return opts_;
    }

  private:
    std::vector<std::shared_ptr<task_type>>
    make_tasks (std::vector<download_request>&, const fs::path& root) const;

    asio::awaitable<void>
    run_task (std::shared_ptr<task_type>);

    // Authentication failure: cancel the active tasks, the rest will be
    // failed without being attempted.
    //
    void
    abort ();

    // Finalize a task that will never be admitted.
    //
    void
    skip (task_type&);

  private:
    asio::io_context& ioc_;
    download_options opts_;
    worker_type worker_;

    std::vector<std::shared_ptr<task_type>> tasks_;
    std::size_t active_ = 0;

    std::atomic<bool> cancelled_ {false};
    std::atomic<bool> aborted_ {false};
  };
}

#include <datamap/download/download-manager.txx>
