#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <cstdint>
#include <utility>
#include <stdexcept>
#include <functional>
#include <filesystem>

#include <datamap/download/download-types.hxx>
#include <datamap/download/download-result.hxx>
#include <datamap/download/download-request.hxx>
#include <datamap/progress/progress-types.hxx>

namespace datamap
{
  namespace fs = std::filesystem;

  // Why a task was asked to stop.
  //
  enum class cancel_reason
  {
    none,
    interrupt, // User interrupt or shutdown: pause, keep the partial file.
    auth       // Batch aborted after an authentication failure.
  };

  // Download task: one unit of work created by the manager and mutated only
  // by the worker that runs it.
  //
  class download_task
  {
  public:
    using progress_callback = std::function<void (const progress_event&)>;

    download_task (std::string id,
                   download_request req,
                   fs::path root,
                   fs::path dest)
      : id (std::move (id)),
        request (std::move (req)),
        root (std::move (root)),
        destination (std::move (dest))
    {
      result.task_id = this->id;
      result.file = request.file;
      result.destination = destination;
    }

    download_task (const download_task&) = delete;
    download_task& operator= (const download_task&) = delete;

    const std::string id;
    const download_request request;

    // Normalized batch root and absolute destination.
    //
    const fs::path root;
    const fs::path destination;

    // Temporary file the bytes are written to. It lives next to the
    // destination so that the final rename stays on one filesystem.
    //
    fs::path
    temp_path () const
    {
      fs::path p (destination);
      p += ".part";
      return p;
    }

    std::atomic<download_state> state {download_state::pending};
    std::atomic<std::uint64_t> bytes_transferred {0};
    std::atomic<std::uint32_t> attempt_count {0};

    download_result result;

    progress_callback on_progress;

    // Move to the next state. Throw std::logic_error if the transition is
    // not allowed by the state machine.
    //
    void
    advance (download_state s)
    {
      download_state f (state.load ());

      if (!valid_transition (f, s))
        throw std::logic_error ("invalid download state transition");

      state.store (s);
      publish ();
    }

    void
    update_progress (std::uint64_t n)
    {
      bytes_transferred.store (n);
      publish ();
    }

    void
    publish () const
    {
      if (on_progress)
      {
        progress_event e;
        e.task_id     = id;
        e.name        = request.file.name;
        e.bytes_done  = bytes_transferred.load ();
        e.total_bytes = request.file.size_bytes;
        e.timestamp   = std::chrono::steady_clock::now ();
        e.state       = state.load ();

        on_progress (e);
      }
    }

    // Control.
    //
    void
    cancel (cancel_reason r)
    {
      cancel_reason e (cancel_reason::none);
      reason_.compare_exchange_strong (e, r);
    }

    bool
    should_cancel () const noexcept
    {
      return reason_.load () != cancel_reason::none;
    }

    cancel_reason
    reason () const noexcept
    {
      return reason_.load ();
    }

  private:
    std::atomic<cancel_reason> reason_ {cancel_reason::none};
  };
}
