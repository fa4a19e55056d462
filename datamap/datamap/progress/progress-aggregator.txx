#include <utility>

namespace datamap
{
  template <typename T>
  basic_progress_aggregator<T>::
  basic_progress_aggregator (asio::io_context& ioc,
                             snapshot_callback sink,
                             std::chrono::milliseconds interval)
      : ioc_ (ioc),
        sink_ (std::move (sink)),
        interval_ (interval),
        trailing_ (ioc)
  {
  }

  template <typename T>
  void basic_progress_aggregator<T>::
  push (const progress_event& e)
  {
    std::lock_guard<std::mutex> l (mutex_);

    if (closed_)
      return;

    queue_.push_back (e);

    if (!posted_)
    {
      posted_ = true;
      asio::post (ioc_, [this] () {drain ();});
    }
  }

  template <typename T>
  void basic_progress_aggregator<T>::
  drain ()
  {
    std::vector<progress_event> q;
    {
      std::lock_guard<std::mutex> l (mutex_);
      q.swap (queue_);
      posted_ = false;

      if (closed_)
        return;
    }

    if (q.empty ())
      return;

    bool term (false);
    for (const progress_event& e: q)
    {
      if (apply (e))
        term = true;
    }

    dirty_ = true;

    auto now (std::chrono::steady_clock::now ());

    if (term || !emitted_once_ || now - last_emit_ >= interval_)
      emit ();
    else
      schedule_trailing ();
  }

  template <typename T>
  bool basic_progress_aggregator<T>::
  apply (const progress_event& e)
  {
    auto i (index_.find (e.task_id));

    if (i == index_.end ())
    {
      i = index_.emplace (e.task_id, tasks_.size ()).first;
      tasks_.push_back (
        task_progress {e.task_id, e.name, 0, 0, download_state::pending});
    }

    task_progress& t (tasks_[i->second]);

    bool term (terminal (e.state) && t.state != e.state);

    t.bytes_done  = e.bytes_done;
    t.total_bytes = e.total_bytes;
    t.state       = e.state;

    return term;
  }

  template <typename T>
  progress_snapshot basic_progress_aggregator<T>::
  snapshot () const
  {
    progress_snapshot s;

    for (const task_progress& t: tasks_)
    {
      s.bytes_done  += t.bytes_done;
      s.total_bytes += t.total_bytes;

      switch (t.state)
      {
      case download_state::pending:                   break;
      case download_state::resolving:
      case download_state::transferring:
      case download_state::verifying:    ++s.active;    break;
      case download_state::completed:    ++s.completed; break;
      case download_state::failed:       ++s.failed;    break;
      case download_state::paused:       ++s.paused;    break;
      }
    }

    s.speed = tracker_.speed ();
    s.timestamp = std::chrono::steady_clock::now ();
    s.tasks = tasks_;

    return s;
  }

  template <typename T>
  void basic_progress_aggregator<T>::
  emit ()
  {
    progress_snapshot s (snapshot ());

    tracker_.update (s.bytes_done, s.timestamp);
    s.speed = tracker_.speed ();

    last_emit_ = s.timestamp;
    emitted_once_ = true;
    dirty_ = false;
    ++emitted_;

    if (sink_)
      sink_ (s);
  }

  template <typename T>
  void basic_progress_aggregator<T>::
  schedule_trailing ()
  {
    if (trailing_armed_)
      return;

    trailing_armed_ = true;
    trailing_.expires_at (last_emit_ + interval_);
    trailing_.async_wait ([this] (const boost::system::error_code& ec)
    {
      trailing_armed_ = false;

      if (ec == asio::error::operation_aborted)
        return;

      if (dirty_ && !closed_)
        emit ();
    });
  }

  template <typename T>
  void basic_progress_aggregator<T>::
  close ()
  {
    std::vector<progress_event> q;
    {
      std::lock_guard<std::mutex> l (mutex_);

      if (closed_)
        return;

      closed_ = true;
      q.swap (queue_);
    }

    for (const progress_event& e: q)
      apply (e);

    trailing_.cancel ();

    if (!tasks_.empty ())
      emit ();
  }
}
