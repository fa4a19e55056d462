#include <sstream>
#include <utility>
#include <algorithm>
#include <stdexcept>

#include <boost/system/system_error.hpp>

#include <datamap/diagnostics.hxx>

namespace datamap
{
  inline http_client_traits<>
  make_http_traits (const api_endpoint& e)
  {
    http_client_traits<> r;

    auto ms (std::chrono::duration_cast<std::chrono::milliseconds> (
               e.timeout).count ());

    r.connect_timeout = static_cast<std::uint32_t> (ms);
    r.request_timeout = static_cast<std::uint32_t> (ms);
    return r;
  }

  // Describe an error response. If there is a body, append it but cap the
  // length to avoid flooding the message with things like HTML error pages.
  //
  template <typename R>
  std::string
  describe_response (const R& r)
  {
    std::ostringstream o;
    o << "HTTP " << r.status_code ();

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    if (r.body && !r.body->empty ())
    {
      const std::string& b (*r.body);
      const std::size_t m (200);

      if (b.size () <= m)
        o << ": " << b;
      else
        o << ": " << b.substr (0, m) << "...";
    }

    return redact (o.str ());
  }

  template <typename T>
  basic_api_client<T>::
  basic_api_client (asio::io_context& ioc,
                    api_endpoint e,
                    api_credentials c,
                    retry_policy r)
    : ioc_ (ioc),
      endpoint_ (std::move (e)),
      credentials_ (std::move (c)),
      retry_ (r),
      rng_ (std::random_device () ()),
      http_ (ioc, make_http_traits (endpoint_))
  {
    if (credentials_.key.empty () || credentials_.secret.empty ())
      throw std::invalid_argument ("API key and secret are required");

    add_secret (credentials_.key);
    add_secret (credentials_.secret);
  }

  template <typename T>
  typename basic_api_client<T>::request_type basic_api_client<T>::
  make_request (const std::string& path) const
  {
    request_type r (http_method::get, endpoint_.base_url + path);

    r.set_header ("X-Api-Key", credentials_.key);
    r.set_header ("X-Api-Secret", credentials_.secret);

    if (credentials_.user_id)
      r.set_header ("X-User-Id", *credentials_.user_id);

    if (credentials_.tenancy)
      r.set_header ("X-Datamap-Tenancies", *credentials_.tenancy);

    r.set_header ("Accept", "application/json");
    r.normalize ();
    return r;
  }

  template <typename T>
  asio::awaitable<void> basic_api_client<T>::
  sleep (std::chrono::milliseconds d)
  {
    asio::steady_timer t (ioc_, d);
    co_await t.async_wait (asio::use_awaitable);
  }

  // GET with the retry policy applied.
  //
  // Connection failures, 5xx, and 429 are retried. On 429 we wait for the
  // longer of the server-requested delay and our own backoff. Everything
  // else is mapped to an error right away.
  //
  template <typename T>
  asio::awaitable<typename basic_api_client<T>::response_type>
  basic_api_client<T>::
  get (const std::string& path)
  {
    using std::chrono::milliseconds;

    const std::uint32_t n (retry_.max_attempts ());

    for (std::uint32_t a (0);; ++a)
    {
      bool last (a + 1 >= n);
      milliseconds wait (0);

      try
      {
        response_type r (co_await http_.request (make_request (path)));

        if (r.is_success ())
          co_return r;

        std::uint16_t s (r.status_code ());
        std::string m (describe_response (r));

        info () << "GET " << path << ": attempt " << a + 1 << '/' << n
                << ": " << m;

        if (s == 429)
        {
          auto ra (r.retry_after ());

          if (last)
            throw rate_limit_error ("rate limit exceeded (" + m + ")", ra);

          wait = backoff (a);

          if (ra)
            wait = std::max (wait, milliseconds (*ra));
        }
        else if (s >= 500)
        {
          if (last)
            throw transient_network_error ("server error (" + m + ")", s);

          wait = backoff (a);
        }
        else
          throw_api_status (s, m, r.retry_after ());
      }
      catch (const boost::system::system_error& e)
      {
        std::string m (redact (e.what ()));

        info () << "GET " << path << ": attempt " << a + 1 << '/' << n
                << ": " << m;

        if (last)
          throw transient_network_error ("unable to reach " +
                                         endpoint_.base_url + ": " + m);

        wait = backoff (a);
      }

      trace () << "retrying GET " << path << " in " << wait.count () << "ms";
      co_await sleep (wait);
    }
  }

  template <typename T>
  asio::awaitable<json::value> basic_api_client<T>::
  fetch_json (const std::string& path)
  {
    response_type r (co_await get (path));

    if (!r.body)
      throw validation_error ("empty response body for " + path);

    boost::system::error_code ec;
    json::value v (json::parse (*r.body, ec));

    if (ec)
      throw validation_error ("invalid JSON in response for " + path + ": " +
                              ec.message ());

    co_return v;
  }

  template <typename T>
  template <typename E>
  asio::awaitable<E> basic_api_client<T>::
  fetch_metadata (const std::string& path)
  {
    json::value v (co_await fetch_json (path));

    // Our conversions throw validation_error themselves but Boost.JSON may
    // also complain about the types (e.g., a number that does not fit).
    //
    try
    {
      co_return json::value_to<E> (v);
    }
    catch (const api_error&)
    {
      throw;
    }
    catch (const std::exception& e)
    {
      throw validation_error ("unexpected response for " + path + ": " +
                              e.what ());
    }
  }

  template <typename T>
  asio::awaitable<dataset> basic_api_client<T>::
  fetch_dataset (const std::string& id)
  {
    if (!valid_uuid (id))
      throw validation_error ("invalid dataset id '" + id + "'");

    try
    {
      co_return co_await fetch_metadata<dataset> ("/datasets/" + id);
    }
    catch (const not_found_error&)
    {
      throw not_found_error ("dataset with ID '" + id + "' not found", 404);
    }
  }

  template <typename T>
  asio::awaitable<version> basic_api_client<T>::
  fetch_version (const std::string& id, const std::string& name)
  {
    if (!valid_uuid (id))
      throw validation_error ("invalid dataset id '" + id + "'");

    if (!valid_version_name (name))
      throw validation_error ("invalid version name '" + name + "'");

    std::string p ("/datasets/" + id + "/versions/" + name);
    std::optional<json::value> v;

    try
    {
      v = co_await fetch_json (p);
    }
    catch (const not_found_error&)
    {
      throw not_found_error ("version with ID '" + id + '/' + name +
                             "' not found", 404);
    }

    // The version comes wrapped as {"version": {...}}.
    //
    const json::object* o (v->if_object ());
    const json::value* jv (o != nullptr ? o->if_contains ("version") : nullptr);

    if (jv == nullptr)
      throw validation_error ("response does not contain version data");

    try
    {
      co_return json::value_to<version> (*jv);
    }
    catch (const api_error&)
    {
      throw;
    }
    catch (const std::exception& e)
    {
      throw validation_error ("unexpected response for " + p + ": " +
                              e.what ());
    }
  }

  template <typename T>
  asio::awaitable<download_url> basic_api_client<T>::
  resolve_download_url (const file_ref& f)
  {
    if (!valid_uuid (f.dataset_id))
      throw validation_error ("invalid dataset id '" + f.dataset_id + "'");

    if (!valid_version_name (f.version_name))
      throw validation_error ("invalid version name '" + f.version_name + "'");

    if (!valid_uuid (f.file_id))
      throw validation_error ("invalid file id '" + f.file_id + "'");

    try
    {
      co_return co_await fetch_metadata<download_url> (
        "/datasets/" + f.dataset_id +
        "/versions/" + f.version_name +
        "/files/" + f.file_id);
    }
    catch (const not_found_error&)
    {
      throw not_found_error ("file with ID '" + f.dataset_id + '/' +
                             f.version_name + '/' + f.file_id +
                             "' not found", 404);
    }
  }

  template <typename T>
  asio::awaitable<typename basic_api_client<T>::response_type>
  basic_api_client<T>::
  fetch (const std::string& url,
         std::optional<std::uint64_t> offset,
         head_callback on_head,
         chunk_callback on_chunk,
         std::size_t chunk_size)
  {
    // Note: no credential headers here, the URL usually points at third
    // party storage and is self-authorizing.
    //
    request_type rq (http_method::get, url);

    if (offset)
      rq.set_range (*offset);

    rq.normalize ();

    std::optional<response_type> failed;
    response_type r;

    try
    {
      r = co_await http_.stream (
        rq,
        [&failed, &on_head] (const response_type& h)
        {
          if (h.is_error ())
          {
            failed = h;
            return false;
          }

          return on_head (h);
        },
        on_chunk,
        chunk_size);
    }
    catch (const boost::system::system_error& e)
    {
      throw transient_network_error ("transfer failed: " +
                                     redact (e.what ()));
    }
    catch (const std::invalid_argument& e)
    {
      throw validation_error ("invalid download URL: " +
                              std::string (e.what ()));
    }

    if (failed)
    {
      std::uint16_t s (failed->status_code ());
      std::string m (describe_response (*failed));

      switch (s)
      {
      case 401:
      case 403:
        throw transient_network_error ("download URL rejected (" + m + ")", s);
      case 404:
        throw not_found_error ("download URL not found (" + m + ")", s);
      case 416:
        throw validation_error ("range not satisfiable (" + m + ")", s);
      case 429:
        throw rate_limit_error ("rate limit exceeded (" + m + ")",
                                failed->retry_after ());
      }

      if (s >= 500)
        throw transient_network_error ("storage error (" + m + ")", s);

      throw api_error ("download failed (" + m + ")", s);
    }

    co_return r;
  }

  template <typename T>
  asio::awaitable<bool> basic_api_client<T>::
  health_check ()
  {
    try
    {
      co_await get ("/health");
      co_return true;
    }
    catch (const std::exception& e)
    {
      warn () << "API health check failed: " << e.what ();
    }

    co_return false;
  }
}
