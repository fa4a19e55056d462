#include <datamap/api/api-client.hxx>
#include <datamap/api/api-error.hxx>

#include <deque>
#include <chrono>
#include <string>
#include <vector>
#include <cassert>
#include <algorithm>
#include <optional>
#include <exception>
#include <functional>

#include <boost/asio.hpp>
#include <boost/system/system_error.hpp>

#include <datamap/diagnostics.hxx>

using namespace std;
using namespace datamap;

namespace asio = boost::asio;

using chrono::milliseconds;
using chrono::steady_clock;

// In-process HTTP transport replaying scripted responses.
//
struct fake_http
{
  using request_type   = http_request;
  using response_type  = http_response;
  using head_callback  = function<bool (const response_type&)>;
  using chunk_callback = function<bool (const char*, size_t)>;

  // An empty optional means a connection failure.
  //
  deque<optional<response_type>> script;

  vector<request_type> requests;
  vector<steady_clock::time_point> times;

  fake_http (asio::io_context&, const http_client_traits<>&) {}

  response_type
  next (const request_type& r)
  {
    requests.push_back (r);
    times.push_back (steady_clock::now ());

    assert (!script.empty ());

    optional<response_type> x (move (script.front ()));
    script.pop_front ();

    if (!x)
      throw boost::system::system_error (asio::error::connection_refused);

    return move (*x);
  }

  asio::awaitable<response_type>
  request (const request_type& r)
  {
    co_return next (r);
  }

  asio::awaitable<response_type>
  stream (const request_type& r,
          head_callback on_head,
          chunk_callback on_chunk,
          size_t chunk_size)
  {
    response_type x (next (r));

    string b (x.body ? *x.body : string ());
    x.body.reset ();

    if (!on_head (x))
      co_return x;

    for (size_t p (0); p < b.size (); p += chunk_size)
    {
      size_t n (min (chunk_size, b.size () - p));

      if (!on_chunk (b.data () + p, n))
        break;
    }

    co_return x;
  }
};

using client = basic_api_client<api_client_traits<fake_http>>;

static const char* const dataset_id ("0b0e1c2d-3e4f-4a5b-8c6d-7e8f9a0b1c2d");
static const char* const file_id    ("3f2b8c1e-9a4d-4e6f-8b21-0c5d7e9f1a23");

static const char* const secret ("s3cr3t-value");

static http_response
reply (uint16_t s, string body = string (), http_headers h = http_headers ())
{
  return http_response (static_cast<http_status> (s), move (h), move (body));
}

static string
dataset_json ()
{
  return string (R"({"id": ")") + dataset_id +
    R"(", "name": "Traffic", "tenancy": "public", "is_enabled": true})";
}

// Run a coroutine to completion rethrowing its exception, if any.
//
template <typename T>
static T
run (asio::io_context& ioc, asio::awaitable<T> a)
{
  optional<T> r;
  exception_ptr ep;

  asio::co_spawn (ioc,
                  move (a),
                  [&r, &ep] (exception_ptr e, T v)
  {
    ep = e;
    if (!e)
      r = move (v);
  });

  ioc.restart ();
  ioc.run ();

  if (ep)
    rethrow_exception (ep);

  return move (*r);
}

static retry_policy
fast_retry (uint32_t retries = 3)
{
  retry_policy p;
  p.retries = retries;
  p.base_delay = milliseconds (1);
  p.max_delay = milliseconds (4);
  return p;
}

static api_credentials
credentials ()
{
  api_credentials c;
  c.key = "key-123";
  c.secret = secret;
  c.user_id = "42";
  return c;
}

static api_endpoint
endpoint ()
{
  return api_endpoint {"https://api.example.org/v1", chrono::seconds (5)};
}

// Credential headers on every API request and transient failures retried.
//
static void
test_retry_server_errors ()
{
  asio::io_context ioc;
  client c (ioc, endpoint (), credentials (), fast_retry ());

  c.http ().script.push_back (reply (503, "busy"));
  c.http ().script.push_back (nullopt);
  c.http ().script.push_back (reply (200, dataset_json ()));

  dataset d (run (ioc, c.fetch_dataset (dataset_id)));

  assert (d.name == "Traffic");
  assert (c.http ().requests.size () == 3);

  for (const http_request& r: c.http ().requests)
  {
    assert (r.url == string ("https://api.example.org/v1/datasets/") +
                     dataset_id);
    assert (r.get_header ("X-Api-Key") == "key-123");
    assert (r.get_header ("X-Api-Secret") == secret);
    assert (r.get_header ("X-User-Id") == "42");
    assert (!r.has_header ("X-Datamap-Tenancies"));
    assert (r.get_header ("Accept") == "application/json");
    assert (r.has_header ("User-Agent"));
  }
}

static void
test_retry_exhausted ()
{
  asio::io_context ioc;
  client c (ioc, endpoint (), credentials (), fast_retry (2));

  for (int i (0); i != 3; ++i)
    c.http ().script.push_back (reply (502));

  try
  {
    run (ioc, c.fetch_dataset (dataset_id));
    assert (false);
  }
  catch (const transient_network_error& e)
  {
    assert (e.status == 502);
  }

  assert (c.http ().requests.size () == 3);

  // Same for connection failures.
  //
  for (int i (0); i != 3; ++i)
    c.http ().script.push_back (nullopt);

  try
  {
    run (ioc, c.fetch_dataset (dataset_id));
    assert (false);
  }
  catch (const transient_network_error&) {}

  assert (c.http ().requests.size () == 6);
}

// 429 with Retry-After is not retried before the delay elapses.
//
static void
test_rate_limit ()
{
  asio::io_context ioc;
  client c (ioc, endpoint (), credentials (), fast_retry ());

  http_headers h;
  h.set ("Retry-After", "1");

  c.http ().script.push_back (reply (429, "slow down", h));
  c.http ().script.push_back (reply (200, dataset_json ()));

  run (ioc, c.fetch_dataset (dataset_id));

  const auto& t (c.http ().times);
  assert (t.size () == 2);
  assert (t[1] - t[0] >= milliseconds (1000));

  // Out of attempts.
  //
  client z (ioc, endpoint (), credentials (), fast_retry (0));
  z.http ().script.push_back (reply (429, "", h));

  try
  {
    run (ioc, z.fetch_dataset (dataset_id));
    assert (false);
  }
  catch (const rate_limit_error& e)
  {
    assert (e.status == 429);
    assert (e.retry_after == chrono::seconds (1));
  }
}

// 4xx other than 429 are never retried.
//
static void
test_client_errors ()
{
  asio::io_context ioc;

  {
    client c (ioc, endpoint (), credentials (), fast_retry ());
    c.http ().script.push_back (reply (401));

    try
    {
      run (ioc, c.fetch_dataset (dataset_id));
      assert (false);
    }
    catch (const auth_error& e)
    {
      assert (e.status == 401);
    }

    assert (c.http ().requests.size () == 1);
  }

  {
    client c (ioc, endpoint (), credentials (), fast_retry ());
    c.http ().script.push_back (reply (404));

    try
    {
      run (ioc, c.fetch_dataset (dataset_id));
      assert (false);
    }
    catch (const not_found_error& e)
    {
      assert (string (e.what ()).find (dataset_id) != string::npos);
    }

    assert (c.http ().requests.size () == 1);
  }

  {
    client c (ioc, endpoint (), credentials (), fast_retry ());
    c.http ().script.push_back (reply (400, "bad"));

    try
    {
      run (ioc, c.fetch_dataset (dataset_id));
      assert (false);
    }
    catch (const validation_error&) {}

    assert (c.http ().requests.size () == 1);
  }

  // Schema mismatch.
  //
  {
    client c (ioc, endpoint (), credentials (), fast_retry ());
    c.http ().script.push_back (reply (200, R"({"name": "no id"})"));

    try
    {
      run (ioc, c.fetch_dataset (dataset_id));
      assert (false);
    }
    catch (const validation_error&) {}
  }
}

// Bad identifiers never reach the network.
//
static void
test_validation ()
{
  asio::io_context ioc;
  client c (ioc, endpoint (), credentials (), fast_retry ());

  try
  {
    run (ioc, c.resolve_download_url (file_ref {dataset_id, "../x", file_id}));
    assert (false);
  }
  catch (const validation_error&) {}

  try
  {
    run (ioc, c.resolve_download_url (file_ref {dataset_id, "v1", "1"}));
    assert (false);
  }
  catch (const validation_error&) {}

  assert (c.http ().requests.empty ());

  try
  {
    client b (ioc, endpoint (), api_credentials {"key", "", {}, {}});
    assert (false);
  }
  catch (const invalid_argument&) {}
}

// Credential values never leak into error messages.
//
static void
test_redaction ()
{
  asio::io_context ioc;
  client c (ioc, endpoint (), credentials (), fast_retry (0));

  c.http ().script.push_back (
    reply (500, string ("invalid secret ") + secret + " for key-123"));

  try
  {
    run (ioc, c.fetch_dataset (dataset_id));
    assert (false);
  }
  catch (const transient_network_error& e)
  {
    string m (e.what ());
    assert (m.find (secret) == string::npos);
    assert (m.find ("key-123") == string::npos);
    assert (m.find ("***") != string::npos);
  }

  assert (redact (string ("a ") + secret) == "a ***");
}

static void
test_resolve_download_url ()
{
  asio::io_context ioc;
  client c (ioc, endpoint (), credentials (), fast_retry ());

  c.http ().script.push_back (
    reply (200, R"({"url": "https://storage.example.org/f?sig=1"})"));

  download_url u (
    run (ioc, c.resolve_download_url (file_ref {dataset_id, "v1", file_id})));

  assert (u.url == "https://storage.example.org/f?sig=1");
  assert (c.http ().requests[0].url ==
          string ("https://api.example.org/v1/datasets/") + dataset_id +
          "/versions/v1/files/" + file_id);
}

// Storage fetches: no credentials, ranges, and status mapping.
//
static void
test_fetch ()
{
  asio::io_context ioc;
  client c (ioc, endpoint (), credentials (), fast_retry ());

  {
    http_headers h;
    h.set ("Content-Range", "bytes 4-9/10");
    c.http ().script.push_back (reply (206, "456789", h));

    optional<uint64_t> start;
    string got;

    run (ioc,
         c.fetch ("https://storage.example.org/f",
                  4,
                  [&start] (const http_response& r)
                  {
                    start = r.content_range_start ();
                    return true;
                  },
                  [&got] (const char* d, size_t n)
                  {
                    got.append (d, n);
                    return true;
                  },
                  4));

    assert (start == 4u);
    assert (got == "456789");

    const http_request& r (c.http ().requests.back ());
    assert (r.get_header ("Range") == "bytes=4-");
    assert (!r.has_header ("X-Api-Key"));
    assert (!r.has_header ("X-Api-Secret"));
  }

  auto fails_with = [&c, &ioc] (uint16_t s, auto check)
  {
    c.http ().script.push_back (reply (s));

    bool head (false);

    try
    {
      run (ioc,
           c.fetch ("https://storage.example.org/f",
                    nullopt,
                    [&head] (const http_response&) {head = true; return true;},
                    [] (const char*, size_t) {return true;},
                    8192));
      assert (false);
    }
    catch (const api_error& e)
    {
      check (e);
    }

    // Error responses are never handed to the caller's callbacks.
    //
    assert (!head);
  };

  fails_with (403, [] (const api_error& e)
  {
    assert (dynamic_cast<const transient_network_error*> (&e) != nullptr);
  });

  fails_with (404, [] (const api_error& e)
  {
    assert (dynamic_cast<const not_found_error*> (&e) != nullptr);
  });

  fails_with (416, [] (const api_error& e)
  {
    assert (dynamic_cast<const validation_error*> (&e) != nullptr);
  });

  fails_with (429, [] (const api_error& e)
  {
    assert (dynamic_cast<const rate_limit_error*> (&e) != nullptr);
  });

  fails_with (503, [] (const api_error& e)
  {
    assert (dynamic_cast<const transient_network_error*> (&e) != nullptr);
    assert (e.status == 503);
  });

  // Connection failures are transient and never retried here.
  //
  c.http ().script.push_back (nullopt);
  size_t n (c.http ().requests.size ());

  try
  {
    run (ioc,
         c.fetch ("https://storage.example.org/f",
                  nullopt,
                  [] (const http_response&) {return true;},
                  [] (const char*, size_t) {return true;},
                  8192));
    assert (false);
  }
  catch (const transient_network_error&) {}

  assert (c.http ().requests.size () == n + 1);
}

static void
test_health ()
{
  asio::io_context ioc;
  client c (ioc, endpoint (), credentials (), fast_retry (0));

  c.http ().script.push_back (reply (200, "{}"));
  assert (run (ioc, c.health_check ()));

  c.http ().script.push_back (reply (503));
  assert (!run (ioc, c.health_check ()));
}

int
main ()
{
  // Keep the expected warnings out of the test output.
  //
  verb = 0;

  test_retry_server_errors ();
  test_retry_exhausted ();
  test_rate_limit ();
  test_client_errors ();
  test_validation ();
  test_redaction ();
  test_resolve_download_url ();
  test_fetch ();
  test_health ();
}
