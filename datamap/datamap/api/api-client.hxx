#pragma once

#include <chrono>
#include <random>
#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <datamap/http/http-client.hxx>

#include <datamap/api/api-error.hxx>
#include <datamap/api/api-retry.hxx>
#include <datamap/api/api-types.hxx>

namespace datamap
{
  namespace asio = boost::asio;
  namespace json = boost::json;

  // Service location.
  //
  struct api_endpoint
  {
    std::string          base_url; // Without the trailing slash.
    std::chrono::seconds timeout = std::chrono::seconds (30);
  };

  // Already-resolved credentials. The client never looks them up itself.
  //
  struct api_credentials
  {
    std::string                key;
    std::string                secret;
    std::optional<std::string> user_id;
    std::optional<std::string> tenancy;
  };

  // API client traits.
  //
  // The HTTP transport is a traits parameter so that the client can be
  // exercised against an in-process fake.
  //
  template <typename H = http_client>
  struct api_client_traits
  {
    using http_client_type = H;
    using request_type     = typename http_client_type::request_type;
    using response_type    = typename http_client_type::response_type;
    using head_callback    = typename http_client_type::head_callback;
    using chunk_callback   = typename http_client_type::chunk_callback;
  };

  // Dataset hosting API client.
  //
  // Metadata requests carry the credential headers and are retried
  // according to the retry policy. Download URL fetches are single attempts
  // without credentials: the caller (the download worker) owns the retry
  // loop since it must re-resolve the URL before every attempt.
  //
  template <typename T = api_client_traits<>>
  class basic_api_client
  {
  public:
    using traits_type      = T;
    using http_client_type = typename traits_type::http_client_type;
    using request_type     = typename traits_type::request_type;
    using response_type    = typename traits_type::response_type;
    using head_callback    = typename traits_type::head_callback;
    using chunk_callback   = typename traits_type::chunk_callback;

    // Throw std::invalid_argument if the key or the secret is empty.
    //
    basic_api_client (asio::io_context&,
                      api_endpoint,
                      api_credentials,
                      retry_policy = retry_policy ());

    basic_api_client (const basic_api_client&) = delete;
    basic_api_client& operator= (const basic_api_client&) = delete;

    // GET path (relative to the base URL) with retries and validate the
    // JSON body into entity E (any type with a Boost.JSON conversion).
    //
    template <typename E>
    asio::awaitable<E>
    fetch_metadata (const std::string& path);

    asio::awaitable<json::value>
    fetch_json (const std::string& path);

    asio::awaitable<dataset>
    fetch_dataset (const std::string& dataset_id);

    asio::awaitable<version>
    fetch_version (const std::string& dataset_id,
                   const std::string& version_name);

    // Obtain a fresh download URL. Must be called before every transfer
    // attempt: the result is never cached.
    //
    asio::awaitable<download_url>
    resolve_download_url (const file_ref&);

    // Fetch a resolved download URL streaming the body to on_chunk, starting
    // at offset if specified. Single attempt. Error statuses are mapped as
    // follows: 401/403 (expired URL) and 5xx to transient_network_error,
    // 404 to not_found_error, 416 to validation_error, and 429 to
    // rate_limit_error. Connection failures are transient_network_error.
    //
    asio::awaitable<response_type>
    fetch (const std::string& url,
           std::optional<std::uint64_t> offset,
           head_callback on_head,
           chunk_callback on_chunk,
           std::size_t chunk_size);

    // Return true if the service answers the health endpoint.
    //
    asio::awaitable<bool>
    health_check ();

    const retry_policy&
    retry () const noexcept
    {
      return retry_;
    }

    // Backoff delay after the failed attempt n.
    //
    std::chrono::milliseconds
    backoff (std::uint32_t n)
    {
      return retry_.delay (n, rng_);
    }

    http_client_type&
    http () noexcept
    {
      return http_;
    }

    const api_endpoint&
    endpoint () const noexcept
    {
      return endpoint_;
    }

  private:
    request_type
    make_request (const std::string& path) const;

    asio::awaitable<response_type>
    get (const std::string& path);

    asio::awaitable<void>
    sleep (std::chrono::milliseconds);

  private:
    asio::io_context& ioc_;
    api_endpoint endpoint_;
    api_credentials credentials_;
    retry_policy retry_;
    std::mt19937 rng_;
    http_client_type http_;
  };

  using api_client = basic_api_client<>;
}

#include <datamap/api/api-client.txx>
