#pragma once

#include <string>
#include <memory>
#include <cstddef>
#include <cstdint>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <datamap/http/http-types.hxx>
#include <datamap/http/http-request.hxx>
#include <datamap/http/http-response.hxx>

namespace datamap
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client options/configuration traits.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds.
    //
    std::uint32_t connect_timeout = 30000;

    // Request timeout in milliseconds. For streamed bodies it is re-armed
    // before every read so it bounds stalls, not the whole transfer.
    //
    std::uint32_t request_timeout = 30000;

    // Maximum number of redirects to follow (0 = no redirects).
    //
    std::uint8_t max_redirects = 10;

    bool verify_ssl = true;

    // SSL certificate file path (empty = use system defaults).
    //
    string_type ssl_cert_file;

    bool follow_redirects = true;
  };

  // HTTP client session context.
  //
  // Holds the TLS context shared by all the connections made by a client.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP client.
  //
  // Every operation is a coroutine running on the session's io_context.
  // Transport failures (resolve, connect, TLS, timeout) are reported as
  // boost::system::system_error; HTTP error statuses are not exceptions and
  // are returned to the caller as is.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    // Called once the response head (status and headers) of the final,
    // non-redirect response is available. Return false to skip the body.
    //
    using head_callback = std::function<bool (const response_type&)>;

    // Called for every body chunk. Return false to stop reading.
    //
    using chunk_callback = std::function<bool (const char*, std::size_t)>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform a request buffering the whole response body.
    //
    asio::awaitable<response_type>
    request (const request_type& req);

    // Perform a request streaming the response body to the callbacks in
    // chunks of at most chunk_size bytes. Redirects are followed with the
    // original headers (Range included). Return the response head.
    //
    asio::awaitable<response_type>
    stream (const request_type& req,
            head_callback on_head,
            chunk_callback on_chunk,
            std::size_t chunk_size = 8192);

    session_type&
    session () noexcept
    {
      return *session_;
    }

    const session_type&
    session () const noexcept
    {
      return *session_;
    }

  private:
    asio::awaitable<response_type>
    stream_impl (request_type req,
                 const head_callback& on_head,
                 const chunk_callback& on_chunk,
                 std::size_t chunk_size,
                 std::uint8_t redirect_count);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <datamap/http/http-client.ixx>
#include <datamap/http/http-client.txx>
