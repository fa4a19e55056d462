#include <limits>
#include <vector>
#include <chrono>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace datamap
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
      case http_method::get: return http::verb::get;
    }
    return http::verb::get;
  }

  inline http_status
  from_beast_status (unsigned s)
  {
    return static_cast<http_status> (static_cast<std::uint16_t> (s));
  }

  // Resolve a Location header value against the URL it was received for.
  // Servers are allowed to send an absolute path instead of an absolute URL.
  //
  inline std::string
  resolve_location (const std::string& base, const std::string& loc)
  {
    if (loc.find ("://") != std::string::npos)
      return loc;

    url_parts p (parse_url (base));
    std::string origin (p.scheme + "://" + p.host);

    if (!((p.scheme == "https" && p.port == "443") ||
          (p.scheme == "http"  && p.port == "80")))
      origin += ':' + p.port;

    if (!loc.empty () && loc[0] == '/')
      return origin + loc;

    // Relative to the directory of the current target.
    //
    std::string t (p.target.substr (0, p.target.find ('?')));
    return origin + t.substr (0, t.rfind ('/') + 1) + loc;
  }

  // Streaming request implementation.
  //
  // Unlike a plain read into a string_body, here the body is pulled through
  // a fixed buffer and handed out chunk by chunk so that large files never
  // sit in memory and the caller can stop (cancellation) between any two
  // chunks.
  //
  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  stream_impl (request_type req,
               const head_callback& on_head,
               const chunk_callback& on_chunk,
               std::size_t chunk_size,
               std::uint8_t redirect_count)
  {
    using namespace std::chrono;
    using parser_type = http::response_parser<http::buffer_body>;

    const auto& tr (session_->traits ());

    if (redirect_count > tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded");

    req.normalize ();

    url_parts parts (parse_url (req.url));
    bool ssl (parts.scheme == "https");

    auto& ctx (session_->io_context ());

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (parts.host,
                                             parts.port,
                                             asio::use_awaitable));

    // Common exchange logic for both SSL and TCP streams. If the server
    // sends us elsewhere, the resolved location is left in redirect.
    //
    std::string redirect;

    auto exchange = [&] (auto& s) -> asio::awaitable<response_type>
    {
      auto& layer (beast::get_lowest_layer (s));

      http::request<http::empty_body> br;
      br.method (to_beast_verb (req.method));
      br.target (parts.target);
      br.version (req.version.major * 10 + req.version.minor);

      for (const auto& h : req.headers)
        br.set (h.name, h.value);

      layer.expires_after (milliseconds (tr.request_timeout));
      co_await http::async_write (s, br, asio::use_awaitable);

      beast::flat_buffer b;
      parser_type p;
      p.body_limit (std::numeric_limits<std::uint64_t>::max ());

      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      response_type r;
      {
        const auto& m (p.get ());

        r.status  = from_beast_status (m.result_int ());
        r.version = http_version (m.version () / 10, m.version () % 10);
        r.reason  = string_type (m.reason ());

        for (const auto& h : m)
          r.headers.add (string_type (h.name_string ()),
                         string_type (h.value ()));
      }

      if (tr.follow_redirects && r.is_redirection ())
      {
        if (auto loc = r.location (); loc && !loc->empty ())
        {
          redirect = resolve_location (req.url, *loc);
          co_return r;
        }
      }

      if (!on_head (r) || p.is_done ())
        co_return r;

      std::vector<char> buf (chunk_size);

      while (!p.is_done ())
      {
        // Re-arm the timeout so that it bounds a stall rather than the
        // whole transfer.
        //
        layer.expires_after (milliseconds (tr.request_timeout));

        p.get ().body ().data = buf.data ();
        p.get ().body ().size = buf.size ();

        beast::error_code ec;
        co_await http::async_read_some (
          s, b, p, asio::redirect_error (asio::use_awaitable, ec));

        // need_buffer only means our chunk buffer is full.
        //
        if (ec == http::error::need_buffer)
          ec = {};

        if (ec)
          throw beast::system_error (ec);

        std::size_t n (buf.size () - p.get ().body ().size);

        if (n != 0 && !on_chunk (buf.data (), n))
          break;
      }

      co_return r;
    };

    response_type r;

    if (ssl)
    {
      using stream_type = beast::ssl_stream<beast::tcp_stream>;
      stream_type s (ctx, session_->ssl_context ());

      // Set the SNI hostname, otherwise many servers (and most CDNs) will
      // reject the handshake or present the wrong certificate.
      //
      if (!SSL_set_tlsext_host_name (s.native_handle (), parts.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw beast::system_error (ec, "unable to set SNI hostname");
      }

      auto& layer (beast::get_lowest_layer (s));
      layer.expires_after (milliseconds (tr.connect_timeout));

      co_await layer.async_connect (addrs, asio::use_awaitable);
      co_await s.async_handshake (ssl::stream_base::client,
                                  asio::use_awaitable);

      r = co_await exchange (s);

      // Many servers don't send close_notify so don't wait for the TLS
      // shutdown, just close the socket. Errors are of no interest here.
      //
      beast::error_code ec;
      layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }
    else
    {
      beast::tcp_stream s (ctx);
      s.expires_after (milliseconds (tr.connect_timeout));
      co_await s.async_connect (addrs, asio::use_awaitable);

      r = co_await exchange (s);

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }

    // Follow the redirect with the same method and headers except for Host
    // which must match the new location.
    //
    if (!redirect.empty ())
    {
      request_type next (req.method, redirect, req.version);
      next.headers = req.headers;
      next.headers.remove (string_type ("Host"));

      co_return co_await stream_impl (std::move (next),
                                      on_head,
                                      on_chunk,
                                      chunk_size,
                                      redirect_count + 1);
    }

    co_return r;
  }
}
