#pragma once

#include <chrono>
#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <datamap/http/http-types.hxx>

namespace datamap
{
  // HTTP response.
  //
  // For streamed downloads only the head is populated; the body is delivered
  // to the caller chunk by chunk and never buffered here.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_status              status;
    http_version             version;
    string_type              reason;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_response () : status (http_status::ok) {}

    basic_http_response (http_status s, body_type b)
      : status (s), body (std::move (b)) {}

    basic_http_response (http_status s, headers_type h, body_type b)
      : status (s), headers (std::move (h)), body (std::move (b)) {}

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    bool
    is_server_error () const noexcept
    {
      return status_code () >= 500 && status_code () < 600;
    }

    bool
    is_error () const noexcept
    {
      return status_code () >= 400;
    }

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    std::optional<std::uint64_t>
    content_length () const;

    // Server-requested delay from the Retry-After header.
    //
    std::optional<std::chrono::seconds>
    retry_after () const;

    // First byte position from the Content-Range header of a 206.
    //
    std::optional<std::uint64_t>
    content_range_start () const;
  };

  template <typename S, typename B>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_response<S, B>& r) -> decltype (o)
  {
    o << r.version << ' ' << r.status_code ();

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string, std::string>;
}

#include <datamap/http/http-response.ixx>
