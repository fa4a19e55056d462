#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <optional>

#include <datamap/http/http-types.hxx>

namespace datamap
{
  // HTTP request.
  //
  // Requests never carry a body: everything we send is a GET or a HEAD.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method {http_method::get};
    string_type  url;
    http_version version;
    headers_type headers;

    basic_http_request () = default;

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
        : method (m), url (std::move (u)), version (v) {}

    // Get the request target (path and query component of the URL).
    //
    string_type
    target () const;

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    // Request the tail of the resource starting at the specified offset.
    //
    void
    set_range (std::uint64_t offset)
    {
      set_header (string_type ("Range"),
                  string_type ("bytes=") + std::to_string (offset) +
                  string_type ("-"));
    }

    // Fill in Host and User-Agent unless already set.
    //
    void
    normalize ();

    bool
    valid () const noexcept
    {
      return !url.empty ();
    }
  };

  using http_request = basic_http_request<std::string>;
}

#include <datamap/http/http-request.ixx>
