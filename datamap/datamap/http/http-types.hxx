#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

namespace datamap
{
  // HTTP method (verb).
  //
  // Only reads are ever issued.
  //
  enum class http_method
  {
    get
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  // Only the codes the client reacts to are named. Anything else is still
  // representable since the underlying type is the numeric code.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    no_content            = 204,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    request_timeout       = 408,
    range_not_satisfiable = 416,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y) noexcept
  {
    return x.name == y.name && x.value == y.value;
  }

  // HTTP headers collection.
  //
  // Lookups are case-insensitive (RFC 7230) but the original spelling is
  // preserved for the wire.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    basic_http_headers () = default;
    basic_http_headers (fields_type f) : fields (std::move (f)) {}

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Get a header field value. Return nullopt if not found.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const;

    // Remove all fields with the given name.
    //
    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept { return fields.begin (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    bool
    operator== (const http_version& v) const noexcept
    {
      return major == v.major && minor == v.minor;
    }

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  // URL components.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
  };

  // Split scheme://host[:port]/target. Throw std::invalid_argument if the
  // scheme is not http or https or the host is empty.
  //
  url_parts
  parse_url (const std::string&);

  // Parse the Retry-After header value which is either delta-seconds or an
  // HTTP-date (RFC 7231). A date in the past yields zero and anything beyond
  // retry_after_limit (one day) is clamped to it. Return nullopt if the value
  // is malformed.
  //
  const std::chrono::seconds retry_after_limit (86400);

  std::optional<std::chrono::seconds>
  parse_retry_after (const std::string& value,
                     std::chrono::system_clock::time_point now =
                       std::chrono::system_clock::now ());

  // Parse the first-byte position out of a Content-Range header value
  // (`bytes <first>-<last>/<length>`).
  //
  std::optional<std::uint64_t>
  parse_content_range_start (const std::string& value);
}

#include <datamap/http/http-types.ixx>
