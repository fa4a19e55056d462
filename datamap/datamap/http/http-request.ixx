#include <datamap/version.hxx>

namespace datamap
{
  // The request line wants origin-form (path and query), not the absolute
  // URI, so strip the scheme and the authority.
  //
  template <typename S>
  inline typename basic_http_request<S>::string_type basic_http_request<S>::
  target () const
  {
    std::size_t pos (0);

    std::size_t scheme_end (url.find ("://"));
    if (scheme_end != string_type::npos)
      pos = scheme_end + 3;

    std::size_t path_start (url.find_first_of ("/?", pos));
    if (path_start == string_type::npos)
      return string_type ("/");

    if (url[path_start] == '?')
      return string_type ("/") + url.substr (path_start);

    return url.substr (path_start);
  }

  template <typename S>
  inline void basic_http_request<S>::
  normalize ()
  {
    // Host is required by HTTP/1.1. Note that we keep the port if it was
    // specified explicitly since the server may be virtual-hosted on it.
    //
    if (!has_header (string_type ("Host")))
    {
      std::size_t p (0);

      if (std::size_t n (url.find ("://")); n != string_type::npos)
        p = n + 3;

      std::size_t n (url.find_first_of ("/?", p));
      if (n == string_type::npos)
        n = url.size ();

      string_type h (url.substr (p, n - p));
      if (!h.empty ())
        set_header (string_type ("Host"), h);
    }

    if (!has_header (string_type ("User-Agent")))
      set_header (string_type ("User-Agent"),
                  string_type ("datamap/") + string_type (DATAMAP_VERSION_STR));
  }
}
