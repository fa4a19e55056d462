#include <datamap/http/http-types.hxx>

#include <ctime>
#include <cctype>
#include <algorithm>
#include <locale>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace datamap
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get: return "GET";
    }
    return "GET";
  }

  string
  to_string (http_status s)
  {
    switch (s)
    {
      case http_status::ok:                    return "OK";
      case http_status::no_content:            return "No Content";
      case http_status::partial_content:       return "Partial Content";
      case http_status::moved_permanently:     return "Moved Permanently";
      case http_status::found:                 return "Found";
      case http_status::see_other:             return "See Other";
      case http_status::temporary_redirect:    return "Temporary Redirect";
      case http_status::permanent_redirect:    return "Permanent Redirect";
      case http_status::bad_request:           return "Bad Request";
      case http_status::unauthorized:          return "Unauthorized";
      case http_status::forbidden:             return "Forbidden";
      case http_status::not_found:             return "Not Found";
      case http_status::request_timeout:       return "Request Timeout";
      case http_status::range_not_satisfiable: return "Range Not Satisfiable";
      case http_status::too_many_requests:     return "Too Many Requests";
      case http_status::internal_server_error: return "Internal Server Error";
      case http_status::bad_gateway:           return "Bad Gateway";
      case http_status::service_unavailable:   return "Service Unavailable";
      case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    return "HTTP " + std::to_string (static_cast<uint16_t> (s));
  }

  string http_version::
  string () const
  {
    ostringstream os;

    os << "HTTP/" << static_cast<unsigned> (major)
       << '.'     << static_cast<unsigned> (minor);

    return os.str ();
  }

  // Note that we only handle the scheme://host[:port]/path form. Download
  // URLs handed out by the service are plain presigned URLs so there is no
  // need for user info or IPv6 literals.
  //
  url_parts
  parse_url (const std::string& url)
  {
    url_parts r;

    size_t p (url.find ("://"));
    if (p == std::string::npos)
      throw invalid_argument ("invalid URL: missing scheme");

    r.scheme = url.substr (0, p);

    if (r.scheme != "http" && r.scheme != "https")
      throw invalid_argument ("invalid URL: unsupported scheme '" +
                              r.scheme + "'");

    size_t b (p + 3);
    size_t e (url.find_first_of ("/?", b));
    if (e == std::string::npos)
      e = url.size ();

    std::string auth (url.substr (b, e - b));
    size_t colon (auth.find (':'));

    if (colon != std::string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
      r.host = auth;

    if (r.port.empty ())
      r.port = r.scheme == "https" ? "443" : "80";

    if (r.host.empty ())
      throw invalid_argument ("invalid URL: missing host");

    if (e < url.size ())
      r.target = url[e] == '?' ? "/" + url.substr (e) : url.substr (e);
    else
      r.target = "/";

    return r;
  }

  optional<chrono::seconds>
  parse_retry_after (const std::string& v, chrono::system_clock::time_point now)
  {
    size_t b (v.find_first_not_of (" \t"));
    if (b == std::string::npos)
      return nullopt;

    size_t e (v.find_last_not_of (" \t"));
    std::string s (v.substr (b, e - b + 1));

    // Delta-seconds.
    //
    if (isdigit (static_cast<unsigned char> (s[0])))
    {
      uint64_t n (0);
      auto r (from_chars (s.data (), s.data () + s.size (), n));

      if (r.ptr != s.data () + s.size ())
        return nullopt;

      if (r.ec == errc::result_out_of_range ||
          n > static_cast<uint64_t> (retry_after_limit.count ()))
        return retry_after_limit;

      if (r.ec != errc ())
        return nullopt;

      return chrono::seconds (static_cast<chrono::seconds::rep> (n));
    }

    // HTTP-date, IMF-fixdate form: Sun, 06 Nov 1994 08:49:37 GMT
    //
    tm t {};
    istringstream is (s);
    is.imbue (locale::classic ());
    is >> get_time (&t, "%a, %d %b %Y %H:%M:%S");

    if (is.fail ())
      return nullopt;

    time_t at (timegm (&t));
    if (at == static_cast<time_t> (-1))
      return nullopt;

    auto d (chrono::duration_cast<chrono::seconds> (
              chrono::system_clock::from_time_t (at) - now));

    if (d.count () <= 0)
      return chrono::seconds (0);

    return min (d, retry_after_limit);
  }

  optional<uint64_t>
  parse_content_range_start (const std::string& v)
  {
    const std::string unit ("bytes");

    size_t p (v.find (unit));
    if (p == std::string::npos)
      return nullopt;

    p = v.find_first_not_of (" \t", p + unit.size ());
    if (p == std::string::npos)
      return nullopt;

    size_t dash (v.find ('-', p));
    if (dash == std::string::npos || dash == p)
      return nullopt;

    uint64_t n (0);
    auto r (from_chars (v.data () + p, v.data () + dash, n));

    if (r.ec != errc () || r.ptr != v.data () + dash)
      return nullopt;

    return n;
  }
}
