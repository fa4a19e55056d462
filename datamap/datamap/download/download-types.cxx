#include <datamap/download/download-types.hxx>

using namespace std;

namespace datamap
{
  bool
  valid_transition (download_state f, download_state t) noexcept
  {
    using s = download_state;

    switch (f)
    {
    case s::pending:      return t == s::resolving || t == s::completed;
    case s::resolving:    return t == s::transferring || t == s::failed;
    case s::transferring: return t == s::verifying ||
                                 t == s::failed    ||
                                 t == s::paused;
    case s::verifying:    return t == s::completed || t == s::failed;
    case s::completed:
    case s::failed:
    case s::paused:       return false;
    }

    return false;
  }

  ostream&
  operator<< (ostream& os, failure_kind k)
  {
    switch (k)
    {
    case failure_kind::auth:               return os << "authentication error";
    case failure_kind::not_found:          return os << "not found";
    case failure_kind::rate_limit:         return os << "rate limited";
    case failure_kind::transient_network:  return os << "network error";
    case failure_kind::checksum:           return os << "checksum mismatch";
    case failure_kind::insufficient_space: return os << "insufficient space";
    case failure_kind::path:               return os << "path error";
    case failure_kind::validation:         return os << "validation error";
    case failure_kind::api:                return os << "API error";
    }
    return os;
  }

  string duplicate_destination_error::
  describe (const vector<fs::path>& ps)
  {
    string r ("duplicate destination path");

    if (ps.size () > 1)
      r += 's';

    for (size_t i (0); i != ps.size (); ++i)
      r += (i == 0 ? ": " : ", ") + ps[i].string ();

    return r;
  }
}
