#include <datamap/api/api-error.hxx>

using namespace std;

namespace datamap
{
  void
  throw_api_status (uint16_t s,
                    const string& what,
                    optional<chrono::seconds> ra)
  {
    switch (s)
    {
    case 400: throw validation_error (what, s);
    case 401:
    case 403: throw auth_error (what, s);
    case 404: throw not_found_error (what, s);
    case 429: throw rate_limit_error (what, ra);
    }

    if (s >= 500)
      throw transient_network_error (what, s);

    throw api_error (what, s);
  }
}
