#include <datamap/api/api-retry.hxx>

#include <algorithm>

using namespace std;

namespace datamap
{
  chrono::milliseconds retry_policy::
  ceiling (uint32_t n) const noexcept
  {
    using rep = chrono::milliseconds::rep;

    // Stop doubling once we are past the cap so that we never overflow.
    //
    rep d (base_delay.count ());
    for (uint32_t i (0); i < n && d < max_delay.count (); ++i)
      d *= 2;

    return chrono::milliseconds (min (d, static_cast<rep> (max_delay.count ())));
  }

  chrono::milliseconds retry_policy::
  delay (uint32_t n, mt19937& g) const
  {
    auto d (ceiling (n).count ());

    if (d <= 1)
      return chrono::milliseconds (d);

    uniform_int_distribution<chrono::milliseconds::rep> dist (d / 2, d);
    return chrono::milliseconds (dist (g));
  }
}
