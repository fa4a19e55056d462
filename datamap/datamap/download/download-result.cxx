#include <datamap/download/download-result.hxx>

using namespace std;

namespace datamap
{
  size_t batch_report::
  count (download_outcome o) const noexcept
  {
    size_t r (0);
    for (const download_result& x: results)
    {
      if (x.outcome == o)
        ++r;
    }
    return r;
  }

  batch_outcome
  rollup (const vector<download_result>& rs) noexcept
  {
    size_t n (0);
    for (const download_result& r: rs)
    {
      if (r.completed ())
        ++n;
    }

    if (n == rs.size ())
      return batch_outcome::all_succeeded;

    return n == 0 ? batch_outcome::all_failed : batch_outcome::partial_failure;
  }
}
