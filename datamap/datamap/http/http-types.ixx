#include <algorithm>
#include <cctype>

namespace datamap
{
  // basic_http_headers
  //

  template <typename S>
  inline bool
  http_name_equal (const S& x, const S& y)
  {
    if (x.size () != y.size ())
      return false;

    for (std::size_t i (0); i < x.size (); ++i)
    {
      if (std::tolower (static_cast<unsigned char> (x[i])) !=
          std::tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  // Note that we enforce single value semantics here even though HTTP allows
  // repeated fields. None of the headers we send may legally repeat.
  //
  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type n, string_type v)
  {
    remove (n);
    fields.push_back (field_type (std::move (n), std::move (v)));
  }

  template <typename S>
  inline void basic_http_headers<S>::
  add (string_type n, string_type v)
  {
    fields.push_back (field_type (std::move (n), std::move (v)));
  }

  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& n) const
  {
    auto i (std::find_if (fields.begin (), fields.end (),
                          [&n] (const field_type& f)
                          {
                            return http_name_equal (f.name, n);
                          }));

    return i != fields.end () ? std::optional<string_type> (i->value)
                              : std::nullopt;
  }

  template <typename S>
  inline bool basic_http_headers<S>::
  contains (const string_type& n) const
  {
    return get (n).has_value ();
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& n)
  {
    fields.erase (std::remove_if (fields.begin (), fields.end (),
                                  [&n] (const field_type& f)
                                  {
                                    return http_name_equal (f.name, n);
                                  }),
                  fields.end ());
  }
}
