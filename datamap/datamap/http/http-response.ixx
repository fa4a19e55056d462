#include <charconv>

namespace datamap
{
  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_length () const
  {
    auto v (get_header (string_type ("Content-Length")));

    if (!v)
      return std::nullopt;

    std::uint64_t n (0);
    auto r (std::from_chars (v->data (), v->data () + v->size (), n));

    if (r.ec == std::errc () && r.ptr == v->data () + v->size ())
      return n;

    return std::nullopt;
  }

  template <typename S, typename B>
  inline std::optional<std::chrono::seconds> basic_http_response<S, B>::
  retry_after () const
  {
    auto v (get_header (string_type ("Retry-After")));
    return v ? parse_retry_after (*v) : std::nullopt;
  }

  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_range_start () const
  {
    auto v (get_header (string_type ("Content-Range")));
    return v ? parse_content_range_start (*v) : std::nullopt;
  }
}
