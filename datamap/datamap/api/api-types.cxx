#include <datamap/api/api-types.hxx>

#include <ctime>
#include <regex>
#include <cctype>
#include <locale>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <stdexcept>

#include <datamap/api/api-error.hxx>

using namespace std;

namespace datamap
{
  string
  to_string (checksum_algorithm a)
  {
    switch (a)
    {
    case checksum_algorithm::md5:    return "md5";
    case checksum_algorithm::sha1:   return "sha1";
    case checksum_algorithm::sha256: return "sha256";
    case checksum_algorithm::sha512: return "sha512";
    }

    return "sha256";
  }

  checksum_algorithm
  to_checksum_algorithm (const string& s)
  {
    string n;
    for (char c: s)
    {
      if (c != '-' && c != '_')
        n += static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }

    if (n == "md5")    return checksum_algorithm::md5;
    if (n == "sha1")   return checksum_algorithm::sha1;
    if (n == "sha256") return checksum_algorithm::sha256;
    if (n == "sha512") return checksum_algorithm::sha512;

    throw invalid_argument ("unknown checksum algorithm '" + s + "'");
  }

  uint64_t version::
  total_size () const noexcept
  {
    uint64_t r (0);
    for (const file_descriptor& f: files)
      r += f.size_bytes;
    return r;
  }

  const file_descriptor* version::
  find_file (const string& id) const noexcept
  {
    auto i (find_if (files.begin (),
                     files.end (),
                     [&id] (const file_descriptor& f)
    {
      return f.id == id;
    }));

    return i != files.end () ? &*i : nullptr;
  }

  const version* dataset::
  find_version (const string& n) const noexcept
  {
    auto i (find_if (versions.begin (),
                     versions.end (),
                     [&n] (const version& v)
    {
      return v.name == n;
    }));

    return i != versions.end () ? &*i : nullptr;
  }

  bool
  valid_uuid (const string& s)
  {
    static const regex re (
      "^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$",
      regex::icase);

    return regex_match (s, re);
  }

  bool
  valid_version_name (const string& s)
  {
    static const regex re ("^[A-Za-z0-9._-]+$");

    // Dot names would turn into path navigation on the server side.
    //
    return s != "." && s != ".." && regex_match (s, re);
  }

  // Field extraction helpers. Each throws validation_error naming the
  // entity and the field.
  //
  static const json::object&
  as_object (const json::value& v, const char* what)
  {
    if (!v.is_object ())
      throw validation_error (string (what) + " must be a JSON object");

    return v.as_object ();
  }

  static string
  get_string (const json::object& o, const char* what, const char* k)
  {
    const json::value* v (o.if_contains (k));

    if (v == nullptr || !v->is_string ())
      throw validation_error (string (what) + ": missing or invalid '" + k +
                              "'");

    return json::value_to<string> (*v);
  }

  static optional<string>
  get_optional_string (const json::object& o, const char* what, const char* k)
  {
    const json::value* v (o.if_contains (k));

    if (v == nullptr || v->is_null ())
      return nullopt;

    if (!v->is_string ())
      throw validation_error (string (what) + ": invalid '" + k + "'");

    return json::value_to<string> (*v);
  }

  static bool
  get_bool (const json::object& o, const char* what, const char* k)
  {
    const json::value* v (o.if_contains (k));

    if (v == nullptr || v->is_null ())
      return false;

    if (!v->is_bool ())
      throw validation_error (string (what) + ": invalid '" + k + "'");

    return v->get_bool ();
  }

  static string
  get_uuid (const json::object& o, const char* what)
  {
    string r (get_string (o, what, "id"));

    if (!valid_uuid (r))
      throw validation_error (string (what) + ": invalid id '" + r + "'");

    return r;
  }

  static optional<file_checksum>
  make_checksum (const string& a, const string& v, const char* what)
  {
    file_checksum r;

    try
    {
      r.algorithm = to_checksum_algorithm (a);
    }
    catch (const invalid_argument& e)
    {
      throw validation_error (string (what) + ": " + e.what ());
    }

    for (char c: v)
    {
      if (!isxdigit (static_cast<unsigned char> (c)))
        throw validation_error (string (what) + ": checksum is not hex");

      r.value += static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }

    if (r.value.empty ())
      return nullopt;

    return r;
  }

  // The checksum may be published as a {algorithm, value} object, as an
  // "<algorithm>:<value>" string, or as a field named after the algorithm.
  //
  static optional<file_checksum>
  get_checksum (const json::object& o)
  {
    const char* what ("file");

    if (const json::value* v = o.if_contains ("checksum"))
    {
      if (v->is_object ())
      {
        const json::object& c (v->as_object ());
        return make_checksum (get_string (c, what, "algorithm"),
                              get_string (c, what, "value"),
                              what);
      }

      if (v->is_string ())
      {
        string s (json::value_to<string> (*v));
        size_t p (s.find (':'));

        if (p == string::npos)
          throw validation_error ("file: checksum without algorithm");

        return make_checksum (s.substr (0, p), s.substr (p + 1), what);
      }

      if (!v->is_null ())
        throw validation_error ("file: invalid 'checksum'");
    }

    for (const char* a: {"sha512", "sha256", "sha1", "md5"})
    {
      if (optional<string> v = get_optional_string (o, what, a))
        return make_checksum (a, *v, what);
    }

    return nullopt;
  }

  file_descriptor
  tag_invoke (json::value_to_tag<file_descriptor>, const json::value& jv)
  {
    const char* what ("file");
    const json::object& o (as_object (jv, what));

    file_descriptor r;
    r.id   = get_uuid (o, what);
    r.name = get_string (o, what, "name");

    const json::value* s (o.if_contains ("size_bytes"));

    if (s == nullptr)
      throw validation_error ("file: missing 'size_bytes'");

    if (s->is_uint64 ())
      r.size_bytes = s->get_uint64 ();
    else if (s->is_int64 () && s->get_int64 () >= 0)
      r.size_bytes = static_cast<uint64_t> (s->get_int64 ());
    else
      throw validation_error ("file: invalid 'size_bytes'");

    r.extension = get_optional_string (o, what, "extension");
    r.format    = get_optional_string (o, what, "format");
    r.checksum  = get_checksum (o);

    return r;
  }

  version
  tag_invoke (json::value_to_tag<version>, const json::value& jv)
  {
    const char* what ("version");
    const json::object& o (as_object (jv, what));

    version r;
    r.id           = get_uuid (o, what);
    r.name         = get_string (o, what, "name");
    r.design_state = get_optional_string (o, what, "design_state").value_or ("");
    r.is_enabled   = get_bool (o, what, "is_enabled");

    // Depending on the endpoint the file list comes as files or files_in.
    //
    const json::value* fs (o.if_contains ("files"));
    if (fs == nullptr || fs->is_null ())
      fs = o.if_contains ("files_in");

    if (fs != nullptr && !fs->is_null ())
    {
      if (!fs->is_array ())
        throw validation_error ("version: file list must be an array");

      for (const json::value& f: fs->as_array ())
        r.files.push_back (json::value_to<file_descriptor> (f));
    }

    return r;
  }

  dataset
  tag_invoke (json::value_to_tag<dataset>, const json::value& jv)
  {
    const char* what ("dataset");
    const json::object& o (as_object (jv, what));

    dataset r;
    r.id           = get_uuid (o, what);
    r.name         = get_string (o, what, "name");
    r.tenancy      = get_optional_string (o, what, "tenancy").value_or ("");
    r.design_state = get_optional_string (o, what, "design_state").value_or ("");
    r.is_enabled   = get_bool (o, what, "is_enabled");

    if (const json::value* vs = o.if_contains ("versions"))
    {
      if (!vs->is_null ())
      {
        if (!vs->is_array ())
          throw validation_error ("dataset: versions must be an array");

        for (const json::value& v: vs->as_array ())
          r.versions.push_back (json::value_to<version> (v));
      }
    }

    if (const json::value* cv = o.if_contains ("current_version"))
    {
      if (!cv->is_null ())
        r.current_version = json::value_to<version> (*cv);
    }

    return r;
  }

  // Parse an ISO-8601 UTC timestamp (2024-05-01T12:00:00Z). Fractional
  // seconds are ignored.
  //
  static optional<chrono::system_clock::time_point>
  parse_timestamp (const string& s)
  {
    tm t {};
    istringstream is (s);
    is.imbue (locale::classic ());
    is >> get_time (&t, "%Y-%m-%dT%H:%M:%S");

    if (is.fail ())
      return nullopt;

    time_t r (timegm (&t));
    if (r == static_cast<time_t> (-1))
      return nullopt;

    return chrono::system_clock::from_time_t (r);
  }

  download_url
  tag_invoke (json::value_to_tag<download_url>, const json::value& jv)
  {
    const char* what ("download URL");
    const json::object& o (as_object (jv, what));

    download_url r;
    r.url = get_string (o, what, "url");

    if (r.url.compare (0, 7, "http://") != 0 &&
        r.url.compare (0, 8, "https://") != 0)
      throw validation_error ("download URL: invalid URL format");

    if (const json::value* e = o.if_contains ("expires_in"))
    {
      if (e->is_number ())
        r.expires_at = chrono::system_clock::now () +
                       chrono::seconds (
                         static_cast<int64_t> (e->to_number<double> ()));
    }

    if (optional<string> e = get_optional_string (o, what, "expires_at"))
    {
      if (auto t = parse_timestamp (*e))
        r.expires_at = *t;
    }

    return r;
  }
}
