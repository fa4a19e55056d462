#include <datamap/datamap-settings.hxx>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <iterator>

#include <boost/json.hpp>

using namespace std;

namespace datamap
{
  namespace json = boost::json;

  const char* const default_api_base_url ("https://datamap.pcs.usp.br/api/v1");

  optional<string>
  process_env (const string& n)
  {
    if (const char* v = getenv (n.c_str ()))
      return string (v);

    return nullopt;
  }

  static string
  trim (string s)
  {
    size_t b (0), e (s.size ());

    while (b != e && isspace (static_cast<unsigned char> (s[b])))
      ++b;

    while (e != b && isspace (static_cast<unsigned char> (s[e - 1])))
      --e;

    return s.substr (b, e - b);
  }

  optional<uint16_t>
  parse_log_level (const string& s)
  {
    string l;
    for (char c: trim (s))
      l += static_cast<char> (toupper (static_cast<unsigned char> (c)));

    if (l == "DEBUG")                       return 3;
    if (l == "INFO")                        return 2;
    if (l == "WARNING" || l == "WARN")      return 1;
    if (l == "ERROR"   || l == "CRITICAL")  return 0;

    return nullopt;
  }

  optional<fs::path>
  default_config_file (const env_lookup& env)
  {
    if (optional<string> x = env ("XDG_CONFIG_HOME"); x && !x->empty ())
      return fs::path (*x) / "datamap" / "config.json";

    if (optional<string> h = env ("HOME"); h && !h->empty ())
      return fs::path (*h) / ".config" / "datamap" / "config.json";

    return nullopt;
  }

  // Configuration file.
  //
  static string
  file_string (const json::object& o,
               const char* k,
               const fs::path& f)
  {
    const json::value& v (o.at (k));

    if (!v.is_string ())
      throw configuration_error ("'" + string (k) + "' in " + f.string () +
                                 " must be a string");

    return string (v.get_string ());
  }

  static int64_t
  file_integer (const json::object& o,
                const char* k,
                const fs::path& f)
  {
    const json::value& v (o.at (k));

    if (v.is_int64 ())
      return v.get_int64 ();

    if (v.is_uint64 () && v.get_uint64 () <= INT64_MAX)
      return static_cast<int64_t> (v.get_uint64 ());

    throw configuration_error ("'" + string (k) + "' in " + f.string () +
                               " must be an integer");
  }

  settings_layer
  load_settings_file (const fs::path& f)
  {
    ifstream ifs (f);

    if (!ifs.is_open ())
      throw configuration_error ("unable to open configuration file " +
                                 f.string ());

    string s ((istreambuf_iterator<char> (ifs)), istreambuf_iterator<char> ());

    if (ifs.bad ())
      throw configuration_error ("unable to read configuration file " +
                                 f.string ());

    json::error_code ec;
    json::value jv (json::parse (s, ec));

    if (ec)
      throw configuration_error ("invalid JSON in " + f.string () + ": " +
                                 ec.message ());

    if (!jv.is_object ())
      throw configuration_error (f.string () + " must contain a JSON object");

    const json::object& o (jv.get_object ());

    settings_layer r;
    r.source = f.string ();

    auto str = [&o, &f] (const char* k, optional<string>& m)
    {
      if (o.contains (k))
        m = file_string (o, k, f);
    };

    auto num = [&o, &f] (const char* k, optional<int64_t>& m)
    {
      if (o.contains (k))
        m = file_integer (o, k, f);
    };

    str ("api_key",              r.api_key);
    str ("api_secret",           r.api_secret);
    str ("api_base_url",         r.api_base_url);
    num ("timeout",              r.timeout);
    num ("retry_attempts",       r.retry_attempts);
    num ("retry_delay_ms",       r.retry_delay_ms);
    str ("user_id",              r.user_id);
    str ("tenancies",            r.tenancies);
    num ("download_concurrency", r.download_concurrency);
    num ("chunk_size",           r.chunk_size);

    if (o.contains ("log_level"))
    {
      string l (file_string (o, "log_level", f));

      if (!(r.verbosity = parse_log_level (l)))
        throw configuration_error ("invalid 'log_level' in " + f.string () +
                                   ": " + l);
    }

    return r;
  }

  // Environment.
  //
  settings_layer
  load_settings_env (const env_lookup& env)
  {
    settings_layer r;
    r.source = "environment";

    auto str = [&env] (const char* n, optional<string>& m)
    {
      if (optional<string> v = env (string ("DATAMAP_") + n))
        m = move (v);
    };

    auto num = [&env] (const char* n, optional<int64_t>& m)
    {
      string k (string ("DATAMAP_") + n);

      if (optional<string> v = env (k))
      {
        string s (trim (*v));

        size_t p (0);
        try
        {
          m = stoll (s, &p);
        }
        catch (const std::exception&)
        {
          p = 0;
        }

        if (s.empty () || p != s.size ())
          throw configuration_error (k + " must be an integer");
      }
    };

    str ("API_KEY",              r.api_key);
    str ("API_SECRET",           r.api_secret);
    str ("API_BASE_URL",         r.api_base_url);
    num ("TIMEOUT",              r.timeout);
    num ("RETRY_ATTEMPTS",       r.retry_attempts);
    num ("RETRY_DELAY_MS",       r.retry_delay_ms);
    str ("USER_ID",              r.user_id);
    str ("TENANCIES",            r.tenancies);
    num ("DOWNLOAD_CONCURRENCY", r.download_concurrency);
    num ("CHUNK_SIZE",           r.chunk_size);

    if (optional<string> l = env ("DATAMAP_LOG_LEVEL"))
    {
      if (!(r.verbosity = parse_log_level (*l)))
        throw configuration_error ("invalid DATAMAP_LOG_LEVEL: " + *l);
    }

    return r;
  }

  // Resolution.
  //
  namespace
  {
    // Highest-precedence value of a member and where it came from.
    //
    template <typename V>
    struct picked
    {
      optional<V> value;
      string      source = "default";
    };

    template <typename V>
    picked<V>
    pick (optional<V> settings_layer::*m,
          const settings_layer& file,
          const settings_layer& env,
          const settings_layer& flags)
    {
      for (const settings_layer* l: {&flags, &env, &file})
      {
        if (l->*m)
          return picked<V> {l->*m, l->source};
      }

      return picked<V> {};
    }

    int64_t
    ranged (const picked<int64_t>& p,
            const char* key,
            int64_t def,
            int64_t lo,
            int64_t hi)
    {
      if (!p.value)
        return def;

      if (*p.value < lo || *p.value > hi)
        throw configuration_error (string (key) + " from " + p.source +
                                   " must be between " + to_string (lo) +
                                   " and " + to_string (hi) + ", got " +
                                   to_string (*p.value));

      return *p.value;
    }

    string
    credential (const picked<string>& p, const char* key, const char* env)
    {
      string r (p.value ? trim (*p.value) : string ());

      // Note: never mention the value, not even a rejected one.
      //
      if (r.empty ())
        throw configuration_error (string (key) + " is required (set " + env +
                                   " or '" + key +
                                   "' in the configuration file)");

      return r;
    }

    optional<string>
    optional_string (const picked<string>& p)
    {
      if (!p.value)
        return nullopt;

      string r (trim (*p.value));
      return r.empty () ? nullopt : optional<string> (move (r));
    }
  }

  settings
  resolve_settings (const settings_layer& file,
                    const settings_layer& env,
                    const settings_layer& flags)
  {
    auto p = [&] (auto m) {return pick (m, file, env, flags);};

    settings r;

    r.api_key    = credential (p (&settings_layer::api_key),
                               "api_key", "DATAMAP_API_KEY");
    r.api_secret = credential (p (&settings_layer::api_secret),
                               "api_secret", "DATAMAP_API_SECRET");

    {
      picked<string> u (p (&settings_layer::api_base_url));
      string s (u.value ? trim (*u.value) : string (default_api_base_url));

      if (s.compare (0, 7, "http://") != 0 && s.compare (0, 8, "https://") != 0)
        throw configuration_error ("api_base_url from " + u.source +
                                   " must start with http:// or https://");

      while (!s.empty () && s.back () == '/')
        s.pop_back ();

      r.api_base_url = move (s);
    }

    r.timeout = chrono::seconds (
      ranged (p (&settings_layer::timeout), "timeout", 30, 1, 300));

    r.retry_attempts = static_cast<uint32_t> (
      ranged (p (&settings_layer::retry_attempts), "retry_attempts", 3, 0, 10));

    r.retry_delay = chrono::milliseconds (
      ranged (p (&settings_layer::retry_delay_ms),
              "retry_delay_ms", 1000, 1, 60000));

    r.user_id   = optional_string (p (&settings_layer::user_id));
    r.tenancies = optional_string (p (&settings_layer::tenancies));

    r.download_concurrency = static_cast<size_t> (
      ranged (p (&settings_layer::download_concurrency),
              "download_concurrency", 3, 1, 10));

    r.chunk_size = static_cast<size_t> (
      ranged (p (&settings_layer::chunk_size),
              "chunk_size", 8192, 1024, 1048576));

    r.verbosity = p (&settings_layer::verbosity).value.value_or (1);
    r.resume    = p (&settings_layer::resume).value.value_or (false);
    r.verify    = p (&settings_layer::verify).value.value_or (true);

    return r;
  }
}
