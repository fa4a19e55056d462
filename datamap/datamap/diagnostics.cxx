#include <datamap/diagnostics.hxx>

#include <mutex>
#include <iostream>

using namespace std;

namespace datamap
{
  uint16_t verb (1);

  static mutex diag_mutex;
  static vector<string> secrets;

  void
  add_secret (string s)
  {
    lock_guard<mutex> l (diag_mutex);

    if (!s.empty ())
      secrets.push_back (move (s));
  }

  void
  clear_secrets ()
  {
    lock_guard<mutex> l (diag_mutex);
    secrets.clear ();
  }

  static string
  redact_locked (string s)
  {
    for (const string& v: secrets)
    {
      for (size_t p (s.find (v)); p != string::npos; p = s.find (v, p + 3))
        s.replace (p, v.size (), "***");
    }

    return s;
  }

  string
  redact (string s)
  {
    lock_guard<mutex> l (diag_mutex);
    return redact_locked (move (s));
  }

  static uint16_t
  level (severity s)
  {
    switch (s)
    {
    case severity::error:   return 0;
    case severity::warning: return 1;
    case severity::info:    return 2;
    case severity::trace:   return 3;
    }

    return 0;
  }

  static const char*
  prefix (severity s)
  {
    switch (s)
    {
    case severity::error:   return "error: ";
    case severity::warning: return "warning: ";
    case severity::info:    return "info: ";
    case severity::trace:   return "trace: ";
    }

    return "";
  }

  diag_record::
  diag_record (severity s)
    : s_ (s), enabled_ (level (s) <= verb)
  {
  }

  diag_record::
  ~diag_record ()
  {
    if (!enabled_)
      return;

    lock_guard<mutex> l (diag_mutex);

    // Note: a record may have been moved from in which case the stream is
    // empty and there is nothing to write.
    //
    string m (os_.str ());
    if (m.empty ())
      return;

    cerr << prefix (s_) << redact_locked (move (m)) << endl;
  }
}
