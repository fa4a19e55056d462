#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <sstream>

namespace datamap
{
  // Diagnostics verbosity level.
  //
  // 0 - errors only
  // 1 - plus warnings (default)
  // 2 - plus information (retry attempts, HTTP statuses)
  // 3 - plus tracing
  //
  extern std::uint16_t verb;

  enum class severity
  {
    error,
    warning,
    info,
    trace
  };

  // Register a value that must never be printed (API key, secret). Every
  // diagnostics record passes through redact() before it is written.
  //
  void
  add_secret (std::string);

  void
  clear_secrets ();

  // Replace every occurrence of every registered secret with ***.
  //
  std::string
  redact (std::string);

  // Diagnostics record. Accumulates the message and writes it to stderr as
  // a single line (prefixed with the severity) on destruction. Records are
  // written under a lock so lines from concurrent tasks never interleave.
  //
  class diag_record
  {
  public:
    explicit
    diag_record (severity);

    diag_record (diag_record&&) = default;
    diag_record (const diag_record&) = delete;
    diag_record& operator= (const diag_record&) = delete;

    ~diag_record ();

    template <typename X>
    diag_record&
    operator<< (const X& x)
    {
      if (enabled_)
        os_ << x;

      return *this;
    }

  private:
    severity s_;
    bool enabled_;
    std::ostringstream os_;
  };

  inline diag_record error () {return diag_record (severity::error);}
  inline diag_record warn  () {return diag_record (severity::warning);}
  inline diag_record info  () {return diag_record (severity::info);}
  inline diag_record trace () {return diag_record (severity::trace);}
}
