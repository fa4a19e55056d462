#pragma once

#include <string>
#include <utility>
#include <filesystem>

#include <datamap/api/api-types.hxx>

namespace datamap
{
  namespace fs = std::filesystem;

  // Download request represents a single file to fetch.
  //
  struct download_request
  {
    // Where to obtain the download URL from.
    //
    file_ref ref;

    // The file metadata (size, optional checksum).
    //
    file_descriptor file;

    // Target path relative to the batch destination root.
    //
    fs::path target;

    download_request () = default;

    download_request (file_ref r, file_descriptor f, fs::path t)
      : ref (std::move (r)), file (std::move (f)), target (std::move (t)) {}

    bool
    valid () const
    {
      return !file.id.empty () && !target.empty ();
    }
  };
}
