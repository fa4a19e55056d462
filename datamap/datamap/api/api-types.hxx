#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <ostream>

#include <boost/json.hpp>

namespace datamap
{
  namespace json = boost::json;

  // Digest algorithm of a published checksum.
  //
  enum class checksum_algorithm
  {
    md5,
    sha1,
    sha256,
    sha512
  };

  std::string
  to_string (checksum_algorithm);

  // Throw std::invalid_argument if the name is not recognized. The name is
  // case-insensitive and may contain a dash (SHA-256).
  //
  checksum_algorithm
  to_checksum_algorithm (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, checksum_algorithm a)
  {
    return o << to_string (a);
  }

  struct file_checksum
  {
    checksum_algorithm algorithm;
    std::string        value;     // Lower-case hex.
  };

  // Remote file as published in a version's file list.
  //
  struct file_descriptor
  {
    std::string                  id;
    std::string                  name;
    std::uint64_t                size_bytes = 0;
    std::optional<std::string>   extension;
    std::optional<std::string>   format;
    std::optional<file_checksum> checksum;
  };

  struct version
  {
    std::string                  id;
    std::string                  name;
    std::string                  design_state;
    bool                         is_enabled = false;
    std::vector<file_descriptor> files;

    std::uint64_t
    total_size () const noexcept;

    std::size_t
    file_count () const noexcept
    {
      return files.size ();
    }

    const file_descriptor*
    find_file (const std::string& id) const noexcept;
  };

  struct dataset
  {
    std::string            id;
    std::string            name;
    std::string            tenancy;
    std::string            design_state;
    bool                   is_enabled = false;
    std::vector<version>   versions;
    std::optional<version> current_version;

    const version*
    find_version (const std::string& name) const noexcept;
  };

  // Short-lived URL a file can be fetched from. Never reuse it across
  // transfer attempts.
  //
  struct download_url
  {
    std::string url;
    std::optional<std::chrono::system_clock::time_point> expires_at;
  };

  // Address of a file's download URL endpoint.
  //
  struct file_ref
  {
    std::string dataset_id;
    std::string version_name;
    std::string file_id;
  };

  // Identifier validation.
  //
  bool
  valid_uuid (const std::string&);

  // Version names are used verbatim in request paths.
  //
  bool
  valid_version_name (const std::string&);

  // Boost.JSON conversions. Throw validation_error on schema mismatch.
  //
  file_descriptor
  tag_invoke (json::value_to_tag<file_descriptor>, const json::value&);

  version
  tag_invoke (json::value_to_tag<version>, const json::value&);

  dataset
  tag_invoke (json::value_to_tag<dataset>, const json::value&);

  download_url
  tag_invoke (json::value_to_tag<download_url>, const json::value&);
}
