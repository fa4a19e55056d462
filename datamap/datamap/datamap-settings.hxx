#pragma once

#include <chrono>
#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <functional>
#include <filesystem>

#include <datamap/api/api-retry.hxx>
#include <datamap/api/api-client.hxx>
#include <datamap/download/download-types.hxx>

namespace datamap
{
  namespace fs = std::filesystem;

  // Invalid or missing configuration value. The message names the key and
  // where it came from but never a credential value.
  //
  class configuration_error: public std::invalid_argument
  {
  public:
    using std::invalid_argument::invalid_argument;
  };

  // Settings as supplied by one source (configuration file, environment, or
  // command line). Everything is optional: unset values fall through to the
  // next source.
  //
  struct settings_layer
  {
    std::string source; // For diagnostics, e.g. "environment".

    std::optional<std::string>   api_key;
    std::optional<std::string>   api_secret;
    std::optional<std::string>   api_base_url;
    std::optional<std::int64_t>  timeout;              // Seconds.
    std::optional<std::int64_t>  retry_attempts;
    std::optional<std::int64_t>  retry_delay_ms;
    std::optional<std::string>   user_id;
    std::optional<std::string>   tenancies;
    std::optional<std::int64_t>  download_concurrency;
    std::optional<std::int64_t>  chunk_size;
    std::optional<std::uint16_t> verbosity;
    std::optional<bool>          resume;
    std::optional<bool>          verify;
  };

  // Resolved settings. Produced once at startup and passed explicitly to
  // whatever needs them.
  //
  struct settings
  {
    std::string                api_key;
    std::string                api_secret;
    std::string                api_base_url;
    std::chrono::seconds       timeout;
    std::uint32_t              retry_attempts;
    std::chrono::milliseconds  retry_delay;
    std::optional<std::string> user_id;
    std::optional<std::string> tenancies;
    std::size_t                download_concurrency;
    std::size_t                chunk_size;
    std::uint16_t              verbosity;
    bool                       resume;
    bool                       verify;

    api_endpoint
    endpoint () const
    {
      return api_endpoint {api_base_url, timeout};
    }

    api_credentials
    credentials () const
    {
      return api_credentials {api_key, api_secret, user_id, tenancies};
    }

    retry_policy
    retry () const
    {
      retry_policy r;
      r.retries = retry_attempts;
      r.base_delay = retry_delay;
      return r;
    }

    download_options
    download () const
    {
      download_options o;
      o.concurrency = download_concurrency;
      o.chunk_size = chunk_size;
      o.resume = resume;
      o.verify = verify;
      return o;
    }
  };

  extern const char* const default_api_base_url;

  // Environment variable lookup. Injectable for testing.
  //
  using env_lookup =
    std::function<std::optional<std::string> (const std::string&)>;

  std::optional<std::string>
  process_env (const std::string& name);

  // Map a log level name (DEBUG, INFO, WARNING, ERROR, CRITICAL; case-
  // insensitive) to verbosity. Return nullopt if not recognized.
  //
  std::optional<std::uint16_t>
  parse_log_level (const std::string&);

  // Default configuration file location: $XDG_CONFIG_HOME/datamap/config.json
  // or ~/.config/datamap/config.json. Return nullopt if neither variable is
  // set.
  //
  std::optional<fs::path>
  default_config_file (const env_lookup&);

  // Load the JSON configuration file. Throw configuration_error if it cannot
  // be read, is not a JSON object, or a value has the wrong type.
  //
  settings_layer
  load_settings_file (const fs::path&);

  // Read the DATAMAP_* environment variables.
  //
  settings_layer
  load_settings_env (const env_lookup&);

  // Merge the layers (command line over environment over file over built-in
  // defaults) and validate the result. Throw configuration_error.
  //
  settings
  resolve_settings (const settings_layer& file,
                    const settings_layer& env,
                    const settings_layer& flags);
}
