#pragma once

#include <chrono>
#include <string>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace datamap
{
  // Base of all the errors reported by the API client. Carries the HTTP
  // status if the error originated from a response.
  //
  // Note that the message is always composed by us: credential values never
  // make it into what().
  //
  class api_error: public std::runtime_error
  {
  public:
    explicit
    api_error (const std::string& what,
               std::optional<std::uint16_t> s = std::nullopt)
      : std::runtime_error (what), status (s) {}

    std::optional<std::uint16_t> status;
  };

  // 401/403 from the API. Fatal for the whole batch.
  //
  class auth_error: public api_error
  {
  public:
    using api_error::api_error;
  };

  class not_found_error: public api_error
  {
  public:
    using api_error::api_error;
  };

  // 429 that outlived all the retry attempts.
  //
  class rate_limit_error: public api_error
  {
  public:
    explicit
    rate_limit_error (const std::string& what,
                      std::optional<std::chrono::seconds> ra = std::nullopt)
      : api_error (what, 429), retry_after (ra) {}

    std::optional<std::chrono::seconds> retry_after;
  };

  // Connection, DNS, TLS, and timeout failures as well as 5xx responses
  // that outlived all the retry attempts.
  //
  class transient_network_error: public api_error
  {
  public:
    using api_error::api_error;
  };

  // The request was rejected (400) or the response does not match the
  // expected schema.
  //
  class validation_error: public api_error
  {
  public:
    using api_error::api_error;
  };

  // Throw the error corresponding to an API response status.
  //
  [[noreturn]] void
  throw_api_status (std::uint16_t status,
                    const std::string& what,
                    std::optional<std::chrono::seconds> retry_after =
                      std::nullopt);
}
