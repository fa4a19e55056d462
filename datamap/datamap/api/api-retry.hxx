#pragma once

#include <chrono>
#include <random>
#include <cstdint>

namespace datamap
{
  // Exponential backoff with equal jitter.
  //
  // The delay after the failed attempt n (zero-based) is d/2 + rand(0, d/2)
  // where d = min (max_delay, base_delay * 2^n). Attempts are bounded by
  // max_attempts () = retries + 1.
  //
  struct retry_policy
  {
    std::uint32_t             retries    = 3;
    std::chrono::milliseconds base_delay = std::chrono::milliseconds (1000);
    std::chrono::milliseconds max_delay  = std::chrono::milliseconds (30000);

    std::uint32_t
    max_attempts () const noexcept
    {
      return retries + 1;
    }

    // Ceiling of the delay after the failed attempt n, before jitter.
    //
    std::chrono::milliseconds
    ceiling (std::uint32_t n) const noexcept;

    std::chrono::milliseconds
    delay (std::uint32_t n, std::mt19937& g) const;
  };
}
