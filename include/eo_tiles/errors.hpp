// === Errors ==================================================================
//
// Exception types raised by tile map persistence and KML ingestion. Lookups of
// unknown tile identifiers are never errors.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace eo_tiles {

/** @brief A file or stream could not be opened, read, or written. */
class IoError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input did not match the tile map grammar or the mission's KML rule.
 *
 * line() is the 1-based line of the offending tile map entry, or 0 when the
 * failure is not tied to a line (KML documents).
 */
class ParseError final : public std::runtime_error {
  public:
    explicit ParseError(const std::string& message, std::size_t line = 0);

    [[nodiscard]] std::size_t line() const noexcept;

  private:
    std::size_t line_;
};

}  // namespace eo_tiles
