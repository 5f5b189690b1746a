#include "eo_tiles/errors.hpp"

#include <fmt/format.h>

namespace eo_tiles {

namespace {
std::string decorate(const std::string& message, std::size_t line) {
    if (line == 0) {
        return message;
    }
    return fmt::format("line {}: {}", line, message);
}
}  // namespace

ParseError::ParseError(const std::string& message, std::size_t line)
    : std::runtime_error(decorate(message, line)),
      line_(line) {}

std::size_t ParseError::line() const noexcept {
    return line_;
}

}  // namespace eo_tiles
