#pragma once

#include <stdexcept>
#include <string>

namespace scanbridge::domain
{

// Malformed, undersized or foreign frame. Always recoverable: the frame is dropped.
struct FormatError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// A message value that cannot be laid out in its fixed-width field.
struct EncodingError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

}  // namespace scanbridge::domain
