#pragma once

#include <string>

namespace mediagate {
namespace stream {

// Media type for a file name by extension, empty when unknown.
std::string GuessMimeType(const std::string& filename);

} // namespace stream
} // namespace mediagate
