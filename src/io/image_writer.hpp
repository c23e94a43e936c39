#pragma once

#include "core/types.hpp"
#include "render/canvas.hpp"
#include <string>

namespace codevis {

// Encodes the canvas with the codec implied by the file extension.
Result write_image(const Canvas& canvas, const std::string& path);

}
