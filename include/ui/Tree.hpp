#pragma once

#include "model/Data.hpp"
#include "ui/Block.hpp"

namespace tessera::ui {

// Nested mapping as a guided outline:
//   +-- X
//   |   +-- a
//   |   +-- b
//   +-- Y
//       +-- Z: c
// Each level indents 4 columns. Scalar values sit inline after their key.
// The root must be a Node; anything else raises InvalidInput.
Block tree(const model::TreeValue& data);

} // namespace tessera::ui
