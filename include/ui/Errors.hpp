#pragma once

#include <stdexcept>

namespace tessera::ui {

// Base of every error raised by a renderer or by dispatch.
struct RenderError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Non-positive width (or a width too small to hold a frame).
struct InvalidConfig : public RenderError { using RenderError::RenderError; };

// Data that is structurally wrong for the requested display kind.
struct InvalidInput : public RenderError { using RenderError::RenderError; };

// Dispatch was asked for a kind nobody registered.
struct UnknownDisplayKind : public RenderError { using RenderError::RenderError; };

} // namespace tessera::ui
