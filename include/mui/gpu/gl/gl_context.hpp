#pragma once

#include "mui/gpu/gpu_context.hpp"

namespace mui {

/**
 * GL-specific GpuContext factory functions.
 *
 * Usage:
 *   #include <mui/gpu/gl/gl_context.hpp>
 *   auto ctx = GpuContexts::MakeGL();
 */
namespace GpuContexts {

/**
 * Create a GpuContext for the currently active OpenGL context.
 * Host must have created and made current a GL context before calling.
 * Loads GL entry points, queries the driver strings and extension list,
 * then validates them as GpuContext::Make does.
 */
Result<std::shared_ptr<const GpuContext>> MakeGL();

} // namespace GpuContexts

} // namespace mui
