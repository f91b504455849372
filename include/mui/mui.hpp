#pragma once

/**
 * @file mui.hpp
 * @brief Umbrella header that includes the entire public mui API.
 */

#include "mui/version.hpp"
#include "mui/types.hpp"
#include "mui/result.hpp"
#include "mui/pixmap.hpp"
#include "mui/image_decoder.hpp"
#include "mui/keyboard.hpp"
#include "mui/event.hpp"
#include "mui/event_pump.hpp"
#include "mui/platform.hpp"
#include "mui/window.hpp"
#include "mui/gpu/gpu_context.hpp"
#include "mui/gpu/gl/gl_context.hpp"
#include "mui/primitive.hpp"
#include "mui/transform.hpp"
#include "mui/drawable.hpp"
#include "mui/program.hpp"
#include "mui/canvas.hpp"
