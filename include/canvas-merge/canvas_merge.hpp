/// @file canvas_merge.hpp
/// @brief Umbrella header: includes the full public API of canvas-merge.

#pragma once

#include <canvas-merge/error.hpp>
#include <canvas-merge/value.hpp>
#include <canvas-merge/document.hpp>
#include <canvas-merge/ulid.hpp>
#include <canvas-merge/pointer.hpp>
#include <canvas-merge/node_index.hpp>
#include <canvas-merge/patch.hpp>
#include <canvas-merge/operations.hpp>
#include <canvas-merge/diff.hpp>
#include <canvas-merge/conflict.hpp>
#include <canvas-merge/resolution.hpp>
#include <canvas-merge/merge.hpp>
#include <canvas-merge/validate.hpp>
#include <canvas-merge/json.hpp>
#include <canvas-merge/logging.hpp>
