// include/fxpoint/fxpoint.hpp — Umbrella header that exposes the fxpoint components.

#pragma once

// Users should generally include only this file.

#include <fxpoint/config.hpp>
#include <fxpoint/core/bigint.hpp>
#include <fxpoint/core/errors.hpp>
#include <fxpoint/format.hpp>
#include <fxpoint/io/format.hpp>
#include <fxpoint/io/parse.hpp>
#include <fxpoint/number.hpp>
#include <fxpoint/util/debug.hpp>
#include <fxpoint/util/random.hpp>
