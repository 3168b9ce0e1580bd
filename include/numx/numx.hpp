// include/numx/numx.hpp — Umbrella header for the numx library.

#pragma once

#include <numx/core/error.hpp>
#include <numx/core/small_int.hpp>
#include <numx/core/wide_int.hpp>
#include <numx/fp/double_double.hpp>
#include <numx/fp/ieee_float.hpp>
#include <numx/fp/round.hpp>
#include <numx/io/format.hpp>
#include <numx/io/parse.hpp>
#include <numx/util/debug.hpp>
#include <numx/util/random.hpp>
