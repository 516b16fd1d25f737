#pragma once

/** \file execerr.hpp
 *  \brief Umbrella header: error kinds, coded errors, sinks and the first-error latch.
 */

#include "execerr/error.hpp"
#include "execerr/coded_error.hpp"
#include "execerr/sink.hpp"
