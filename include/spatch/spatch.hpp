/// @file spatch.hpp
/// @brief Umbrella header for the spatch library.
///
/// Include this to get the full public API. The parallel batch entry
/// points live in <spatch/batch.hpp> and the spatch_batch library.

#pragma once

#include <spatch/apply.hpp>
#include <spatch/diff.hpp>
#include <spatch/error.hpp>
#include <spatch/json.hpp>
#include <spatch/logging.hpp>
#include <spatch/options.hpp>
#include <spatch/patch.hpp>
#include <spatch/path.hpp>
#include <spatch/resolve.hpp>
#include <spatch/result.hpp>
#include <spatch/schema_index.hpp>
#include <spatch/value.hpp>
