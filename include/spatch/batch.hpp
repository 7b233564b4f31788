/// @file batch.hpp
/// @brief Run independent diffs or applies in parallel.
///
/// Part of the optional spatch_batch library, built when Taskflow is
/// available. Every job is an ordinary synchronous call; results come back
/// in input order, one per input, failures included.

#pragma once

#include <spatch/options.hpp>
#include <spatch/patch.hpp>
#include <spatch/result.hpp>
#include <spatch/schema_index.hpp>
#include <spatch/value.hpp>

#include <vector>

namespace spatch {

/// One document pair to diff.
struct DiffJob {
    Value old_value;
    Value new_value;
};

/// compute_diff for every job.
auto diff_each(const std::vector<DiffJob>& jobs,
               const SchemaIndex* schema = nullptr,
               const Options& options = {}) -> std::vector<Result<Patch>>;

/// apply `patch` to every document.
auto apply_each(const std::vector<Value>& documents, const Patch& patch,
                const Options& options = {}) -> std::vector<Result<Value>>;

}  // namespace spatch
