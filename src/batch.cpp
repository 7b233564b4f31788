#include <spatch/batch.hpp>

#include <spatch/apply.hpp>
#include <spatch/diff.hpp>
#include <spatch/logging.hpp>

#include "executor.hpp"

#include <optional>
#include <utility>

namespace spatch {

namespace {

// Run fn(i) for every i in [0, count) on the global executor and collect
// the results in index order.
template <typename T, typename Fn>
auto run_indexed(std::size_t count, Fn fn) -> std::vector<Result<T>> {
    auto slots = std::vector<std::optional<Result<T>>>(count);
    if (count > 0) {
        auto taskflow = tf::Taskflow{};
        taskflow.for_each_index(std::size_t{0}, count, std::size_t{1},
                                [&](std::size_t i) { slots[i].emplace(fn(i)); });
        detail::global_executor().run(taskflow).wait();
    }

    auto out = std::vector<Result<T>>{};
    out.reserve(count);
    for (auto& slot : slots) out.push_back(std::move(*slot));
    return out;
}

}  // namespace

auto diff_each(const std::vector<DiffJob>& jobs, const SchemaIndex* schema,
               const Options& options) -> std::vector<Result<Patch>> {
    logger()->debug("diffing {} document pair(s) on {} worker(s)", jobs.size(),
                    detail::global_executor().num_workers());
    return run_indexed<Patch>(jobs.size(), [&](std::size_t i) {
        return compute_diff(jobs[i].old_value, jobs[i].new_value, schema, options);
    });
}

auto apply_each(const std::vector<Value>& documents, const Patch& patch,
                const Options& options) -> std::vector<Result<Value>> {
    logger()->debug("applying {} operation(s) to {} document(s)", patch.size(), documents.size());
    return run_indexed<Value>(documents.size(), [&](std::size_t i) {
        return apply(documents[i], patch, options);
    });
}

}  // namespace spatch
