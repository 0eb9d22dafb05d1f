/**
 * @file strategy_selector.cpp
 * @brief Implementation of transfer strategy selection
 */

#include <kcenon/upload_orchestrator/core/strategy_selector.h>

#include <algorithm>

namespace kcenon::upload_orchestrator {

auto transfer_plan::chunked_count() const -> std::size_t {
    return static_cast<std::size_t>(
        std::count(methods.begin(), methods.end(), upload_method::chunked));
}

auto strategy_selector::select_path(std::size_t file_count) const -> transfer_path {
    if (file_count == 0) {
        return transfer_path::none;
    }
    return file_count <= config_.direct_threshold ? transfer_path::direct
                                                  : transfer_path::bulk;
}

auto strategy_selector::select_method(uint64_t file_size) const -> upload_method {
    return file_size >= config_.chunk_threshold ? upload_method::chunked
                                                : upload_method::single;
}

auto strategy_selector::plan(const std::vector<file_ref>& files) const -> transfer_plan {
    transfer_plan result;
    result.path = select_path(files.size());

    // The bulk endpoint accepts whole files; sizes only matter on the direct path
    if (result.path == transfer_path::direct) {
        result.methods.reserve(files.size());
        for (const auto& f : files) {
            result.methods.push_back(select_method(f.size));
        }
    }
    return result;
}

}  // namespace kcenon::upload_orchestrator
