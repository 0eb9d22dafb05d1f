/**
 * @file job_status.cpp
 * @brief Bulk job status parsing
 */

#include <kcenon/upload_orchestrator/client/job_status.h>

#include <nlohmann/json.hpp>

#include <array>
#include <utility>

namespace kcenon::upload_orchestrator {

namespace {

using json = nlohmann::json;

constexpr std::array<std::pair<std::string_view, job_state>, 6> job_state_names = {{
    {"queued", job_state::queued},
    {"processing", job_state::processing},
    {"completed", job_state::completed},
    {"completed_with_errors", job_state::completed_with_errors},
    {"failed", job_state::failed},
    {"cancelled", job_state::cancelled},
}};

auto trim(std::string_view s) -> std::string_view {
    constexpr std::string_view whitespace = " \t\r\n";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

auto invalid(std::string message) -> unexpected {
    return unexpected(error{error_code::invalid_job_status, std::move(message)});
}

auto read_count(const json& doc, const char* field) -> result<std::size_t> {
    auto it = doc.find(field);
    if (it == doc.end() || it->is_null()) {
        return invalid(std::string("missing field: ") + field);
    }
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
        return invalid(std::string("field must be a non-negative integer: ") + field);
    }
    return it->get<std::size_t>();
}

}  // namespace

auto parse_job_state(std::string_view name) -> std::optional<job_state> {
    for (const auto& [wire, state] : job_state_names) {
        if (wire == name) {
            return state;
        }
    }
    return std::nullopt;
}

auto parse_job_error(std::string_view entry) -> job_error_entry {
    auto colon = entry.find(':');
    if (colon == std::string_view::npos) {
        return {std::string(trim(entry)), {}};
    }
    return {std::string(trim(entry.substr(0, colon))),
            std::string(trim(entry.substr(colon + 1)))};
}

auto job_status::failed_files() const -> std::vector<job_error_entry> {
    std::vector<job_error_entry> out;
    out.reserve(errors.size());
    for (const auto& e : errors) {
        out.push_back(parse_job_error(e));
    }
    return out;
}

auto parse_job_status(std::string_view payload) -> result<job_status> {
    json doc = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (doc.is_discarded()) {
        return invalid("malformed job status JSON");
    }
    if (!doc.is_object()) {
        return invalid("job status must be a JSON object");
    }

    job_status status;

    auto state_it = doc.find("status");
    if (state_it == doc.end() || !state_it->is_string()) {
        return invalid("missing field: status");
    }
    auto state = parse_job_state(state_it->get<std::string>());
    if (!state) {
        return invalid("unknown job status: " + state_it->get<std::string>());
    }
    status.status = *state;

    auto success = read_count(doc, "success_count");
    if (!success) {
        return unexpected(success.error());
    }
    status.success_count = success.value();

    auto errors = read_count(doc, "error_count");
    if (!errors) {
        return unexpected(errors.error());
    }
    status.error_count = errors.value();

    if (auto it = doc.find("progress"); it != doc.end() && !it->is_null()) {
        if (!it->is_number()) {
            return invalid("field must be numeric: progress");
        }
        status.progress = it->get<double>();
    }

    if (auto it = doc.find("total"); it != doc.end() && !it->is_null()) {
        auto total = read_count(doc, "total");
        if (!total) {
            return unexpected(total.error());
        }
        status.total = total.value();
    }

    if (auto it = doc.find("current_file"); it != doc.end() && !it->is_null()) {
        if (!it->is_string()) {
            return invalid("field must be a string: current_file");
        }
        status.current_file = it->get<std::string>();
    }

    if (auto it = doc.find("errors"); it != doc.end() && !it->is_null()) {
        if (!it->is_array()) {
            return invalid("field must be an array: errors");
        }
        for (const auto& entry : *it) {
            if (!entry.is_string()) {
                return invalid("error entries must be strings");
            }
            status.errors.push_back(entry.get<std::string>());
        }
    }

    return status;
}

}  // namespace kcenon::upload_orchestrator
