// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "review_directory.h"
#include "utils/error_code.h"
#include <nlohmann/json.hpp>
#include <charconv>

namespace jjstack::host {

using json = nlohmann::json;
using namespace utils;

review_directory_t::review_directory_t(code_host_t &host_, std::uint32_t list_limit_) noexcept
    : host{host_}, list_limit{list_limit_}, log{get_logger("jjstack.host.directory")} {}

outcome::result<model::review_request_index_t> review_directory_t::list_open_by_head() noexcept {
    auto out = host.list_open(list_limit);
    if (!out) {
        return out.assume_error();
    }
    auto requests = parse_listing(out.assume_value());
    if (!requests) {
        LOG_ERROR(log, "cannot parse review requests listing: {}", requests.assume_error().message());
        return requests.assume_error();
    }
    auto &list = requests.assume_value();
    LOG_DEBUG(log, "{} open review request(s)", list.size());
    if (list.size() >= list_limit) {
        LOG_ERROR(log, "{} open review requests, the listing may be incomplete; raise code_host/list_limit",
                  list.size());
        return make_error_code(protocol_error_code_t::truncated_listing);
    }
    return make_index(std::move(list));
}

model::review_request_index_t review_directory_t::make_index(model::review_requests_t requests) noexcept {
    model::review_request_index_t index;
    for (auto &request : requests) {
        auto [prev, inserted] = index.try_emplace(request.head, request);
        if (!inserted) {
            auto &existing = prev->second;
            LOG_WARN(log, "several open review requests (#{}, #{}) for {}, the lowest number is used",
                     existing.number, request.number, request.head);
            if (request.number < existing.number) {
                existing = std::move(request);
            }
        }
    }
    return index;
}

outcome::result<model::request_number_t> review_directory_t::create(std::string_view head, std::string_view base,
                                                                    std::string_view title,
                                                                    std::string_view body) noexcept {
    auto out = host.create(head, base, title, body);
    if (!out) {
        return out.assume_error();
    }
    auto r = parse_created(out.assume_value());
    if (!r) {
        LOG_ERROR(log, "no review request number in '{}'", out.assume_value());
        return r;
    }
    LOG_INFO(log, "review request #{} ({} -> {}) has been created", r.assume_value(), head, base);
    return r;
}

outcome::result<void> review_directory_t::update(model::request_number_t number, std::optional<std::string_view> base,
                                                 std::optional<std::string_view> body) noexcept {
    if (!base && !body) {
        return make_error_code(error_code_t::empty_update);
    }
    auto r = host.edit(number, base, body);
    if (r) {
        if (base) {
            LOG_INFO(log, "review request #{} has been rebased onto {}", number, *base);
        }
        if (body) {
            LOG_DEBUG(log, "review request #{} body has been updated", number);
        }
    }
    return r;
}

outcome::result<std::string> review_directory_t::default_branch() noexcept {
    auto out = host.view_default_branch();
    if (!out) {
        return out.assume_error();
    }
    return parse_default_branch(out.assume_value());
}

outcome::result<model::review_requests_t> review_directory_t::parse_listing(std::string_view output) noexcept {
    auto data = json::parse(output.begin(), output.end(), nullptr, false);
    if (data.is_discarded()) {
        return make_error_code(protocol_error_code_t::malformed_json);
    }
    if (!data.is_array()) {
        return make_error_code(protocol_error_code_t::incorrect_json);
    }

    auto read_string = [](const json &obj, const char *key) -> std::string {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string()) {
            return it->get<std::string>();
        }
        return {};
    };

    model::review_requests_t requests;
    requests.reserve(data.size());
    for (auto &it : data) {
        if (!it.is_object()) {
            return make_error_code(protocol_error_code_t::incorrect_json);
        }
        auto number = it.find("number");
        auto head = it.find("headRefName");
        if (number == it.end() || !number->is_number_integer() || head == it.end() || !head->is_string()) {
            return make_error_code(protocol_error_code_t::incorrect_json);
        }
        auto value = number->get<std::int64_t>();
        if (value <= 0) {
            return make_error_code(protocol_error_code_t::incorrect_json);
        }
        requests.emplace_back(model::review_request_t{static_cast<model::request_number_t>(value),
                                                      head->get<std::string>(), read_string(it, "baseRefName"),
                                                      read_string(it, "body")});
    }
    return requests;
}

outcome::result<model::request_number_t> review_directory_t::parse_created(std::string_view output) noexcept {
    static const constexpr std::string_view whitespace = " \t\r\n";
    auto e = output.find_last_not_of(whitespace);
    if (e == output.npos) {
        return make_error_code(protocol_error_code_t::missing_identifier);
    }
    output = output.substr(0, e + 1);
    auto slash = output.find_last_of('/');
    auto digits = slash == output.npos ? output : output.substr(slash + 1);

    model::request_number_t value = 0;
    auto begin = digits.data();
    auto end = begin + digits.size();
    auto r = std::from_chars(begin, end, value);
    if (digits.empty() || r.ec != std::errc() || r.ptr != end || value == 0) {
        return make_error_code(protocol_error_code_t::missing_identifier);
    }
    return value;
}

outcome::result<std::string> review_directory_t::parse_default_branch(std::string_view output) noexcept {
    auto data = json::parse(output.begin(), output.end(), nullptr, false);
    if (data.is_discarded()) {
        return make_error_code(protocol_error_code_t::malformed_json);
    }
    if (!data.is_object()) {
        return make_error_code(protocol_error_code_t::incorrect_json);
    }
    auto ref = data.find("defaultBranchRef");
    if (ref == data.end() || !ref->is_object()) {
        return make_error_code(protocol_error_code_t::incorrect_json);
    }
    auto name = ref->find("name");
    if (name == ref->end() || !name->is_string() || name->get<std::string>().empty()) {
        return make_error_code(protocol_error_code_t::incorrect_json);
    }
    return name->get<std::string>();
}

} // namespace jjstack::host
