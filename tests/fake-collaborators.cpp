// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "fake-collaborators.h"
#include <algorithm>
#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace jjstack::test {

using json = nlohmann::json;

static std::size_t count_calls(const calls_t &calls, std::string_view method) noexcept {
    return std::count_if(calls.begin(), calls.end(), [&](const std::string &call) {
        auto name = std::string_view(call).substr(0, call.find(' '));
        return name == method;
    });
}

fake_vcs_t::fake_vcs_t(model::names_t stack_) : stack{std::move(stack_)} {}

outcome::result<void> fake_vcs_t::push(std::string_view remote, std::string_view revset) noexcept {
    calls.emplace_back(fmt::format("push {} {}", remote, revset));
    if (push_error) {
        return push_error;
    }
    return outcome::success();
}

outcome::result<std::string> fake_vcs_t::list_bookmarks(std::string_view revset) noexcept {
    calls.emplace_back(fmt::format("list_bookmarks {}", revset));
    if (list_error) {
        return list_error;
    }
    if (bookmarks_json) {
        return *bookmarks_json;
    }
    // sorted by name, as the tool does
    auto names = stack;
    std::sort(names.begin(), names.end());
    std::string r;
    for (auto &name : names) {
        auto index = std::find(stack.begin(), stack.end(), name) - stack.begin();
        auto line = json{{"name", name}, {"target", json::array({fmt::format("c{}", index)})}};
        r += line.dump();
        r += '\n';
    }
    return r;
}

outcome::result<std::string> fake_vcs_t::log_bookmarks(std::string_view revset) noexcept {
    calls.emplace_back(fmt::format("log_bookmarks {}", revset));
    if (log_error) {
        return log_error;
    }
    if (bookmarks_text) {
        return *bookmarks_text;
    }
    std::string r;
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        r += *it;
        r += '\n';
    }
    return r;
}

outcome::result<std::string> fake_vcs_t::log_topology(std::string_view revset) noexcept {
    calls.emplace_back(fmt::format("log_topology {}", revset));
    if (topology_error) {
        return topology_error;
    }
    if (topology) {
        return *topology;
    }
    std::string r;
    for (std::size_t i = 0; i < stack.size(); ++i) {
        r += fmt::format("c{}\t{}\n", i, stack[i]);
    }
    return r;
}

outcome::result<std::string> fake_vcs_t::upstream_default_branch(std::string_view remote) noexcept {
    calls.emplace_back(fmt::format("upstream_default_branch {}", remote));
    if (upstream_error) {
        return upstream_error;
    }
    return upstream;
}

std::size_t fake_vcs_t::count(std::string_view method) const noexcept { return count_calls(calls, method); }

outcome::result<std::string> fake_host_t::list_open(std::uint32_t limit) noexcept {
    calls.emplace_back(fmt::format("list_open {}", limit));
    if (list_error) {
        return list_error;
    }
    auto r = json::array();
    for (auto &[number, request] : requests) {
        if (r.size() >= limit) {
            break;
        }
        r.push_back(json{
            {"number", number},
            {"headRefName", request.head},
            {"baseRefName", request.base},
            {"body", request.body},
        });
    }
    return r.dump();
}

outcome::result<std::string> fake_host_t::create(std::string_view head, std::string_view base, std::string_view title,
                                                 std::string_view body) noexcept {
    calls.emplace_back(fmt::format("create {} {} {}", head, base, title));
    if (create_error) {
        return create_error;
    }
    if (create_output) {
        return *create_output;
    }
    auto number = next_number++;
    requests[number] = model::review_request_t{number, std::string(head), std::string(base), std::string(body)};
    return fmt::format("https://github.com/owner/repo/pull/{}\n", number);
}

outcome::result<void> fake_host_t::edit(model::request_number_t number, std::optional<std::string_view> base,
                                        std::optional<std::string_view> body) noexcept {
    auto call = fmt::format("edit {}", number);
    if (base) {
        call += fmt::format(" base={}", *base);
    }
    if (body) {
        call += " body";
    }
    calls.emplace_back(std::move(call));
    if (edit_error) {
        return edit_error;
    }
    auto it = requests.find(number);
    if (it == requests.end()) {
        return sys::errc::make_error_code(sys::errc::no_such_file_or_directory);
    }
    if (base) {
        it->second.base = *base;
    }
    if (body) {
        it->second.body = *body;
    }
    return outcome::success();
}

outcome::result<std::string> fake_host_t::view_default_branch() noexcept {
    calls.emplace_back("view_default_branch");
    if (default_branch_error) {
        return default_branch_error;
    }
    return json{{"defaultBranchRef", {{"name", default_branch}}}}.dump();
}

void fake_host_t::add(model::review_request_t request) {
    auto number = request.number;
    requests[number] = std::move(request);
    next_number = std::max(next_number, number + 1);
}

const model::review_request_t &fake_host_t::get(std::string_view head) const {
    for (auto &[number, request] : requests) {
        if (request.head == head) {
            return request;
        }
    }
    throw std::out_of_range(fmt::format("no review request for {}", head));
}

std::size_t fake_host_t::count(std::string_view method) const noexcept { return count_calls(calls, method); }

std::size_t fake_host_t::mutations() const noexcept { return count("create") + count("edit"); }

} // namespace jjstack::test
