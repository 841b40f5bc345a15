// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 jjstack authors

#include "process.h"
#include "error_code.h"
#include "log.h"
#include <boost/asio.hpp>
#include <boost/process.hpp>
#include <future>
#include <system_error>

namespace jjstack::utils {

namespace asio = boost::asio;
namespace bp = boost::process;

process_t::process_t(std::string executable_, bfs::path work_dir_) noexcept
    : executable{std::move(executable_)}, work_dir{std::move(work_dir_)} {}

outcome::result<process_result_t> process_t::run(const args_t &args) const noexcept {
    auto log = get_logger("jjstack.process");
    auto cmd = join_args(executable, args);
    LOG_DEBUG(log, "running '{}' in {}", cmd, work_dir.string());

    auto exe = executable.find('/') == executable.npos ? bp::search_path(executable)
                                                       : boost::filesystem::path(executable);
    if (exe.empty()) {
        LOG_ERROR(log, "'{}' is not found in PATH", executable);
        return make_error_code(error_code_t::collaborator_unreachable);
    }

    try {
        asio::io_context io_context;
        std::future<std::string> out;
        std::future<std::string> err;
        std::error_code ec;
        auto dir = work_dir.empty() ? bfs::current_path(ec) : work_dir;
        if (ec) {
            LOG_ERROR(log, "cannot determine working directory: {}", ec.message());
            return make_error_code(error_code_t::collaborator_unreachable);
        }

        bp::child child(exe, bp::args(args), bp::start_dir(dir.string()), bp::std_in.close(), bp::std_out > out,
                        bp::std_err > err, io_context, ec);
        if (ec) {
            LOG_ERROR(log, "cannot start '{}': {}", cmd, ec.message());
            return make_error_code(error_code_t::collaborator_unreachable);
        }
        io_context.run();
        child.wait(ec);
        if (ec) {
            LOG_ERROR(log, "waiting '{}' failed: {}", cmd, ec.message());
            return make_error_code(error_code_t::collaborator_unreachable);
        }

        auto result = process_result_t{child.exit_code(), out.get(), err.get()};
        LOG_TRACE(log, "'{}' exited with {}, stdout: {} bytes, stderr: {} bytes", cmd, result.exit_code,
                  result.out.size(), result.err.size());
        return result;
    } catch (const std::exception &ex) {
        LOG_ERROR(log, "cannot run '{}': {}", cmd, ex.what());
        return make_error_code(error_code_t::collaborator_unreachable);
    }
}

outcome::result<std::string> process_t::run_ok(const args_t &args) const noexcept {
    auto r = run(args);
    if (!r) {
        return r.assume_error();
    }
    auto &result = r.assume_value();
    if (!result.ok()) {
        auto log = get_logger("jjstack.process");
        auto &diagnostics = result.err.empty() ? result.out : result.err;
        LOG_ERROR(log, "'{}' exited with {}:\n{}", join_args(executable, args), result.exit_code, diagnostics);
        return make_error_code(error_code_t::collaborator_failure);
    }
    auto &out = result.out;
    auto last = out.find_last_not_of(" \t\r\n");
    out.resize(last == out.npos ? 0 : last + 1);
    return std::move(out);
}

std::string join_args(std::string_view executable, const args_t &args) noexcept {
    auto r = std::string(executable);
    for (auto &arg : args) {
        r += ' ';
        if (arg.empty() || arg.find_first_of(" \t\n\"'") != arg.npos) {
            r += '\'';
            r += arg;
            r += '\'';
        } else {
            r += arg;
        }
    }
    return r;
}

} // namespace jjstack::utils
