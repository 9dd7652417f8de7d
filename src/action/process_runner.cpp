// ---------------------------------------------------------------------------
// process_runner.cpp
//
// Boost.Process 로 자식을 띄우고 Boost.Asio 코루틴으로 stdin/stdout 과
// deadline 을 경쟁시킨다.
//
// [알려진 한계]
// - EOF 이후 종료 대기는 5ms 간격 폴링이다. 정상 스크립트는 EOF 직후 종료하므로
//   대부분 첫 폴링에서 끝난다.
// - 백그라운드로 분리된 손자 프로세스가 stdout 을 쥐고 있으면 deadline 까지
//   EOF 가 오지 않는다. 이 경우도 그룹 kill 로 정리된다.
// ---------------------------------------------------------------------------

#include "action/process_runner.hpp"

#include <array>
#include <csignal>
#include <mutex>
#include <system_error>
#include <thread>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/env.hpp>
#include <boost/process/environment.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/group.hpp>
#include <boost/process/io.hpp>
#include <boost/process/start_dir.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace asio = boost::asio;
namespace bp   = boost::process;

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{5};

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// ---------------------------------------------------------------------------
// write_stdin
//   stdin 데이터를 모두 쓰고 파이프를 닫는다.
//   자식이 stdin 을 읽지 않고 종료하면 EPIPE 가 나며, 오류로 보지 않는다.
// ---------------------------------------------------------------------------
auto write_stdin(bp::async_pipe& pipe, const std::string& data) -> asio::awaitable<void> {
    boost::system::error_code ec;
    if (!data.empty()) {
        co_await asio::async_write(pipe, asio::buffer(data),
                                   asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            spdlog::debug("process_runner: stdin write ended early: {}", ec.message());
        }
    }
    boost::system::error_code close_ec;
    pipe.close(close_ec);
    co_return;
}

// ---------------------------------------------------------------------------
// collect_stdout
//   EOF 까지 읽는다. limit 을 넘는 데이터는 읽되 버린다 (자식이 write 에서
//   막히지 않도록). 끝나면 deadline 타이머를 취소해 경쟁을 끝낸다.
// ---------------------------------------------------------------------------
auto collect_stdout(bp::async_pipe&            pipe,
                    std::size_t                limit,
                    std::string&               out,
                    bool&                      truncated,
                    bool&                      finished,
                    boost::system::error_code& result,
                    asio::steady_timer&        deadline) -> asio::awaitable<void> {
    std::array<char, 4096> buf{};
    for (;;) {
        boost::system::error_code ec;
        const std::size_t n = co_await pipe.async_read_some(
            asio::buffer(buf), asio::redirect_error(asio::use_awaitable, ec));

        if (n > 0) {
            const std::size_t room = out.size() < limit ? limit - out.size() : 0;
            out.append(buf.data(), std::min(n, room));
            if (n > room) {
                truncated = true;
            }
        }
        if (ec) {
            if (ec != asio::error::eof) {
                result = ec;
            }
            break;
        }
    }
    finished = true;
    deadline.cancel();
    co_return;
}

}  // namespace

std::expected<ProcessResult, ProcessError> ProcessRunner::run(const ProcessRequest& request) const {
    ignore_sigpipe_once();

    const auto started = std::chrono::steady_clock::now();

    // 없는 작업 디렉토리에서 부모의 cwd 로 조용히 실행되지 않도록 spawn 전에 확인한다
    if (!request.working_dir.empty()) {
        std::error_code dir_ec;
        if (!std::filesystem::is_directory(request.working_dir, dir_ec)) {
            return std::unexpected(ProcessError{
                ProcessErrorCode::kSpawnFailed,
                fmt::format("working directory '{}' does not exist", request.working_dir.string()),
                0,
            });
        }
    }

    asio::io_context io_ctx;
    bp::async_pipe   stdout_pipe{io_ctx};
    bp::async_pipe   stdin_pipe{io_ctx};
    bp::group        group;

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : request.env) {
        env[key] = value;
    }

    std::error_code ec;
    std::error_code cwd_ec;
    const std::string work_dir = request.working_dir.empty()
                                     ? std::filesystem::current_path(cwd_ec).string()
                                     : request.working_dir.string();

    bp::child child{
        bp::exe  = "/bin/sh",
        bp::args = std::vector<std::string>{"-c", request.command},
        bp::std_out > stdout_pipe,
        bp::std_in < stdin_pipe,
        bp::std_err > bp::null,
        env,
        bp::start_dir(work_dir),
        group,
        ec,
    };
    if (ec) {
        return std::unexpected(ProcessError{
            ProcessErrorCode::kSpawnFailed,
            fmt::format("failed to spawn '/bin/sh -c {}': {}", request.command, ec.message()),
            0,
        });
    }

    const int pid = child.id();
    spdlog::debug("process_runner: spawned pid {} (timeout {}ms)", pid, request.timeout.count());

    std::string               output;
    bool                      truncated = false;
    bool                      finished  = false;
    bool                      timed_out = false;
    boost::system::error_code read_ec;

    asio::steady_timer deadline{io_ctx, request.timeout};

    asio::co_spawn(io_ctx, write_stdin(stdin_pipe, request.stdin_data), asio::detached);
    asio::co_spawn(io_ctx,
                   collect_stdout(stdout_pipe, request.max_output_bytes, output, truncated,
                                  finished, read_ec, deadline),
                   asio::detached);

    deadline.async_wait([&](const boost::system::error_code& wait_ec) {
        if (wait_ec == asio::error::operation_aborted || finished) {
            return;
        }
        // deadline 승리: 그룹 전체 SIGKILL, 파이프를 닫아 대기 중인 읽기/쓰기를 끝낸다.
        timed_out = true;
        std::error_code kill_ec;
        group.terminate(kill_ec);
        boost::system::error_code close_ec;
        stdout_pipe.close(close_ec);
        stdin_pipe.close(close_ec);
    });

    io_ctx.run();

    const auto kill_and_reap = [&] {
        std::error_code kill_ec;
        group.terminate(kill_ec);
        std::error_code wait_ec;
        child.wait(wait_ec);
    };

    if (timed_out) {
        kill_and_reap();
        return std::unexpected(ProcessError{
            ProcessErrorCode::kTimeout,
            fmt::format("process timed out after {}ms", request.timeout.count()),
            pid,
        });
    }

    if (read_ec) {
        kill_and_reap();
        return std::unexpected(ProcessError{
            ProcessErrorCode::kIoError,
            fmt::format("failed to read process output: {}", read_ec.message()),
            pid,
        });
    }

    // EOF 이후: 남은 시간 동안 종료 대기
    const auto give_up_at = started + request.timeout;
    std::error_code run_ec;
    while (child.running(run_ec)) {
        if (std::chrono::steady_clock::now() >= give_up_at) {
            kill_and_reap();
            return std::unexpected(ProcessError{
                ProcessErrorCode::kTimeout,
                fmt::format("process did not exit within {}ms", request.timeout.count()),
                pid,
            });
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
    if (run_ec) {
        kill_and_reap();
        return std::unexpected(ProcessError{
            ProcessErrorCode::kIoError,
            fmt::format("failed to wait for process: {}", run_ec.message()),
            pid,
        });
    }

    ProcessResult result{};
    result.exit_code   = child.exit_code();
    result.stdout_data = std::move(output);
    result.truncated   = truncated;
    result.pid         = pid;
    result.elapsed     = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::debug("process_runner: pid {} exited with {} after {}ms", pid, result.exit_code,
                  result.elapsed.count());
    return result;
}
