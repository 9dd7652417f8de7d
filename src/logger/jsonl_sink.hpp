#pragma once

// ---------------------------------------------------------------------------
// jsonl_sink.hpp
//
// O_APPEND 파일 디스크립터에 레코드 하나를 write(2) 한 번으로 쓰는 spdlog 싱크.
//
// [설계 원칙]
// - 여러 hookgate 프로세스가 같은 로그 파일에 동시에 붙여 쓴다.
//   O_APPEND + 단일 write 로 줄 단위 원자성을 얻는다 (PIPE_BUF 이하 보장,
//   일반 파일은 실질적으로 레코드 전체).
// - 회전(rotation)은 하지 않는다. 여러 프로세스가 회전을 경쟁하면 레코드가
//   유실되기 때문이다.
// - write 실패는 spdlog::spdlog_ex 로 던진다. 로거의 error handler 가 받는다.
// ---------------------------------------------------------------------------

#include <cerrno>
#include <filesystem>
#include <mutex>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/common.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/base_sink.h>

class JsonlAppendSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    // 파일을 열 수 없으면 spdlog::spdlog_ex
    explicit JsonlAppendSink(const std::filesystem::path& path)
        : path_(path) {
        fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            spdlog::throw_spdlog_ex("jsonl_sink: failed to open " + path_.string(), errno);
        }
    }

    ~JsonlAppendSink() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    JsonlAppendSink(const JsonlAppendSink&)            = delete;
    JsonlAppendSink& operator=(const JsonlAppendSink&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);

        const char* data = formatted.data();
        std::size_t left = formatted.size();
        while (left > 0) {
            const ssize_t n = ::write(fd_, data, left);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                spdlog::throw_spdlog_ex("jsonl_sink: write failed on " + path_.string(), errno);
            }
            data += n;
            left -= static_cast<std::size_t>(n);
        }
    }

    // 버퍼링하지 않는다
    void flush_() override {}

private:
    std::filesystem::path path_;
    int                   fd_{-1};
};
