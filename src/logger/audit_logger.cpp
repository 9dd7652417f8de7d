// ---------------------------------------------------------------------------
// audit_logger.cpp
// ---------------------------------------------------------------------------

#include "logger/audit_logger.hpp"

#include <system_error>

#include <fmt/format.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include "logger/jsonl_sink.hpp"

std::string to_jsonl(const AuditLogEntry& entry) {
    const nlohmann::json j = entry;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ---------------------------------------------------------------------------
// AuditLogger 생성자
// ---------------------------------------------------------------------------
AuditLogger::AuditLogger(const std::filesystem::path& log_path)
    : log_path_(log_path)
{
    if (log_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(log_path_.parent_path(), ec);
        if (ec) {
            open_error_ = fmt::format("failed to create log directory {}: {}",
                                      log_path_.parent_path().string(), ec.message());
            return;
        }
    }

    try {
        auto sink = std::make_shared<JsonlAppendSink>(log_path_);
        logger_   = std::make_shared<spdlog::logger>("hookgate-audit", std::move(sink));
        logger_->set_level(spdlog::level::trace);

        // 레코드 자체가 JSON 이므로 접두어 없이 본문만 쓴다
        logger_->set_pattern("%v");
        logger_->set_error_handler([this](const std::string& msg) { last_error_ = msg; });
    } catch (const spdlog::spdlog_ex& ex) {
        logger_.reset();
        open_error_ = ex.what();
    }
}

AuditLogger::~AuditLogger() = default;

// ---------------------------------------------------------------------------
// append
// ---------------------------------------------------------------------------
std::expected<void, std::string> AuditLogger::append(const AuditLogEntry& entry) {
    if (!logger_) {
        return std::unexpected(open_error_.value_or("audit log is not open"));
    }

    const std::string line = to_jsonl(entry);

    last_error_.reset();
    logger_->log(spdlog::level::info, spdlog::string_view_t{line.data(), line.size()});

    if (last_error_) {
        return std::unexpected(*last_error_);
    }
    return {};
}
