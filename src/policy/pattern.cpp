// ---------------------------------------------------------------------------
// pattern.cpp
// ---------------------------------------------------------------------------

#include "policy/pattern.hpp"

#include <re2/re2.h>

std::expected<Pattern, std::string> Pattern::compile(std::string_view pattern) {
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingUTF8);
    options.set_log_errors(false);

    auto re = std::make_shared<const RE2>(re2::StringPiece(pattern.data(), pattern.size()), options);
    if (!re->ok()) {
        return std::unexpected(re->error());
    }

    Pattern out{};
    out.source_ = std::string{pattern};
    out.re_     = std::move(re);
    return out;
}

bool Pattern::search(std::string_view text) const noexcept {
    if (!re_) {
        return false;
    }
    return RE2::PartialMatch(re2::StringPiece(text.data(), text.size()), *re_);
}
