#pragma once

#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace persist {

// Minimal forward-only JSON reader for the engine's own file schemas. Schema
// code drives it field by field; anything unexpected is an error, never a skip.
class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() const noexcept {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool expect(char c) noexcept { return consume(c); }

    bool peek(char c) const noexcept {
        skip_ws();
        return pos_ < src_.size() && src_[pos_] == c;
    }

    std::optional<std::string> parse_string(std::string& err) {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != '"') {
            err = at("expected string");
            return std::nullopt;
        }
        ++pos_;
        std::string out;
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= src_.size()) {
                err = at("invalid escape");
                return std::nullopt;
            }
            const char esc = src_[pos_++];
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                default:
                    err = at("unsupported escape sequence");
                    return std::nullopt;
            }
        }
        err = at("unterminated string");
        return std::nullopt;
    }

    std::optional<std::uint64_t> parse_uint64(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        if (start == pos_) {
            err = at("expected unsigned integer");
            return std::nullopt;
        }
        std::uint64_t value = 0;
        const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
        if (conv.ec != std::errc()) {
            err = at("invalid integer");
            return std::nullopt;
        }
        return value;
    }

    std::optional<std::int64_t> parse_int64(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        if (pos_ < src_.size() && src_[pos_] == '-') {
            ++pos_;
        }
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        std::int64_t value = 0;
        const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
        if (conv.ec != std::errc() || conv.ptr != src_.data() + pos_) {
            pos_ = start;
            err = at("expected integer");
            return std::nullopt;
        }
        return value;
    }

    std::optional<double> parse_double(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.' || c == 'e' ||
                  c == 'E')) {
                break;
            }
            ++pos_;
        }
        double value = 0.0;
        const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
        if (start == pos_ || conv.ec != std::errc() || conv.ptr != src_.data() + pos_) {
            pos_ = start;
            err = at("expected number");
            return std::nullopt;
        }
        return value;
    }

    std::optional<bool> parse_bool(std::string& err) noexcept {
        if (parse_literal("true")) {
            return true;
        }
        if (parse_literal("false")) {
            return false;
        }
        err = at("expected boolean");
        return std::nullopt;
    }

    // Consumes `null` if present.
    bool consume_null() noexcept { return parse_literal("null"); }

    bool parse_literal(std::string_view literal) noexcept {
        skip_ws();
        if (src_.substr(pos_).compare(0, literal.size(), literal) == 0) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    bool eof() const noexcept {
        skip_ws();
        return pos_ >= src_.size();
    }

    std::size_t offset() const noexcept { return pos_; }

    std::string at(std::string_view what) const {
        return std::string(what) + " at offset " + std::to_string(pos_);
    }

private:
    mutable std::size_t pos_{0};
    std::string_view src_;
};

// Walks `{ "key": value, ... }`; on_field(key) must consume the value.
template <typename F>
bool parse_object(JsonCursor& cur, std::string& error, F&& on_field) {
    if (!cur.expect('{')) {
        error = cur.at("expected object");
        return false;
    }
    if (cur.consume('}')) {
        return true;
    }
    while (true) {
        auto key = cur.parse_string(error);
        if (!key) {
            return false;
        }
        if (!cur.expect(':')) {
            error = cur.at("expected ':'");
            return false;
        }
        if (!on_field(*key)) {
            return false;
        }
        if (cur.consume('}')) {
            return true;
        }
        if (!cur.consume(',')) {
            error = cur.at("expected ','");
            return false;
        }
    }
}

// Walks `[ value, ... ]`; on_item() must consume one value.
template <typename F>
bool parse_array(JsonCursor& cur, std::string& error, F&& on_item) {
    if (!cur.expect('[')) {
        error = cur.at("expected array");
        return false;
    }
    if (cur.consume(']')) {
        return true;
    }
    while (true) {
        if (!on_item()) {
            return false;
        }
        if (cur.consume(']')) {
            return true;
        }
        if (!cur.consume(',')) {
            error = cur.at("expected ','");
            return false;
        }
    }
}

inline bool parse_string_array(JsonCursor& cur, std::vector<std::string>& out, std::string& error) {
    return parse_array(cur, error, [&] {
        auto v = cur.parse_string(error);
        if (!v) {
            return false;
        }
        out.push_back(std::move(*v));
        return true;
    });
}

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error) noexcept;

} // namespace persist
