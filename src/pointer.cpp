#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/error.hpp>

#include <charconv>
#include <string>
#include <system_error>

namespace jsonpatch_cpp {

auto escape_token(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result.push_back(c);
        }
    }
    return result;
}

auto unescape_token(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] != '~') {
            result.push_back(token[i]);
            continue;
        }
        if (i + 1 < token.size() && token[i + 1] == '0') {
            result.push_back('~');
        } else if (i + 1 < token.size() && token[i + 1] == '1') {
            result.push_back('/');
        } else {
            throw Exception{ErrorKind::bad_path,
                            "invalid escape in pointer token: " + std::string{token}};
        }
        ++i;
    }
    return result;
}

auto append_token(std::string_view pointer, std::string_view token) -> std::string {
    auto result = std::string{pointer};
    result.push_back('/');
    result += escape_token(token);
    return result;
}

auto append_index(std::string_view pointer, std::size_t index) -> std::string {
    auto result = std::string{pointer};
    result.push_back('/');
    result += std::to_string(index);
    return result;
}

auto split_pointer(std::string_view pointer) -> std::vector<std::string> {
    if (pointer.empty()) return {};
    if (pointer.front() != '/') {
        throw Exception{ErrorKind::bad_path,
                        "pointer must start with '/': " + std::string{pointer}};
    }

    auto tokens = std::vector<std::string>{};
    auto pos = std::size_t{1};
    while (true) {
        auto next = pointer.find('/', pos);
        tokens.push_back(unescape_token(pointer.substr(pos, next - pos)));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return tokens;
}

auto parse_index(std::string_view token) -> std::optional<std::int64_t> {
    auto digits = token;
    if (!digits.empty() && digits.front() == '-') digits.remove_prefix(1);
    if (digits.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (digits.front() == '0' && (digits.size() > 1 || digits.size() != token.size())) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (c < '0' || c > '9') return std::nullopt;
    }

    auto result = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec != std::errc{} || ptr != token.data() + token.size()) return std::nullopt;
    return result;
}

}  // namespace jsonpatch_cpp
