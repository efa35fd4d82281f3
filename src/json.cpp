#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/error.hpp>

#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

namespace {

// -- Number tokens ------------------------------------------------------------

auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

auto is_number_char(char c) -> bool {
    return is_digit(c) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

// Returns the text of every number token outside string literals, in
// document order. For a document nlohmann accepts, these are exactly the
// tokens its SAX parser reports as numbers, in the same order.
auto scan_numbers(std::string_view text) -> std::vector<std::string_view> {
    auto tokens = std::vector<std::string_view>{};
    auto i = std::size_t{0};
    while (i < text.size()) {
        const auto c = text[i];
        if (c == '"') {
            for (++i; i < text.size() && text[i] != '"'; ++i) {
                if (text[i] == '\\') ++i;
            }
            ++i;
        } else if (c == '-' || is_digit(c)) {
            const auto start = i;
            while (i < text.size() && is_number_char(text[i])) ++i;
            tokens.push_back(text.substr(start, i - start));
        } else {
            ++i;
        }
    }
    return tokens;
}

// RFC 8259 number grammar:
// -? (0 | [1-9][0-9]*) (. [0-9]+)? ([eE] [+-]? [0-9]+)?
auto is_number_token(std::string_view t) -> bool {
    auto i = std::size_t{0};
    auto digits = [&] {
        const auto start = i;
        while (i < t.size() && is_digit(t[i])) ++i;
        return i > start;
    };
    if (i < t.size() && t[i] == '-') ++i;
    if (i < t.size() && t[i] == '0') {
        ++i;
    } else if (!digits()) {
        return false;
    }
    if (i < t.size() && t[i] == '.') {
        ++i;
        if (!digits()) return false;
    }
    if (i < t.size() && (t[i] == 'e' || t[i] == 'E')) {
        ++i;
        if (i < t.size() && (t[i] == '+' || t[i] == '-')) ++i;
        if (!digits()) return false;
    }
    return i == t.size();
}

// nlohmann converts every number with strtod and rejects the document
// when the result is not finite.
auto overflows_double(std::string_view t) -> bool {
    return std::isinf(std::strtod(std::string{t}.c_str(), nullptr));
}

// Assembles nlohmann SAX events into a Value tree. Numbers take their
// text from the scanned source tokens, so every token, "-0" included, is
// kept verbatim.
class ValueBuilder {
public:
    using json = nlohmann::json;

    ValueBuilder(Value& root, const std::vector<std::string_view>& numbers)
        : root_{root}, numbers_{numbers} {}

    auto null() -> bool {
        insert(Value{Null{}});
        return true;
    }

    auto boolean(bool val) -> bool {
        insert(Value{val});
        return true;
    }

    auto number_integer(json::number_integer_t) -> bool {
        insert(next_number());
        return true;
    }

    auto number_unsigned(json::number_unsigned_t) -> bool {
        insert(next_number());
        return true;
    }

    auto number_float(json::number_float_t, const json::string_t&) -> bool {
        insert(next_number());
        return true;
    }

    auto string(json::string_t& val) -> bool {
        insert(Value{std::move(val)});
        return true;
    }

    // The text parser never produces binary values.
    auto binary(json::binary_t&) -> bool { return false; }

    auto start_object(std::size_t) -> bool {
        check_depth();
        stack_.push_back(insert(Value{Object{}}));
        return true;
    }

    auto key(json::string_t& val) -> bool {
        auto& obj = std::get<Object>(stack_.back()->data);
        member_ = &obj[std::move(val)];
        return true;
    }

    auto end_object() -> bool {
        stack_.pop_back();
        return true;
    }

    auto start_array(std::size_t) -> bool {
        check_depth();
        stack_.push_back(insert(Value{Array{}}));
        return true;
    }

    auto end_array() -> bool {
        stack_.pop_back();
        return true;
    }

    auto parse_error(std::size_t, const std::string&, const json::exception& ex) -> bool {
        throw Exception{ErrorKind::parse_error, ex.what()};
    }

private:
    auto next_number() -> Value {
        if (next_number_ >= numbers_.size()) {
            throw Exception{ErrorKind::parse_error, "unexpected number token"};
        }
        return Value{Number{std::string{numbers_[next_number_++]}}};
    }

    void check_depth() const {
        if (stack_.size() >= max_nesting_depth) {
            throw Exception{ErrorKind::parse_error,
                            "nesting depth exceeds " + std::to_string(max_nesting_depth)};
        }
    }

    // Places a completed value into the innermost open container and
    // returns its address there.
    auto insert(Value val) -> Value* {
        if (stack_.empty()) {
            root_ = std::move(val);
            return &root_;
        }
        if (auto* arr = stack_.back()->get_if<Array>()) {
            arr->push_back(std::move(val));
            return &arr->back();
        }
        *member_ = std::move(val);
        return member_;
    }

    Value& root_;
    const std::vector<std::string_view>& numbers_;
    std::size_t next_number_{0};
    std::vector<Value*> stack_;
    Value* member_{nullptr};
};

void write_string(std::string& out, const std::string& s) {
    out += nlohmann::json(s).dump(-1, ' ', false,
                                  nlohmann::json::error_handler_t::replace);
}

void write_newline(std::string& out, int indent, int depth) {
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent * depth), ' ');
}

void write_value(std::string& out, const Value& value, int indent, int depth) {
    const auto pretty = indent >= 0;

    std::visit(overload{
        [&](Null) { out += "null"; },
        [&](bool b) { out += b ? "true" : "false"; },
        [&](const Number& n) { out += n.text; },
        [&](const std::string& s) { write_string(out, s); },
        [&](const Array& arr) {
            if (arr.empty()) {
                out += "[]";
                return;
            }
            out.push_back('[');
            auto first = true;
            for (const auto& element : arr) {
                if (!first) out.push_back(',');
                first = false;
                if (pretty) write_newline(out, indent, depth + 1);
                write_value(out, element, indent, depth + 1);
            }
            if (pretty) write_newline(out, indent, depth);
            out.push_back(']');
        },
        [&](const Object& obj) {
            if (obj.empty()) {
                out += "{}";
                return;
            }
            out.push_back('{');
            auto first = true;
            for (const auto& [key, member] : obj) {
                if (!first) out.push_back(',');
                first = false;
                if (pretty) write_newline(out, indent, depth + 1);
                write_string(out, key);
                out += pretty ? ": " : ":";
                write_value(out, member, indent, depth + 1);
            }
            if (pretty) write_newline(out, indent, depth);
            out.push_back('}');
        },
    }, value.data);
}

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

}  // anonymous namespace

// =============================================================================
// Text codec
// =============================================================================

auto parse(std::string_view text) -> Value {
    const auto numbers = scan_numbers(text);

    // Tokens nlohmann would reject as out of range are replaced by "0"
    // of the same length; the builder restores their text.
    auto masked = std::string{};
    for (const auto token : numbers) {
        if (!is_number_token(token) || !overflows_double(token)) continue;
        if (masked.empty()) masked = std::string{text};
        const auto offset = static_cast<std::size_t>(token.data() - text.data());
        masked.replace(offset, token.size(), token.size(), ' ');
        masked[offset] = '0';
    }
    const auto input = masked.empty() ? text : std::string_view{masked};

    auto result = Value{};
    auto builder = ValueBuilder{result, numbers};
    if (!nlohmann::json::sax_parse(input.begin(), input.end(), &builder)) {
        throw Exception{ErrorKind::parse_error, "invalid JSON document"};
    }
    return result;
}

auto dump(const Value& value, int indent) -> std::string {
    auto out = std::string{};
    write_value(out, value, indent, 0);
    return out;
}

auto dump_size(const Value& value) -> std::size_t {
    return dump(value).size();
}

auto resembles_array(std::string_view text) -> bool {
    text = trim(text);
    return !text.empty() && text.front() == '[' && text.back() == ']';
}

auto split_array_elements(std::string_view text) -> std::vector<std::string_view> {
    text = trim(text);
    auto elements = std::vector<std::string_view>{};
    if (text.size() < 2) return elements;

    auto depth = 0;
    auto in_string = false;
    auto start = std::size_t{1};
    for (std::size_t i = 1; i + 1 < text.size(); ++i) {
        const auto c = text[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        switch (c) {
            case '"': in_string = true; break;
            case '[':
            case '{': ++depth; break;
            case ']':
            case '}': --depth; break;
            case ',':
                if (depth == 0) {
                    elements.push_back(trim(text.substr(start, i - start)));
                    start = i + 1;
                }
                break;
            default: break;
        }
    }
    auto last = trim(text.substr(start, text.size() - 1 - start));
    if (!last.empty() || !elements.empty()) elements.push_back(last);
    return elements;
}

auto equal(std::string_view a, std::string_view b) -> bool {
    try {
        return parse(a) == parse(b);
    } catch (const Exception&) {
        return false;
    }
}

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Value& value) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](const Number& n) {
            try {
                j = nlohmann::json::parse(n.text);
            } catch (const nlohmann::json::out_of_range& e) {
                throw Exception{ErrorKind::type_mismatch, e.what()};
            }
        },
        [&](const std::string& s) { j = s; },
        [&](const Array& arr) {
            j = nlohmann::json::array();
            for (const auto& element : arr) {
                auto element_json = nlohmann::json{};
                to_json(element_json, element);
                j.push_back(std::move(element_json));
            }
        },
        [&](const Object& obj) {
            j = nlohmann::json::object();
            for (const auto& [key, member] : obj) {
                to_json(j[key], member);
            }
        },
    }, value.data);
}

void from_json(const nlohmann::json& j, Value& value) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            value = Value{Null{}};
            return;
        case nlohmann::json::value_t::boolean:
            value = Value{j.get<bool>()};
            return;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            value = Value{Number{j.dump()}};
            return;
        case nlohmann::json::value_t::string:
            value = Value{j.get<std::string>()};
            return;
        case nlohmann::json::value_t::array: {
            auto arr = Array{};
            arr.reserve(j.size());
            for (const auto& element : j) {
                auto& slot = arr.emplace_back();
                from_json(element, slot);
            }
            value = Value{std::move(arr)};
            return;
        }
        case nlohmann::json::value_t::object: {
            auto obj = Object{};
            for (const auto& [key, member] : j.items()) {
                from_json(member, obj[key]);
            }
            value = Value{std::move(obj)};
            return;
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
    }
    throw Exception{ErrorKind::invalid_operation,
                    std::string{"cannot convert JSON of type "} + j.type_name()};
}

}  // namespace jsonpatch_cpp
