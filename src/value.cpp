#include <jsonpatch-cpp/value.hpp>

namespace jsonpatch_cpp {

auto operator==(const Value& a, const Value& b) -> bool {
    if (!same_kind(a, b)) return false;

    return std::visit(overload{
        [&](Null) { return true; },
        [&](bool x) { return x == std::get<bool>(b.data); },
        [&](const Number& x) { return x.text == std::get<Number>(b.data).text; },
        [&](const std::string& x) { return x == std::get<std::string>(b.data); },
        [&](const Array& x) {
            const auto& y = std::get<Array>(b.data);
            if (x.size() != y.size()) return false;
            for (std::size_t i = 0; i < x.size(); ++i) {
                if (!(x[i] == y[i])) return false;
            }
            return true;
        },
        [&](const Object& x) {
            const auto& y = std::get<Object>(b.data);
            if (x.size() != y.size()) return false;
            for (const auto& [key, val] : x) {
                auto it = y.find(key);
                if (it == y.end() || !(val == it->second)) return false;
            }
            return true;
        },
    }, a.data);
}

}  // namespace jsonpatch_cpp
