#include "trapeze/catalog.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace trapeze {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    const auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

std::optional<double> parse_decimal(const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(t.c_str(), &end);
    if (errno == ERANGE || end != t.c_str() + t.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

} // namespace

std::optional<double> as_number(const FieldValue& value) {
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d)) return *d;
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return parse_decimal(*s);
    }
    return std::nullopt;
}

std::optional<std::string> as_string(const FieldValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss.precision(15);
        oss << *d;
        return oss.str();
    }
    return std::nullopt;
}

std::optional<double> find_number(const Record& record, const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        auto it = record.find(key);
        if (it == record.end()) continue;
        if (auto number = as_number(it->second)) {
            return number;
        }
    }
    return std::nullopt;
}

std::optional<std::string> find_string(const Record& record, const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        auto it = record.find(key);
        if (it == record.end()) continue;
        auto text = as_string(it->second);
        if (text && !text->empty()) {
            return text;
        }
    }
    return std::nullopt;
}

} // namespace trapeze
