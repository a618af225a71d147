#include "hindsight/core/config/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace hindsight::core::config {
namespace {

std::string join_key(std::string_view section, std::string_view key) {
    if (section.empty()) {
        return std::string{key};
    }
    std::string joined;
    joined.reserve(section.size() + 1 + key.size());
    joined.append(section);
    joined.push_back('.');
    joined.append(key);
    return joined;
}

bool looks_like_list(std::string_view value) {
    return value.size() >= 2 && value.front() == '[' && value.back() == ']';
}

// Drops a trailing "# comment" that is not inside a quoted string.
std::string strip_comment(std::string_view line) {
    bool in_string = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (ch == '"') {
            in_string = !in_string;
        } else if (ch == '#' && !in_string) {
            return std::string{line.substr(0, i)};
        }
    }
    return std::string{line};
}

std::vector<std::string> split_list(std::string_view raw) {
    std::vector<std::string> items;
    if (!looks_like_list(raw)) {
        return items;
    }

    std::string current;
    bool in_string = false;
    auto flush = [&]() {
        auto item = Configuration::trim(current);
        if (!item.empty()) {
            items.emplace_back(Configuration::strip_quotes(item));
        }
        current.clear();
    };

    for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
        char ch = raw[i];
        if (ch == '"') {
            in_string = !in_string;
            continue;
        }
        if (ch == ',' && !in_string) {
            flush();
            continue;
        }
        current.push_back(ch);
    }
    flush();
    return items;
}

}  // namespace

Configuration Configuration::load_from_file(const std::filesystem::path& path) {
    std::ifstream input{path};
    if (!input) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    Configuration config;
    config.source_path_ = path;
    config.parse(input);
    return config;
}

Configuration Configuration::load_from_string(std::string_view text) {
    std::istringstream input{std::string{text}};
    Configuration config;
    config.parse(input);
    return config;
}

void Configuration::parse(std::istream& input) {
    std::string section;
    std::map<std::string, int> array_counters;
    std::string line;

    while (std::getline(input, line)) {
        auto trimmed = trim(strip_comment(line));
        if (trimmed.empty()) {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            bool array_table = trimmed.size() > 4 && trimmed[1] == '[' && trimmed[trimmed.size() - 2] == ']';
            if (array_table) {
                auto name = trim(std::string_view{trimmed}.substr(2, trimmed.size() - 4));
                int index = array_counters[name]++;
                section = name + "[" + std::to_string(index) + "]";
            } else {
                section = trim(std::string_view{trimmed}.substr(1, trimmed.size() - 2));
            }
            continue;
        }

        auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        auto key = trim(std::string_view{trimmed}.substr(0, eq));
        auto value = trim(std::string_view{trimmed}.substr(eq + 1));
        if (key.empty()) {
            continue;
        }
        values_[join_key(section, key)] = std::move(value);
    }
}

bool Configuration::contains(std::string_view key) const {
    return values_.find(std::string{key}) != values_.end();
}

std::string Configuration::get_string(std::string_view key, std::string default_value) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) {
        return default_value;
    }
    return strip_quotes(it->second);
}

bool Configuration::get_bool(std::string_view key, bool default_value) const {
    auto raw = get_string(key, default_value ? "true" : "false");
    std::transform(raw.begin(), raw.end(), raw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (raw == "true" || raw == "1" || raw == "yes") {
        return true;
    }
    if (raw == "false" || raw == "0" || raw == "no") {
        return false;
    }
    return default_value;
}

int Configuration::get_int(std::string_view key, int default_value) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) {
        return default_value;
    }

    auto text = trim(it->second);
    int value = default_value;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec == std::errc{} && result.ptr == text.data() + text.size()) {
        return value;
    }
    return default_value;
}

std::uint64_t Configuration::get_uint64(std::string_view key, std::uint64_t default_value) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) {
        return default_value;
    }

    auto text = trim(it->second);
    std::uint64_t value = default_value;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec == std::errc{} && result.ptr == text.data() + text.size()) {
        return value;
    }
    return default_value;
}

std::chrono::milliseconds Configuration::get_milliseconds(std::string_view key,
                                                          std::chrono::milliseconds default_value) const {
    auto raw = get_uint64(key, static_cast<std::uint64_t>(default_value.count()));
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(raw)};
}

std::vector<std::string> Configuration::get_list(std::string_view key) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) {
        return {};
    }
    return split_list(trim(it->second));
}

std::vector<std::string> Configuration::get_keys() const {
    std::vector<std::string> keys;
    keys.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void Configuration::set(std::string key, std::string value) {
    values_[std::move(key)] = std::move(value);
}

std::string Configuration::trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\n\r");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\n\r");
    return std::string{text.substr(begin, end - begin + 1)};
}

std::string Configuration::strip_quotes(std::string_view text) {
    if (text.size() >= 2) {
        auto first = text.front();
        auto last = text.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return std::string{text.substr(1, text.size() - 2)};
        }
    }
    return std::string{text};
}

}  // namespace hindsight::core::config
