#include "aibridge/core/config/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace aibridge::core::config {
namespace {

std::string qualify(const std::string& section, const std::string& key) {
    return section.empty() ? key : section + "." + key;
}

// Drops a trailing "# comment" that is not inside a quoted string.
std::string_view strip_comment(std::string_view line) {
    char quote = '\0';
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            }
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::vector<std::string> split_list(std::string_view raw) {
    std::vector<std::string> items;
    if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
        return items;
    }

    auto flush = [&items](const std::string& buffer) {
        auto item = Configuration::trim(buffer);
        if (!item.empty()) {
            items.push_back(Configuration::strip_quotes(item));
        }
    };

    std::string buffer;
    bool quoted = false;
    for (char ch : raw.substr(1, raw.size() - 2)) {
        if (ch == '"') {
            quoted = !quoted;
        } else if (ch == ',' && !quoted) {
            flush(buffer);
            buffer.clear();
            continue;
        }
        buffer.push_back(ch);
    }
    flush(buffer);
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
    config.parse(input, path.string());
    return config;
}

Configuration Configuration::load_from_string(std::string_view text) {
    std::istringstream input{std::string{text}};
    Configuration config;
    config.parse(input, "<string>");
    return config;
}

Configuration Configuration::load_or_default(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Configuration{};
    }
    return load_from_file(path);
}

void Configuration::parse(std::istream& input, const std::string& origin) {
    std::string section;
    std::map<std::string, int> array_counts;
    std::string line;
    int line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        const auto text = trim(strip_comment(line));
        if (text.empty()) {
            continue;
        }

        if (text.front() == '[') {
            if (text.back() != ']') {
                throw std::runtime_error(origin + ":" + std::to_string(line_number) + ": unterminated table header");
            }
            if (text.size() > 4 && text[1] == '[' && text[text.size() - 2] == ']') {
                const auto name = trim(std::string_view{text}.substr(2, text.size() - 4));
                section = name + "[" + std::to_string(array_counts[name]++) + "]";
            } else {
                section = trim(std::string_view{text}.substr(1, text.size() - 2));
            }
            continue;
        }

        const auto eq = text.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error(origin + ":" + std::to_string(line_number) + ": expected 'key = value'");
        }

        auto key = trim(std::string_view{text}.substr(0, eq));
        if (key.empty()) {
            throw std::runtime_error(origin + ":" + std::to_string(line_number) + ": empty key");
        }
        values_[qualify(section, key)] = trim(std::string_view{text}.substr(eq + 1));
    }
}

bool Configuration::contains(std::string_view key) const {
    return values_.count(std::string{key}) != 0;
}

std::string Configuration::get_string(std::string_view key, std::string default_value) const {
    auto it = values_.find(std::string{key});
    return it == values_.end() ? default_value : strip_quotes(it->second);
}

bool Configuration::get_bool(std::string_view key, bool default_value) const {
    auto value = get_string(key);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1") {
        return true;
    }
    if (value == "false" || value == "0") {
        return false;
    }
    return default_value;
}

int Configuration::get_int(std::string_view key, int default_value) const {
    const auto value = get_string(key);
    if (value.empty()) {
        return default_value;
    }

    int parsed = 0;
    const auto* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    return (ec == std::errc{} && ptr == end) ? parsed : default_value;
}

std::optional<std::chrono::milliseconds> Configuration::get_milliseconds(std::string_view key) const {
    if (!contains(key)) {
        return std::nullopt;
    }
    const auto value = get_string(key);
    long long parsed = 0;
    const auto* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (ec != std::errc{} || ptr != end) {
        throw std::runtime_error("Configuration value '" + std::string{key} + "' is not an integer: " + value);
    }
    return std::chrono::milliseconds{parsed};
}

std::vector<std::string> Configuration::get_list(std::string_view key) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) {
        return {};
    }
    return split_list(it->second);
}

void Configuration::set(std::string key, std::string value) {
    values_[std::move(key)] = std::move(value);
}

std::string Configuration::trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    const auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(whitespace);
    return std::string{text.substr(begin, end - begin + 1)};
}

std::string Configuration::strip_quotes(std::string_view text) {
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
        return std::string{text.substr(1, text.size() - 2)};
    }
    return std::string{text};
}

}  // namespace aibridge::core::config
