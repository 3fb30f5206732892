#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace aibridge::core::config {

// Flat view over a TOML subset: [section], [[array]] tables and key = value lines.
// Keys are stored as "section.key"; array tables become "name[N].key".
class Configuration {
public:
    Configuration() = default;

    // Throws std::runtime_error when the file cannot be read or a line is malformed.
    static Configuration load_from_file(const std::filesystem::path& path);
    static Configuration load_from_string(std::string_view text);

    // Empty configuration when the file does not exist.
    static Configuration load_or_default(const std::filesystem::path& path);

    [[nodiscard]] const std::filesystem::path& source_path() const noexcept { return source_path_; }
    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::string get_string(std::string_view key, std::string default_value = "") const;
    [[nodiscard]] bool get_bool(std::string_view key, bool default_value = false) const;
    [[nodiscard]] int get_int(std::string_view key, int default_value = 0) const;
    [[nodiscard]] std::optional<std::chrono::milliseconds> get_milliseconds(std::string_view key) const;
    [[nodiscard]] std::vector<std::string> get_list(std::string_view key) const;
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    void set(std::string key, std::string value);

    static std::string trim(std::string_view text);
    static std::string strip_quotes(std::string_view text);

private:
    void parse(std::istream& input, const std::string& origin);

    std::unordered_map<std::string, std::string> values_{};
    std::filesystem::path source_path_{};
};

}  // namespace aibridge::core::config
