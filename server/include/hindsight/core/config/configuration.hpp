#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hindsight::core::config {

/**
 * @brief 扁平化的 TOML 子集配置表
 *
 * 支持 [section]、[[array]]、key = value、字符串列表与 # 注释。
 * 所有键以 "section.key" 形式保存，数组节展开为 "name[i].key"。
 */
class Configuration {
public:
    Configuration() = default;

    static Configuration load_from_file(const std::filesystem::path& path);
    static Configuration load_from_string(std::string_view text);

    [[nodiscard]] const std::filesystem::path& source_path() const noexcept { return source_path_; }
    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::string get_string(std::string_view key, std::string default_value = "") const;
    [[nodiscard]] bool get_bool(std::string_view key, bool default_value = false) const;
    [[nodiscard]] int get_int(std::string_view key, int default_value = 0) const;
    [[nodiscard]] std::uint64_t get_uint64(std::string_view key, std::uint64_t default_value = 0) const;
    [[nodiscard]] std::chrono::milliseconds get_milliseconds(std::string_view key,
                                                             std::chrono::milliseconds default_value) const;
    [[nodiscard]] std::vector<std::string> get_list(std::string_view key) const;
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] std::vector<std::string> get_keys() const;

    void set(std::string key, std::string value);

    static std::string trim(std::string_view text);
    static std::string strip_quotes(std::string_view text);

private:
    void parse(std::istream& input);

    using Table = std::unordered_map<std::string, std::string>;

    Table values_{};
    std::filesystem::path source_path_{};
};

}  // namespace hindsight::core::config
