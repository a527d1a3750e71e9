// VoxStruct Core
// config.hpp - JSON-backed configuration

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "logger.hpp"

namespace voxstruct::core {

// Two-level "section.key" settings persisted as a JSON document
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view content);
    bool save(const std::filesystem::path& path) const;
    bool save() const;  // Save to loaded path
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path get_path() const;

    // Typed getters, the default is returned on a missing key or a type mismatch
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    bool remove(std::string_view section, std::string_view key);

    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Console level from logging.level, everything else defaulted
[[nodiscard]] LoggerConfig make_logger_config(const Config& config);

namespace config_section {
    inline constexpr const char* STRUCTURE = "structure";
    inline constexpr const char* LOGGING = "logging";
}  // namespace config_section

namespace config_key {
    // Structure section
    inline constexpr const char* DEFAULT_PALETTE = "default_palette";
    inline constexpr const char* AIR_BLOCK = "air_block";
    inline constexpr const char* BINARY_FORMAT = "binary_format";
    inline constexpr const char* OVERLAY_LAYER = "overlay_layer";

    // Logging section
    inline constexpr const char* LEVEL = "level";
}  // namespace config_key

}  // namespace voxstruct::core
