// VoxStruct Core
// config.cpp - JSON-backed configuration implementation

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <voxstruct/core/config.hpp>
#include <voxstruct/core/logger.hpp>

namespace voxstruct::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

    const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &*key_it;
    }

    template<typename T>
    void assign(std::string_view section, std::string_view key, T&& value) {
        data[std::string(section)][std::string(key)] = std::forward<T>(value);
        dirty = true;
        if (change_callback) {
            change_callback(section, key);
        }
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        VOXSTRUCT_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_from_string(buffer.str())) {
        return false;
    }

    impl_->path = path;
    VOXSTRUCT_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view content) {
    try {
        json parsed = json::parse(content);
        if (!parsed.is_object()) {
            VOXSTRUCT_LOG_ERROR(log_category::CONFIG, "Config root must be an object");
            return false;
        }

        // Keys absent from the document keep their defaults
        set_defaults();
        impl_->data.merge_patch(parsed);
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        VOXSTRUCT_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    std::error_code ec;
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        if (!std::filesystem::create_directories(parent, ec)) {
            VOXSTRUCT_LOG_ERROR(log_category::CONFIG, "Failed to create config directory: {}", parent.string());
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        VOXSTRUCT_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }
    file << impl_->data.dump(4);
    if (!file.good()) {
        VOXSTRUCT_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    VOXSTRUCT_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        VOXSTRUCT_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
        return false;
    }
    return save(impl_->path);
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (!save(path)) {
        VOXSTRUCT_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_number_integer()) {
        return value->get<int>();
    }
    return default_value;
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_boolean()) {
        return value->get<bool>();
    }
    return default_value;
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_string()) {
        return value->get<std::string>();
    }
    return std::string(default_value);
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->assign(section, key, value);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->assign(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->assign(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->data[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::STRUCTURE,
                        {{config_key::DEFAULT_PALETTE, "default"},
                         {config_key::AIR_BLOCK, "minecraft:air"},
                         {config_key::BINARY_FORMAT, "cbor"},
                         {config_key::OVERLAY_LAYER, true}}},
                       {config_section::LOGGING, {{config_key::LEVEL, "info"}}}};
    impl_->dirty = true;
}

LoggerConfig make_logger_config(const Config& config) {
    LoggerConfig logger_config;
    std::string level = config.get_string(config_section::LOGGING, config_key::LEVEL, "info");
    if (auto parsed = parse_log_level(level)) {
        logger_config.console_level = *parsed;
    } else {
        VOXSTRUCT_LOG_WARN(log_category::CONFIG, "Unknown log level '{}', using info", level);
    }
    return logger_config;
}

}  // namespace voxstruct::core
