#include "menu_props.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::uint8_t parse_color(const nlohmann::json& value, const std::string& key) {
    if (value.is_string()) {
        const std::string name = value.get<std::string>();
        const int idx = Colors::by_name(name.c_str());
        if (idx < 0) throw std::invalid_argument("[MenuProps] unknown color name for '" + key + "': " + name);
        return static_cast<std::uint8_t>(idx);
    }
    if (!value.is_number_integer()) {
        throw std::invalid_argument("[MenuProps] '" + key + "' must be an integer or color name");
    }
    const long long raw = value.get<long long>();
    if (raw < 0 || raw > 255) {
        throw std::invalid_argument("[MenuProps] '" + key + "' out of range 0-255: " + std::to_string(raw));
    }
    return static_cast<std::uint8_t>(raw);
}

void read_color(const nlohmann::json& j, const char* key, std::uint8_t& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    out = parse_color(*it, key);
}

void read_optional_color(const nlohmann::json& j, const char* key, std::optional<std::uint8_t>& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (it->is_null()) {
        out.reset();
        return;
    }
    out = parse_color(*it, key);
}

template <typename T>
void read_value(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::type_error&) {
        throw std::invalid_argument(std::string("[MenuProps] '") + key + "' has the wrong type: " + it->type_name());
    }
}

nlohmann::json optional_color_json(const std::optional<std::uint8_t>& c) {
    if (!c) return nullptr;
    return static_cast<int>(*c);
}

} // namespace

MenuStyle MenuStyle::resolve(const MenuProps& props) {
    MenuStyle s;
    s.bg       = props.bg_color;
    s.fg       = props.fg_color;
    s.title    = props.title_color.value_or(props.fg_color);
    s.selected = props.selected_color.value_or(props.fg_color);
    s.msg      = props.msg_color.value_or(props.fg_color);
    return s;
}

MenuProps default_menu_props() {
    return MenuProps{};
}

MenuProps menu_props_from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::invalid_argument("[MenuProps] expected a JSON object");
    MenuProps props = default_menu_props();
    read_value(j, "title", props.title);
    read_value(j, "message", props.message);
    read_value(j, "exit_on_action", props.exit_on_action);
    read_value(j, "reserved_rows", props.reserved_rows);
    read_value(j, "log_path", props.log_path);
    if (props.reserved_rows < 0) {
        throw std::invalid_argument("[MenuProps] 'reserved_rows' must not be negative");
    }
    read_color(j, "bg_color", props.bg_color);
    read_color(j, "fg_color", props.fg_color);
    read_optional_color(j, "title_color", props.title_color);
    read_optional_color(j, "selected_color", props.selected_color);
    read_optional_color(j, "msg_color", props.msg_color);
    return props;
}

nlohmann::json menu_props_to_json(const MenuProps& props) {
    nlohmann::json j;
    j["title"]          = props.title;
    j["message"]        = props.message;
    j["exit_on_action"] = props.exit_on_action;
    j["bg_color"]       = static_cast<int>(props.bg_color);
    j["fg_color"]       = static_cast<int>(props.fg_color);
    j["title_color"]    = optional_color_json(props.title_color);
    j["selected_color"] = optional_color_json(props.selected_color);
    j["msg_color"]      = optional_color_json(props.msg_color);
    j["reserved_rows"]  = props.reserved_rows;
    j["log_path"]       = props.log_path;
    return j;
}

MenuProps load_menu_props(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open menu config: " + path);
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("Failed to parse menu config " + path + ": " + ex.what());
    }
    return menu_props_from_json(j);
}

bool save_menu_props(const std::string& path, const MenuProps& props) {
    try {
        fs::path p(path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        std::ofstream out(path);
        if (!out) return false;
        out << menu_props_to_json(props).dump(4);
        return static_cast<bool>(out);
    } catch (const std::exception& ex) {
        std::cerr << "[MenuProps] save failed: " << ex.what() << "\n";
        return false;
    }
}
