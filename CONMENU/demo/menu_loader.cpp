#include "menu_loader.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "ui/colors.hpp"

MenuLoader::MenuLoader(std::shared_ptr<Terminal> terminal, std::ostream& out)
: terminal_(std::move(terminal)), out_(out) {}

MenuOption MenuLoader::build_option(const nlohmann::json& entry, std::size_t index) const {
    if (!entry.is_object() || !entry.contains("label") || !entry["label"].is_string()) {
        throw std::invalid_argument("[MenuLoader] option " + std::to_string(index) + " needs a string 'label'");
    }
    const std::string label = entry["label"].get<std::string>();

    if (entry.contains("menu")) {
        auto nested = std::make_shared<Menu>(build(entry["menu"]));
        return MenuOption(label, [nested] { nested->show(); });
    }
    if (entry.contains("counter")) {
        if (!entry["counter"].is_string()) {
            throw std::invalid_argument("[MenuLoader] option " + std::to_string(index) + ": 'counter' must be a string");
        }
        const std::string name = entry["counter"].get<std::string>();
        auto count = std::make_shared<int>(0);
        std::ostream* out = &out_;
        return MenuOption(label, [out, name, count] { *out << name << ": " << ++*count << "\n"; });
    }
    if (entry.contains("print")) {
        const std::string text = entry["print"].get<std::string>();
        std::ostream* out = &out_;
        return MenuOption(label, [out, text] { *out << text << "\n"; });
    }
    return MenuOption(label, [] {});
}

Menu MenuLoader::build(const nlohmann::json& doc) const {
    if (!doc.is_object()) throw std::invalid_argument("[MenuLoader] menu document must be an object");

    MenuProps props = default_menu_props();
    if (doc.contains("props")) props = menu_props_from_json(doc["props"]);

    std::vector<MenuOption> options;
    const auto it = doc.find("options");
    if (it != doc.end()) {
        if (!it->is_array()) throw std::invalid_argument("[MenuLoader] 'options' must be an array");
        options.reserve(it->size());
        for (std::size_t i = 0; i < it->size(); ++i) {
            options.push_back(build_option((*it)[i], i));
        }
    }
    return Menu(std::move(options), std::move(props), terminal_);
}

Menu MenuLoader::load_file(const std::string& path) const {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open menu file: " + path);
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("Failed to parse menu file " + path + ": " + ex.what());
    }
    return build(doc);
}

namespace {
nlohmann::json option_entry(const std::string& label, const std::string& print) {
    nlohmann::json entry;
    entry["label"] = label;
    if (!print.empty()) entry["print"] = print;
    return entry;
}
} // namespace

nlohmann::json MenuLoader::sample_document() {
    nlohmann::json themes;
    themes["props"] = nlohmann::json::object({
        {"title", "Themes"},
        {"message", "esc to go back"},
        {"exit_on_action", true},
        {"bg_color", static_cast<int>(Colors::DARK_GRAY)},
        {"fg_color", static_cast<int>(Colors::WHITE)},
        {"selected_color", static_cast<int>(Colors::ORANGE)},
        {"msg_color", static_cast<int>(Colors::LIGHT_GRAY)}
    });
    themes["options"] = nlohmann::json::array();
    for (const char* name : {"blue", "green", "purple", "red", "orange", "yellow"}) {
        themes["options"].push_back(option_entry(name, std::string("picked ") + name));
    }

    nlohmann::json counter;
    counter["props"] = nlohmann::json::object({
        {"title", "Counter"},
        {"message", "esc to go back"},
        {"exit_on_action", false},
        {"bg_color", static_cast<int>(Colors::DARK_GRAY)},
        {"fg_color", static_cast<int>(Colors::WHITE)},
        {"selected_color", static_cast<int>(Colors::GREEN)}
    });
    nlohmann::json increment = option_entry("Increment", "");
    increment["counter"] = "count";
    counter["options"] = nlohmann::json::array({increment});

    nlohmann::json doc;
    doc["props"] = nlohmann::json::object({
        {"title", "conmenu demo"},
        {"message", "enter to select, q to quit"},
        {"exit_on_action", true},
        {"bg_color", static_cast<int>(Colors::BLUE)},
        {"fg_color", static_cast<int>(Colors::WHITE)},
        {"title_color", static_cast<int>(Colors::YELLOW)},
        {"selected_color", static_cast<int>(Colors::BLACK)},
        {"msg_color", static_cast<int>(Colors::LIGHT_GRAY)}
    });
    doc["options"] = nlohmann::json::array();
    doc["options"].push_back(option_entry("Say hello", "hello"));
    nlohmann::json nested = option_entry("Themes", "");
    nested["menu"] = themes;
    doc["options"].push_back(nested);
    nlohmann::json counting = option_entry("Counter", "");
    counting["menu"] = counter;
    doc["options"].push_back(counting);
    for (int i = 1; i <= 24; ++i) {
        doc["options"].push_back(option_entry("Filler row " + std::to_string(i), ""));
    }
    return doc;
}
