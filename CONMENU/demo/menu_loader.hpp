#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <nlohmann/json_fwd.hpp>

#include "core/menu.hpp"

// Builds menus (and nested sub-menus) from JSON documents of the form
//
//   { "props":   { ...MenuProps keys... },
//     "options": [ { "label": "Say hi", "print": "hi" },
//                  { "label": "Tap",    "counter": "taps" },
//                  { "label": "More",   "menu": { ... } } ] }
//
// A "print" option writes its text to `out`; a "counter" option bumps its
// own count and writes "<name>: <count>"; a "menu" option shows the nested
// menu. An option with none of these does nothing.
class MenuLoader {
public:
    MenuLoader(std::shared_ptr<Terminal> terminal, std::ostream& out);

    Menu build(const nlohmann::json& doc) const;
    Menu load_file(const std::string& path) const;

    // Built-in sample with a nested menu, a counter and enough rows to paginate.
    static nlohmann::json sample_document();

private:
    MenuOption build_option(const nlohmann::json& entry, std::size_t index) const;

private:
    std::shared_ptr<Terminal> terminal_;
    std::ostream& out_;
};
