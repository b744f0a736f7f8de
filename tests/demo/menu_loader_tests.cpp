#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "demo/menu_loader.hpp"
#include "support/scripted_terminal.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {
std::shared_ptr<ScriptedTerminal> make_terminal() {
    TerminalSize size;
    size.rows = 30;
    size.cols = 100;
    return std::make_shared<ScriptedTerminal>(size);
}
}

TEST_CASE("Print options write their text when confirmed") {
    auto term = make_terminal();
    std::ostringstream out;
    MenuLoader loader(term, out);
    Menu menu = loader.build(nlohmann::json::parse(R"({
        "props": { "title": "Demo", "exit_on_action": false },
        "options": [
            { "label": "one", "print": "first" },
            { "label": "two", "print": "second" },
            { "label": "noop" }
        ]
    })"));
    CHECK_EQ(menu.props().title, "Demo");
    REQUIRE_EQ(menu.options().size(), 3);

    term->push(Key::ENTER);
    term->push(Key::ARROW_DOWN);
    term->push(Key::ENTER);
    term->push(Key::ARROW_DOWN);
    term->push(Key::ENTER);
    term->push(Key::ESCAPE);
    menu.show();
    CHECK_EQ(out.str(), "first\nsecond\n");
}

TEST_CASE("Nested menus open from their parent option") {
    auto term = make_terminal();
    std::ostringstream out;
    MenuLoader loader(term, out);
    Menu menu = loader.build(nlohmann::json::parse(R"({
        "options": [
            { "label": "sub", "menu": { "options": [ { "label": "deep", "print": "from below" } ] } }
        ]
    })"));
    term->push(Key::ENTER);   // open the nested menu
    term->push(Key::ENTER);   // run "deep"
    menu.show();
    CHECK_EQ(out.str(), "from below\n");
    CHECK_EQ(term->keys_left(), 0);
}

TEST_CASE("Invalid documents are rejected before anything is shown") {
    auto term = make_terminal();
    std::ostringstream out;
    MenuLoader loader(term, out);
    CHECK_THROWS_AS(loader.build(nlohmann::json::parse(R"({"options": []})")), std::invalid_argument);
    CHECK_THROWS_AS(loader.build(nlohmann::json::parse(R"({})")), std::invalid_argument);
    CHECK_THROWS_AS(loader.build(nlohmann::json::parse(R"({"options": [ {"print": "x"} ]})")), std::invalid_argument);
    CHECK_THROWS_AS(loader.build(nlohmann::json::parse(R"({"options": {"label": "x"}})")), std::invalid_argument);
    CHECK_THROWS_AS(loader.build(nlohmann::json::parse(R"([1, 2])")), std::invalid_argument);
    CHECK(term->flushes().empty());
}

TEST_CASE("Menu files are loaded from disk") {
    const auto path = std::filesystem::temp_directory_path() / "conmenu_loader_tests.json";
    {
        std::ofstream f(path);
        f << R"({"props": {"message": "hi"}, "options": [{"label": "a"}, {"label": "b"}]})";
    }
    auto term = make_terminal();
    std::ostringstream out;
    MenuLoader loader(term, out);
    Menu menu = loader.load_file(path.string());
    CHECK_EQ(menu.props().message, "hi");
    CHECK_EQ(menu.options().size(), 2);
    std::filesystem::remove(path);

    CHECK_THROWS_AS(loader.load_file(path.string()), std::runtime_error);
}

TEST_CASE("Built-in sample paginates and carries a nested menu and a counter") {
    const nlohmann::json doc = MenuLoader::sample_document();
    auto term = make_terminal();
    std::ostringstream out;
    MenuLoader loader(term, out);
    Menu menu = loader.build(doc);
    CHECK(menu.options().size() > static_cast<std::size_t>(term->size().rows - 6));
    CHECK(menu.metrics().page_count > 1);
    CHECK(doc["options"][1].contains("menu"));
    REQUIRE(doc["options"][2].contains("menu"));
    CHECK_EQ(doc["options"][2]["menu"]["props"]["exit_on_action"], false);

    term->push(Key::ARROW_DOWN);
    term->push(Key::ARROW_DOWN);
    term->push(Key::ENTER);    // open the counter menu
    term->push(Key::ENTER);
    term->push(Key::ENTER);
    term->push(Key::ESCAPE);   // leave the counter menu
    menu.show();
    CHECK_EQ(out.str(), "count: 1\ncount: 2\n");
    CHECK_EQ(term->keys_left(), 0);
}

TEST_CASE("Each counter option keeps its own count") {
    auto term = make_terminal();
    std::ostringstream out;
    MenuLoader loader(term, out);
    Menu menu = loader.build(nlohmann::json::parse(R"({
        "props": { "exit_on_action": false },
        "options": [
            { "label": "apples", "counter": "apples" },
            { "label": "pears",  "counter": "pears" }
        ]
    })"));
    term->push(Key::ENTER);
    term->push(Key::ENTER);
    term->push(Key::ARROW_DOWN);
    term->push(Key::ENTER);
    term->push(Key::ARROW_UP);
    term->push(Key::ENTER);
    term->push_char('q');
    menu.show();
    CHECK_EQ(out.str(), "apples: 1\napples: 2\npears: 1\napples: 3\n");

    CHECK_THROWS_AS(loader.build(nlohmann::json::parse(R"({"options": [ {"label": "x", "counter": 3} ]})")),
                    std::invalid_argument);
}
