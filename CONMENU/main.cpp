#include "core/menu.hpp"
#include "demo/menu_loader.hpp"
#include "utils/terminal.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
	if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))) {
		std::cout << "usage: " << argv[0] << " [menu.json]\n";
		return argc > 2 ? 2 : 0;
	}
	try {
		MenuLoader loader(Terminal::standard(), std::cout);
		Menu menu = (argc == 2) ? loader.load_file(argv[1])
		                        : loader.build(MenuLoader::sample_document());
		menu.show();
	} catch (const std::exception& ex) {
		std::cerr << "[Main] " << ex.what() << "\n";
		return 1;
	}
	return 0;
}
