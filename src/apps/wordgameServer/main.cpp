#include "server/config.hpp"
#include "server/gameServer.hpp"

#include "core/wordList.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

int main(int argc, char** argv) {
	using namespace wordgame;

	std::string error;
	const auto config = server::parseArguments(std::vector<std::string>(argv + 1, argv + argc), error);
	if (!config) {
		std::cerr << error << "\n" << server::usage(argv[0]);
		return 2;
	}
	if (config->showHelp) {
		std::cout << server::usage(argv[0]);
		return 0;
	}

	auto words = std::make_shared<WordList>();
	if (!config->wordListPath.empty() && !words->load(config->wordListPath)) {
		std::cerr << "Could not read word list '" << config->wordListPath << "'.\n";
		return 1;
	}

	std::unique_ptr<server::GameServer> gameServer;
	try {
		gameServer = std::make_unique<server::GameServer>(*config, server::makeGameSettings(*config, words));
	} catch (const std::system_error& e) {
		std::cerr << "Could not listen on port " << config->port << ": " << e.what() << "\n";
		return 1;
	}
	gameServer->start();

	// Keep the server process alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	gameServer->stop();
	return 0;
}
