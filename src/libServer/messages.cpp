#include "server/messages.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <vector>

namespace wordgame::server {

static constexpr std::string_view CLIENT_CREATE = "CREATE";
static constexpr std::string_view CLIENT_JOIN   = "JOIN:";
static constexpr std::string_view CLIENT_START  = "START:";
static constexpr std::string_view CLIENT_STATE  = "STATE:";
static constexpr std::string_view CLIENT_PLAY   = "PLAY:";
static constexpr std::string_view CLIENT_SWAP   = "SWAP:";

static constexpr std::string_view SERVER_CREATED = "CREATED:";
static constexpr std::string_view SERVER_JOINED  = "JOINED:";
static constexpr std::string_view SERVER_STARTED = "STARTED:";
static constexpr std::string_view SERVER_STATE   = "STATE:";
static constexpr std::string_view SERVER_ERROR   = "ERROR:";

static constexpr std::string_view NAME_FORBIDDEN = ",;|=:/";

static std::vector<std::string_view> split(std::string_view text, char separator) {
	std::vector<std::string_view> parts;
	std::size_t begin = 0;
	while (true) {
		const auto pos = text.find(separator, begin);
		if (pos == std::string_view::npos) {
			parts.push_back(text.substr(begin));
			return parts;
		}
		parts.push_back(text.substr(begin, pos - begin));
		begin = pos + 1;
	}
}

template <class Number>
static bool parseNumber(std::string_view value, Number& out) {
	if (value.empty()) {
		return false;
	}
	const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
	return ec == std::errc{} && ptr == value.data() + value.size();
}

static std::optional<Coord> parseCoord(std::string_view value) {
	const auto parts = split(value, '|');
	Coord c{};
	if (parts.size() != 2 || !parseNumber(parts[0], c.x) || !parseNumber(parts[1], c.y)) {
		return std::nullopt;
	}
	return c;
}

static bool isTileList(std::string_view value) {
	return std::all_of(value.begin(), value.end(), isTile);
}

static std::optional<network::Message> checkedSize(std::string message) {
	if (message.size() > network::MAX_PAYLOAD_BYTES) {
		return std::nullopt;
	}
	return message;
}

bool isValidPlayerName(std::string_view name) {
	if (name.empty() || name.size() > MAX_NAME_LENGTH) {
		return false;
	}
	return std::all_of(name.begin(), name.end(), [](char c) { return c >= 0x20 && c <= 0x7E && NAME_FORBIDDEN.find(c) == std::string_view::npos; });
}

//
// Client -> server
//

static std::optional<network::Message> toMessage(const CreateGameRequest&) {
	return std::string{CLIENT_CREATE};
}
static std::optional<network::Message> toMessage(const JoinGameRequest& r) {
	if (!isValidPlayerName(r.playerName)) {
		return std::nullopt;
	}
	return std::format("{}{},{}", CLIENT_JOIN, r.gameId.toString(), r.playerName);
}
static std::optional<network::Message> toMessage(const StartGameRequest& r) {
	return std::format("{}{}", CLIENT_START, r.gameId.toString());
}
static std::optional<network::Message> toMessage(const StateRequest& r) {
	return std::format("{}{},{}", CLIENT_STATE, r.gameId.toString(), r.playerId.toString());
}
static std::optional<network::Message> toMessage(const PlayTilesRequest& r) {
	if (!isTileList(r.tiles)) {
		return std::nullopt;
	}
	return std::format("{}{},{},{}|{},{}|{},{}", CLIENT_PLAY, r.gameId.toString(), r.playerId.toString(), r.start.x, r.start.y, r.end.x, r.end.y, r.tiles);
}
static std::optional<network::Message> toMessage(const SwapTilesRequest& r) {
	if (!isTileList(r.tiles)) {
		return std::nullopt;
	}
	return std::format("{}{},{},{}", CLIENT_SWAP, r.gameId.toString(), r.playerId.toString(), r.tiles);
}

std::optional<network::Message> toMessage(const ClientRequest& request) {
	const auto message = std::visit([](const auto& r) { return toMessage(r); }, request);
	if (!message) {
		return std::nullopt;
	}
	return checkedSize(*message);
}

std::optional<ClientRequest> fromClientMessage(std::string_view message) {
	if (message == CLIENT_CREATE) {
		return CreateGameRequest{};
	}

	if (message.starts_with(CLIENT_JOIN)) {
		// Expect "JOIN:game,name"
		const auto payload = message.substr(CLIENT_JOIN.size());
		const auto comma   = payload.find(',');
		if (comma == std::string_view::npos) {
			return {};
		}
		const auto gameId = GameId::parse(payload.substr(0, comma));
		const auto name   = payload.substr(comma + 1);
		if (!gameId || !isValidPlayerName(name)) {
			return {};
		}
		return JoinGameRequest{.gameId = *gameId, .playerName = std::string{name}};
	}

	if (message.starts_with(CLIENT_START)) {
		const auto gameId = GameId::parse(message.substr(CLIENT_START.size()));
		if (!gameId) {
			return {};
		}
		return StartGameRequest{.gameId = *gameId};
	}

	if (message.starts_with(CLIENT_STATE)) {
		const auto parts = split(message.substr(CLIENT_STATE.size()), ',');
		if (parts.size() != 2) {
			return {};
		}
		const auto gameId   = GameId::parse(parts[0]);
		const auto playerId = PlayerId::parse(parts[1]);
		if (!gameId || !playerId) {
			return {};
		}
		return StateRequest{.gameId = *gameId, .playerId = *playerId};
	}

	if (message.starts_with(CLIENT_PLAY)) {
		// Expect "PLAY:game,player,sx|sy,ex|ey,TILES"
		const auto parts = split(message.substr(CLIENT_PLAY.size()), ',');
		if (parts.size() != 5) {
			return {};
		}
		const auto gameId   = GameId::parse(parts[0]);
		const auto playerId = PlayerId::parse(parts[1]);
		const auto start    = parseCoord(parts[2]);
		const auto end      = parseCoord(parts[3]);
		if (!gameId || !playerId || !start || !end || !isTileList(parts[4])) {
			return {};
		}
		return PlayTilesRequest{.gameId = *gameId, .playerId = *playerId, .start = *start, .end = *end, .tiles = Tiles{parts[4]}};
	}

	if (message.starts_with(CLIENT_SWAP)) {
		const auto parts = split(message.substr(CLIENT_SWAP.size()), ',');
		if (parts.size() != 3) {
			return {};
		}
		const auto gameId   = GameId::parse(parts[0]);
		const auto playerId = PlayerId::parse(parts[1]);
		if (!gameId || !playerId || !isTileList(parts[2])) {
			return {};
		}
		return SwapTilesRequest{.gameId = *gameId, .playerId = *playerId, .tiles = Tiles{parts[2]}};
	}

	// Invalid
	return {};
}

//
// Server -> client
//

static std::optional<network::Message> toMessage(const GameCreatedReply& r) {
	return std::format("{}{}", SERVER_CREATED, r.gameId.toString());
}
static std::optional<network::Message> toMessage(const JoinedReply& r) {
	return std::format("{}{},{}", SERVER_JOINED, r.gameId.toString(), r.playerId.toString());
}
static std::optional<network::Message> toMessage(const StartedReply& r) {
	return std::format("{}{}", SERVER_STARTED, r.gameId.toString());
}
static std::optional<network::Message> toMessage(const StateReply& r) {
	const auto& state = r.state;

	std::string players;
	for (const auto& player: state.players) {
		if (!isValidPlayerName(player.name)) {
			return std::nullopt;
		}
		if (!players.empty()) {
			players.push_back(',');
		}
		players += std::format("{}|{}|{}|{}", player.name, player.number, player.score, player.rackSize);
	}

	std::string board;
	board.reserve(BOARD_SIZE * (BOARD_SIZE + 1));
	for (std::size_t y = 0; y < BOARD_SIZE; ++y) {
		if (y) {
			board.push_back('/');
		}
		board += state.board.row(y);
	}

	if (!isTileList(state.playerTiles)) {
		return std::nullopt;
	}
	return std::format("{}game={};turn={};tiles={};players={};board={}", SERVER_STATE, state.gameId.toString(), state.turn, state.playerTiles, players, board);
}
static std::optional<network::Message> toMessage(const ErrorReply& r) {
	return std::format("{}{}", SERVER_ERROR, r.reason);
}

std::optional<network::Message> toMessage(const ServerReply& reply) {
	const auto message = std::visit([](const auto& r) { return toMessage(r); }, reply);
	if (!message) {
		return std::nullopt;
	}
	return checkedSize(*message);
}

static bool parsePlayers(std::string_view value, std::vector<PlayerView>& players) {
	if (value.empty()) {
		return true;
	}
	for (const auto entry: split(value, ',')) {
		const auto fields = split(entry, '|');
		PlayerView view;
		if (fields.size() != 4 || !isValidPlayerName(fields[0]) || !parseNumber(fields[1], view.number) || !parseNumber(fields[2], view.score) ||
		    !parseNumber(fields[3], view.rackSize)) {
			return false;
		}
		view.name = std::string{fields[0]};
		players.push_back(std::move(view));
	}
	return true;
}

static bool parseBoard(std::string_view value, Board& board) {
	const auto rows = split(value, '/');
	if (rows.size() != BOARD_SIZE) {
		return false;
	}
	for (unsigned y = 0; y < BOARD_SIZE; ++y) {
		if (rows[y].size() != BOARD_SIZE) {
			return false;
		}
		for (unsigned x = 0; x < BOARD_SIZE; ++x) {
			const auto square = rows[y][x];
			if (square == '.') {
				continue;
			}
			if (!isTile(square)) {
				return false;
			}
			board.set(Coord{x, y}, square);
		}
	}
	return true;
}

static std::optional<ServerReply> fromServerStateMessage(std::string_view payload) {
	static constexpr std::array<std::string_view, 5> KEYS{"game", "turn", "tiles", "players", "board"};

	GameStateResponse state;
	unsigned seen = 0; // Bit per key in KEYS.

	for (const auto field: split(payload, ';')) {
		const auto eq = field.find('=');
		if (eq == std::string_view::npos) {
			return {};
		}
		const auto key   = field.substr(0, eq);
		const auto value = field.substr(eq + 1);

		const auto keyIt = std::find(KEYS.begin(), KEYS.end(), key);
		if (keyIt == KEYS.end()) {
			return {};
		}
		const auto bit = 1u << static_cast<unsigned>(keyIt - KEYS.begin());
		if (seen & bit) {
			return {}; // Repeated key.
		}
		seen |= bit;

		if (key == "game") {
			const auto gameId = GameId::parse(value);
			if (!gameId) {
				return {};
			}
			state.gameId = *gameId;
		} else if (key == "turn") {
			if (!parseNumber(value, state.turn)) {
				return {};
			}
		} else if (key == "tiles") {
			if (!isTileList(value)) {
				return {};
			}
			state.playerTiles = Tiles{value};
		} else if (key == "players") {
			if (!parsePlayers(value, state.players)) {
				return {};
			}
		} else if (key == "board") {
			if (!parseBoard(value, state.board)) {
				return {};
			}
		}
	}

	if (seen != (1u << KEYS.size()) - 1) {
		return {};
	}
	return StateReply{.state = std::move(state)};
}

std::optional<ServerReply> fromServerMessage(std::string_view message) {
	if (message.starts_with(SERVER_CREATED)) {
		const auto gameId = GameId::parse(message.substr(SERVER_CREATED.size()));
		if (!gameId) {
			return {};
		}
		return GameCreatedReply{.gameId = *gameId};
	}

	if (message.starts_with(SERVER_JOINED)) {
		const auto parts = split(message.substr(SERVER_JOINED.size()), ',');
		if (parts.size() != 2) {
			return {};
		}
		const auto gameId   = GameId::parse(parts[0]);
		const auto playerId = PlayerId::parse(parts[1]);
		if (!gameId || !playerId) {
			return {};
		}
		return JoinedReply{.gameId = *gameId, .playerId = *playerId};
	}

	if (message.starts_with(SERVER_STARTED)) {
		const auto gameId = GameId::parse(message.substr(SERVER_STARTED.size()));
		if (!gameId) {
			return {};
		}
		return StartedReply{.gameId = *gameId};
	}

	if (message.starts_with(SERVER_STATE)) {
		return fromServerStateMessage(message.substr(SERVER_STATE.size()));
	}

	if (message.starts_with(SERVER_ERROR)) {
		const auto reason = message.substr(SERVER_ERROR.size());
		if (reason.empty()) {
			return {};
		}
		return ErrorReply{.reason = std::string{reason}};
	}

	// Invalid
	return {};
}

} // namespace wordgame::server
