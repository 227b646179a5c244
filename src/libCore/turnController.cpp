#include "core/turnController.hpp"

#include "Logging.hpp"

#include <array>
#include <cassert>
#include <format>
#include <future>
#include <memory>
#include <optional>

namespace wordgame {

bool rackHolds(const Tiles& rack, const Tiles& tiles) {
	std::array<int, 256> counts{};
	for (const auto tile: rack) {
		++counts[static_cast<unsigned char>(tile)];
	}
	for (const auto tile: tiles) {
		if (--counts[static_cast<unsigned char>(tile)] < 0) {
			return false;
		}
	}
	return true;
}

void removeFromRack(Tiles& rack, const Tiles& tiles) {
	for (const auto tile: tiles) {
		const auto pos = rack.find(tile);
		assert(pos != Tiles::npos);
		rack.erase(pos, 1);
	}
}

TurnController::TurnController(GameId gameId, std::vector<Player> players, std::unique_ptr<IDrawPool> pool,
                               std::shared_ptr<const IBoardEngine> engine)
    : m_gameId{gameId}, m_players{std::move(players)}, m_pool{std::move(pool)}, m_engine{std::move(engine)} {
	assert(m_pool && m_engine && !m_players.empty());

	for (const auto& player: m_players) {
		m_replySlots.emplace(player.id, std::make_unique<ReplySlot>());
	}
	m_thread = std::thread([this] { run(); });
}

TurnController::~TurnController() {
	shutdown();
}

void TurnController::shutdown() {
	m_accepting = false;
	m_mailbox.Release();

	if (m_thread.joinable()) {
		m_thread.join();
	}

	// Requests that slipped in after the controller thread left.
	while (!m_mailbox.Empty()) {
		const auto envelope = m_mailbox.Pop();
		m_replySlots.at(requester(envelope.request))->fill(envelope.ticket, GameStateResponse{.error = GameError::ShuttingDown, .gameId = m_gameId});
	}
}

GameStateResponse TurnController::submit(TurnRequest request, std::chrono::milliseconds timeout) {
	auto reply       = std::make_shared<std::promise<GameStateResponse>>();
	auto future      = reply->get_future();
	const auto owner = requester(request);

	const auto ticket = submitAsync(std::move(request), [reply](GameStateResponse response) { reply->set_value(std::move(response)); });
	if (ticket && future.wait_for(timeout) == std::future_status::timeout) {
		expire(owner, *ticket);
	}
	return future.get();
}

std::optional<ReplySlot::Ticket> TurnController::submitAsync(TurnRequest request, ReplySlot::Handler handler) {
	const auto slotIt = m_replySlots.find(requester(request));
	if (slotIt == m_replySlots.end()) {
		handler(GameStateResponse{.error = GameError::NotFound, .gameId = m_gameId});
		return std::nullopt;
	}
	if (!m_accepting) {
		handler(GameStateResponse{.error = GameError::ShuttingDown, .gameId = m_gameId});
		return std::nullopt;
	}

	const auto ticket = slotIt->second->arm(handler);
	if (!ticket) {
		handler(GameStateResponse{.error = GameError::RequestInFlight, .gameId = m_gameId});
		return std::nullopt;
	}

	m_mailbox.Push(Envelope{.request = std::move(request), .ticket = *ticket});
	return ticket;
}

void TurnController::expire(const PlayerId& playerId, ReplySlot::Ticket ticket) {
	const auto slotIt = m_replySlots.find(playerId);
	if (slotIt == m_replySlots.end()) {
		return;
	}

	auto handler = slotIt->second->expire(ticket);
	if (!handler) {
		return; // Replied in time.
	}

	{
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Warning, std::format("[TurnController] Game {}: no reply for player {} in time.", m_gameId.toString(), playerId.toString()));
	}
	handler(GameStateResponse{.error = GameError::Timeout, .gameId = m_gameId});
}

bool TurnController::isBusy() const {
	return m_handling || !m_mailbox.Empty();
}

void TurnController::run() {
	{
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Info, std::format("[TurnController] Game {} started with {} players.", m_gameId.toString(), m_players.size()));
	}

	while (true) {
		std::optional<Envelope> envelope;
		try {
			envelope.emplace(m_mailbox.Pop());
		} catch (const QueueReleased&) {
			break;
		}
		m_handling = true;
		process(*envelope);
		m_handling = false;
	}

	{
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Info, std::format("[TurnController] Game {} stopped.", m_gameId.toString()));
	}
}

void TurnController::process(const Envelope& envelope) {
	const auto& playerId = requester(envelope.request);
	auto& slot           = *m_replySlots.at(playerId);
	if (!slot.isArmed(envelope.ticket)) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Debug, std::format("[TurnController] Game {}: dropped expired request of player {}.", m_gameId.toString(), playerId.toString()));
		return;
	}

	GameStateResponse response;
	try {
		response = std::visit([&](const auto& r) { return handle(r); }, envelope.request);
	} catch (const std::exception& e) {
		// A failing collaborator must not take the controller down. State is untouched:
		// handlers only commit after every call succeeded.
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Error, std::format("[TurnController] Game {}: request failed: {}", m_gameId.toString(), e.what()));
		const auto* player = findPlayer(playerId);
		response           = player ? reject(*player, GameError::IllegalMove) : GameStateResponse{.error = GameError::NotFound, .gameId = m_gameId};
	}

	slot.fill(envelope.ticket, std::move(response));
}

GameStateResponse TurnController::handle(const QueryRequest& request) {
	const auto* player = findPlayer(request.playerId);
	if (!player) {
		return GameStateResponse{.error = GameError::NotFound, .gameId = m_gameId};
	}
	return stateFor(*player);
}

GameStateResponse TurnController::handle(const PlayRequest& request) {
	auto* player = findPlayer(request.playerId);
	if (!player) {
		return GameStateResponse{.error = GameError::NotFound, .gameId = m_gameId};
	}
	if (player->number != m_turnIndex) {
		return reject(*player, GameError::NotYourTurn);
	}
	if (request.tiles.empty() || !rackHolds(player->tiles, request.tiles)) {
		return reject(*player, GameError::InvalidTiles);
	}

	auto placed = m_engine->tryPlace(m_board, request.start, request.end, request.tiles);
	if (placed.error != GameError::None) {
		auto logger = Logger();
		logger.Log(Logging::LogLevel::Debug, std::format("[TurnController] Game {}: '{}' rejected play of '{}'.", m_gameId.toString(), player->name, request.tiles));
		return reject(*player, placed.error);
	}

	auto replacement = m_pool->draw(request.tiles.size());

	m_board = std::move(placed.board);
	removeFromRack(player->tiles, request.tiles);
	player->tiles += replacement;
	player->score += placed.score;
	advanceTurn();

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[TurnController] Game {}: '{}' played {} tiles for {} points.", m_gameId.toString(), player->name,
	                                                request.tiles.size(), placed.score));
	return stateFor(*player);
}

GameStateResponse TurnController::handle(const SwapRequest& request) {
	auto* player = findPlayer(request.playerId);
	if (!player) {
		return GameStateResponse{.error = GameError::NotFound, .gameId = m_gameId};
	}
	if (player->number != m_turnIndex) {
		return reject(*player, GameError::NotYourTurn);
	}
	if (request.tiles.empty() || !rackHolds(player->tiles, request.tiles)) {
		return reject(*player, GameError::InvalidTiles);
	}

	Tiles replacement;
	if (const auto error = m_pool->exchange(request.tiles, replacement); error != GameError::None) {
		return reject(*player, error);
	}

	removeFromRack(player->tiles, request.tiles);
	player->tiles += replacement;
	advanceTurn();

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[TurnController] Game {}: '{}' swapped {} tiles.", m_gameId.toString(), player->name, request.tiles.size()));
	return stateFor(*player);
}

Player* TurnController::findPlayer(const PlayerId& playerId) {
	for (auto& player: m_players) {
		if (player.id == playerId) {
			return &player;
		}
	}
	return nullptr;
}

GameStateResponse TurnController::stateFor(const Player& player) const {
	GameStateResponse response{
		.error       = GameError::None,
		.gameId      = m_gameId,
		.players     = {},
		.board       = m_board,
		.turn        = m_turnIndex,
		.playerTiles = player.tiles,
	};

	response.players.reserve(m_players.size());
	for (const auto& p: m_players) {
		response.players.push_back(PlayerView{.name = p.name, .number = p.number, .score = p.score, .rackSize = p.tiles.size()});
	}
	return response;
}

GameStateResponse TurnController::reject(const Player& player, GameError error) const {
	auto response  = stateFor(player);
	response.error = error;
	return response;
}

void TurnController::advanceTurn() {
	m_turnIndex = static_cast<unsigned>((m_turnIndex + 1) % m_players.size());
}

} // namespace wordgame
