#include "core/game.hpp"

#include "Logging.hpp"

#include <format>

namespace wordgame {

Game::Game(GameId id, GameSettings settings)
    : m_id{id}, m_settings{std::move(settings)}, m_lastActivity{std::chrono::steady_clock::now().time_since_epoch().count()} {
}

Game::~Game() {
	// Stop the controller thread before the rest of the game goes away.
	m_controller.reset();
}

const GameId& Game::id() const {
	return m_id;
}

GameError Game::addPlayer(std::string name, PlayerId& playerId) {
	touch();

	std::lock_guard<std::mutex> lock(m_lobbyMutex);
	if (m_active) {
		return GameError::AlreadyStarted;
	}
	if (m_lobby.size() >= MAX_PLAYERS) {
		return GameError::GameFull;
	}

	auto& player  = m_lobby.emplace_back();
	player.id     = PlayerId::generate();
	player.name   = std::move(name);
	player.number = static_cast<unsigned>(m_lobby.size() - 1);
	m_playerCount = m_lobby.size();

	playerId = player.id;

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[Game] '{}' joined game {} as player {}.", player.name, m_id.toString(), player.number));
	return GameError::None;
}

GameError Game::start() {
	touch();

	std::lock_guard<std::mutex> lock(m_lobbyMutex);
	if (m_active) {
		return GameError::AlreadyStarted;
	}
	if (m_lobby.size() < MIN_PLAYERS) {
		return GameError::NotEnoughPlayers;
	}

	auto pool = m_settings.makeDrawPool();
	for (auto& player: m_lobby) {
		player.tiles = pool->draw(RACK_SIZE);
	}

	// Hand over. From here on only the controller thread touches racks, board and turn.
	m_controller = std::make_unique<TurnController>(m_id, std::move(m_lobby), std::move(pool), m_settings.engine);
	m_lobby.clear();
	m_active.store(true, std::memory_order_release);

	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[Game] Game {} started with {} players.", m_id.toString(), m_playerCount));
	return GameError::None;
}

GameStateResponse Game::request(TurnRequest request) {
	if (!m_active.load(std::memory_order_acquire)) {
		return GameStateResponse{.error = GameError::NotStarted, .gameId = m_id};
	}

	touch();
	return m_controller->submit(std::move(request), m_settings.replyTimeout);
}

std::optional<ReplySlot::Ticket> Game::requestAsync(TurnRequest request, ReplySlot::Handler handler) {
	if (!m_active.load(std::memory_order_acquire)) {
		handler(GameStateResponse{.error = GameError::NotStarted, .gameId = m_id});
		return std::nullopt;
	}

	touch();
	return m_controller->submitAsync(std::move(request), std::move(handler));
}

void Game::expire(const PlayerId& playerId, ReplySlot::Ticket ticket) {
	if (m_active.load(std::memory_order_acquire)) {
		m_controller->expire(playerId, ticket);
	}
}

std::chrono::milliseconds Game::replyTimeout() const {
	return m_settings.replyTimeout;
}

bool Game::isActive() const {
	return m_active.load(std::memory_order_acquire);
}

bool Game::isBusy() const {
	return isActive() && m_controller->isBusy();
}

std::size_t Game::playerCount() const {
	std::lock_guard<std::mutex> lock(m_lobbyMutex);
	return m_playerCount;
}

std::chrono::steady_clock::time_point Game::lastActivity() const {
	return std::chrono::steady_clock::time_point{std::chrono::steady_clock::duration{m_lastActivity.load()}};
}

void Game::touch() {
	m_lastActivity = std::chrono::steady_clock::now().time_since_epoch().count();
}

} // namespace wordgame
