#include "core/types.hpp"

#include <array>
#include <utility>

namespace wordgame {

static constexpr std::array<std::pair<GameError, std::string_view>, 13> ERROR_NAMES{{
	{GameError::None, "None"},
	{GameError::NotFound, "NotFound"},
	{GameError::GameFull, "GameFull"},
	{GameError::AlreadyStarted, "AlreadyStarted"},
	{GameError::NotEnoughPlayers, "NotEnoughPlayers"},
	{GameError::NotStarted, "NotStarted"},
	{GameError::NotYourTurn, "NotYourTurn"},
	{GameError::IllegalMove, "IllegalMove"},
	{GameError::InvalidTiles, "InvalidTiles"},
	{GameError::NotEnoughTiles, "NotEnoughTiles"},
	{GameError::RequestInFlight, "RequestInFlight"},
	{GameError::Timeout, "Timeout"},
	{GameError::ShuttingDown, "ShuttingDown"},
}};

std::string_view toString(GameError error) {
	for (const auto& [value, name]: ERROR_NAMES) {
		if (value == error) {
			return name;
		}
	}
	return "Unknown";
}

std::optional<GameError> gameErrorFromString(std::string_view value) {
	for (const auto& [error, name]: ERROR_NAMES) {
		if (name == value) {
			return error;
		}
	}
	return std::nullopt;
}

} // namespace wordgame
