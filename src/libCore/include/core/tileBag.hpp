#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <random>

namespace wordgame {

//! Source of replacement tiles for one game.
class IDrawPool {
public:
	virtual ~IDrawPool() = default;

	//! Remove up to count tiles from the pool. Returns fewer when the pool runs low.
	virtual Tiles draw(std::size_t count) = 0;

	//! Draw tiles.size() new tiles, then return the given tiles to the pool.
	//! \returns NotEnoughTiles (and changes nothing) if the pool cannot cover the exchange.
	virtual GameError exchange(const Tiles& tiles, Tiles& replacement) = 0;

	virtual std::size_t remaining() const = 0;
};

//! English letter distribution without blanks.
class TileBag : public IDrawPool {
public:
	explicit TileBag(std::optional<std::uint32_t> seed = std::nullopt);

	Tiles draw(std::size_t count) override;
	GameError exchange(const Tiles& tiles, Tiles& replacement) override;
	std::size_t remaining() const override;

private:
	void shuffle();

private:
	Tiles m_tiles;         //!< Remaining tiles. Drawn from the back.
	std::mt19937 m_random; //!< Shuffles after every refill.
};

//! Number of tiles of a letter in a full bag.
unsigned tileCount(Tile tile);

//! Face value of a letter.
unsigned tileScore(Tile tile);

} // namespace wordgame
