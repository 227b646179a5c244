#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace wordgame {

//! Random 128 bit identifier printed as a version 4 UUID.
//! Uniqueness is probabilistic; there is no collision check.
class Identifier {
public:
	using Bytes = std::array<std::uint8_t, 16>;

	Identifier() = default; //!< The nil identifier. Never returned by generate().

	static Identifier generate();
	static std::optional<Identifier> parse(std::string_view text); //!< Accepts the 8-4-4-4-12 hex form only.

	std::string toString() const;
	bool isNil() const;
	const Bytes& bytes() const;

	bool operator==(const Identifier&) const = default;

private:
	explicit Identifier(const Bytes& bytes);

private:
	Bytes m_bytes{};
};

using GameId   = Identifier;
using PlayerId = Identifier;

} // namespace wordgame

template <>
struct std::hash<wordgame::Identifier> {
	std::size_t operator()(const wordgame::Identifier& id) const noexcept {
		// Random bytes; folding the first eight is enough spread.
		std::size_t value = 0;
		for (std::size_t i = 0; i < sizeof(std::size_t) && i < id.bytes().size(); ++i) {
			value = (value << 8) | id.bytes()[i];
		}
		return value;
	}
};
