#include "core/identifier.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace wordgame {

static constexpr std::size_t TEXT_LENGTH = 36;

static bool isDashPosition(std::size_t pos) {
	return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

static int hexValue(char c) {
	if (c >= '0' && c <= '9') {
		return c - '0';
	}
	if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	}
	if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

Identifier::Identifier(const Bytes& bytes) : m_bytes{bytes} {
}

Identifier Identifier::generate() {
	// One engine per thread, seeded once from the random device.
	thread_local std::mt19937_64 engine{[] {
		std::random_device rd;
		std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
		return std::mt19937_64{seq};
	}()};

	Bytes bytes{};
	for (std::size_t i = 0; i < bytes.size(); i += 8) {
		auto value = engine();
		for (std::size_t j = 0; j < 8; ++j) {
			bytes[i + j] = static_cast<std::uint8_t>(value & 0xFFu);
			value >>= 8;
		}
	}

	bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0Fu) | 0x40u); // Version 4
	bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3Fu) | 0x80u); // RFC 4122 variant
	return Identifier{bytes};
}

std::optional<Identifier> Identifier::parse(std::string_view text) {
	if (text.size() != TEXT_LENGTH) {
		return std::nullopt;
	}

	Bytes bytes{};
	std::size_t byteIndex = 0;
	for (std::size_t pos = 0; pos < text.size();) {
		if (isDashPosition(pos)) {
			if (text[pos] != '-') {
				return std::nullopt;
			}
			++pos;
			continue;
		}

		const auto high = hexValue(text[pos]);
		const auto low  = hexValue(text[pos + 1]);
		if (high < 0 || low < 0) {
			return std::nullopt;
		}
		bytes[byteIndex++] = static_cast<std::uint8_t>((high << 4) | low);
		pos += 2;
	}

	return Identifier{bytes};
}

std::string Identifier::toString() const {
	std::ostringstream oss;
	for (std::size_t i = 0; i < m_bytes.size(); ++i) {
		if (i == 4 || i == 6 || i == 8 || i == 10) {
			oss << '-';
		}
		oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(m_bytes[i]);
	}
	return oss.str();
}

bool Identifier::isNil() const {
	for (const auto byte: m_bytes) {
		if (byte != 0) {
			return false;
		}
	}
	return true;
}

const Identifier::Bytes& Identifier::bytes() const {
	return m_bytes;
}

} // namespace wordgame
