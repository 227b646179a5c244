#include "core/identifier.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

namespace wordgame::gtest {

TEST(Identifier, GeneratedIdsAreUnique) {
	std::unordered_set<Identifier> ids;
	for (int i = 0; i < 1000; ++i) {
		const auto id = Identifier::generate();
		EXPECT_FALSE(id.isNil());
		EXPECT_TRUE(ids.insert(id).second);
	}
}

TEST(Identifier, TextForm) {
	const auto id   = Identifier::generate();
	const auto text = id.toString();

	ASSERT_EQ(text.size(), 36u);
	EXPECT_EQ(text[8], '-');
	EXPECT_EQ(text[13], '-');
	EXPECT_EQ(text[14], '4'); // Version
	EXPECT_EQ(text[18], '-');
	EXPECT_EQ(text[23], '-');

	const auto parsed = Identifier::parse(text);
	ASSERT_TRUE(parsed.has_value());
	EXPECT_EQ(*parsed, id);
}

TEST(Identifier, ParseIsCaseInsensitive) {
	const auto lower = Identifier::parse("0f8fad5b-d9cb-469f-a165-70867728950e");
	const auto upper = Identifier::parse("0F8FAD5B-D9CB-469F-A165-70867728950E");
	ASSERT_TRUE(lower.has_value());
	ASSERT_TRUE(upper.has_value());
	EXPECT_EQ(*lower, *upper);
	EXPECT_EQ(upper->toString(), "0f8fad5b-d9cb-469f-a165-70867728950e");
}

TEST(Identifier, ParseRejectsMalformedText) {
	EXPECT_FALSE(Identifier::parse("").has_value());
	EXPECT_FALSE(Identifier::parse("0f8fad5bd9cb469fa16570867728950e").has_value());
	EXPECT_FALSE(Identifier::parse("0f8fad5b-d9cb-469f-a165-70867728950").has_value());
	EXPECT_FALSE(Identifier::parse("0f8fad5b-d9cb-469f-a165_70867728950e").has_value());
	EXPECT_FALSE(Identifier::parse("0g8fad5b-d9cb-469f-a165-70867728950e").has_value());
}

TEST(Identifier, NilIdentifier) {
	EXPECT_TRUE(Identifier{}.isNil());
	EXPECT_EQ(Identifier{}.toString(), "00000000-0000-0000-0000-000000000000");
}

} // namespace wordgame::gtest
