#include <gtest/gtest.h>

#include "match/DescriptorCodec.hpp"
#include "FakeCollaborators.hpp"

TEST(DescriptorCodec, EncodesAsJsonArray)
{
	const QString s = DescriptorCodec::encode(FaceEmbedding{0.5f, -1.0f, 2.0f});
	EXPECT_TRUE(s.startsWith('['));
	EXPECT_TRUE(s.endsWith(']'));

	const auto back = DescriptorCodec::decode(s);
	ASSERT_TRUE(back.has_value());
	ASSERT_EQ(back->size(), 3u);
	EXPECT_FLOAT_EQ((*back)[0], 0.5f);
	EXPECT_FLOAT_EQ((*back)[1], -1.0f);
	EXPECT_FLOAT_EQ((*back)[2], 2.0f);
}

TEST(DescriptorCodec, RejectsMalformedText)
{
	EXPECT_FALSE(DescriptorCodec::decode("").has_value());
	EXPECT_FALSE(DescriptorCodec::decode("not json").has_value());
	EXPECT_FALSE(DescriptorCodec::decode("[]").has_value());
	EXPECT_FALSE(DescriptorCodec::decode("{\"a\":1}").has_value());
	EXPECT_FALSE(DescriptorCodec::decode("[1, \"x\", 3]").has_value());
	EXPECT_FALSE(DescriptorCodec::decode("[1, null]").has_value());
	EXPECT_FALSE(DescriptorCodec::decode("[0.1, 0.2").has_value());
}

TEST(DescriptorCodec, GroupsRowsAndSkipsBrokenOnes)
{
	const std::vector<DescriptorRow> rows = {
		{"bob",   "[1,0,0,0]"},
		{"alice", "[0,0,0,0]"},
		{"alice", "garbage"},
		{"alice", "[0.1,0,0,0]"},
		{"bob",   "[1,0]"},				// 소수 차원
		{"carol", "[]"},
	};

	DescriptorCodec::GroupStats st;
	const auto g = DescriptorCodec::groupByIdentity(rows, 0, &st);

	EXPECT_EQ(st.rows, 6);
	EXPECT_EQ(st.skipped, 3);
	EXPECT_EQ(st.identities, 2);
	ASSERT_EQ(g.count("alice"), 1u);
	EXPECT_EQ(g.at("alice").size(), 2u);
	EXPECT_EQ(g.at("bob").size(), 1u);
	EXPECT_EQ(g.count("carol"), 0u);
}

TEST(DescriptorCodec, ExpectedDimensionWins)
{
	const std::vector<DescriptorRow> rows = {
		{"a", "[1,2]"},
		{"b", "[1,2,3,4]"},
	};
	const auto g = DescriptorCodec::groupByIdentity(rows, 4);
	EXPECT_EQ(g.count("a"), 0u);
	EXPECT_EQ(g.count("b"), 1u);
}

TEST(DescriptorCodec, MajorityDimensionIgnoresRowOrder)
{
	// 첫 행이 깨진 1차원이어도 다수(4차원) 기준으로 묶인다
	const std::vector<DescriptorRow> rows = {
		{"aaron", "[0.5]"},
		{"alice", "[0,0,0,0]"},
		{"bob",   "[1,0,0,0]"},
	};

	DescriptorCodec::GroupStats st;
	const auto g = DescriptorCodec::groupByIdentity(rows, 0, &st);

	EXPECT_EQ(st.skipped, 1);
	EXPECT_EQ(g.count("aaron"), 0u);
	EXPECT_EQ(g.count("alice"), 1u);
	EXPECT_EQ(g.count("bob"), 1u);
}

TEST(DescriptorCodec, DominantDimensionPrefersCountThenLarger)
{
	EXPECT_EQ(DescriptorCodec::dominantDimension({}), 0u);
	EXPECT_EQ(DescriptorCodec::dominantDimension({{1, 1}, {128, 3}}), 128u);
	EXPECT_EQ(DescriptorCodec::dominantDimension({{2, 5}, {128, 3}}), 2u);
	EXPECT_EQ(DescriptorCodec::dominantDimension({{2, 2}, {4, 2}}), 4u);
}
