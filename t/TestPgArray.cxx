#include "pg/Array.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using Pg::DecodeArray;
using Pg::EncodeArray;

using StringList = std::vector<std::string>;

TEST(PgArray, Decode)
{
	EXPECT_TRUE(DecodeArray(nullptr).empty());
	EXPECT_TRUE(DecodeArray("").empty());
	EXPECT_TRUE(DecodeArray("{}").empty());

	EXPECT_EQ(DecodeArray("{node1}"), StringList{"node1"});
	EXPECT_EQ(DecodeArray("{node1,node2}"),
		  (StringList{"node1", "node2"}));
	EXPECT_EQ(DecodeArray("{\"a b\",c}"), (StringList{"a b", "c"}));
	EXPECT_EQ(DecodeArray("{\"a\\\"b\",\"c\\\\d\"}"),
		  (StringList{"a\"b", "c\\d"}));
	EXPECT_EQ(DecodeArray("{\"\"}"), StringList{""});
}

TEST(PgArray, DecodeErrors)
{
	EXPECT_THROW(DecodeArray("node1"), std::invalid_argument);
	EXPECT_THROW(DecodeArray("{node1"), std::invalid_argument);
	EXPECT_THROW(DecodeArray("{\"node1}"), std::invalid_argument);
	EXPECT_THROW(DecodeArray("{\"a\"b}"), std::invalid_argument);
	EXPECT_THROW(DecodeArray("{{a}}"), std::invalid_argument);
	EXPECT_THROW(DecodeArray("{a}x"), std::invalid_argument);
}

TEST(PgArray, Encode)
{
	EXPECT_EQ(EncodeArray({}), "{}");
	EXPECT_EQ(EncodeArray({"node1"}), "{\"node1\"}");
	EXPECT_EQ(EncodeArray({"a b", "c"}), "{\"a b\",\"c\"}");
	EXPECT_EQ(EncodeArray({"a\"b", "c\\d"}), "{\"a\\\"b\",\"c\\\\d\"}");

	const StringList nodes{"node1", "with,comma", "{brace}"};
	EXPECT_EQ(DecodeArray(EncodeArray(nodes).c_str()), nodes);
}
