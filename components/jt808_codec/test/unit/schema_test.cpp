#include <gtest/gtest.h>

#include "jt808_codec/schema.hpp"
#include "jt808_codec/protocol.hpp"
#include <algorithm>

using namespace jt808_codec;

TEST(SchemaRegistryTest, BuiltInTableContainsKnownMessages) {
    const SchemaRegistry& registry = SchemaRegistry::instance();

    for (uint16_t id : {0x0001, 0x0002, 0x0003, 0x0100, 0x0102, 0x0200, 0x0704, 0x0800,
                        0x8001, 0x8100, 0x8103, 0x8104, 0x8105, 0x8801}) {
        EXPECT_TRUE(registry.contains(id)) << messageIdToString(id);
    }
    EXPECT_EQ(14u, registry.size());
    EXPECT_FALSE(registry.contains(0xFFFF));
    EXPECT_EQ(nullptr, registry.lookup(0xFFFF));
}

TEST(SchemaRegistryTest, MessageIdsAreSorted) {
    auto ids = SchemaRegistry::instance().messageIds();
    ASSERT_FALSE(ids.empty());
    EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
    EXPECT_EQ(0x0001, ids.front());
    EXPECT_EQ(0x8801, ids.back());
}

TEST(SchemaRegistryTest, LocationReportLayout) {
    const MessageStructure* structure = SchemaRegistry::instance().lookup(protocol::message_id::LOCATION_REPORT);
    ASSERT_NE(nullptr, structure);

    EXPECT_EQ(Direction::UPLINK, structure->direction);
    ASSERT_EQ(9u, structure->fields.size());
    EXPECT_EQ("alarmFlag", structure->fields.front().name);
    EXPECT_EQ(FieldType::UINT32, structure->fields.front().type());

    const FieldSchema* timestamp = structure->findField("timestamp");
    ASSERT_NE(nullptr, timestamp);
    EXPECT_EQ(FieldType::BCD, timestamp->type());
    EXPECT_EQ(6u, std::get<BcdField>(timestamp->kind).length);

    const FieldSchema* direction = structure->findField("direction");
    ASSERT_NE(nullptr, direction);
    ASSERT_TRUE(direction->constraints.max.has_value());
    EXPECT_EQ(359, *direction->constraints.max);

    const FieldSchema* additional = structure->findField("additionalInfo");
    ASSERT_NE(nullptr, additional);
    EXPECT_TRUE(additional->optional);
    EXPECT_TRUE(additional->isVariableLength());

    EXPECT_EQ(nullptr, structure->findField("missing"));
    EXPECT_EQ(28u, structure->minimumBodySize());
}

TEST(SchemaRegistryTest, RegistrationLayout) {
    const MessageStructure* structure = SchemaRegistry::instance().lookup(protocol::message_id::TERMINAL_REGISTRATION);
    ASSERT_NE(nullptr, structure);

    EXPECT_EQ(5u, std::get<StringField>(structure->findField("manufacturerId")->kind).length);
    EXPECT_EQ(8u, std::get<StringField>(structure->findField("deviceModel")->kind).length);
    EXPECT_EQ(7u, std::get<StringField>(structure->findField("deviceId")->kind).length);
    EXPECT_TRUE(structure->findField("plateNumber")->isVariableLength());
    EXPECT_EQ(25u, structure->minimumBodySize());
}

TEST(SchemaRegistryTest, DirectionsFollowMessageIdRange) {
    const SchemaRegistry& registry = SchemaRegistry::instance();
    for (uint16_t id : registry.messageIds()) {
        Direction expected = (id & 0x8000) ? Direction::DOWNLINK : Direction::UPLINK;
        EXPECT_EQ(expected, registry.lookup(id)->direction) << messageIdToString(id);
    }

    EXPECT_STREQ("UPLINK", directionToString(registry.lookup(protocol::message_id::LOCATION_REPORT)->direction));
    EXPECT_STREQ("DOWNLINK", directionToString(registry.lookup(protocol::message_id::CAMERA_SHOT_COMMAND)->direction));
}

TEST(SchemaRegistryTest, RejectsDuplicateFieldNames) {
    std::vector<MessageStructure> table{
        {0x1000, "Broken", Direction::UPLINK, {field::uint8("a"), field::uint16("a")}}
    };
    EXPECT_THROW(SchemaRegistry{table}, SchemaError);
}

TEST(SchemaRegistryTest, RejectsZeroLengthFixedFields) {
    std::vector<MessageStructure> strings{
        {0x1000, "Broken", Direction::UPLINK, {field::fixedString("s", 0)}}
    };
    EXPECT_THROW(SchemaRegistry{strings}, SchemaError);

    std::vector<MessageStructure> bcd{
        {0x1000, "Broken", Direction::UPLINK, {field::bcd("b", 0)}}
    };
    EXPECT_THROW(SchemaRegistry{bcd}, SchemaError);

    std::vector<MessageStructure> bytes{
        {0x1000, "Broken", Direction::UPLINK, {field::fixedBytes("b", 0)}}
    };
    EXPECT_THROW(SchemaRegistry{bytes}, SchemaError);
}

TEST(SchemaRegistryTest, RejectsVariableFieldBeforeLast) {
    std::vector<MessageStructure> table{
        {0x1000, "Broken", Direction::UPLINK, {field::variableString("text"), field::uint8("after")}}
    };
    EXPECT_THROW(SchemaRegistry{table}, SchemaError);

    std::vector<MessageStructure> params{
        {0x1000, "Broken", Direction::DOWNLINK, {field::parameterArray("params"), field::uint8("after")}}
    };
    EXPECT_THROW(SchemaRegistry{params}, SchemaError);
}

TEST(SchemaRegistryTest, RejectsDuplicateMessageIds) {
    std::vector<MessageStructure> table{
        {0x1000, "First", Direction::UPLINK, {}},
        {0x1000, "Second", Direction::UPLINK, {}}
    };
    EXPECT_THROW(SchemaRegistry{table}, SchemaError);
}

TEST(SchemaRegistryTest, AcceptsCustomTable) {
    std::vector<MessageStructure> table{
        {0x1000, "Custom", Direction::UPLINK, {
            field::uint8("kind").withEnum({1, 2}),
            field::locationArray("points", true),
            field::variableBytes("tail").asOptional()
        }}
    };

    SchemaRegistry registry(table);
    ASSERT_TRUE(registry.contains(0x1000));
    EXPECT_EQ(3u, registry.lookup(0x1000)->minimumBodySize());
}

TEST(SchemaRegistryTest, ErrorMessagePrefix) {
    try {
        std::vector<MessageStructure> table{
            {0x1000, "Broken", Direction::UPLINK, {field::bcd("b", 0)}}
        };
        SchemaRegistry registry(table);
        FAIL() << "Expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_EQ(0u, std::string(e.what()).find("Schema error: 0x1000"));
    }
}

TEST(SchemaRegistryTest, MessageIdToString) {
    EXPECT_EQ("0x0200", messageIdToString(0x0200));
    EXPECT_EQ("0x8801", messageIdToString(0x8801));
    EXPECT_EQ("0xffff", messageIdToString(0xFFFF));
}
