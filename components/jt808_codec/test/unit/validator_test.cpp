#include <gtest/gtest.h>

#include "jt808_codec/validator.hpp"
#include "jt808_codec/protocol.hpp"

using namespace jt808_codec;

class ValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        location.latitude = 39904200;
        location.longitude = 116407400;
        location.timestamp = "231222143000";

        cameraShot = FieldMap{
            {"channelId", int64_t{1}},
            {"shotCommand", int64_t{1}},
            {"shotInterval", int64_t{0}},
            {"shotCount", int64_t{1}},
            {"saveFlag", int64_t{0}},
            {"resolution", int64_t{1}},
            {"quality", int64_t{5}},
            {"brightness", int64_t{128}},
            {"contrast", int64_t{64}},
            {"saturation", int64_t{64}},
            {"chroma", int64_t{128}}
        };

        locationReport = FieldMap{
            {"alarmFlag", int64_t{0}},
            {"statusFlag", int64_t{2}},
            {"latitude", int64_t{39904200}},
            {"longitude", int64_t{116407400}},
            {"altitude", int64_t{44}},
            {"speed", int64_t{605}},
            {"direction", int64_t{90}},
            {"timestamp", std::string("231222143000")}
        };
    }

    Validator validator;
    LocationRecord location;
    FieldMap cameraShot;
    FieldMap locationReport;
};

TEST_F(ValidatorTest, AcceptsValidMessages) {
    EXPECT_TRUE(validator.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot));
    EXPECT_TRUE(validator.validate(protocol::message_id::LOCATION_REPORT, locationReport));
    EXPECT_TRUE(validator.validate(protocol::message_id::TERMINAL_HEARTBEAT, FieldMap{}));
}

TEST_F(ValidatorTest, UnknownMessageId) {
    auto result = validator.validate(0xFFFF, FieldMap{});

    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::UNKNOWN_MESSAGE_ID, result.errorCode);
    EXPECT_NE(std::string::npos, result.errorMessage.find("Unknown message ID"));
    EXPECT_EQ("Unknown message ID: 0xffff", result.errorMessage);
}

TEST_F(ValidatorTest, MissingField) {
    cameraShot.erase("quality");

    auto result = validator.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot);
    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::MISSING_FIELD, result.errorCode);
    EXPECT_EQ("quality", result.field);
    EXPECT_EQ("Missing required field: quality", result.errorMessage);
}

TEST_F(ValidatorTest, OptionalFieldMayBeAbsent) {
    FieldMap fields{
        {"sequenceNumber", int64_t{1}},
        {"result", int64_t{1}}
    };
    EXPECT_TRUE(validator.validate(protocol::message_id::TERMINAL_REGISTRATION_RESPONSE, fields));
}

TEST_F(ValidatorTest, FirstViolationInSchemaOrder) {
    cameraShot["channelId"] = std::string("one");
    cameraShot["quality"] = int64_t{0};

    auto result = validator.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot);
    ASSERT_FALSE(result);
    EXPECT_EQ("channelId", result.field);
    EXPECT_EQ(ValidationError::TYPE_MISMATCH, result.errorCode);
}

TEST_F(ValidatorTest, WireRangeOfIntegers) {
    cameraShot["brightness"] = int64_t{256};
    auto result = validator.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot);
    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, result.errorCode);
    EXPECT_EQ("brightness", result.field);

    locationReport["alarmFlag"] = int64_t{-1};
    EXPECT_EQ(ValidationError::RANGE_VIOLATION,
              validator.validate(protocol::message_id::LOCATION_REPORT, locationReport).errorCode);

    locationReport["alarmFlag"] = int64_t{4294967296};
    EXPECT_EQ(ValidationError::RANGE_VIOLATION,
              validator.validate(protocol::message_id::LOCATION_REPORT, locationReport).errorCode);

    locationReport["alarmFlag"] = int64_t{4294967295};
    EXPECT_TRUE(validator.validate(protocol::message_id::LOCATION_REPORT, locationReport));
}

TEST_F(ValidatorTest, MinMaxConstraints) {
    cameraShot["quality"] = int64_t{11};
    auto high = validator.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot);
    ASSERT_FALSE(high);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, high.errorCode);
    EXPECT_EQ("Field quality: Value must be <= 10", high.errorMessage);

    cameraShot["quality"] = int64_t{0};
    auto low = validator.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot);
    ASSERT_FALSE(low);
    EXPECT_EQ("Field quality: Value must be >= 1", low.errorMessage);

    cameraShot["quality"] = int64_t{10};
    cameraShot["contrast"] = int64_t{128};
    auto contrast = validator.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot);
    ASSERT_FALSE(contrast);
    EXPECT_EQ("contrast", contrast.field);
}

TEST_F(ValidatorTest, DirectionLimit) {
    locationReport["direction"] = int64_t{359};
    EXPECT_TRUE(validator.validate(protocol::message_id::LOCATION_REPORT, locationReport));

    locationReport["direction"] = int64_t{360};
    auto result = validator.validate(protocol::message_id::LOCATION_REPORT, locationReport);
    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, result.errorCode);
    EXPECT_EQ("direction", result.field);
}

TEST_F(ValidatorTest, EnumConstraint) {
    cameraShot["saveFlag"] = int64_t{2};

    auto result = validator.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot);
    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::ENUM_VIOLATION, result.errorCode);
    EXPECT_EQ("Field saveFlag: Value must be one of: 0, 1", result.errorMessage);
}

TEST_F(ValidatorTest, BcdDigitsAndLength) {
    locationReport["timestamp"] = std::string("23122214300a");
    auto nonDigit = validator.validate(protocol::message_id::LOCATION_REPORT, locationReport);
    ASSERT_FALSE(nonDigit);
    EXPECT_EQ(ValidationError::TYPE_MISMATCH, nonDigit.errorCode);

    locationReport["timestamp"] = std::string("2312221430");
    auto shortDigits = validator.validate(protocol::message_id::LOCATION_REPORT, locationReport);
    ASSERT_FALSE(shortDigits);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, shortDigits.errorCode);
    EXPECT_EQ("Field timestamp: BCD string length must be 12 digits", shortDigits.errorMessage);
}

TEST_F(ValidatorTest, FixedStringLength) {
    FieldMap fields{
        {"provinceId", int64_t{44}},
        {"cityId", int64_t{300}},
        {"manufacturerId", std::string("ABCDEF")},
        {"deviceModel", std::string("M1")},
        {"deviceId", std::string("DEV0001")},
        {"plateColor", int64_t{1}},
        {"plateNumber", std::string("B12345")}
    };

    auto result = validator.validate(protocol::message_id::TERMINAL_REGISTRATION, fields);
    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, result.errorCode);
    EXPECT_EQ("manufacturerId", result.field);

    fields["manufacturerId"] = std::string("ABCDE");
    EXPECT_TRUE(validator.validate(protocol::message_id::TERMINAL_REGISTRATION, fields));
}

TEST_F(ValidatorTest, BatchReportNeedsExactlyOneRecord) {
    FieldMap fields{
        {"dataType", int64_t{0}},
        {"itemCount", int64_t{2}},
        {"locationItems", LocationList{location, location}}
    };

    auto two = validator.validate(protocol::message_id::LOCATION_BATCH_REPORT, fields);
    ASSERT_FALSE(two);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, two.errorCode);
    EXPECT_EQ("locationItems", two.field);

    fields["locationItems"] = LocationList{};
    EXPECT_FALSE(validator.validate(protocol::message_id::LOCATION_BATCH_REPORT, fields));

    fields["locationItems"] = LocationList{location};
    EXPECT_TRUE(validator.validate(protocol::message_id::LOCATION_BATCH_REPORT, fields));

    fields["locationItems"] = location;
    EXPECT_EQ(ValidationError::TYPE_MISMATCH,
              validator.validate(protocol::message_id::LOCATION_BATCH_REPORT, fields).errorCode);
}

TEST_F(ValidatorTest, EmbeddedLocationRecordLimits) {
    FieldMap fields{
        {"multimediaId", int64_t{1}},
        {"multimediaType", int64_t{protocol::multimedia_type::IMAGE}},
        {"multimediaFormat", int64_t{protocol::multimedia_format::JPEG}},
        {"eventCode", int64_t{0}},
        {"channelId", int64_t{1}},
        {"locationInfo", location}
    };
    EXPECT_TRUE(validator.validate(protocol::message_id::MULTIMEDIA_EVENT_UPLOAD, fields));

    LocationRecord turned = location;
    turned.direction = 400;
    fields["locationInfo"] = turned;
    auto direction = validator.validate(protocol::message_id::MULTIMEDIA_EVENT_UPLOAD, fields);
    ASSERT_FALSE(direction);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, direction.errorCode);
    EXPECT_EQ("locationInfo", direction.field);
    EXPECT_EQ("Field locationInfo: direction must be <= 359", direction.errorMessage);

    LocationRecord shortTime = location;
    shortTime.timestamp = "2312221430";
    fields["locationInfo"] = shortTime;
    auto length = validator.validate(protocol::message_id::MULTIMEDIA_EVENT_UPLOAD, fields);
    ASSERT_FALSE(length);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, length.errorCode);
    EXPECT_EQ("Field locationInfo: timestamp length must be 12 digits", length.errorMessage);

    LocationRecord badTime = location;
    badTime.timestamp = "23122214300x";
    fields["locationInfo"] = badTime;
    EXPECT_EQ(ValidationError::TYPE_MISMATCH,
              validator.validate(protocol::message_id::MULTIMEDIA_EVENT_UPLOAD, fields).errorCode);
}

TEST_F(ValidatorTest, BatchReportRecordLimits) {
    LocationRecord turned = location;
    turned.direction = 360;

    FieldMap fields{
        {"dataType", int64_t{0}},
        {"itemCount", int64_t{1}},
        {"locationItems", LocationList{turned}}
    };

    auto result = validator.validate(protocol::message_id::LOCATION_BATCH_REPORT, fields);
    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, result.errorCode);
    EXPECT_EQ("locationItems", result.field);
    EXPECT_EQ("Field locationItems: record 0 direction must be <= 359", result.errorMessage);

    std::vector<FieldSchema> schemas{field::locationArray("points", true)};
    LocationRecord shortTime = location;
    shortTime.timestamp = "2312";
    auto prefixed = validator.validateFields(schemas, FieldMap{{"points", LocationList{location, shortTime}}});
    ASSERT_FALSE(prefixed);
    EXPECT_EQ("Field points: record 1 timestamp length must be 12 digits", prefixed.errorMessage);
}

TEST_F(ValidatorTest, EmptyOptionalValueRejected) {
    locationReport["additionalInfo"] = Bytes{};
    auto emptyBytes = validator.validate(protocol::message_id::LOCATION_REPORT, locationReport);
    ASSERT_FALSE(emptyBytes);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, emptyBytes.errorCode);
    EXPECT_EQ("additionalInfo", emptyBytes.field);

    locationReport["additionalInfo"] = Bytes{0x01};
    EXPECT_TRUE(validator.validate(protocol::message_id::LOCATION_REPORT, locationReport));

    FieldMap control{{"commandFlag", int64_t{4}}, {"commandParameter", std::string()}};
    auto emptyText = validator.validate(protocol::message_id::TERMINAL_CONTROL, control);
    ASSERT_FALSE(emptyText);
    EXPECT_EQ("commandParameter", emptyText.field);

    // Required variable-length fields may be empty
    EXPECT_TRUE(validator.validate(protocol::message_id::TERMINAL_AUTH, FieldMap{{"authCode", std::string()}}));
}

TEST_F(ValidatorTest, ParameterLengthMustMatchValue) {
    ParameterRecord parameter(protocol::parameter_id::HEARTBEAT_INTERVAL, Bytes{0x00, 0x00, 0x00, 0x3C});
    FieldMap fields{
        {"parameterCount", int64_t{1}},
        {"parameters", ParameterList{parameter}}
    };
    EXPECT_TRUE(validator.validate(protocol::message_id::SET_TERMINAL_PARAMETERS, fields));

    parameter.length = 3;
    fields["parameters"] = ParameterList{parameter};
    auto result = validator.validate(protocol::message_id::SET_TERMINAL_PARAMETERS, fields);
    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::RANGE_VIOLATION, result.errorCode);
}

TEST_F(ValidatorTest, PatternConstraint) {
    std::vector<FieldSchema> schemas{
        field::variableString("plate").withPattern("^[A-Z][0-9]{5}$")
    };

    EXPECT_TRUE(validator.validateFields(schemas, FieldMap{{"plate", std::string("B12345")}}));

    auto result = validator.validateFields(schemas, FieldMap{{"plate", std::string("b12")}});
    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::PATTERN_VIOLATION, result.errorCode);
    EXPECT_EQ("plate", result.field);
}

TEST_F(ValidatorTest, InvalidPatternIsReported) {
    std::vector<FieldSchema> schemas{field::variableString("text").withPattern("([")};

    auto result = validator.validateFields(schemas, FieldMap{{"text", std::string("x")}});
    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::PATTERN_VIOLATION, result.errorCode);
}

TEST_F(ValidatorTest, UnexpectedFieldsIgnoredByDefault) {
    cameraShot["extra"] = int64_t{1};
    EXPECT_TRUE(validator.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot));
}

TEST_F(ValidatorTest, StrictModeRejectsUnexpectedFields) {
    Validator::Config config;
    config.strictMode = true;
    Validator strict(config);

    EXPECT_TRUE(strict.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot));

    cameraShot["extra"] = int64_t{1};
    auto result = strict.validate(protocol::message_id::CAMERA_SHOT_COMMAND, cameraShot);
    ASSERT_FALSE(result);
    EXPECT_EQ(ValidationError::TYPE_MISMATCH, result.errorCode);
    EXPECT_EQ("extra", result.field);
    EXPECT_EQ("Unexpected field: extra", result.errorMessage);
}

TEST_F(ValidatorTest, ErrorNames) {
    EXPECT_EQ("ENUM_VIOLATION", errorToString(ValidationError::ENUM_VIOLATION));
    EXPECT_EQ("PATTERN_VIOLATION", errorToString(ValidationError::PATTERN_VIOLATION));
    EXPECT_EQ("UNKNOWN_MESSAGE_ID", errorToString(ValidationError::UNKNOWN_MESSAGE_ID));
}
