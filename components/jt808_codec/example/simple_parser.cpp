#include <iostream>
#include <vector>

#include "jt808_codec/buffer.hpp"
#include "jt808_codec/builder.hpp"
#include "jt808_codec/parser.hpp"
#include "jt808_codec/protocol.hpp"
#include "jt808_codec/validator.hpp"

using namespace jt808_codec;

void printMessage(const ParsedMessage& message) {
    std::cout << "=== Message Details ===" << std::endl;
    std::cout << "Success: " << (message.isSuccess() ? "Yes" : "No") << std::endl;

    if (!message.isSuccess()) {
        std::cout << "Error: " << errorToString(message.getErrorCode())
                  << " - " << message.getErrorMessage() << std::endl;
        std::cout << std::endl;
        return;
    }

    std::cout << "Message ID: " << messageIdToString(message.getMessageId()) << std::endl;
    std::cout << "Device ID: " << message.getDeviceId() << std::endl;
    std::cout << "Sequence: " << message.getSequenceNumber() << std::endl;
    std::cout << "Version: " << protocolVersionToString(message.getProtocolVersion()) << std::endl;

    std::cout << "Fields:" << std::endl;
    for (const std::string& fieldName : message.getFieldNames()) {
        std::cout << "  " << fieldName << std::endl;
    }
    std::cout << std::endl;
}

int main() {
    std::cout << "JT808 Codec Example" << std::endl;
    std::cout << "===================" << std::endl;

    try {
        Parser::Config config;
        config.logRawFrames = true;
        Parser parser(config);

        // Build a location report as a terminal would send it
        std::cout << "\n1. Building a location report..." << std::endl;
        LocationRecord position;
        position.statusFlag = protocol::status_flag::ACC_ON | protocol::status_flag::POSITIONED;
        position.latitude = 39904200;
        position.longitude = 116407400;
        position.altitude = 44;
        position.speed = 605;
        position.direction = 90;
        position.timestamp = "231222143000";

        FieldMap fields{
            {"alarmFlag", static_cast<int64_t>(position.alarmFlag)},
            {"statusFlag", static_cast<int64_t>(position.statusFlag)},
            {"latitude", static_cast<int64_t>(position.latitude)},
            {"longitude", static_cast<int64_t>(position.longitude)},
            {"altitude", static_cast<int64_t>(position.altitude)},
            {"speed", static_cast<int64_t>(position.speed)},
            {"direction", static_cast<int64_t>(position.direction)},
            {"timestamp", position.timestamp}
        };

        auto frame = parser.build(protocol::message_id::LOCATION_REPORT, "13912345678", 7, fields);
        if (!frame) {
            std::cerr << "Build failed: " << frame.errorMessage << std::endl;
            return 1;
        }
        std::cout << "Frame: " << toHex(frame.value, true) << std::endl;

        // Parse it back
        std::cout << "\n2. Parsing the frame back..." << std::endl;
        ParsedMessage message = parser.parse(frame.value);
        printMessage(message);

        if (message.isSuccess()) {
            std::cout << "Latitude: " << message.getField<uint32_t>("latitude") / 1000000.0 << std::endl;
            std::cout << "Speed: " << message.getField<uint16_t>("speed") / 10.0 << " km/h" << std::endl;
            std::cout << message.toJson().dump(2) << std::endl;
        }

        // Acknowledge it the way a platform does
        std::cout << "\n3. Building the platform response..." << std::endl;
        auto response = MessageFactory::createGeneralResponse(
            message.getSequenceNumber(), message.getMessageId(), protocol::general_result::SUCCESS);
        if (response) {
            Bytes responseFrame = parser.buildRaw(protocol::message_id::PLATFORM_GENERAL_RESPONSE,
                                                  message.getDeviceId(), 1, response.value);
            std::cout << "Response: " << toHex(responseFrame, true) << std::endl;
        }

        // Corrupt the checksum
        std::cout << "\n4. Parsing a corrupted frame..." << std::endl;
        Bytes corrupted = frame.value;
        corrupted[corrupted.size() - 2] ^= 0x01;
        printMessage(parser.parse(corrupted));

        // Validation failure
        std::cout << "5. Validating an out-of-range direction..." << std::endl;
        fields["direction"] = static_cast<int64_t>(400);
        Validator validator;
        auto validation = validator.validate(protocol::message_id::LOCATION_REPORT, fields);
        std::cout << "Valid: " << (validation ? "Yes" : "No")
                  << " (" << validation.errorMessage << ")" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
