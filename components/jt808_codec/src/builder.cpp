#include "jt808_codec/builder.hpp"
#include "jt808_codec/protocol.hpp"

namespace jt808_codec {

namespace {

const Serializer& serializer() {
    static const Serializer instance;
    return instance;
}

} // namespace

FieldMap CameraShotParams::toFields() const {
    return FieldMap{
        {"channelId", static_cast<int64_t>(channelId)},
        {"shotCommand", static_cast<int64_t>(shotCommand)},
        {"shotInterval", static_cast<int64_t>(shotInterval)},
        {"shotCount", static_cast<int64_t>(shotCount)},
        {"saveFlag", static_cast<int64_t>(saveFlag)},
        {"resolution", static_cast<int64_t>(resolution)},
        {"quality", static_cast<int64_t>(quality)},
        {"brightness", static_cast<int64_t>(brightness)},
        {"contrast", static_cast<int64_t>(contrast)},
        {"saturation", static_cast<int64_t>(saturation)},
        {"chroma", static_cast<int64_t>(chroma)}
    };
}

Result<Bytes, EncodeError> MessageFactory::createGeneralResponse(uint16_t sequenceNumber,
                                                                 uint16_t messageId,
                                                                 uint8_t result) {
    FieldMap fields;
    fields["sequenceNumber"] = static_cast<int64_t>(sequenceNumber);
    fields["messageId"] = static_cast<int64_t>(messageId);
    fields["result"] = static_cast<int64_t>(result);

    return serializer().encode(protocol::message_id::PLATFORM_GENERAL_RESPONSE, fields);
}

Result<Bytes, EncodeError> MessageFactory::createRegistrationResponse(uint16_t sequenceNumber,
                                                                      uint8_t result,
                                                                      const std::string& authCode) {
    FieldMap fields;
    fields["sequenceNumber"] = static_cast<int64_t>(sequenceNumber);
    fields["result"] = static_cast<int64_t>(result);

    // Terminals only receive a code when registration succeeded
    if (result == protocol::registration_result::SUCCESS && !authCode.empty()) {
        fields["authCode"] = authCode;
    }

    return serializer().encode(protocol::message_id::TERMINAL_REGISTRATION_RESPONSE, fields);
}

Result<Bytes, EncodeError> MessageFactory::createParameterSetting(const ParameterList& parameters) {
    FieldMap fields;
    fields["parameterCount"] = static_cast<int64_t>(parameters.size());
    fields["parameters"] = parameters;

    return serializer().encode(protocol::message_id::SET_TERMINAL_PARAMETERS, fields);
}

Result<Bytes, EncodeError> MessageFactory::createCameraShotCommand(const CameraShotParams& params) {
    return serializer().encode(protocol::message_id::CAMERA_SHOT_COMMAND, params.toFields());
}

Result<Bytes, EncodeError> MessageFactory::createTerminalControl(uint8_t commandFlag,
                                                                 const std::string& commandParameter) {
    FieldMap fields;
    fields["commandFlag"] = static_cast<int64_t>(commandFlag);
    if (!commandParameter.empty()) {
        fields["commandParameter"] = commandParameter;
    }

    return serializer().encode(protocol::message_id::TERMINAL_CONTROL, fields);
}

} // namespace jt808_codec
