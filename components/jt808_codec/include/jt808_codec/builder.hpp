#pragma once

#include "jt808_codec/types.hpp"
#include "jt808_codec/error.hpp"
#include "jt808_codec/serializer.hpp"
#include <cstdint>
#include <string>

namespace jt808_codec {

/**
 * @brief Settings of a camera shot command (0x8801)
 */
struct CameraShotParams {
    uint8_t channelId = 1;
    uint16_t shotCommand = 1;       ///< 0 = stop, 0xFFFF = record video, otherwise photo count
    uint16_t shotInterval = 0;      ///< Seconds
    uint16_t shotCount = 1;
    uint8_t saveFlag = 0;           ///< 1 = save on terminal, 0 = upload
    uint8_t resolution = 1;
    uint8_t quality = 5;            ///< 1-10, 1 is best
    uint8_t brightness = 128;
    uint8_t contrast = 64;          ///< 0-127
    uint8_t saturation = 64;        ///< 0-127
    uint8_t chroma = 128;

    FieldMap toFields() const;
};

/**
 * @brief Builders for the platform messages sent most often
 *
 * Each builder assembles a FieldMap and runs it through the serializer, so
 * the returned body always matches the registered layout.
 */
class MessageFactory {
public:
    /**
     * @brief Platform general response (0x8001)
     * @param sequenceNumber Sequence number of the acknowledged terminal message
     * @param messageId Id of the acknowledged terminal message
     * @param result protocol::general_result value
     */
    static Result<Bytes, EncodeError> createGeneralResponse(uint16_t sequenceNumber, uint16_t messageId, uint8_t result);

    /**
     * @brief Terminal registration response (0x8100)
     * @param sequenceNumber Sequence number of the registration message
     * @param result protocol::registration_result value
     * @param authCode Authentication code, written only when result is success
     */
    static Result<Bytes, EncodeError> createRegistrationResponse(uint16_t sequenceNumber,
                                                                 uint8_t result,
                                                                 const std::string& authCode = "");

    /**
     * @brief Set terminal parameters (0x8103) with the parameter count prepended
     */
    static Result<Bytes, EncodeError> createParameterSetting(const ParameterList& parameters);

    /**
     * @brief Camera shot command (0x8801)
     */
    static Result<Bytes, EncodeError> createCameraShotCommand(const CameraShotParams& params);

    /**
     * @brief Terminal control (0x8105)
     * @param commandFlag Control command word
     * @param commandParameter Semicolon separated parameter string, omitted when empty
     */
    static Result<Bytes, EncodeError> createTerminalControl(uint8_t commandFlag,
                                                            const std::string& commandParameter = "");
};

} // namespace jt808_codec
