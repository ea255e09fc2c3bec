#pragma once

#include "jt808_codec/types.hpp"
#include "jt808_codec/error.hpp"
#include "jt808_codec/message.hpp"
#include "jt808_codec/serializer.hpp"
#include "jt808_codec/validator.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace jt808_codec {

/**
 * @brief Frame-level entry point of the codec
 *
 * Turns one complete frame into a ParsedMessage (unwrap, envelope, body
 * decode) and assembles complete frames from field maps for the reverse
 * direction. Parsing never throws; every wire-level failure is reported in
 * the returned message.
 */
class Parser {
public:
    /**
     * @brief Parser configuration options
     */
    struct Config {
        bool validateChecksum;      ///< Reject frames whose XOR checksum does not match
        bool decodeBody;            ///< Decode registered bodies into fields
        bool validateOnBuild;       ///< Run the validator before encoding in build()
        bool logRawFrames;          ///< Hex dump every frame at debug level
        size_t maxFrameSize;        ///< Larger frames are rejected before unwrapping

        // Default constructor with default values
        Config()
            : validateChecksum(true)
            , decodeBody(true)
            , validateOnBuild(true)
            , logRawFrames(false)
            , maxFrameSize(Constants::DEFAULT_MAX_FRAME_SIZE)
        {}
    };

    /**
     * @brief Constructor with configuration
     * @param config Parser configuration options
     * @param registry Schema table; the built-in table by default
     */
    explicit Parser(const Config& config = Config{},
                    const SchemaRegistry& registry = SchemaRegistry::instance());

    /**
     * @brief Parse one complete frame (delimiters included)
     * @param frame Frame bytes
     * @return Parsed message; check isSuccess()
     */
    ParsedMessage parse(const Bytes& frame) const;

    /**
     * @brief Encode fields and wrap them into a complete frame
     * @param messageId Message identifier
     * @param deviceId Decimal terminal id (12 digits)
     * @param sequenceNumber Sequence number
     * @param fields Body fields
     * @param fragmentInfo Fragment totals for split messages
     * @return Frame bytes, or the validation/encode error
     */
    Result<Bytes, EncodeError> build(uint16_t messageId,
                                     const std::string& deviceId,
                                     uint16_t sequenceNumber,
                                     const FieldMap& fields,
                                     const std::optional<FragmentInfo>& fragmentInfo = std::nullopt) const;

    /**
     * @brief Wrap a pre-encoded body into a complete frame
     */
    Bytes buildRaw(uint16_t messageId,
                   const std::string& deviceId,
                   uint16_t sequenceNumber,
                   const Bytes& body,
                   const std::optional<FragmentInfo>& fragmentInfo = std::nullopt) const;

    const Config& getConfig() const { return config_; }

private:
    Config config_;
    Serializer serializer_;
    Validator validator_;

    ParsedMessage fail(ParseErrorCode code, const std::string& message, const Bytes& frame) const;
};

} // namespace jt808_codec
