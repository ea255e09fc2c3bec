#pragma once

#include "jt808_codec/types.hpp"
#include "jt808_codec/error.hpp"
#include "jt808_codec/schema.hpp"
#include "jt808_codec/buffer.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace jt808_codec {

/**
 * @brief Schema-driven encoder/decoder for message bodies
 *
 * The serializer walks the field list of a MessageStructure in order and
 * converts between wire bytes and a FieldMap. It keeps no state beyond a
 * reference to the registry, so one instance may be shared between threads.
 */
class Serializer {
public:
    /**
     * @brief Constructor
     * @param registry Schema table; the built-in table by default
     */
    explicit Serializer(const SchemaRegistry& registry = SchemaRegistry::instance());

    /**
     * @brief Decode a message body
     * @param messageId Message identifier used to look up the layout
     * @param body Body bytes (envelope and checksum removed)
     * @return Field map, or the first decode error with its field name
     */
    Result<FieldMap, DecodeError> decode(uint16_t messageId, const Bytes& body) const;

    /**
     * @brief Encode a message body
     * @param messageId Message identifier used to look up the layout
     * @param fields Field values keyed by schema name
     * @return Body bytes, or the first encode error with its field name
     */
    Result<Bytes, EncodeError> encode(uint16_t messageId, const FieldMap& fields) const;

    /**
     * @brief Decode an ordered field list from a cursor
     */
    static Result<FieldMap, DecodeError> decodeFields(const std::vector<FieldSchema>& schemas, ByteReader& reader);

    /**
     * @brief Encode an ordered field list into a writer
     */
    static VoidResult<EncodeError> encodeFields(const std::vector<FieldSchema>& schemas,
                                                const FieldMap& fields,
                                                ByteWriter& writer);

    /**
     * @brief Decode a single field at the reader position
     */
    static Result<FieldValue, DecodeError> decodeField(const FieldSchema& schema, ByteReader& reader);

    /**
     * @brief Encode a single field value
     */
    static VoidResult<EncodeError> encodeField(const FieldSchema& schema, const FieldValue& value, ByteWriter& writer);

    // 28-byte location record helpers
    static bool readLocation(ByteReader& reader, LocationRecord& record);
    static void writeLocation(const LocationRecord& record, ByteWriter& writer);

    const SchemaRegistry& registry() const { return registry_; }

private:
    const SchemaRegistry& registry_;
};

} // namespace jt808_codec
