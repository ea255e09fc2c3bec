#pragma once

#include "jt808_codec/types.hpp"
#include "jt808_codec/error.hpp"
#include "jt808_codec/schema.hpp"
#include <cstdint>
#include <vector>

namespace jt808_codec {

/**
 * @brief Constraint checker for decoded or caller-built field maps
 *
 * Validation is independent of decoding: it walks the schema of a message
 * and checks presence, value type, wire range and the declared min/max,
 * enum and pattern constraints. Only the first violation is reported.
 */
class Validator {
public:
    /**
     * @brief Validation configuration options
     */
    struct Config {
        bool strictMode;    ///< Report fields that the schema does not declare

        Config()
            : strictMode(false)
        {}
    };

    /**
     * @brief Constructor with configuration
     * @param config Validator configuration options
     * @param registry Schema table; the built-in table by default
     */
    explicit Validator(const Config& config = Config{},
                       const SchemaRegistry& registry = SchemaRegistry::instance());

    /**
     * @brief Validate the fields of a message against its registered schema
     * @param messageId Message identifier
     * @param data Field values keyed by schema name
     * @return Success, or the first violation with the field involved
     */
    VoidResult<ValidationError> validate(uint16_t messageId, const FieldMap& data) const;

    /**
     * @brief Validate a field map against an explicit field list
     */
    VoidResult<ValidationError> validateFields(const std::vector<FieldSchema>& schemas, const FieldMap& data) const;

    /**
     * @brief Check one present value against its schema
     */
    static VoidResult<ValidationError> validateField(const FieldSchema& schema, const FieldValue& value);

    const Config& getConfig() const { return config_; }

private:
    Config config_;
    const SchemaRegistry& registry_;

    static VoidResult<ValidationError> validateType(const FieldSchema& schema, const FieldValue& value);
    static VoidResult<ValidationError> validateConstraints(const FieldSchema& schema, const FieldValue& value);
};

} // namespace jt808_codec
