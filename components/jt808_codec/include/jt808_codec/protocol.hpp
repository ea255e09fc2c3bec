/**
 * @file protocol.hpp
 * @brief Protocol constants for JT/T 808 terminal communication
 *
 * This file defines the identifiers and bit masks exchanged between
 * terminals and the platform.
 */

#pragma once

#include <cstdint>

namespace jt808_codec {

namespace protocol {

/**
 * @brief Message identifiers
 */
namespace message_id {
    // Terminal -> platform
    constexpr uint16_t TERMINAL_GENERAL_RESPONSE = 0x0001;
    constexpr uint16_t TERMINAL_HEARTBEAT        = 0x0002;
    constexpr uint16_t TERMINAL_UNREGISTER       = 0x0003;
    constexpr uint16_t TERMINAL_REGISTRATION     = 0x0100;
    constexpr uint16_t TERMINAL_AUTH             = 0x0102;
    constexpr uint16_t QUERY_PARAMETERS_RESPONSE = 0x0104;
    constexpr uint16_t LOCATION_REPORT           = 0x0200;
    constexpr uint16_t LOCATION_QUERY_RESPONSE   = 0x0201;
    constexpr uint16_t MULTIMEDIA_INFO_REPORT    = 0x0301;
    constexpr uint16_t LOCATION_BATCH_REPORT     = 0x0704;
    constexpr uint16_t MULTIMEDIA_EVENT_UPLOAD   = 0x0800;
    constexpr uint16_t MULTIMEDIA_DATA_UPLOAD    = 0x0801;
    constexpr uint16_t DATA_UPLINK_TRANSPARENT   = 0x0900;

    // Platform -> terminal
    constexpr uint16_t PLATFORM_GENERAL_RESPONSE      = 0x8001;
    constexpr uint16_t PLATFORM_HEARTBEAT             = 0x8003;
    constexpr uint16_t TERMINAL_REGISTRATION_RESPONSE = 0x8100;
    constexpr uint16_t SET_TERMINAL_PARAMETERS        = 0x8103;
    constexpr uint16_t QUERY_TERMINAL_PARAMETERS      = 0x8104;
    constexpr uint16_t TERMINAL_CONTROL               = 0x8105;
    constexpr uint16_t QUERY_SPECIFIC_PARAMETERS      = 0x8106;
    constexpr uint16_t QUERY_TERMINAL_ATTRIBUTES      = 0x8107;
    constexpr uint16_t LOCATION_INFO_QUERY            = 0x8201;
    constexpr uint16_t TEXT_MESSAGE_SEND              = 0x8300;
    constexpr uint16_t CAMERA_SHOT_COMMAND            = 0x8801;
    constexpr uint16_t DATA_DOWNLINK_TRANSPARENT      = 0x8900;
}

/**
 * @brief Result codes of 0x0001 / 0x8001 general responses
 */
namespace general_result {
    constexpr uint8_t SUCCESS       = 0x00;
    constexpr uint8_t FAILURE       = 0x01;
    constexpr uint8_t MESSAGE_ERROR = 0x02;
    constexpr uint8_t NOT_SUPPORTED = 0x03;
    constexpr uint8_t ALARM_ACK     = 0x04;
}

/**
 * @brief Result codes of the 0x8100 registration response
 */
namespace registration_result {
    constexpr uint8_t SUCCESS                = 0x00;
    constexpr uint8_t VEHICLE_REGISTERED     = 0x01;
    constexpr uint8_t VEHICLE_NOT_IN_DB      = 0x02;
    constexpr uint8_t TERMINAL_REGISTERED    = 0x03;
    constexpr uint8_t TERMINAL_NOT_IN_DB     = 0x04;
}

/**
 * @brief Alarm flag bits of a location record
 */
namespace alarm_flag {
    constexpr uint32_t EMERGENCY                  = 0x00000001;
    constexpr uint32_t OVERSPEED                  = 0x00000002;
    constexpr uint32_t FATIGUE_DRIVING            = 0x00000004;
    constexpr uint32_t DANGEROUS_DRIVING          = 0x00000008;
    constexpr uint32_t GNSS_MODULE_FAULT          = 0x00000010;
    constexpr uint32_t GNSS_ANTENNA_DISCONNECTED  = 0x00000020;
    constexpr uint32_t GNSS_ANTENNA_SHORT_CIRCUIT = 0x00000040;
    constexpr uint32_t MAIN_POWER_UNDERVOLTAGE    = 0x00000080;
    constexpr uint32_t MAIN_POWER_DOWN            = 0x00000100;
    constexpr uint32_t LCD_FAULT                  = 0x00000200;
    constexpr uint32_t TTS_MODULE_FAULT           = 0x00000400;
    constexpr uint32_t CAMERA_FAULT               = 0x00000800;
    constexpr uint32_t IC_CARD_MODULE_FAULT       = 0x00001000;
    constexpr uint32_t OVERSPEED_WARNING          = 0x00002000;
    constexpr uint32_t FATIGUE_DRIVING_WARNING    = 0x00004000;
    constexpr uint32_t ILLEGAL_IGNITION           = 0x00008000;
    constexpr uint32_t ILLEGAL_DISPLACEMENT       = 0x00010000;
    constexpr uint32_t VSS_FAULT                  = 0x00020000;
    constexpr uint32_t OIL_ABNORMAL               = 0x00040000;
    constexpr uint32_t VEHICLE_THEFT              = 0x00080000;
    constexpr uint32_t VEHICLE_ILLEGAL_IGNITION   = 0x00100000;
    constexpr uint32_t VEHICLE_ILLEGAL_DISPLACEMENT = 0x00200000;
    constexpr uint32_t COLLISION_ROLLOVER         = 0x00400000;
    constexpr uint32_t ROLLOVER                   = 0x00800000;
}

/**
 * @brief Status flag bits of a location record
 */
namespace status_flag {
    constexpr uint32_t ACC_ON                 = 0x00000001;
    constexpr uint32_t POSITIONED             = 0x00000002;
    constexpr uint32_t SOUTH_LATITUDE         = 0x00000004;
    constexpr uint32_t WEST_LONGITUDE         = 0x00000008;
    constexpr uint32_t OUT_OF_SERVICE         = 0x00000010;
    constexpr uint32_t COORDINATES_ENCRYPTED  = 0x00000020;
    constexpr uint32_t FORWARD_COLLISION_WARNING = 0x00000040;
    constexpr uint32_t LANE_DEPARTURE_WARNING = 0x00000080;
    constexpr uint32_t LOADED                 = 0x00000100;
    constexpr uint32_t OIL_CIRCUIT_NORMAL     = 0x00000200;
    constexpr uint32_t ELECTRIC_CIRCUIT_NORMAL = 0x00000400;
    constexpr uint32_t DOOR_LOCKED            = 0x00000800;
    constexpr uint32_t DOOR1_OPEN             = 0x00001000;
    constexpr uint32_t DOOR2_OPEN             = 0x00002000;
    constexpr uint32_t DOOR3_OPEN             = 0x00004000;
    constexpr uint32_t DOOR4_OPEN             = 0x00008000;
    constexpr uint32_t DOOR5_OPEN             = 0x00010000;
    constexpr uint32_t GPS_POSITIONING        = 0x00020000;
    constexpr uint32_t BEIDOU_POSITIONING     = 0x00040000;
    constexpr uint32_t GLONASS_POSITIONING    = 0x00080000;
    constexpr uint32_t GALILEO_POSITIONING    = 0x00100000;
}

/**
 * @brief Terminal parameter identifiers used with 0x8103 / 0x8104
 */
namespace parameter_id {
    constexpr uint32_t HEARTBEAT_INTERVAL         = 0x0001;
    constexpr uint32_t TCP_TIMEOUT                = 0x0002;
    constexpr uint32_t TCP_RETRANSMISSION_COUNT   = 0x0003;
    constexpr uint32_t UDP_TIMEOUT                = 0x0004;
    constexpr uint32_t UDP_RETRANSMISSION_COUNT   = 0x0005;
    constexpr uint32_t SMS_TIMEOUT                = 0x0006;
    constexpr uint32_t SMS_RETRANSMISSION_COUNT   = 0x0007;
    constexpr uint32_t MAIN_SERVER_APN            = 0x0010;
    constexpr uint32_t MAIN_SERVER_USERNAME       = 0x0011;
    constexpr uint32_t MAIN_SERVER_PASSWORD       = 0x0012;
    constexpr uint32_t MAIN_SERVER_ADDRESS        = 0x0013;
    constexpr uint32_t BACKUP_SERVER_APN          = 0x0014;
    constexpr uint32_t BACKUP_SERVER_ADDRESS      = 0x0017;
    constexpr uint32_t SERVER_TCP_PORT            = 0x0018;
    constexpr uint32_t SERVER_UDP_PORT            = 0x0019;
    constexpr uint32_t POSITION_REPORT_STRATEGY   = 0x0020;
    constexpr uint32_t POSITION_REPORT_SCHEME     = 0x0021;
    constexpr uint32_t SLEEP_REPORT_INTERVAL      = 0x0027;
    constexpr uint32_t EMERGENCY_REPORT_INTERVAL  = 0x0028;
    constexpr uint32_t DEFAULT_REPORT_INTERVAL    = 0x0029;
    constexpr uint32_t DEFAULT_REPORT_DISTANCE    = 0x002C;
    constexpr uint32_t CORNER_SUPPLEMENT_ANGLE    = 0x0030;
    constexpr uint32_t PLATFORM_PHONE_NUMBER      = 0x0040;
    constexpr uint32_t ALARM_MASK                 = 0x0050;
    constexpr uint32_t MAX_SPEED                  = 0x0055;
    constexpr uint32_t OVERSPEED_DURATION         = 0x0056;
    constexpr uint32_t CONTINUOUS_DRIVING_LIMIT   = 0x0057;
    constexpr uint32_t MINIMUM_REST_TIME          = 0x0059;
    constexpr uint32_t MAXIMUM_PARKING_TIME       = 0x005A;
    constexpr uint32_t PHOTO_QUALITY              = 0x0070;
    constexpr uint32_t PHOTO_BRIGHTNESS           = 0x0071;
    constexpr uint32_t ODOMETER_READING           = 0x0080;
    constexpr uint32_t PROVINCE_ID                = 0x0081;
    constexpr uint32_t CITY_ID                    = 0x0082;
    constexpr uint32_t PLATE_NUMBER               = 0x0083;
    constexpr uint32_t PLATE_COLOR                = 0x0084;
}

/**
 * @brief Multimedia type values for 0x0800
 */
namespace multimedia_type {
    constexpr uint8_t IMAGE = 0x00;
    constexpr uint8_t AUDIO = 0x01;
    constexpr uint8_t VIDEO = 0x02;
}

/**
 * @brief Multimedia format values for 0x0800
 */
namespace multimedia_format {
    constexpr uint8_t JPEG = 0x00;
    constexpr uint8_t TIF  = 0x01;
    constexpr uint8_t MP3  = 0x02;
    constexpr uint8_t WAV  = 0x03;
    constexpr uint8_t WMV  = 0x04;
}

/**
 * @brief Multimedia event codes for 0x0800
 */
namespace event_code {
    constexpr uint8_t PLATFORM_COMMAND  = 0x00;
    constexpr uint8_t TIMED_ACTION      = 0x01;
    constexpr uint8_t ROBBERY_ALARM     = 0x02;
    constexpr uint8_t COLLISION_ROLLOVER = 0x03;
    constexpr uint8_t DOOR_OPEN         = 0x04;
    constexpr uint8_t DOOR_CLOSE        = 0x05;
    constexpr uint8_t DOOR_STATE_CHANGE = 0x06;
    constexpr uint8_t DISTANCE_ACTION   = 0x07;
}

/**
 * @brief Wire frame format
 *
 * +------+------------------------------------------+----------+------+
 * | 0x7E | Envelope (12B or 16B) | Body (variable)  | XOR (1B) | 0x7E |
 * +------+------------------------------------------+----------+------+
 *
 * Envelope:
 *   messageId   (2B, big endian)
 *   properties  (2B) bits 0-9 body length, 10-12 encryption,
 *               13 fragmented, 14-15 reserved
 *   deviceId    (6B, BCD, 12 digits)
 *   sequence    (2B)
 *   fragTotal   (2B, only if fragmented)
 *   fragCurrent (2B, only if fragmented)
 *
 * The checksum is the XOR of every byte between the delimiters except the
 * checksum itself. Delimiter-valued bytes inside the body are not escaped.
 */

} // namespace protocol

} // namespace jt808_codec
