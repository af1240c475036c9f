#pragma once
/**
 * @file requests.hpp
 * @brief Service codes, object codes, smart-meter properties, request builders and a
 *        one-line response summary.
 * @details
 * PURPOSE
 * -------
 * frame.hpp knows the wire format but not what the numbers mean. This layer names
 * them for the B-route case: a home controller (0x05FF01) polling a low-voltage
 * smart electric energy meter (0x028801) for instantaneous power and cumulative
 * energy.
 *
 * It lets the host:
 *   - Build **requests** (Get / SetC) with the right objects and ESV.
 *   - Classify **responses** (Get_Res vs Get_SNA, notifications).
 *   - Render a response as a compact `key=value` line for logs and shell scripts.
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - **frame.hpp**: the codec. Every builder here ends in Frame::make().
 * - **cli/main.cpp**: `echolite-cli decode --format raw` prints describe().
 *
 * EXAMPLE FLOW
 * ------------
 *   Request:  make_get_request({EPC_INSTANT_POWER}, req, 1)
 *             → 10 81 00 01 05 FF 01 02 88 01 62 01 E7 01 00
 *   Meter:    10 81 00 01 02 88 01 05 FF 01 72 01 E7 04 00 00 01 F4
 *   Host:     req.is_valid_response(resp) == true
 *             describe(resp) → "status=ok tid=1 esv=0x72 instant_power_w=500"
 *
 * MAINTENANCE
 * -----------
 * - Codes are part of the ECHONET Lite standard; do not renumber.
 * - Keep describe() output stable; scripts grep it.
 */

#include "echolite/frame.hpp"

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace echolite {

// =============================== ESV ================================
/**
 * @name Service codes (ESV)
 * @brief One-byte operation codes.
 *
 * Requests live in 0x6X, responses and notifications in 0x7X, and the
 * "service not available" answers (SNA) in 0x5X.
 */
enum : uint8_t {
    ESV_SETI       = 0x60, /**< Set, no response required. */
    ESV_SETC       = 0x61, /**< Set, response required. */
    ESV_GET        = 0x62, /**< Property read. */
    ESV_INF_REQ    = 0x63, /**< Ask the device to notify a property. */
    ESV_SETGET     = 0x6E, /**< Combined set + get. */

    ESV_SET_RES    = 0x71, /**< SetC accepted. */
    ESV_GET_RES    = 0x72, /**< Get answered; EDTs carry the values. */
    ESV_INF        = 0x73, /**< Unsolicited notification. */
    ESV_INFC       = 0x74, /**< Notification, response required. */
    ESV_INFC_RES   = 0x7A, /**< Answer to INFC. */
    ESV_SETGET_RES = 0x7E,

    ESV_SETI_SNA   = 0x50, /**< SetI refused. */
    ESV_SETC_SNA   = 0x51, /**< SetC refused. */
    ESV_GET_SNA    = 0x52, /**< Get refused; unsupported EPCs come back with PDC 0. */
    ESV_INF_SNA    = 0x53,
    ESV_SETGET_SNA = 0x5E
};

// =============================== EOJ ================================
/**
 * @name Object codes (EOJ)
 * @brief 3-byte [class group][class][instance] identifiers.
 */
enum : uint32_t {
    EOJ_CONTROLLER   = 0x05FF01, /**< Home controller, instance 1. */
    EOJ_SMART_METER  = 0x028801, /**< Low-voltage smart electric energy meter, instance 1. */
    EOJ_NODE_PROFILE = 0x0EF001  /**< Node profile object. */
};

// ========================= Smart-meter EPCs ==========================
/**
 * @name Low-voltage smart electric energy meter properties (EPC)
 */
enum : uint8_t {
    EPC_OPERATION_STATUS  = 0x80, /**< u8 : 0x30 on, 0x31 off. */
    EPC_COEFFICIENT       = 0xD3, /**< u32: multiply cumulative readings by this. */
    EPC_EFFECTIVE_DIGITS  = 0xD7, /**< u8 : digits of the cumulative counters. */
    EPC_CUMULATIVE_NORMAL = 0xE0, /**< u32: cumulative energy, normal direction. */
    EPC_CUMULATIVE_UNIT   = 0xE1, /**< u8 : unit code for E0/E3/EA (0x01 = 0.1 kWh). */
    EPC_CUMULATIVE_REV    = 0xE3, /**< u32: cumulative energy, reverse direction. */
    EPC_INSTANT_POWER     = 0xE7, /**< s32: instantaneous power in W. */
    EPC_INSTANT_CURRENT   = 0xE8, /**< s16 R + s16 T, 0.1 A units. */
    EPC_CUMULATIVE_FIXED  = 0xEA  /**< date/time (7 bytes) + u32 counter at the last fixed time. */
};

// ============================== Builders ==============================

/**
 * @brief Build a Get (0x62) from the controller to the smart meter.
 *
 * Each EPC goes out with the default value (PDC 1, EDT 0x00).
 *
 * @param epcs  Properties to read, in the order they should appear.
 * @param out   Receives the frame on FrameStatus::Ok.
 * @param tid   Transaction id; random when omitted.
 */
FrameStatus make_get_request(const std::vector<uint8_t>& epcs, Frame& out,
                             std::optional<uint16_t> tid = std::nullopt);

/**
 * @brief Build a SetC (0x61) from the controller to the smart meter.
 */
FrameStatus make_set_request(const std::vector<PropertyInput>& props, Frame& out,
                             std::optional<uint16_t> tid = std::nullopt);

/// ESV in the 0x5X range ("service not available").
bool is_error_response(const Frame& f);

/// ESV_INF or ESV_INFC.
bool is_notification(const Frame& f);

/**
 * @brief Multiplier for a cumulative-unit code (EPC 0xE1), in kWh.
 * @return false for codes outside the standard table.
 */
bool cumulative_unit_kwh(uint8_t code, double& kwh);

// =========================== Response decode ==========================

/**
 * @brief Render a frame as a single `key=value` line.
 *
 * Example output:
 *   "status=ok tid=1 esv=0x72 instant_power_w=500"
 *   "status=error tid=7 esv=0x52 epc_e7=unavailable"
 *
 * - status is ok / error / request / notify / unknown from the ESV.
 * - Known smart-meter EPCs are decoded; PDC 0 prints `epc_XX=unavailable`.
 * - Anything else, or a known EPC with an unexpected PDC, falls back to
 *   `epc_XX=0x<hex>`.
 *
 * Lossy: use Frame accessors when you need the exact values.
 */
std::string describe(const Frame& f);

} // namespace echolite
