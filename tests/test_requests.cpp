#include <doctest/doctest.h>
#include "echolite/requests.hpp"
#include "echolite/hex.hpp"

using namespace echolite;

static Frame from_hex(const std::string& hex) {
    std::vector<uint8_t> b;
    REQUIRE(hex_to_bytes(hex, b));
    Frame f;
    REQUIRE(Frame::parse(b, f) == FrameStatus::Ok);
    return f;
}

TEST_CASE("make_get_request: controller to smart meter") {
    Frame req;
    REQUIRE(make_get_request({EPC_INSTANT_POWER}, req, 1) == FrameStatus::Ok);
    CHECK(bytes_to_hex(req.to_bytes()) == "1081000105ff010288016201e70100");

    Frame resp = from_hex("10 81 00 01 02 88 01 05 FF 01 72 01 E7 04 00 00 01 F4");
    CHECK(req.is_valid_response(resp));

    uint64_t w = 0;
    REQUIRE(resp.get_edt(EPC_INSTANT_POWER, w) == FrameStatus::Ok);
    CHECK(w == 500);
}

TEST_CASE("make_get_request: several EPCs keep their order") {
    Frame req;
    REQUIRE(make_get_request({EPC_COEFFICIENT, EPC_CUMULATIVE_UNIT, EPC_CUMULATIVE_NORMAL}, req, 0x10)
            == FrameStatus::Ok);
    CHECK(req.esv() == ESV_GET);
    CHECK(req.seoj() == EOJ_CONTROLLER);
    CHECK(req.deoj() == EOJ_SMART_METER);
    REQUIRE(req.properties().size() == 3);
    CHECK(req.properties()[0].epc == 0xD3);
    CHECK(req.properties()[1].epc == 0xE1);
    CHECK(req.properties()[2].epc == 0xE0);
}

TEST_CASE("make_set_request: SetC with values") {
    Frame req;
    REQUIRE(make_set_request({PropertyInput(EPC_OPERATION_STATUS, int64_t(0x30))}, req, 5)
            == FrameStatus::Ok);
    CHECK(bytes_to_hex(req.to_bytes()) == "1081000505ff010288016101800130");

    CHECK(make_set_request({PropertyInput(EPC_OPERATION_STATUS, int64_t(-1))}, req)
          == FrameStatus::NegativeEdt);
}

TEST_CASE("is_error_response / is_notification") {
    CHECK(is_error_response(from_hex("1081000702880105ff015201e700")));
    CHECK_FALSE(is_error_response(from_hex("1081000702880105ff017201e700")));

    CHECK(is_notification(from_hex("1081000002880105ff017300")));
    CHECK(is_notification(from_hex("1081000002880105ff017400")));
    CHECK_FALSE(is_notification(from_hex("1081000002880105ff017200")));
}

TEST_CASE("cumulative_unit_kwh table") {
    double k = 0;
    REQUIRE(cumulative_unit_kwh(0x00, k)); CHECK(k == doctest::Approx(1.0));
    REQUIRE(cumulative_unit_kwh(0x01, k)); CHECK(k == doctest::Approx(0.1));
    REQUIRE(cumulative_unit_kwh(0x04, k)); CHECK(k == doctest::Approx(0.0001));
    REQUIRE(cumulative_unit_kwh(0x0A, k)); CHECK(k == doctest::Approx(10.0));
    REQUIRE(cumulative_unit_kwh(0x0D, k)); CHECK(k == doctest::Approx(10000.0));
    CHECK_FALSE(cumulative_unit_kwh(0x05, k));
    CHECK_FALSE(cumulative_unit_kwh(0xFF, k));
}

TEST_CASE("describe: instantaneous power") {
    Frame f = from_hex("10 81 00 01 02 88 01 05 FF 01 72 01 E7 04 00 00 01 F4");
    CHECK(describe(f) == "status=ok tid=1 esv=0x72 instant_power_w=500");

    // negative power is reverse flow
    f = from_hex("10 81 00 02 02 88 01 05 FF 01 72 01 E7 04 FF FF FF 9C");
    CHECK(describe(f) == "status=ok tid=2 esv=0x72 instant_power_w=-100");
}

TEST_CASE("describe: Get_SNA with empty EDT") {
    Frame f = from_hex("1081000702880105ff015201e700");
    CHECK(describe(f) == "status=error tid=7 esv=0x52 epc_e7=unavailable");
}

TEST_CASE("describe: current, single and three phase") {
    Frame f = from_hex("1081000302880105ff017201e804" "00647ffe");
    CHECK(describe(f) == "status=ok tid=3 esv=0x72 current_r_a=10.0");

    f = from_hex("1081000302880105ff017201e804" "00640032");
    CHECK(describe(f) == "status=ok tid=3 esv=0x72 current_r_a=10.0 current_t_a=5.0");
}

TEST_CASE("describe: cumulative energy set") {
    // D3 coefficient 1, D7 6 digits, E1 0.1 kWh, E0 12345
    Frame f = from_hex("1081000402880105ff017204"
                       "d30400000001" "d70106" "e10101" "e00400003039");
    CHECK(describe(f) == "status=ok tid=4 esv=0x72 coefficient=1 effective_digits=6 "
                         "cumulative_unit_kwh=0.1 cumulative_normal=12345");

    f = from_hex("1081000402880105ff017201e30400000064");
    CHECK(describe(f) == "status=ok tid=4 esv=0x72 cumulative_reverse=100");
}

TEST_CASE("describe: fixed-time cumulative") {
    Frame f = from_hex("1081000502880105ff017201ea0b07e60a0100000000000064");
    CHECK(describe(f) == "status=ok tid=5 esv=0x72 "
                         "fixed_time=2022-10-01T00:00:00 cumulative_fixed=100");
}

TEST_CASE("describe: operation status and request/notify words") {
    Frame f = from_hex("1081000602880105ff017301800130");
    CHECK(describe(f) == "status=notify tid=6 esv=0x73 operation=on");

    f = from_hex("1081000605ff010288016201800100");
    CHECK(describe(f) == "status=request tid=6 esv=0x62 epc_80=0x00");

    f = from_hex("1081000605ff010288010001800131");
    CHECK(describe(f) == "status=unknown tid=6 esv=0x00 operation=off");
}

TEST_CASE("describe: unknown EPC and unexpected width fall back to hex") {
    Frame f = from_hex("1081000802880105ff017202f0020102e7020001");
    CHECK(describe(f) == "status=ok tid=8 esv=0x72 epc_f0=0x0102 epc_e7=0x0001");
}
