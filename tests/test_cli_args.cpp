#include <doctest/doctest.h>
#include "echolite/cli_args.hpp"
#include "echolite/hex.hpp"
#include "echolite/requests.hpp"

using namespace echolite;

static const char* GET_E7_HEX     = "10 81 00 01 05 FF 01 02 88 01 62 01 E7 00";
static const char* GET_RES_E7_HEX = "10 81 00 01 02 88 01 05 FF 01 72 01 E7 04 00 00 01 F4";

TEST_CASE("parse_code: hex with or without prefix, no sign") {
    uint64_t v = 0;
    REQUIRE(parse_code("E7", 0xFF, v));
    CHECK(v == 0xE7);
    REQUIRE(parse_code("0x05FF01", 0xFFFFFF, v));
    CHECK(v == 0x05FF01);
    REQUIRE(parse_code("62", 0xFF, v));
    CHECK(v == 0x62);                       // hex, not decimal 62

    CHECK_FALSE(parse_code("", 0xFF, v));
    CHECK_FALSE(parse_code("+E7", 0xFF, v));
    CHECK_FALSE(parse_code("-0", 0xFF, v));
    CHECK_FALSE(parse_code("1FF", 0xFF, v));
    CHECK_FALSE(parse_code("G1", 0xFF, v));
}

TEST_CASE("parse_number: decimal or 0x, bounded") {
    uint64_t v = 0;
    REQUIRE(parse_number("65535", 0xFFFF, v));
    CHECK(v == 65535);
    REQUIRE(parse_number("0x10", 0xFFFF, v));
    CHECK(v == 16);
    CHECK_FALSE(parse_number("65536", 0xFFFF, v));
    CHECK_FALSE(parse_number("-1", 0xFFFF, v));
    CHECK_FALSE(parse_number("1e3", 0xFFFF, v));
}

TEST_CASE("parse_prop: EPC and EPC=VALUE") {
    PropertyInput in;
    REQUIRE(parse_prop("E7", in));
    CHECK(in.epc == 0xE7);
    CHECK(in.kind == PropertyInput::Kind::None);

    REQUIRE(parse_prop("80=0x30", in));
    CHECK(in.epc == 0x80);
    CHECK(in.kind == PropertyInput::Kind::Text);
    CHECK(in.text == "0x30");

    REQUIRE(parse_prop("0xE0=12345", in));
    CHECK(in.epc == 0xE0);
    CHECK(in.text == "12345");

    CHECK_FALSE(parse_prop("", in));
    CHECK_FALSE(parse_prop("=5", in));
    CHECK_FALSE(parse_prop("E7=", in));
    CHECK_FALSE(parse_prop("-E7=1", in));
    CHECK_FALSE(parse_prop("+80", in));
    CHECK_FALSE(parse_prop("100=1", in));
}

TEST_CASE("build_frame: flags to wire bytes") {
    EncodeArgs a;
    a.esv   = "62";
    a.tid   = "1";
    a.props = {"E7"};

    Frame f;
    std::string reason;
    REQUIRE(build_frame(a, Config{}, f, reason));
    CHECK(bytes_to_hex(f.to_bytes()) == "1081000105ff010288016201e70100");
}

TEST_CASE("build_frame: objects come from config unless given") {
    Config cfg;
    cfg.seoj = 0x0EF001;
    cfg.deoj = 0x0EF001;

    EncodeArgs a;
    a.esv = "0x73";
    a.tid = "0x20";

    Frame f;
    std::string reason;
    REQUIRE(build_frame(a, cfg, f, reason));
    CHECK(f.seoj() == 0x0EF001);
    CHECK(f.deoj() == 0x0EF001);
    CHECK(f.tid() == 0x20);

    a.deoj = "028801";
    REQUIRE(build_frame(a, cfg, f, reason));
    CHECK(f.deoj() == EOJ_SMART_METER);
}

TEST_CASE("build_frame: error tokens") {
    Frame f;
    std::string reason;
    EncodeArgs a;
    a.esv = "62";

    SUBCASE("esv") {
        a.esv = "-62";
        CHECK_FALSE(build_frame(a, Config{}, f, reason));
        CHECK(reason == "invalid_esv");
    }
    SUBCASE("tid") {
        a.tid = "70000";
        CHECK_FALSE(build_frame(a, Config{}, f, reason));
        CHECK(reason == "invalid_tid");
    }
    SUBCASE("seoj") {
        a.seoj = "zz";
        CHECK_FALSE(build_frame(a, Config{}, f, reason));
        CHECK(reason == "invalid_seoj");
    }
    SUBCASE("object wider than 24 bits") {
        a.deoj = "1000000";
        CHECK_FALSE(build_frame(a, Config{}, f, reason));
        CHECK(reason == "object_out_of_range");
    }
    SUBCASE("prop syntax") {
        a.props = {"E7", "+80=1"};
        CHECK_FALSE(build_frame(a, Config{}, f, reason));
        CHECK(reason == "invalid_prop");
    }
    SUBCASE("prop value") {
        a.props = {"80=12a"};
        CHECK_FALSE(build_frame(a, Config{}, f, reason));
        CHECK(reason == "malformed_value");
    }
}

TEST_CASE("decode_hex: reasons") {
    Frame f;
    std::string reason;
    REQUIRE(decode_hex(GET_E7_HEX, f, reason));
    CHECK(f.esv() == ESV_GET);

    CHECK_FALSE(decode_hex("10 81 0", f, reason));
    CHECK(reason == "invalid_hex");

    CHECK_FALSE(decode_hex("1081000105", f, reason));
    CHECK(reason == "frame_too_short");

    CHECK_FALSE(decode_hex("2081000105ff0102880162 01e700", f, reason));
    CHECK(reason == "invalid_header");
}

TEST_CASE("decode_hex + is_valid_response: match decision") {
    Frame req, resp;
    std::string reason;
    REQUIRE(decode_hex(GET_E7_HEX, req, reason));
    REQUIRE(decode_hex(GET_RES_E7_HEX, resp, reason));
    CHECK(req.is_valid_response(resp));

    Frame other;
    REQUIRE(decode_hex("10 81 00 02 02 88 01 05 FF 01 72 01 E7 04 00 00 01 F4", other, reason));
    CHECK_FALSE(req.is_valid_response(other));
}

TEST_CASE("apply_overrides: flags win over config") {
    Config cfg;
    std::string err;
    REQUIRE(parse_config(R"({"format":"raw","log_level":"warn"})", cfg, err));

    CliOverrides none;
    REQUIRE(apply_overrides(none, cfg, err));
    CHECK(cfg.format == "raw");
    CHECK(cfg.log_level == Logger::kWarn);

    CliOverrides flags;
    flags.format = "json";
    REQUIRE(apply_overrides(flags, cfg, err));
    CHECK(cfg.format == "json");
    CHECK(cfg.log_level == Logger::kWarn);

    flags.log_level = "debug";
    REQUIRE(apply_overrides(flags, cfg, err));
    CHECK(cfg.log_level == Logger::kDebug);
}

TEST_CASE("apply_overrides: bad values leave config alone") {
    Config cfg;
    std::string err;

    CliOverrides flags;
    flags.format = "json";
    flags.log_level = "trace";
    CHECK_FALSE(apply_overrides(flags, cfg, err));
    CHECK(err == "invalid_log_level");
    CHECK(cfg.format == "pretty");

    CliOverrides bad_format;
    bad_format.format = "xml";
    CHECK_FALSE(apply_overrides(bad_format, cfg, err));
    CHECK(err == "invalid_format");
}

TEST_CASE("frame_to_json") {
    Frame f;
    std::string reason;
    REQUIRE(decode_hex(GET_RES_E7_HEX, f, reason));

    const nlohmann::json j = frame_to_json(f);
    CHECK(j["tid"].get<int>() == 1);
    CHECK(j["seoj"].get<std::string>() == "0x028801");
    CHECK(j["deoj"].get<std::string>() == "0x05ff01");
    CHECK(j["esv"].get<std::string>() == "0x72");
    REQUIRE(j["properties"].size() == 1);
    CHECK(j["properties"][0]["epc"].get<std::string>() == "0xe7");
    CHECK(j["properties"][0]["pdc"].get<int>() == 4);
    CHECK(j["properties"][0]["edt"].get<std::string>() == "0x1f4");
    CHECK(j["properties"][0]["value"].get<std::string>() == "500");
    CHECK(j["hex"].get<std::string>() == "1081000102880105ff017201e704000001f4");
}

TEST_CASE("render_frame: one rendering per format") {
    Frame f;
    std::string reason;
    REQUIRE(decode_hex(GET_RES_E7_HEX, f, reason));

    CHECK(render_frame(f, "raw") == "status=ok tid=1 esv=0x72 instant_power_w=500");
    CHECK(render_frame(f, "pretty") == f.to_string());

    const nlohmann::json j = nlohmann::json::parse(render_frame(f, "json"), nullptr, false);
    REQUIRE_FALSE(j.is_discarded());
    CHECK(j["tid"].get<int>() == 1);
}
