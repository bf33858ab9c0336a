/**
 * @file test_device_record.cpp
 * @brief Device document mapping and host identity tests
 */

#include <catch2/catch_test_macros.hpp>
#include "../../src/device/device_identity.hpp"
#include "../../src/device/device_record.hpp"
#include "../../src/core/errors.hpp"

using namespace keyward;
using namespace keyward::device;

TEST_CASE("Device Status Names", "[device][record]") {
    REQUIRE(std::string(device_status_name(DeviceStatus::APPROVED)) == "approved");
    REQUIRE(parse_device_status("revoked") == DeviceStatus::REVOKED);
    REQUIRE(parse_device_status("approved") == DeviceStatus::APPROVED);
    REQUIRE(parse_device_status("something-new") == DeviceStatus::PENDING);
}

TEST_CASE("Device Record From Document", "[device][record]") {
    SECTION("Full approved record") {
        remote::Document doc = {
            {"name", "Work Laptop"},
            {"platform", "linux"},
            {"public_key", "cGs="},
            {"wrapped_umk", "d3JhcA=="},
            {"wrapped_umk_nonce", "bm9uY2U="},
            {"approved_by_public_key", "YXBwcm92ZXI="},
            {"status", "approved"},
            {"created_at", "2025-03-01T08:15:30.250Z"},
            {"approved_at", "2025-03-01T09:00:00Z"},
            {"device_details", {{"manufacturer", "Lenovo"}, {"model", "X1"}, {"year", 2024}}},
            {"recovered", true},
        };
        auto r = DeviceRecord::from_document("dev-1", doc);
        REQUIRE(r.id == "dev-1");
        REQUIRE(r.is_approved());
        REQUIRE(r.has_wrapped_umk());
        REQUIRE(r.approved_by_public_key == std::optional<std::string>("YXBwcm92ZXI="));
        REQUIRE(r.created_at.has_value());
        REQUIRE(to_unix_millis(*r.created_at) == 1740816930250);
        REQUIRE(r.device_details.at("year") == "2024");
        REQUIRE(r.recovered);
        REQUIRE(r.description() == "Lenovo X1");
    }

    SECTION("Defaults for a sparse record") {
        auto r = DeviceRecord::from_document("dev-2", remote::Document{{"public_key", "cGs="}});
        REQUIRE(r.name == "Unknown Device");
        REQUIRE(r.platform == "unknown");
        REQUIRE(r.is_pending());
        REQUIRE_FALSE(r.has_wrapped_umk());
        REQUIRE_FALSE(r.created_at.has_value());
        REQUIRE_FALSE(r.recovered);
        REQUIRE(r.description() == "Unknown Device");
    }

    SECTION("Unparsable timestamp reads as absent") {
        auto r = DeviceRecord::from_document("dev-3",
            remote::Document{{"public_key", "cGs="}, {"created_at", "last tuesday"}});
        REQUIRE_FALSE(r.created_at.has_value());
    }

    SECTION("Malformed documents throw") {
        REQUIRE_THROWS_AS(DeviceRecord::from_document("x", remote::Document::array()), KeywardError);
        REQUIRE_THROWS_AS(DeviceRecord::from_document("x", remote::Document{{"name", "n"}}), KeywardError);
    }
}

TEST_CASE("Device Record To Document", "[device][record]") {
    DeviceRecord r;
    r.id = "dev-1";
    r.name = "Phone";
    r.platform = "android";
    r.public_key = "cGs=";
    r.created_at = parse_iso8601("2025-03-01T08:15:30Z");

    auto doc = r.to_document();
    REQUIRE(doc.at("status") == "pending");
    REQUIRE(doc.at("created_at") == "2025-03-01T08:15:30.000Z");
    REQUIRE_FALSE(doc.contains("wrapped_umk"));
    REQUIRE_FALSE(doc.contains("recovered"));
    REQUIRE_FALSE(doc.contains("id"));

    auto back = DeviceRecord::from_document("dev-1", doc);
    REQUIRE(back.name == "Phone");
    REQUIRE(back.created_at == r.created_at);
}

TEST_CASE("Approval Request View", "[device][record]") {
    DeviceRecord r;
    r.id = "dev-9";
    r.name = "Tablet";
    r.platform = "ios";
    r.public_key = "cGs=";
    r.device_details["manufacturer"] = "Apple";

    auto req = ApprovalRequest::from_record(r);
    REQUIRE(req.device_id == "dev-9");
    REQUIRE(req.device_name == "Tablet");
    REQUIRE(req.platform == "ios");
    REQUIRE(req.description == "Apple");
}

TEST_CASE("Host Identity", "[device][identity]") {
    SECTION("os-release parsing") {
        auto os = parse_os_release(
            "# comment\n"
            "NAME=\"Debian GNU/Linux\"\n"
            "VERSION_ID='12'\n"
            "ID=debian\n"
            "=ignored\n"
            "garbage line\n");
        REQUIRE(os.size() == 3);
        REQUIRE(os.at("NAME") == "Debian GNU/Linux");
        REQUIRE(os.at("VERSION_ID") == "12");
        REQUIRE(os.at("ID") == "debian");
    }

    SECTION("Name override wins") {
        auto id = detect_local_device(std::string("Build Agent"));
        REQUIRE(id.name == "Build Agent");
        REQUIRE_FALSE(id.platform.empty());
    }

    SECTION("Detected name is never empty") {
        REQUIRE_FALSE(detect_local_device().name.empty());
    }
}
