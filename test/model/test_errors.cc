//
// Tests for the error taxonomy
//

#include <doctest/doctest.h>
#include <snapfix/errors.hh>

#include <string>

using namespace snapfix;

TEST_SUITE("Model - Errors") {

    TEST_CASE("Messages carry the breadcrumb") {
        Path path{PathSegment::field("address"), PathSegment::field("zipCode")};

        unsupported_type_error e("Money", path);
        CHECK(std::string(e.what()) == "Unsupported type: Money at path: address → zipCode");
        CHECK(e.kind() == error_kind::UnsupportedType);
        CHECK(e.type_name() == "Money");
        CHECK(e.path() == path);
    }

    TEST_CASE("Empty path omits the suffix") {
        CHECK(message_at_path("Unsupported type: X", {}) == "Unsupported type: X");

        reflection_error e("boom", {});
        CHECK(std::string(e.what()) == "Reflection failed: boom");
        CHECK(e.reason() == "boom");
    }

    TEST_CASE("Every subclass is a snapshot_error") {
        const auto kind_of = [](const snapshot_error& e) { return e.kind(); };

        CHECK(kind_of(io_error("disk full")) == error_kind::IOFailure);
        CHECK(kind_of(overwrite_disallowed_error("/tmp/a.swift")) == error_kind::OverwriteDisallowed);
        CHECK(kind_of(formatting_error("unbalanced")) == error_kind::FormattingFailure);
        CHECK(kind_of(cycle_error("Node", {})) == error_kind::CycleDetected);
        CHECK(kind_of(depth_limit_error(3, {})) == error_kind::DepthLimitExceeded);
    }

    TEST_CASE("Specific messages") {
        CHECK(std::string(io_error("disk full").what()) == "I/O error: disk full");
        CHECK(overwrite_disallowed_error("/tmp/a.swift").file_path() == "/tmp/a.swift");
        CHECK(depth_limit_error(3, {}).limit() == 3);
        CHECK(std::string(error_kind_name(error_kind::CycleDetected)).size() > 0);
    }
}
