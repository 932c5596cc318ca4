#include <catch2/catch.hpp>
#include "render_cache/fingerprint.hpp"
#include "render_cache/errors.hpp"
#include <cmath>
#include <limits>
#include <set>

using namespace docserve;

static bool is_lower_hex(const std::string& s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

// ── Shape and determinism ───────────────────────────────────────

TEST_CASE("fingerprint: 64 lowercase hex characters", "[fingerprint]") {
    auto key = fingerprint("# Hello");
    REQUIRE(key.size() == 64);
    REQUIRE(is_lower_hex(key));
}

TEST_CASE("fingerprint: same inputs give same key", "[fingerprint]") {
    CacheKeyParams p;
    p.source = "# Title\n\nBody";
    p.file_path = "guide/intro.md";
    p.options = {{"toc", true}, {"math", false}};
    p.theme = "dark";
    p.metadata = {{"lang", "en"}};

    REQUIRE(fingerprint(p) == fingerprint(p));
    REQUIRE(fingerprint(p) == fingerprint(p.source, p.file_path, p.options, p.theme, p.metadata));
}

TEST_CASE("fingerprint: option key order is irrelevant", "[fingerprint]") {
    auto a = nlohmann::json::parse(R"({"toc": true, "nested": {"x": 1, "y": 2}})");
    auto b = nlohmann::json::parse(R"({"nested": {"y": 2, "x": 1}, "toc": true})");
    REQUIRE(fingerprint("src", std::nullopt, a) == fingerprint("src", std::nullopt, b));
}

TEST_CASE("fingerprint: encoding is stable across releases", "[fingerprint]") {
    // Changing the field encoding invalidates every key clients may hold.
    REQUIRE(fingerprint("") ==
            "8b4136e42eb6dbe4644fcc82362de75953b2c9876c52590d62876b1b538d6317");
    nlohmann::json opts = {{"toc", true}};
    REQUIRE(fingerprint("# Hello", std::string("a.md"), opts, std::string("dark")) ==
            "a625a85cb920b499822d3544875400251ab5fab1200446c91a70e6ed2bff1f72");
}

// ── Sensitivity ─────────────────────────────────────────────────

TEST_CASE("fingerprint: every field changes the key", "[fingerprint]") {
    CacheKeyParams base;
    base.source = "body";
    base.file_path = "a.md";
    base.options = {{"toc", true}};
    base.theme = "light";
    base.metadata = {{"v", 1}};

    std::set<std::string> keys;
    keys.insert(fingerprint(base));

    auto p = base; p.source = "body!";
    keys.insert(fingerprint(p));
    p = base; p.file_path = "b.md";
    keys.insert(fingerprint(p));
    p = base; p.options = {{"toc", false}};
    keys.insert(fingerprint(p));
    p = base; p.theme = "dark";
    keys.insert(fingerprint(p));
    p = base; p.metadata = {{"v", 2}};
    keys.insert(fingerprint(p));

    REQUIRE(keys.size() == 6);
}

TEST_CASE("fingerprint: absent differs from empty", "[fingerprint]") {
    REQUIRE(fingerprint("x") != fingerprint("x", std::string("")));
    REQUIRE(fingerprint("x") != fingerprint("x", std::nullopt, nlohmann::json::object()));
    REQUIRE(fingerprint("x") != fingerprint("x", std::nullopt, nullptr, std::string("")));
}

TEST_CASE("fingerprint: field boundaries are unambiguous", "[fingerprint]") {
    // Moving bytes between adjacent fields must not collide.
    auto a = fingerprint("ab", std::string("c"));
    auto b = fingerprint("a", std::string("bc"));
    REQUIRE(a != b);

    auto c = fingerprint("x", std::nullopt, nullptr, std::string("dark"));
    auto d = fingerprint("x", std::string("dark"));
    REQUIRE(c != d);
}

// ── Rejected inputs ─────────────────────────────────────────────

TEST_CASE("fingerprint: non-object options rejected", "[fingerprint]") {
    REQUIRE_THROWS_AS(fingerprint("x", std::nullopt, nlohmann::json::array({1, 2})),
                      InvalidKeyParams);
    REQUIRE_THROWS_AS(fingerprint("x", std::nullopt, nlohmann::json("toc")),
                      InvalidKeyParams);
    REQUIRE_THROWS_AS(fingerprint("x", std::nullopt, nullptr, std::nullopt, nlohmann::json(42)),
                      InvalidKeyParams);
}

TEST_CASE("fingerprint: non-finite numbers rejected", "[fingerprint]") {
    nlohmann::json opts = {{"scale", std::numeric_limits<double>::infinity()}};
    REQUIRE_THROWS_AS(fingerprint("x", std::nullopt, opts), InvalidKeyParams);

    nlohmann::json nested = {{"list", {1.0, std::nan("")}}};
    REQUIRE_THROWS_AS(fingerprint("x", std::nullopt, nullptr, std::nullopt, nested),
                      InvalidKeyParams);
}

TEST_CASE("fingerprint: invalid UTF-8 in options rejected", "[fingerprint]") {
    nlohmann::json opts = {{"title", std::string("bad \xff\xfe bytes")}};
    REQUIRE_THROWS_AS(fingerprint("x", std::nullopt, opts), InvalidKeyParams);
}

TEST_CASE("fingerprint: arbitrary bytes in source accepted", "[fingerprint]") {
    std::string binary("\x00\xff\x01", 3);
    auto key = fingerprint(binary);
    REQUIRE(key.size() == 64);
    REQUIRE(key != fingerprint(std::string("\x00\xff", 2)));
}
