#include <catch2/catch_all.hpp>

#include "utility/strings.hpp"

using namespace chromatone::utility;

TEST_CASE("split and join", "[strings]") {
    auto parts = split("Navy Blue, Crisp White, Steel Blue", ", ");
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[1] == "Crisp White");
    REQUIRE(join(parts, " | ") == "Navy Blue | Crisp White | Steel Blue");

    REQUIRE(split("", ",").empty());
    REQUIRE(split("a,,b", ",").size() == 3);
    REQUIRE(split("single", ", ").size() == 1);
    REQUIRE(join({}, ", ").empty());
}

TEST_CASE("trim and case helpers", "[strings]") {
    REQUIRE(trim("  Camel \t") == "Camel");
    REQUIRE(trim("   ").empty());
    REQUIRE(to_lower("NeUtRaL") == "neutral");
    REQUIRE(title_case("light beige") == "Light Beige");
    REQUIRE(title_case("DARK ESPRESSO") == "Dark Espresso");
    REQUIRE(title_case("light-beige") == "Light-Beige");
}
