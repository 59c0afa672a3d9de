#include "catch.hpp"

#include "vecmath.h"

TEST_CASE("Vector products and quotients are component-wise")
{
    Vector2 product = Vector2(2.0f, 3.0f) * Vector2(4.0f, 5.0f);
    Vector2 quotient = Vector2(8.0f, 9.0f) / Vector2(2.0f, 3.0f);
    Vector4 product4 = Vector4(1.0f, 2.0f, 3.0f, 4.0f) * Vector4(0.5f, 0.5f, 2.0f, 0.0f);

    REQUIRE(product == Vector2(8.0f, 15.0f));
    REQUIRE(quotient == Vector2(4.0f, 3.0f));
    REQUIRE(product4 == Vector4(0.5f, 1.0f, 6.0f, 0.0f));
}

TEST_CASE("Subtracting a scalar subtracts it from every component")
{
    REQUIRE((Vector2(1.0f, 2.0f) - 1.0f) == Vector2(0.0f, 1.0f));
}

TEST_CASE("Scaled vectors sum component-wise")
{
    Vector4 sum = Vector4(1.0f, 0.0f, 0.0f, 1.0f)*0.5f + Vector4(0.0f, 1.0f, 0.0f, 1.0f)*0.5f;

    REQUIRE(sum == Vector4(0.5f, 0.5f, 0.0f, 1.0f));
    REQUIRE((Vector2(1.0f, 2.0f) + Vector2(3.0f, 4.0f)*2.0f) == Vector2(7.0f, 10.0f));
}

TEST_CASE("Clamping holds values at the boundaries")
{
    REQUIRE(clampf(-2.0f, 0.0f, 1.0f) == 0.0f);
    REQUIRE(clampf(2.0f, 0.0f, 1.0f) == 1.0f);
    REQUIRE(clampf(0.25f, 0.0f, 1.0f) == 0.25f);
    REQUIRE(clamp(5, 0, 3) == 3);
    REQUIRE(clamp(-1, 0, 3) == 0);
}
