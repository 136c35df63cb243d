#include <doctest/doctest.h>
#include "utils/StringUtils.hpp"

#include <stylemotion/animation/AnimationConfig.hpp>
#include <stylemotion/animation/Ease.hpp>
#include <stylemotion/style/StyleAlgebra.hpp>

TEST_SUITE("utils.string") {

TEST_CASE("Case-insensitive equality") {
    CHECK(SM::equals_ignore_case("OutBack", "outback"));
    CHECK(SM::equals_ignore_case("HOVER", "hover"));
    CHECK(SM::equals_ignore_case("", ""));
    CHECK_FALSE(SM::equals_ignore_case("hover", "hovered"));
    CHECK_FALSE(SM::equals_ignore_case("yoyo", "yoyp"));
    CHECK_FALSE(SM::equals_ignore_case("red", ""));
}

TEST_CASE("Every name lookup shares the comparison") {
    CHECK(SM::Style::ParseColor("WHITE").has_value());
    CHECK(SM::Animation::ParseEase("inoutbounce") == SM::Animation::Ease::InOutBounce);
    CHECK(SM::Animation::ParseAnimationState("ExIt") == SM::Animation::AnimationState::Exit);
    CHECK(SM::Animation::ParseCycleMode("YoYo") == SM::Animation::CycleMode::Yoyo);
}

} // TEST_SUITE
