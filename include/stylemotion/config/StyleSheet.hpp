#pragma once

#include <stylemotion/animation/AnimationConfig.hpp>
#include <stylemotion/core/Error.hpp>
#include <stylemotion/style/StylePatch.hpp>

#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace SM::Config {

struct ElementDefinition {
    std::string                    selector;
    Style::StylePatch              base;
    Animation::AnimationConfig     animation;
    std::vector<ElementDefinition> children;

    [[nodiscard]] auto child(std::string_view selector) const -> ElementDefinition const*;
};

struct StyleSheet {
    std::map<std::string, ElementDefinition> styles;

    // "#id" wins over classes; classes are tried in the order given as ".class".
    [[nodiscard]] auto Resolve(std::string_view id, std::span<std::string const> classes) const
        -> ElementDefinition const*;
};

auto ParseStyleSheet(std::string_view json) -> SM::Expected<StyleSheet>;

auto LoadStyleSheet(std::filesystem::path const& path) -> SM::Expected<StyleSheet>;

} // namespace SM::Config
