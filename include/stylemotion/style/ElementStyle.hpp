#pragma once

#include <stylemotion/style/StylePatch.hpp>
#include <stylemotion/style/StyleRecord.hpp>

#include <cstdint>
#include <functional>

namespace SM::Style {

/**
 * ElementStyle: the live style cell of one element.
 *
 * Notes:
 * - `baseline` is what the host captured from its own primitives before any
 *   stylesheet was applied. It never changes unless the host recaptures it.
 * - `normal` is the baseline merged with the element's base patch; animation
 *   states are merged on top of it and it is where interactions come to rest.
 * - `current` is the last record applied. Every Apply forwards the record to the
 *   sink so the host can push it onto its rendering primitives.
 */
class ElementStyle {
public:
    using Sink = std::function<void(StyleRecord const&)>;

    ElementStyle();
    explicit ElementStyle(StyleRecord baseline);

    auto captureBaseline(StyleRecord const& baseline) -> void;
    auto applyDefinition(StylePatch const& base_patch) -> void;
    auto apply(StyleRecord const& record) -> void;

    auto setSink(Sink sink) -> void;

    [[nodiscard]] auto baseline() const -> StyleRecord const& { return baselineRecord; }
    [[nodiscard]] auto normal() const -> StyleRecord const& { return normalRecord; }
    [[nodiscard]] auto current() const -> StyleRecord const& { return currentRecord; }
    [[nodiscard]] auto applyCount() const -> std::uint64_t { return applied; }

private:
    StyleRecord   baselineRecord;
    StyleRecord   normalRecord;
    StyleRecord   currentRecord;
    Sink          sink;
    std::uint64_t applied = 0;
};

} // namespace SM::Style
