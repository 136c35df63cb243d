#include <stylemotion/style/ElementStyle.hpp>

#include <stylemotion/style/StyleAlgebra.hpp>

#include <utility>

namespace SM::Style {

ElementStyle::ElementStyle()
    : ElementStyle(StyleRecord::Default()) {}

ElementStyle::ElementStyle(StyleRecord baseline)
    : baselineRecord(baseline), normalRecord(baseline), currentRecord(std::move(baseline)) {}

auto ElementStyle::captureBaseline(StyleRecord const& baseline) -> void {
    this->baselineRecord = baseline;
    this->normalRecord   = baseline;
    this->currentRecord  = baseline;
}

auto ElementStyle::applyDefinition(StylePatch const& base_patch) -> void {
    auto merged = Merge(this->baselineRecord, base_patch);
    this->apply(merged);
    this->normalRecord = std::move(merged);
}

auto ElementStyle::apply(StyleRecord const& record) -> void {
    this->currentRecord = record;
    ++this->applied;
    if (this->sink) {
        this->sink(this->currentRecord);
    }
}

auto ElementStyle::setSink(Sink sink) -> void {
    this->sink = std::move(sink);
}

} // namespace SM::Style
