#include <stylemotion/config/StyleSheet.hpp>

#include "utils/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <functional>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace SM::Config {

namespace {

using json = nlohmann::json;
using VariableTable = std::map<std::string, json, std::less<>>;

auto make_error(std::string message, SM::Error::Code code = SM::Error::Code::MalformedInput) -> SM::Error {
    return SM::Error{code, std::move(message)};
}

auto make_type_error(std::string message) -> SM::Error {
    return make_error(std::move(message), SM::Error::Code::InvalidType);
}

auto member_path(std::string const& path, std::string_view key) -> std::string {
    std::string out = path;
    out.push_back('.');
    out.append(key);
    return out;
}

auto resolve_variables(json& node, VariableTable const& variables) -> void {
    if (node.is_object() || node.is_array()) {
        for (auto& child : node) {
            resolve_variables(child, variables);
        }
        return;
    }
    if (!node.is_string()) {
        return;
    }
    auto const& text = node.get_ref<std::string const&>();
    if (text.size() < 2 || text.front() != '$') {
        return;
    }
    auto found = variables.find(std::string_view(text).substr(1));
    if (found != variables.end()) {
        node = found->second;
    }
}

auto read_float(json const& object, std::string_view key, std::string const& path)
    -> SM::Expected<std::optional<float>> {
    auto it = object.find(std::string(key));
    if (it == object.end() || it->is_null()) {
        return std::optional<float>{};
    }
    if (!it->is_number()) {
        return std::unexpected(make_type_error(member_path(path, key) + " must be a number"));
    }
    return std::optional<float>{it->get<float>()};
}

auto read_string(json const& object, std::string_view key, std::string const& path)
    -> SM::Expected<std::optional<std::string>> {
    auto it = object.find(std::string(key));
    if (it == object.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return std::unexpected(make_type_error(member_path(path, key) + " must be a string"));
    }
    return std::optional<std::string>{it->get<std::string>()};
}

// Vectors are {"x": .., "y": ..[, "z": ..]} with missing components at 0, or [x, y[, z]].
template <std::size_t N>
auto read_components(json const& object, std::string_view key, std::string const& path)
    -> SM::Expected<std::optional<std::array<float, N>>> {
    auto it = object.find(std::string(key));
    if (it == object.end() || it->is_null()) {
        return std::optional<std::array<float, N>>{};
    }
    auto const            where = member_path(path, key);
    std::array<float, N>  out{};
    constexpr std::string_view names[] = {"x", "y", "z"};
    if (it->is_array()) {
        if (it->size() != N) {
            return std::unexpected(make_error(where + " must have " + std::to_string(N) + " components"));
        }
        for (std::size_t i = 0; i < N; ++i) {
            if (!(*it)[i].is_number()) {
                return std::unexpected(make_type_error(where + " components must be numbers"));
            }
            out[i] = (*it)[i].template get<float>();
        }
        return std::optional<std::array<float, N>>{out};
    }
    if (!it->is_object()) {
        return std::unexpected(make_type_error(where + " must be an object or an array"));
    }
    for (std::size_t i = 0; i < N; ++i) {
        auto component = read_float(*it, names[i], where);
        if (!component) {
            return std::unexpected(component.error());
        }
        out[i] = component->value_or(0.0f);
    }
    return std::optional<std::array<float, N>>{out};
}

auto read_vec2(json const& object, std::string_view key, std::string const& path)
    -> SM::Expected<std::optional<Style::Vec2>> {
    auto components = read_components<2>(object, key, path);
    if (!components) {
        return std::unexpected(components.error());
    }
    if (!components->has_value()) {
        return std::optional<Style::Vec2>{};
    }
    auto const& v = **components;
    return std::optional<Style::Vec2>{Style::Vec2{v[0], v[1]}};
}

auto read_vec3(json const& object, std::string_view key, std::string const& path)
    -> SM::Expected<std::optional<Style::Vec3>> {
    auto components = read_components<3>(object, key, path);
    if (!components) {
        return std::unexpected(components.error());
    }
    if (!components->has_value()) {
        return std::optional<Style::Vec3>{};
    }
    auto const& v = **components;
    return std::optional<Style::Vec3>{Style::Vec3{v[0], v[1], v[2]}};
}

// Reads one optional member into `field`, returning the error when the member is malformed.
#define SM_READ_INTO(field, reader, object, key, path)                                                       \
    do {                                                                                                     \
        auto sm_read_value = reader(object, key, path);                                                      \
        if (!sm_read_value) {                                                                                \
            return std::unexpected(sm_read_value.error());                                                   \
        }                                                                                                    \
        field = std::move(*sm_read_value);                                                                   \
    } while (false)

auto find_group(json const& object, std::string_view key, std::string const& path)
    -> SM::Expected<json const*> {
    auto it = object.find(std::string(key));
    if (it == object.end() || it->is_null()) {
        return static_cast<json const*>(nullptr);
    }
    if (!it->is_object()) {
        return std::unexpected(make_type_error(member_path(path, key) + " must be an object"));
    }
    return &*it;
}

auto decode_patch(json const& object, std::string const& path) -> SM::Expected<Style::StylePatch> {
    Style::StylePatch patch;

    SM_READ_INTO(patch.background_color, read_string, object, "backgroundColor", path);
    SM_READ_INTO(patch.opacity, read_float, object, "opacity", path);
    SM_READ_INTO(patch.radius, read_float, object, "radius", path);
    SM_READ_INTO(patch.text_color, read_string, object, "textColor", path);
    SM_READ_INTO(patch.font_size, read_float, object, "fontSize", path);
    SM_READ_INTO(patch.character_spacing, read_float, object, "characterSpacing", path);
    SM_READ_INTO(patch.scale, read_vec2, object, "scale", path);
    SM_READ_INTO(patch.rotation, read_vec3, object, "rotation", path);

    auto border = find_group(object, "border", path);
    if (!border) {
        return std::unexpected(border.error());
    }
    if (*border) {
        auto const      where = member_path(path, "border");
        Style::BorderPatch group;
        SM_READ_INTO(group.width, read_float, **border, "width", where);
        SM_READ_INTO(group.color, read_string, **border, "color", where);
        patch.border = std::move(group);
    }

    auto shadow = find_group(object, "shadow", path);
    if (!shadow) {
        return std::unexpected(shadow.error());
    }
    if (*shadow) {
        auto const         where = member_path(path, "shadow");
        Style::ShadowPatch group;
        std::optional<float> x;
        std::optional<float> y;
        SM_READ_INTO(x, read_float, **shadow, "x", where);
        SM_READ_INTO(y, read_float, **shadow, "y", where);
        if (x && y) {
            group.offset = Style::Vec2{*x, *y};
        }
        SM_READ_INTO(group.color, read_string, **shadow, "color", where);
        SM_READ_INTO(group.softness, read_float, **shadow, "softness", where);
        patch.shadow = std::move(group);
    }

    auto rect = find_group(object, "rect", path);
    if (!rect) {
        return std::unexpected(rect.error());
    }
    if (*rect) {
        auto const       where = member_path(path, "rect");
        Style::RectPatch group;
        SM_READ_INTO(group.anchored_position, read_vec2, **rect, "anchoredPosition", where);
        SM_READ_INTO(group.size_delta, read_vec2, **rect, "sizeDelta", where);
        SM_READ_INTO(group.anchor_min, read_vec2, **rect, "anchorMin", where);
        SM_READ_INTO(group.anchor_max, read_vec2, **rect, "anchorMax", where);
        SM_READ_INTO(group.pivot, read_vec2, **rect, "pivot", where);
        patch.rect = std::move(group);
    }

    auto layout = find_group(object, "layoutItem", path);
    if (!layout) {
        return std::unexpected(layout.error());
    }
    if (*layout) {
        auto const         where = member_path(path, "layoutItem");
        Style::LayoutPatch group;
        SM_READ_INTO(group.preferred_width, read_float, **layout, "preferredWidth", where);
        SM_READ_INTO(group.preferred_height, read_float, **layout, "preferredHeight", where);
        SM_READ_INTO(group.flexible_width, read_float, **layout, "flexibleWidth", where);
        SM_READ_INTO(group.flexible_height, read_float, **layout, "flexibleHeight", where);
        patch.layout = std::move(group);
    }

    return patch;
}

auto decode_transition(json const& object, std::string const& path) -> SM::Expected<Animation::Transition> {
    Animation::Transition transition;

    std::optional<float> duration;
    std::optional<float> delay;
    std::optional<std::string> ease;
    SM_READ_INTO(duration, read_float, object, "duration", path);
    SM_READ_INTO(delay, read_float, object, "delay", path);
    SM_READ_INTO(ease, read_string, object, "ease", path);

    if (duration) {
        transition.duration = std::max(*duration, 0.0f);
    }
    if (delay) {
        transition.delay = std::max(*delay, 0.0f);
    }
    if (ease) {
        if (auto parsed = Animation::ParseEase(*ease)) {
            transition.ease = *parsed;
        } else {
            sm_log("Unknown ease '" + *ease + "' at " + path + ", keeping default", "StyleSheet", "WARNING");
        }
    }
    return transition;
}

auto decode_repeat(json const& object, std::string const& path) -> SM::Expected<Animation::Repeat> {
    Animation::Repeat repeat;

    auto cycles = object.find("cycles");
    if (cycles != object.end() && !cycles->is_null()) {
        if (!cycles->is_number_integer()) {
            return std::unexpected(make_type_error(member_path(path, "cycles") + " must be an integer"));
        }
        bool in_range = false;
        if (cycles->is_number_unsigned()) {
            in_range = cycles->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
        } else {
            auto const value = cycles->get<std::int64_t>();
            in_range = value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
        }
        if (!in_range) {
            return std::unexpected(make_error(member_path(path, "cycles") + " is out of range"));
        }
        repeat.cycles = cycles->get<int>();
    }

    std::optional<std::string> mode;
    SM_READ_INTO(mode, read_string, object, "cycleMode", path);
    if (mode) {
        if (auto parsed = Animation::ParseCycleMode(*mode)) {
            repeat.cycle_mode = *parsed;
        } else {
            sm_log("Unknown cycle mode '" + *mode + "' at " + path + ", keeping default", "StyleSheet", "WARNING");
        }
    }
    return repeat;
}

auto decode_state(json const& object, std::string const& path) -> SM::Expected<Animation::StateDefinition> {
    Animation::StateDefinition definition;

    auto patch = decode_patch(object, path);
    if (!patch) {
        return std::unexpected(patch.error());
    }
    definition.patch = std::move(*patch);

    auto transition = find_group(object, "transition", path);
    if (!transition) {
        return std::unexpected(transition.error());
    }
    if (*transition) {
        auto decoded = decode_transition(**transition, member_path(path, "transition"));
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        definition.transition = *decoded;
    }
    return definition;
}

auto decode_animation(json const& object, std::string const& path) -> SM::Expected<Animation::AnimationConfig> {
    Animation::AnimationConfig config;

    for (auto const& [key, value] : object.items()) {
        auto const where = member_path(path, key);
        if (key == "transition" && value.is_object()) {
            auto transition = decode_transition(value, where);
            if (!transition) {
                return std::unexpected(transition.error());
            }
            config.transition = *transition;
            continue;
        }
        if (key == "repeat" && value.is_object()) {
            auto repeat = decode_repeat(value, where);
            if (!repeat) {
                return std::unexpected(repeat.error());
            }
            config.repeat = *repeat;
            continue;
        }
        if (!value.is_object()) {
            continue;
        }
        auto state = Animation::ParseAnimationState(key);
        if (!state || *state == Animation::AnimationState::Normal) {
            continue;
        }
        auto definition = decode_state(value, where);
        if (!definition) {
            return std::unexpected(definition.error());
        }
        *config.definition(*state) = std::move(*definition);
    }
    return config;
}

auto decode_element(std::string selector, json const& object, std::string const& path)
    -> SM::Expected<ElementDefinition> {
    ElementDefinition element;
    element.selector = std::move(selector);

    auto patch = decode_patch(object, path);
    if (!patch) {
        return std::unexpected(patch.error());
    }
    element.base = std::move(*patch);

    for (auto const& [key, value] : object.items()) {
        if (!value.is_object()) {
            continue;
        }
        if (key == "animation") {
            auto animation = decode_animation(value, member_path(path, key));
            if (!animation) {
                return std::unexpected(animation.error());
            }
            element.animation = std::move(*animation);
            continue;
        }
        if (!key.empty() && (key.front() == '.' || key.front() == '#')) {
            auto child = decode_element(key, value, member_path(path, key));
            if (!child) {
                return std::unexpected(child.error());
            }
            element.children.push_back(std::move(*child));
        }
    }
    return element;
}

} // namespace

auto ElementDefinition::child(std::string_view name) const -> ElementDefinition const* {
    for (auto const& candidate : this->children) {
        if (candidate.selector == name) {
            return &candidate;
        }
    }
    return nullptr;
}

auto StyleSheet::Resolve(std::string_view id, std::span<std::string const> classes) const
    -> ElementDefinition const* {
    if (!id.empty()) {
        auto found = this->styles.find("#" + std::string(id));
        if (found != this->styles.end()) {
            return &found->second;
        }
    }
    for (auto const& name : classes) {
        auto found = this->styles.find("." + name);
        if (found != this->styles.end()) {
            return &found->second;
        }
    }
    return nullptr;
}

auto ParseStyleSheet(std::string_view text) -> SM::Expected<StyleSheet> {
    auto root = json::parse(text.begin(), text.end(), nullptr, false);
    if (root.is_discarded()) {
        return std::unexpected(make_error("stylesheet is not valid JSON"));
    }
    if (!root.is_object()) {
        return std::unexpected(make_type_error("stylesheet root must be an object"));
    }

    VariableTable variables;
    if (auto vars = root.find("variables"); vars != root.end() && vars->is_object()) {
        for (auto const& [name, value] : vars->items()) {
            variables.emplace(name, value);
        }
    }

    StyleSheet sheet;
    auto       styles = root.find("styles");
    if (styles == root.end() || !styles->is_object()) {
        return sheet;
    }

    resolve_variables(*styles, variables);
    for (auto const& [selector, value] : styles->items()) {
        if (!value.is_object()) {
            continue;
        }
        auto element = decode_element(selector, value, "styles." + selector);
        if (!element) {
            return std::unexpected(element.error());
        }
        sheet.styles.insert_or_assign(selector, std::move(*element));
    }
    return sheet;
}

auto LoadStyleSheet(std::filesystem::path const& path) -> SM::Expected<StyleSheet> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(make_error("stylesheet not found: " + path.string(), SM::Error::Code::NotFound));
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::unexpected(make_error("unable to open stylesheet: " + path.string(), SM::Error::Code::UnknownError));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto sheet = ParseStyleSheet(buffer.str());
    if (!sheet) {
        sm_log("Failed to load " + path.string() + ": " + SM::describeError(sheet.error()), "StyleSheet", "ERROR");
    }
    return sheet;
}

#undef SM_READ_INTO

} // namespace SM::Config
