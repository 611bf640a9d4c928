#include "morph/MorphController.hpp"
#include "morph/Logger.hpp"
#include "morph/Overloaded.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace morph {

MorphController::MorphController(std::size_t variant_count, MorphConfig config)
    : m_variant_count(variant_count)
    , m_config(config)
{
}

std::expected<void, InvalidVariantIndexError> MorphController::morph_to(std::size_t index) {
    if (index >= m_variant_count)
        return std::unexpected(InvalidVariantIndexError{index, m_variant_count});

    m_commands.emplace_back(MorphToCommand{index});
    return {};
}

void MorphController::tick(float dt) {
    dt = std::max(dt, 0.0f);
    advance_transition(dt);
    advance_timer(dt);
    drain_commands();
}

void MorphController::set_auto_advance(bool enabled) {
    if (m_config.auto_advance == enabled)
        return;
    m_config.auto_advance = enabled;
    m_timer = 0.0f;
    Logger::instance().debug("Auto-advance {}", enabled ? "enabled" : "disabled");
}

void MorphController::add_listener(MorphListener listener) {
    m_listeners.push_back(std::move(listener));
}

void MorphController::advance_transition(float dt) {
    if (!m_transitioning)
        return;

    m_elapsed += dt;
    float linear = m_config.duration > 0.0f ? std::min(m_elapsed / m_config.duration, 1.0f) : 1.0f;
    // duration may be shortened mid-transition, never let that move progress backwards
    m_progress = std::max(m_progress, linear);

    if (m_progress >= 1.0f) {
        m_progress = 1.0f;
        m_current = m_target;
        m_transitioning = false;
        notify(TransitionFinished{m_current});
    }
}

void MorphController::advance_timer(float dt) {
    if (!m_config.auto_advance || m_config.auto_advance_interval <= 0.0f || m_variant_count == 0)
        return;

    m_timer += dt;
    if (m_timer < m_config.auto_advance_interval)
        return;

    // One advance per tick, a stalled frame drops the extra intervals but keeps the phase
    m_timer = std::fmod(m_timer, m_config.auto_advance_interval);
    m_commands.emplace_back(AdvanceCommand{});
}

void MorphController::drain_commands() {
    // Commands queued by listeners while draining wait for the next tick
    std::deque<Command> commands;
    commands.swap(m_commands);

    for (const auto& command : commands) {
        std::visit(
            overloaded{
                [this](const MorphToCommand& cmd) { start_transition(cmd.index); },
                // m_target is the latest request, equal to m_current when idle
                [this](const AdvanceCommand&) { start_transition((m_target + 1) % m_variant_count); },
            },
            command);
    }
}

void MorphController::start_transition(std::size_t index) {
    m_target = index;
    m_progress = 0.0f;
    m_elapsed = 0.0f;
    m_transitioning = true;
    Logger::instance().debug("Morphing {} -> {}", m_current, m_target);
    notify(TransitionStarted{m_current, m_target});
}

void MorphController::notify(const MorphEvent& event) {
    for (const auto& listener : m_listeners)
        listener(event);
}

std::vector<UICallback> MorphController::get_ui_callbacks(std::span<const std::string> variant_names) {
    std::vector<UICallback> callbacks;

    callbacks.emplace_back("Progress", ReadoutCallback{
        .getter = [this]() { return m_progress; },
        .min = 0.0f,
        .max = 1.0f
    });

    if (m_variant_count > 0) {
        callbacks.emplace_back("Shape", DiscreteCallback{
            .setter = [this](int value) {
                auto index = static_cast<std::size_t>(value);
                if (index == m_target)
                    return;
                if (auto result = morph_to(index); !result)
                    Logger::instance().warn("{}", result.error().describe());
            },
            .getter = [this]() { return static_cast<int>(m_target); },
            .min = 0,
            .max = static_cast<int>(m_variant_count) - 1
        });
    }

    callbacks.emplace_back("Auto advance", ToggleCallback{
        .setter = [this](bool value) { set_auto_advance(value); },
        .getter = [this]() { return m_config.auto_advance; }
    });

    callbacks.emplace_back("Duration (s)", ContinuousCallback{
        .setter = [this](float value) { set_duration(value); },
        .getter = [this]() { return m_config.duration; },
        .min = 0.1f,
        .max = 10.0f
    });

    callbacks.emplace_back("Interval (s)", ContinuousCallback{
        .setter = [this](float value) { set_auto_advance_interval(value); },
        .getter = [this]() { return m_config.auto_advance_interval; },
        .min = 0.5f,
        .max = 20.0f
    });

    for (std::size_t i = 0; i < variant_names.size(); ++i) {
        callbacks.emplace_back(std::format("Morph to {}", variant_names[i]), ActionCallback{
            .trigger = [this, i]() {
                if (auto result = morph_to(i); !result)
                    Logger::instance().warn("{}", result.error().describe());
            }
        });
    }

    return callbacks;
}

} // namespace morph
