#pragma once

#include "Errors.hpp"
#include "UICallback.hpp"

#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace morph {

/**
 * @brief Timing of the morph tween and the auto-advance timer, in seconds
 */
struct MorphConfig {
    float duration = 3.0f;
    float auto_advance_interval = 4.0f;
    bool auto_advance = true;
};

/**
 * @brief Morph state as seen by the renderer for one frame
 */
struct MorphSnapshot {
    std::size_t current_index = 0;
    std::size_t target_index = 0;
    float progress = 0.0f;
};

struct TransitionStarted {
    std::size_t from;
    std::size_t to;
};

struct TransitionFinished {
    std::size_t index;
};

using MorphEvent = std::variant<TransitionStarted, TransitionFinished>;
using MorphListener = std::function<void(const MorphEvent&)>;

/**
 * @brief Owns "which variant is shown" and drives the 0 -> 1 progress between two variants
 *
 * Requests never change state directly. morph_to() and the auto-advance timer both append
 * commands to a single queue which tick() drains once per frame, so every frame renders
 * a consistent snapshot. At most one transition is in flight; a new request preempts it,
 * keeping the current variant as the source and restarting progress at 0. Auto-advance
 * steps from the latest requested variant, at most once per tick.
 */
class MorphController {
public:
    explicit MorphController(std::size_t variant_count, MorphConfig config = {});

    // Non-copyable, non-movable (UI callbacks capture this)
    MorphController(const MorphController&) = delete;
    MorphController& operator=(const MorphController&) = delete;
    MorphController(MorphController&&) = delete;
    MorphController& operator=(MorphController&&) = delete;

    /**
     * @brief Request a transition to the given variant
     *
     * The request is queued and applied by the next tick(). An out-of-range index is
     * rejected immediately and nothing is queued.
     */
    std::expected<void, InvalidVariantIndexError> morph_to(std::size_t index);

    /**
     * @brief Per-frame update
     *
     * Advances the active transition, then the auto-advance timer, then drains the
     * command queue once in FIFO order.
     *
     * @param dt Seconds since the previous tick (negative values are treated as 0)
     */
    void tick(float dt);

    [[nodiscard]] std::size_t current_index() const { return m_current; }
    [[nodiscard]] std::size_t target_index() const { return m_target; }
    [[nodiscard]] float progress() const { return m_progress; }
    [[nodiscard]] bool is_transitioning() const { return m_transitioning; }
    [[nodiscard]] std::size_t variant_count() const { return m_variant_count; }
    [[nodiscard]] std::size_t pending_commands() const { return m_commands.size(); }
    [[nodiscard]] MorphSnapshot snapshot() const { return {m_current, m_target, m_progress}; }

    [[nodiscard]] bool auto_advance() const { return m_config.auto_advance; }
    void set_auto_advance(bool enabled);

    [[nodiscard]] float duration() const { return m_config.duration; }
    void set_duration(float seconds) { m_config.duration = seconds; }

    [[nodiscard]] float auto_advance_interval() const { return m_config.auto_advance_interval; }
    void set_auto_advance_interval(float seconds) { m_config.auto_advance_interval = seconds; }

    void add_listener(MorphListener listener);

    /**
     * @brief Progress readout, shape selector, auto-advance toggle, timing sliders and one button per variant
     *
     * @param variant_names Button labels; index i requests morph_to(i)
     */
    std::vector<UICallback> get_ui_callbacks(std::span<const std::string> variant_names = {});

private:
    struct MorphToCommand {
        std::size_t index;
    };
    struct AdvanceCommand {};
    using Command = std::variant<MorphToCommand, AdvanceCommand>;

    void advance_transition(float dt);
    void advance_timer(float dt);
    void drain_commands();
    void start_transition(std::size_t index);
    void notify(const MorphEvent& event);

    std::size_t m_variant_count;
    MorphConfig m_config;

    std::size_t m_current = 0;
    std::size_t m_target = 0;
    float m_progress = 0.0f;
    float m_elapsed = 0.0f;
    bool m_transitioning = false;

    float m_timer = 0.0f;
    std::deque<Command> m_commands;
    std::vector<MorphListener> m_listeners;
};

} // namespace morph
