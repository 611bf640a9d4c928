#ifndef PARTICLEMORPH_UICALLBACK_HPP
#define PARTICLEMORPH_UICALLBACK_HPP

#include <functional>
#include <variant>
#include <string>

#include <glm/glm.hpp>

#include "Overloaded.hpp"

namespace morph
{

/**
 * @brief Callback for continuous (float) UI parameters
 */
struct ContinuousCallback
{
	std::function<void(float)> setter;
	std::function<float()> getter;
	float min;
	float max;
	bool logarithmic = false;  // Optional: use logarithmic scale in UI
};

/**
 * @brief Callback for discrete (int) UI parameters
 */
struct DiscreteCallback
{
	std::function<void(int)> setter;
	std::function<int()> getter;
	int min;
	int max;
};

/**
 * @brief Callback for toggle (bool) UI parameters
 */
struct ToggleCallback
{
	std::function<void(bool)> setter;
	std::function<bool()> getter;
};

/**
 * @brief Callback for an RGB colour in [0,1]
 */
struct ColorCallback
{
	std::function<void(glm::vec3)> setter;
	std::function<glm::vec3()> getter;
};

/**
 * @brief Read-only value, shown as a progress bar when max > min
 */
struct ReadoutCallback
{
	std::function<float()> getter;
	float min = 0.0f;
	float max = 0.0f;
};

/**
 * @brief Button
 */
struct ActionCallback
{
	std::function<void()> trigger;
};

enum class CallbackType
{
	Continuous,
	Discrete,
	Toggle,
	Color,
	Readout,
	Action
};

/**
 * @brief Generic UI callback
 *
 * The controller and the renderer return vectors of these to expose their tunables without
 * knowing about the UI toolkit. The panel interprets the callback type and draws the widget.
 */
struct UICallback
{
	std::string field_name;
	std::variant<ContinuousCallback, DiscreteCallback, ToggleCallback,
				 ColorCallback, ReadoutCallback, ActionCallback> callback;

	UICallback(std::string name, ContinuousCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, DiscreteCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, ToggleCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, ColorCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, ReadoutCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, ActionCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	[[nodiscard]] CallbackType get_callback_type() const
	{
		return std::visit(
			overloaded{
				[](const ContinuousCallback&) { return CallbackType::Continuous; },
				[](const DiscreteCallback&) { return CallbackType::Discrete; },
				[](const ToggleCallback&) { return CallbackType::Toggle; },
				[](const ColorCallback&) { return CallbackType::Color; },
				[](const ReadoutCallback&) { return CallbackType::Readout; },
				[](const ActionCallback&) { return CallbackType::Action; },
			},
			callback);
	}

	[[nodiscard]] const ContinuousCallback* as_continuous() const {
		return std::get_if<ContinuousCallback>(&callback);
	}

	[[nodiscard]] const DiscreteCallback* as_discrete() const {
		return std::get_if<DiscreteCallback>(&callback);
	}

	[[nodiscard]] const ToggleCallback* as_toggle() const {
		return std::get_if<ToggleCallback>(&callback);
	}

	[[nodiscard]] const ColorCallback* as_color() const {
		return std::get_if<ColorCallback>(&callback);
	}

	[[nodiscard]] const ReadoutCallback* as_readout() const {
		return std::get_if<ReadoutCallback>(&callback);
	}

	[[nodiscard]] const ActionCallback* as_action() const {
		return std::get_if<ActionCallback>(&callback);
	}
};

} // namespace morph

#endif // PARTICLEMORPH_UICALLBACK_HPP
