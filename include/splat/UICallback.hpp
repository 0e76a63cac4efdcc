#ifndef INKSPLATTER_UICALLBACK_HPP
#define INKSPLATTER_UICALLBACK_HPP

#include <functional>
#include <string>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

namespace splat
{

template<class... Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};

template<class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

struct ContinuousCallback
{
	std::function<void(float)> setter;
	std::function<float()> getter;
	float min;
	float max;
	bool logarithmic = false;
};

struct DiscreteCallback
{
	std::function<void(int)> setter;
	std::function<int()> getter;
	int min;
	int max;
};

struct ToggleCallback
{
	std::function<void(bool)> setter;
	std::function<bool()> getter;
};

struct ColorCallback
{
	std::function<void(glm::vec3)> setter;
	std::function<glm::vec3()> getter;
};

/// One of several exclusive labelled options, e.g. a blend mode
struct ChoiceCallback
{
	std::function<void(int)> setter;
	std::function<int()> getter;
	std::vector<std::string> options;
};

enum class CallbackType
{
	Continuous,
	Discrete,
	Toggle,
	Color,
	Choice
};

/**
 * @brief A single editable parameter exposed to the control panel
 *
 * The host builds these per layer and renders them with the matching ImGui
 * widget, so the panel code does not need to know about layer internals.
 */
struct UICallback
{
	std::string field_name;
	std::variant<ContinuousCallback, DiscreteCallback, ToggleCallback, ColorCallback, ChoiceCallback> callback;

	UICallback(std::string name, ContinuousCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, DiscreteCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, ToggleCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, ColorCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, ChoiceCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	[[nodiscard]] CallbackType get_callback_type() const
	{
		return std::visit(
			overloaded{
				[](const ContinuousCallback&) { return CallbackType::Continuous; },
				[](const DiscreteCallback&) { return CallbackType::Discrete; },
				[](const ToggleCallback&) { return CallbackType::Toggle; },
				[](const ColorCallback&) { return CallbackType::Color; },
				[](const ChoiceCallback&) { return CallbackType::Choice; },
			},
			callback);
	}

	template<class T>
	[[nodiscard]] const T* as() const
	{
		return std::get_if<T>(&callback);
	}
};

} // namespace splat

#endif // INKSPLATTER_UICALLBACK_HPP
