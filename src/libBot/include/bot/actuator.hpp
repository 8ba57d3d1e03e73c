#pragma once

#include "vision/types.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>
#include <string_view>

namespace flyff::bot {

enum class Key { W, A, S, D, Space, Z, Escape };

std::string_view toString(Key key);

//! Input side of the game client. Actions are fire-and-forget; failures are logged by the implementation.
class IActuator {
public:
	virtual ~IActuator() = default;

	virtual void click(const vision::Point& point) = 0;
	virtual void pressKey(Key key)                 = 0;
	virtual void holdKey(Key key)                  = 0;
	virtual void releaseKey(Key key)               = 0;
	virtual void useSlot(int slot)                 = 0;

	//! Block for the given duration. Used between the steps of a maneuver.
	virtual void wait(std::chrono::milliseconds duration) = 0;
};

//! Screenshot source of the game client.
class IFrameSource {
public:
	virtual ~IFrameSource() = default;

	//! Latest frame, or nothing if the capture failed or timed out.
	virtual std::optional<cv::Mat> captureFrame() = 0;
};

} // namespace flyff::bot
