#pragma once

#include "capture/capture_source.hpp"

#include <chrono>
#include <vector>

namespace platform {

// ImageMagick import, scrot, gnome-screenshot, each writing a full-screen PNG.
std::vector<CaptureSource::NamedScreenshotMethod>
default_screenshot_methods(std::chrono::milliseconds timeout);

} // namespace platform
