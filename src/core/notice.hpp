#pragma once

#include <functional>
#include <string>

enum class Severity { Info, Warning, Error };

using NoticeCallback = std::function<void(const std::string& message, Severity severity)>;
