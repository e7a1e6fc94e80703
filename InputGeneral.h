#pragma once

#include <functional>
#include <limits>
#include <string>

constexpr int InputControlHeight = 23;
constexpr int DefaultLabelWidth = 200;
constexpr int DefaultInputWidth = 200;
