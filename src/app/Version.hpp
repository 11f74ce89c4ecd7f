#pragma once

// TEXTSENSE_VERSION_STRING is injected by CMake from project(VERSION).
#ifndef TEXTSENSE_VERSION_STRING
#define TEXTSENSE_VERSION_STRING "0.0.0"
#endif

namespace app
{

inline constexpr const char* kVersionString = TEXTSENSE_VERSION_STRING;

} // namespace app
