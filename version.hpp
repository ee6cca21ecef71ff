#pragma once

constexpr const char g_version_string[] = "1.0.0";
