#pragma once

constexpr const char szDefaultFnText[] = "\x1b[35m";
constexpr const char szDefaultMsText[] = "\x1b[01;31m";
constexpr const char szDefaultWaText[] = "\x1b[38;5;229m";
constexpr const char szEraseEOL[] = "\x1b[K";
constexpr const char szDefaultText[] = "\x1b[m";
