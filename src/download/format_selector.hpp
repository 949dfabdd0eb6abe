#pragma once

#include <string>
#include "protocol/download_contract.hpp"

namespace vidmcp::download {

// "best", "worst", "720p", "480p", "360p". Anything else maps to 720p.
protocol::Quality parse_quality(const std::string& text);

// yt-dlp format constraint: "best", "worst" or "best[height<=N]".
// Audio-only downloads always use "bestaudio/best".
std::string format_constraint(protocol::Quality quality, bool audio_only = false);

}  // namespace vidmcp::download
