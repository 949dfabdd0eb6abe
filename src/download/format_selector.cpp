#include "download/format_selector.hpp"

namespace vidmcp::download {

using protocol::Quality;

Quality parse_quality(const std::string& text) {
    if (text == "best") {
        return Quality::Best;
    }
    if (text == "worst") {
        return Quality::Worst;
    }
    if (text == "480p") {
        return Quality::P480;
    }
    if (text == "360p") {
        return Quality::P360;
    }
    return Quality::P720;
}

std::string format_constraint(const Quality quality, const bool audio_only) {
    if (audio_only) {
        return "bestaudio/best";
    }
    switch (quality) {
        case Quality::Best:
            return "best";
        case Quality::Worst:
            return "worst";
        case Quality::P480:
            return "best[height<=480]";
        case Quality::P360:
            return "best[height<=360]";
        case Quality::P720:
        default:
            return "best[height<=720]";
    }
}

}  // namespace vidmcp::download
