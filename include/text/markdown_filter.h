#pragma once

#include <string>

namespace parley {

/**
 * @brief Strip markdown so a synthesizer does not read markup aloud
 *
 * Removes emphasis markers, heading hashes, list bullets, code fences and
 * inline code ticks, and reduces [label](url) links to their label.
 */
std::string strip_markdown(const std::string& text);

} // namespace parley
