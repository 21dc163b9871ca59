#pragma once

#include <string>
#include <vector>

namespace screenqa {

/// @brief Canonicalize a free-text answer before comparison.
///
/// Applies, in order: Unicode lowercasing (locale independent), removal of
/// ASCII punctuation (deleted, not replaced by a space), replacement of the
/// whole words "a", "an" and "the" by a space, and collapsing of Unicode
/// whitespace runs into single spaces with leading/trailing whitespace
/// trimmed. Input and output are UTF-8.
///
/// @param text Raw answer text.
/// @return The normalized answer.
std::string normalize_answer(const std::string& text);

/// @brief Split a UTF-8 string on runs of Unicode whitespace.
/// @param text Text to split.
/// @return The non-empty tokens in order.
std::vector<std::string> split_tokens(const std::string& text);

} // namespace screenqa
