/**
 * Text flush buffer and markdown filter tests.
 * Asserts:
 * - "Hello", " world.", " How are you" flush "Hello world." on the second token
 *   and hold " How are you" until end of turn.
 * - The chunk ends at the last boundary in the buffer, including newlines.
 * - Without a boundary the buffer force-flushes once it passes max_chars.
 * - Markdown markup is removed before synthesis; snake_case survives.
 * - Blank transcripts and UTF-8 truncation helpers behave at the edges.
 *
 * Run from build dir: ./test_text_flush_buffer
 */

#include "text/markdown_filter.h"
#include "text/text_flush_buffer.h"
#include "utils.h"
#include <iostream>
#include <string>

using namespace parley;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- sentence boundary flush ---
    {
        TextFlushBuffer buffer;
        ASSERT(!buffer.append("Hello").has_value());
        auto chunk = buffer.append(" world.");
        ASSERT(chunk.has_value() && *chunk == "Hello world.");
        ASSERT(!buffer.append(" How are you").has_value());
        ASSERT(buffer.pending() == " How are you");

        auto rest = buffer.flush();
        ASSERT(rest.has_value() && *rest == " How are you");
        ASSERT(buffer.empty());
        ASSERT(!buffer.flush().has_value());
    }

    // --- last boundary wins, remainder retained ---
    {
        TextFlushBuffer buffer;
        auto chunk = buffer.append("One. Two! Three");
        ASSERT(chunk.has_value() && *chunk == "One. Two!");
        ASSERT(buffer.pending() == " Three");

        chunk = buffer.append("?\nFour");
        ASSERT(chunk.has_value() && *chunk == " Three?\n");
        ASSERT(buffer.pending() == "Four");

        chunk = buffer.append(" line\n");
        ASSERT(chunk.has_value() && *chunk == "Four line\n");
        ASSERT(buffer.empty());
    }

    // --- force flush without a boundary ---
    {
        TextFlushBuffer buffer(10);
        ASSERT(!buffer.append("abcde").has_value());
        ASSERT(!buffer.append("fghij").has_value());  // exactly 10, not over
        auto chunk = buffer.append("k");
        ASSERT(chunk.has_value() && *chunk == "abcdefghijk");
        ASSERT(buffer.empty());
    }
    {
        TextFlushBuffer buffer;
        std::string long_run(401, 'x');
        auto chunk = buffer.append(long_run);
        ASSERT(chunk.has_value() && chunk->size() == 401);
    }

    // --- clear drops pending text ---
    {
        TextFlushBuffer buffer;
        buffer.append("interrupted mid");
        buffer.clear();
        ASSERT(!buffer.flush().has_value());
    }

    // --- strip_markdown ---
    ASSERT(strip_markdown("**Bold** and *soft*") == "Bold and soft");
    ASSERT(strip_markdown("# Title") == "Title");
    ASSERT(strip_markdown("- first\n- second") == "first\nsecond");
    ASSERT(strip_markdown("see [the docs](https://x.test/a) now") == "see the docs now");
    ASSERT(strip_markdown("```\ncode\n```") == "code");
    ASSERT(strip_markdown("use `ls` here") == "use ls here");
    ASSERT(strip_markdown("keep snake_case but _drop_ this") == "keep snake_case but drop this");
    ASSERT(strip_markdown("> quoted") == "quoted");
    ASSERT(strip_markdown("Plain sentence.\n") == "Plain sentence.\n");

    // --- transcript helpers ---
    ASSERT(utils::is_blank_transcript(""));
    ASSERT(utils::is_blank_transcript("  [BLANK_AUDIO] "));
    ASSERT(utils::is_blank_transcript("(music)"));
    ASSERT(!utils::is_blank_transcript("what color is my shirt"));

    std::string accented = "caf\xC3\xA9";  // "café", 5 bytes
    ASSERT(utils::truncate_utf8(accented, 4) == "caf");
    ASSERT(utils::truncate_utf8(accented, 5) == accented);
    ASSERT(utils::truncate_utf8("abc", 2) == "ab");

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All text flush buffer tests passed.\n";
    return 0;
}
