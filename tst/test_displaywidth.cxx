/*
 * Copyright (c) 2017-2018, Marcin Konarski (amok at codestation.org)
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 *   * Redistributions of source code must retain the above copyright notice,
 *     this list of conditions and the following disclaimer.
 *   * Redistributions in binary form must reproduce the above copyright
 *     notice, this list of conditions and the following disclaimer in the
 *     documentation and/or other materials provided with the distribution.
 *   * Neither the name of Redis nor the names of its contributors may be used
 *     to endorse or promote products derived from this software without
 *     specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */


#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <vector>

#include "util.hxx"
#include "prompt.hxx"
#include "unicodestring.hxx"

using namespace simpleprompt;

BOOST_AUTO_TEST_SUITE(TestDisplayWidth)

BOOST_AUTO_TEST_CASE(TestAsciiIsOneColumn) {

    BOOST_CHECK_EQUAL(display_width(U'a'), 1);
    BOOST_CHECK_EQUAL(display_width(U' '), 1);
    BOOST_CHECK_EQUAL(display_width(U'~'), 1);
}

BOOST_AUTO_TEST_CASE(TestControlAndCombiningAreZero) {

    BOOST_CHECK_EQUAL(display_width(U'\t'), 0);
    BOOST_CHECK_EQUAL(display_width(0x7f), 0);
    BOOST_CHECK_EQUAL(display_width(0x0301), 0);
}

BOOST_AUTO_TEST_CASE(TestWideCharacters) {

    BOOST_CHECK_EQUAL(display_width(0x4e2d), 2);
    BOOST_CHECK_EQUAL(display_width(0xac00), 2);
    BOOST_CHECK_EQUAL(display_width(0x1f600), 2);
    BOOST_CHECK_EQUAL(display_width(0x20000), 2);
}

BOOST_AUTO_TEST_CASE(TestSurrogatePairWidths) {

    UnicodeString text(std::string("a\xf0\x9f\x98\x80" "b"));
    BOOST_REQUIRE_EQUAL(text.length(), 4);

    std::vector<char> widths(4);
    recompute_character_widths(text.get(), widths.data(), text.length());

    BOOST_CHECK_EQUAL(widths[0], 1);
    BOOST_CHECK_EQUAL(widths[1], 0);
    BOOST_CHECK_EQUAL(widths[2], 2);
    BOOST_CHECK_EQUAL(widths[3], 1);
}

BOOST_AUTO_TEST_CASE(TestMalformedUtf8Replaced) {

    UnicodeString text(std::string("ab\xff" "cd"));

    BOOST_REQUIRE_EQUAL(text.length(), 5);
    BOOST_CHECK(text[2] == 0xfffd);
    BOOST_CHECK(text[4] == u'd');
    BOOST_CHECK_EQUAL(text.to_utf8(), "ab\xef\xbf\xbd" "cd");
}

BOOST_AUTO_TEST_CASE(TestPromptColorHasNoWidth) {

    UnicodeString prompt(std::string("\x1b[1;32mok\x1b[0m> "));
    std::vector<char> widths(static_cast<size_t>(prompt.length()));
    compute_prompt_widths(prompt.get(), widths.data(), prompt.length());

    int width(0);
    for (char w : widths) {
        width += w;
    }
    BOOST_CHECK_EQUAL(width, 4);
    BOOST_CHECK_EQUAL(sgr_sequence_length(prompt.get(), prompt.length()), 7);
}

BOOST_AUTO_TEST_CASE(TestSplitPrompt) {

    prompt_lines_t lines(split_prompt("first\r\nsecond\n\x07third> "));

    BOOST_REQUIRE_EQUAL(lines.size(), 3u);
    BOOST_CHECK(lines[0] == UnicodeString(std::string("first")));
    BOOST_CHECK(lines[1] == UnicodeString(std::string("second")));
    BOOST_CHECK(lines[2] == UnicodeString(std::string("third> ")));
}

BOOST_AUTO_TEST_CASE(TestSplitEmptyPrompt) {

    prompt_lines_t lines(split_prompt(""));

    BOOST_REQUIRE_EQUAL(lines.size(), 1u);
    BOOST_CHECK(lines[0].is_empty());
}

BOOST_AUTO_TEST_SUITE_END()
