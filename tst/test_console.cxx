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
#include <string>
#include <thread>
#include <chrono>

#include "console_impl.hxx"
#include "fake_terminal.hxx"

using namespace simpleprompt;

typedef SimpleConsole::KEY KEY;
typedef SimpleConsole::KeyEvent KeyEvent;
typedef SimpleConsole::KEY_HOOK_RESULT KEY_HOOK_RESULT;
typedef SimpleConsole::ReadLineOptions ReadLineOptions;
typedef SimpleConsole::ReadLineResult ReadLineResult;

namespace {

struct ConsoleFixture {
    FakeTerminal* terminal;
    SimpleConsole::SimpleConsoleImpl console;

    ConsoleFixture()
        : terminal(new FakeTerminal(80, 24))
        , console(SimpleConsole::SimpleConsoleImpl::terminal_t(terminal)) {
    }
};

}

BOOST_FIXTURE_TEST_SUITE(TestConsole, ConsoleFixture)

BOOST_AUTO_TEST_CASE(TestDefaultOptions) {

    ReadLineOptions options;
    BOOST_CHECK(options.inputColor == SimpleConsole::Color::YELLOW);
    BOOST_CHECK_EQUAL(options.maxInputLength, 64 * 1024);
    BOOST_CHECK_EQUAL(options.prompt, "> ");
    BOOST_CHECK_EQUAL(options.multilinePrompt, "# ");
    BOOST_CHECK_EQUAL(options.multilineDelimiter, "\"\"\"");
    BOOST_CHECK(options.lineContinuation == 0);
    BOOST_CHECK(!options.cancelOnEscape);
    BOOST_CHECK(!options.allowEmptyLineInput);
    BOOST_CHECK(options.maskingCharacter == 0);

    BOOST_CHECK(ReadLineOptions::single_line().multilineDelimiter.empty());
    BOOST_CHECK(ReadLineOptions::multi_line().lineContinuation == U'\\');
}

BOOST_AUTO_TEST_CASE(TestEnqueuedInput) {

    BOOST_REQUIRE(console.enqueue_input("hello\n"));
    ReadLineResult result(console.read_line(ReadLineOptions::single_line()));

    BOOST_CHECK(result.kind() == ReadLineResult::KIND::SUCCESS);
    BOOST_CHECK_EQUAL(result.text(), "hello");
    BOOST_CHECK_EQUAL(terminal->row(0), "> hello");
    BOOST_CHECK_EQUAL(terminal->cursor_top(), 1);
    BOOST_CHECK_EQUAL(terminal->raw_mode_calls(), 1);
    BOOST_CHECK_EQUAL(terminal->raw_mode_depth(), 0);
    BOOST_CHECK(!console.is_read_line_in_progress());
}

BOOST_AUTO_TEST_CASE(TestTypedBytes) {

    terminal->type("ab\x1b[Dc\r");
    ReadLineResult result(console.read_line(ReadLineOptions::single_line()));

    BOOST_CHECK(result.is_success());
    BOOST_CHECK_EQUAL(result.text(), "acb");
}

BOOST_AUTO_TEST_CASE(TestCrLfIsOneEnter) {

    BOOST_REQUIRE(console.enqueue_input("one\r\ntwo\n"));

    BOOST_CHECK_EQUAL(console.read_line(ReadLineOptions::single_line()).text(), "one");
    BOOST_CHECK_EQUAL(console.read_line(ReadLineOptions::single_line()).text(), "two");
    BOOST_CHECK_EQUAL(terminal->row(0), "> one");
    BOOST_CHECK_EQUAL(terminal->row(1), "> two");
}

BOOST_AUTO_TEST_CASE(TestPromptFromDefaults) {

    ReadLineOptions options(ReadLineOptions::single_line());
    options.allowEmptyLineInput = true;
    console.set_default_options(options);
    console.enqueue_input("\n");
    ReadLineResult result(console.read_line("$ "));

    BOOST_CHECK(result.is_success());
    BOOST_CHECK(result.text().empty());
    BOOST_CHECK_EQUAL(terminal->row(0), "$");
}

BOOST_AUTO_TEST_CASE(TestTerminationSentinel) {

    console.enqueue_input("abc");
    console.enqueue_termination();
    ReadLineResult result(console.read_line(ReadLineOptions::single_line()));

    BOOST_CHECK(result.kind() == ReadLineResult::KIND::TERMINATED);
    BOOST_CHECK(!console.is_terminated());
    BOOST_CHECK_EQUAL(terminal->raw_mode_depth(), 0);
}

BOOST_AUTO_TEST_CASE(TestTerminateFromAnotherThread) {

    std::thread stopper([this]() {
        while (!console.is_read_line_in_progress()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        console.terminate();
    });
    ReadLineResult result(console.read_line(ReadLineOptions::single_line()));
    stopper.join();

    BOOST_CHECK(result.kind() == ReadLineResult::KIND::TERMINATED);
    BOOST_CHECK(console.is_terminated());
    BOOST_CHECK(console.read_line(ReadLineOptions()).kind() == ReadLineResult::KIND::TERMINATED);
    BOOST_CHECK_EQUAL(terminal->raw_mode_depth(), 0);
}

BOOST_AUTO_TEST_CASE(TestCancelOnEscape) {

    ReadLineOptions options(ReadLineOptions::single_line());
    options.cancelOnEscape = true;
    console.enqueue_input("abc");
    console.emulate_key_press(KeyEvent(KEY::ESCAPE));
    ReadLineResult result(console.read_line(options));

    BOOST_CHECK(result.kind() == ReadLineResult::KIND::CANCELED);
    BOOST_CHECK(result.text().empty());
}

BOOST_AUTO_TEST_CASE(TestEscapeIgnoredByDefault) {

    console.emulate_key_press(KeyEvent(KEY::ESCAPE));
    console.enqueue_input("x\n");
    ReadLineResult result(console.read_line(ReadLineOptions::single_line()));

    BOOST_CHECK(result.is_success());
    BOOST_CHECK_EQUAL(result.text(), "x");
}

BOOST_AUTO_TEST_CASE(TestKeyHook) {

    ReadLineOptions options(ReadLineOptions::single_line());
    int seen(0);
    options.keyInputHook = [&seen](KeyEvent const& key) {
        ++seen;
        return key == KeyEvent::character('a') ? KEY_HOOK_RESULT::HANDLED : KEY_HOOK_RESULT::NOT_HANDLED;
    };
    console.enqueue_input("abca\n");
    ReadLineResult result(console.read_line(options));

    BOOST_CHECK_EQUAL(result.text(), "bc");
    BOOST_CHECK_EQUAL(seen, 5);
}

BOOST_AUTO_TEST_CASE(TestKeyHookCancels) {

    ReadLineOptions options(ReadLineOptions::single_line());
    options.keyInputHook = [](KeyEvent const& key) {
        return key.key == KEY::F5 ? KEY_HOOK_RESULT::CANCEL : KEY_HOOK_RESULT::NOT_HANDLED;
    };
    console.enqueue_input("ab");
    console.emulate_key_press(KeyEvent(KEY::F5));
    console.enqueue_input("\n");

    BOOST_CHECK(console.read_line(options).kind() == ReadLineResult::KIND::CANCELED);
}

BOOST_AUTO_TEST_CASE(TestTextHookRejectsAndRewrites) {

    ReadLineOptions options(ReadLineOptions::single_line());
    int calls(0);
    options.textInputHook = [&calls](std::string& text) {
        ++calls;
        if (text == "bad") {
            return false;
        }
        text = "[" + text + "]";
        return true;
    };
    console.enqueue_input("bad\ngood\n");
    ReadLineResult result(console.read_line(options));

    BOOST_CHECK(result.is_success());
    BOOST_CHECK_EQUAL(result.text(), "[good]");
    BOOST_CHECK_EQUAL(calls, 2);
    BOOST_CHECK_EQUAL(terminal->row(0), "> good");
    BOOST_CHECK_EQUAL(terminal->row(1), "");
}

BOOST_AUTO_TEST_CASE(TestMaskedReadLine) {

    ReadLineOptions options(ReadLineOptions::single_line());
    options.maskingCharacter = U'*';
    console.enqueue_input("secret\n");
    ReadLineResult result(console.read_line(options));

    BOOST_CHECK_EQUAL(result.text(), "secret");
    BOOST_CHECK_EQUAL(terminal->row(0), "> ******");
    BOOST_CHECK_EQUAL(terminal->output().find("secret"), std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestMultiLineReadLine) {

    console.enqueue_input("A\\\nB\\\nC\n");
    ReadLineResult result(console.read_line(ReadLineOptions::multi_line()));

    BOOST_CHECK_EQUAL(result.text(), "ABC");
    BOOST_CHECK_EQUAL(terminal->row(0), "> A\\");
    BOOST_CHECK_EQUAL(terminal->row(1), "# B\\");
    BOOST_CHECK_EQUAL(terminal->row(2), "# C");
    BOOST_CHECK_EQUAL(terminal->cursor_top(), 3);
}

BOOST_AUTO_TEST_CASE(TestWriteLineWithoutSession) {

    console.write_line("plain");

    BOOST_CHECK_EQUAL(terminal->output(), "plain\n");
}

BOOST_AUTO_TEST_CASE(TestWriteLineFromKeyHook) {

    ReadLineOptions options(ReadLineOptions::single_line());
    options.keyInputHook = [this](KeyEvent const& key) {
        if (key.key == KEY::F1) {
            console.write_line("note\nsecond note");
            return KEY_HOOK_RESULT::HANDLED;
        }
        return KEY_HOOK_RESULT::NOT_HANDLED;
    };
    console.enqueue_input("ab");
    console.emulate_key_press(KeyEvent(KEY::F1));
    console.enqueue_input("c\n");
    ReadLineResult result(console.read_line(options));

    BOOST_CHECK_EQUAL(result.text(), "abc");
    BOOST_CHECK_EQUAL(terminal->row(0), "note");
    BOOST_CHECK_EQUAL(terminal->row(1), "second note");
    BOOST_CHECK_EQUAL(terminal->row(2), "> abc");
    BOOST_CHECK_EQUAL(terminal->row(3), "");
}

BOOST_AUTO_TEST_CASE(TestWriteLineFromAnotherThread) {

    std::thread writer([this]() {
        while (!console.is_read_line_in_progress()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        console.write_line("from thread");
        console.enqueue_input("c\n");
    });
    console.enqueue_input("ab");
    ReadLineResult result(console.read_line(ReadLineOptions::single_line()));
    writer.join();

    BOOST_CHECK_EQUAL(result.text(), "abc");
    BOOST_CHECK_EQUAL(terminal->row(0), "from thread");
    BOOST_CHECK_EQUAL(terminal->row(1), "> abc");
}

BOOST_AUTO_TEST_CASE(TestNestedReadLine) {

    std::string answer;
    bool nestedInProgress(false);
    ReadLineOptions options(ReadLineOptions::single_line());
    options.keyInputHook = [this, &answer, &nestedInProgress](KeyEvent const& key) {
        if (key.key != KEY::F2) {
            return KEY_HOOK_RESULT::NOT_HANDLED;
        }
        ReadLineOptions nested(ReadLineOptions::single_line());
        nested.prompt = "? ";
        nestedInProgress = console.is_read_line_in_progress();
        answer = console.read_line(nested).text();
        return KEY_HOOK_RESULT::HANDLED;
    };
    console.enqueue_input("ab");
    console.emulate_key_press(KeyEvent(KEY::F2));
    console.enqueue_input("yes\nc\n");
    ReadLineResult result(console.read_line(options));

    BOOST_CHECK(nestedInProgress);
    BOOST_CHECK_EQUAL(answer, "yes");
    BOOST_CHECK_EQUAL(result.text(), "abc");
    BOOST_CHECK_EQUAL(terminal->row(0), "> ab");
    BOOST_CHECK_EQUAL(terminal->row(1), "? yes");
    BOOST_CHECK_EQUAL(terminal->row(2), "> abc");
    BOOST_CHECK_EQUAL(terminal->raw_mode_calls(), 1);
    BOOST_CHECK_EQUAL(terminal->raw_mode_depth(), 0);
}

BOOST_AUTO_TEST_CASE(TestResizeMidEdit) {

    ReadLineOptions options(ReadLineOptions::single_line());
    options.keyInputHook = [this](KeyEvent const& key) {
        if (key.key == KEY::F3) {
            terminal->set_size(40, 24);
            return KEY_HOOK_RESULT::HANDLED;
        }
        return KEY_HOOK_RESULT::NOT_HANDLED;
    };
    console.enqueue_input(std::string(60, 'x'));
    console.emulate_key_press(KeyEvent(KEY::F3));
    console.emulate_key_press(KeyEvent(KEY::END));
    console.enqueue_input("\n");
    ReadLineResult result(console.read_line(options));

    BOOST_CHECK_EQUAL(result.text(), std::string(60, 'x'));
    BOOST_CHECK_EQUAL(terminal->row(0), "> " + std::string(38, 'x'));
    BOOST_CHECK_EQUAL(terminal->row(1), std::string(22, 'x'));
    BOOST_CHECK_EQUAL(terminal->cursor_top(), 2);
}

BOOST_AUTO_TEST_CASE(TestStartsBelowPartialLine) {

    terminal->write8("partial", 7);
    console.enqueue_input("x\n");
    ReadLineResult result(console.read_line(ReadLineOptions::single_line()));

    BOOST_CHECK_EQUAL(result.text(), "x");
    BOOST_CHECK_EQUAL(terminal->row(0), "partial");
    BOOST_CHECK_EQUAL(terminal->row(1), "> x");
}

BOOST_AUTO_TEST_CASE(TestInputQueueCapacity) {

    BOOST_CHECK(!console.enqueue_input(std::string(SimpleConsole::SimpleConsoleImpl::INPUT_QUEUE_CAPACITY + 1, 'a')));
    BOOST_CHECK(console.enqueue_input(std::string(SimpleConsole::SimpleConsoleImpl::INPUT_QUEUE_CAPACITY, 'a')));
    BOOST_CHECK(!console.emulate_key_press(KeyEvent::character('b')));
    BOOST_CHECK(!console.enqueue_termination());
}

BOOST_AUTO_TEST_CASE(TestMalformedInjectedTextKept) {

    BOOST_REQUIRE(console.enqueue_input("ab\xff" "cd\n"));
    ReadLineResult result(console.read_line(ReadLineOptions::single_line()));

    BOOST_CHECK(result.is_success());
    BOOST_CHECK_EQUAL(result.text(), "ab\xef\xbf\xbd" "cd");
}

BOOST_AUTO_TEST_CASE(TestPlainInputWhenRawModeUnavailable) {

    terminal->set_fails_raw_mode(true);
    terminal->pipe_input("typed line\r\nsec");
    terminal->pipe_input("ond\r");
    terminal->pipe_input("\nthird");
    terminal->close_input();

    BOOST_CHECK_EQUAL(console.read_line(ReadLineOptions::single_line()).text(), "typed line");
    BOOST_CHECK_EQUAL(console.read_line(ReadLineOptions::single_line()).text(), "second");
    ReadLineResult last(console.read_line(ReadLineOptions::single_line()));
    BOOST_CHECK(last.is_success());
    BOOST_CHECK_EQUAL(last.text(), "third");
    BOOST_CHECK(console.read_line(ReadLineOptions::single_line()).kind() == ReadLineResult::KIND::TERMINATED);
    BOOST_CHECK(!console.is_read_line_in_progress());
    BOOST_CHECK_EQUAL(terminal->raw_mode_depth(), 0);
}

BOOST_AUTO_TEST_CASE(TestPlainInputHonorsTerminationSentinel) {

    terminal->set_fails_raw_mode(true);
    console.enqueue_termination();
    terminal->pipe_input("from stdin\n");

    BOOST_CHECK(console.read_line(ReadLineOptions::single_line()).kind() == ReadLineResult::KIND::TERMINATED);
    BOOST_CHECK_EQUAL(console.read_line(ReadLineOptions::single_line()).text(), "from stdin");
}

BOOST_AUTO_TEST_CASE(TestPlainInputTakesInjectedKeys) {

    terminal->set_fails_raw_mode(true);
    console.enqueue_input("ab");
    console.emulate_key_press(KeyEvent(KEY::BACKSPACE));
    console.enqueue_input("c\n");
    ReadLineResult result(console.read_line(ReadLineOptions::single_line()));

    BOOST_CHECK(result.is_success());
    BOOST_CHECK_EQUAL(result.text(), "ac");
}

BOOST_AUTO_TEST_CASE(TestPlainInputSeesTerminate) {

    terminal->set_fails_raw_mode(true);
    std::thread stopper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        console.terminate();
    });
    ReadLineResult result(console.read_line(ReadLineOptions::single_line()));
    stopper.join();

    BOOST_CHECK(result.kind() == ReadLineResult::KIND::TERMINATED);
}

BOOST_AUTO_TEST_CASE(TestPlainInputTextHookRejects) {

    terminal->set_fails_raw_mode(true);
    ReadLineOptions options(ReadLineOptions::single_line());
    options.textInputHook = [](std::string& text) {
        return text != "bad";
    };
    terminal->pipe_input("bad\ngood\n");
    ReadLineResult result(console.read_line(options));

    BOOST_CHECK_EQUAL(result.text(), "good");
    BOOST_CHECK_EQUAL(terminal->output(), "> > ");
}

BOOST_AUTO_TEST_SUITE_END()
