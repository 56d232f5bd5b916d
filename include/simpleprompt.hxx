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


#ifndef HAVE_SIMPLEPROMPT_HXX_INCLUDED
#define HAVE_SIMPLEPROMPT_HXX_INCLUDED 1

#include <memory>
#include <string>
#include <functional>

namespace simpleprompt {

class SimpleConsole {
public:
	enum class Color {
		BLACK         = 0,
		RED           = 1,
		GREEN         = 2,
		BROWN         = 3,
		BLUE          = 4,
		MAGENTA       = 5,
		CYAN          = 6,
		LIGHTGRAY     = 7,
		GRAY          = 8,
		BRIGHTRED     = 9,
		BRIGHTGREEN   = 10,
		YELLOW        = 11,
		BRIGHTBLUE    = 12,
		BRIGHTMAGENTA = 13,
		BRIGHTCYAN    = 14,
		WHITE         = 15,
		NORMAL        = LIGHTGRAY,
		DEFAULT       = -1,
#undef ERROR
		ERROR         = -2
	};
	enum class KEY {
		NONE,
		CHARACTER,
		BACKSPACE,
		TAB,
		ENTER,
		ESCAPE,
		INSERT,
		DELETE,
		HOME,
		END,
		PAGE_UP,
		PAGE_DOWN,
		LEFT,
		RIGHT,
		UP,
		DOWN,
		F1,
		F2,
		F3,
		F4,
		F5,
		F6,
		F7,
		F8,
		F9,
		F10,
		F11,
		F12,
		F13,
		F14,
		F15,
		F16,
		F17,
		F18,
		F19,
		F20
	};
	struct MODIFIER {
		enum {
			NONE    = 0,
			SHIFT   = 1,
			ALT     = 2,
			CONTROL = 4
		};
	};

	/*! \brief Normalized key press.
	 *
	 * \e keyChar holds a single UTF-16 code unit. Characters outside
	 * of the Basic Multilingual Plane are delivered as two consecutive
	 * events carrying high and low surrogate respectively.
	 */
	struct KeyEvent {
		KEY key;
		int modifiers;
		char16_t keyChar;
		KeyEvent( KEY key_ = KEY::NONE, int modifiers_ = MODIFIER::NONE, char16_t keyChar_ = 0 )
			: key( key_ )
			, modifiers( modifiers_ )
			, keyChar( keyChar_ ) {
		}
		bool has( int modifier_ ) const {
			return ( ( modifiers & modifier_ ) != 0 );
		}
		bool operator == ( KeyEvent const& other_ ) const {
			return ( ( key == other_.key ) && ( modifiers == other_.modifiers ) && ( keyChar == other_.keyChar ) );
		}
		bool operator != ( KeyEvent const& other_ ) const {
			return ( ! operator == ( other_ ) );
		}
		static KeyEvent character( char16_t char_ ) {
			return ( KeyEvent( KEY::CHARACTER, MODIFIER::NONE, char_ ) );
		}
		static KeyEvent control( char16_t char_ ) {
			return ( KeyEvent( KEY::CHARACTER, MODIFIER::CONTROL, char_ ) );
		}
		static KeyEvent alt( char16_t char_ ) {
			return ( KeyEvent( KEY::CHARACTER, MODIFIER::ALT, char_ ) );
		}
	};

	enum class KEY_HOOK_RESULT {
		NOT_HANDLED,
		HANDLED,
		CANCEL
	};

	/*! \brief Key input hook type definition.
	 *
	 * Hook is invoked for every key press before the default handling.
	 * It may call SimpleConsole::read_line() recursively to open a nested prompt,
	 * the nested prompt owns the terminal until it finishes.
	 *
	 * \param key - key press to be processed.
	 * \return NOT_HANDLED to let default handling run, HANDLED to swallow the key,
	 * CANCEL to finish current read_line() with ReadLineResult::KIND::CANCELED.
	 */
	typedef std::function<KEY_HOOK_RESULT ( KeyEvent const& key )> key_input_hook_t;

	/*! \brief Text input hook type definition.
	 *
	 * Hook is invoked with assembled user input before it is accepted.
	 *
	 * \param[in,out] text - UTF-8 encoded input, may be modified in place.
	 * \return false to reject input and let the user type it again.
	 */
	typedef std::function<bool ( std::string& text )> text_input_hook_t;

	struct ReadLineOptions {
		Color inputColor;
		int maxInputLength;
		std::string prompt;
		std::string multilinePrompt;
		std::string multilineDelimiter; // empty disables delimiter mode
		char32_t lineContinuation;      // 0 disables continuation mode
		bool cancelOnEscape;
		bool allowEmptyLineInput;
		char32_t maskingCharacter;      // 0 disables masking
		key_input_hook_t keyInputHook;
		text_input_hook_t textInputHook;
		ReadLineOptions( void );
		static ReadLineOptions single_line( void );
		static ReadLineOptions multi_line( void );
	};

	class ReadLineResult {
	public:
		enum class KIND {
			SUCCESS,
			CANCELED,
			TERMINATED
		};
	private:
		KIND _kind;
		std::string _text;
	public:
		ReadLineResult( KIND kind_, std::string const& text_ = std::string() )
			: _kind( kind_ )
			, _text( text_ ) {
		}
		KIND kind( void ) const {
			return ( _kind );
		}
		std::string const& text( void ) const {
			return ( _text );
		}
		bool is_success( void ) const {
			return ( _kind == KIND::SUCCESS );
		}
	};

	class SimpleConsoleImpl;
private:
	typedef std::unique_ptr<SimpleConsoleImpl, void (*)( SimpleConsoleImpl* )> impl_t;
	impl_t _impl;

public:
	SimpleConsole( void );
	SimpleConsole( SimpleConsole&& ) = default;
	SimpleConsole& operator = ( SimpleConsole&& ) = default;

	/*! \brief Read user input.
	 *
	 * Blocks the calling thread until the user accepts the input,
	 * cancels it (Escape with ReadLineOptions::cancelOnEscape) or until
	 * terminate() is called. Never throws.
	 *
	 * \param options - prompt and behavior of this read.
	 * \return Result kind and UTF-8 encoded input.
	 */
	ReadLineResult read_line( ReadLineOptions const& options );

	/*! \brief Read user input with default options and given prompt.
	 */
	ReadLineResult read_line( std::string const& prompt );

	/*! \brief Write a line of text above in-progress input.
	 *
	 * Safe to call from any thread and from inside hooks.
	 * Edited input is redrawn below written text.
	 *
	 * \param text - UTF-8 encoded text, may contain line breaks.
	 */
	void write_line( std::string const& text );

	/*! \brief Print formatted string through write_line().
	 *
	 * Single trailing newline is consumed.
	 *
	 * \param fmt - printf style format.
	 */
	void print( char const* fmt, ... );

	/*! \brief Schedule an emulated key press event.
	 *
	 * \param key - key press to be emulated.
	 * \return false if input queue is full.
	 */
	bool emulate_key_press( KeyEvent const& key );

	/*! \brief Schedule text to be processed as if typed by the user.
	 *
	 * Line breaks become Enter key presses.
	 *
	 * \param text - UTF-8 encoded text.
	 * \return false if input queue cannot hold whole text.
	 */
	bool enqueue_input( std::string const& text );

	/*! \brief Schedule termination of current read_line().
	 */
	bool enqueue_termination( void );

	/*! \brief Terminate all current and future read_line() calls.
	 */
	void terminate( void );
	bool is_terminated( void ) const;
	bool is_read_line_in_progress( void ) const;

	void set_default_options( ReadLineOptions const& options );

private:
	SimpleConsole( SimpleConsole const& ) = delete;
	SimpleConsole& operator = ( SimpleConsole const& ) = delete;
};

}

#endif /* HAVE_SIMPLEPROMPT_HXX_INCLUDED */

