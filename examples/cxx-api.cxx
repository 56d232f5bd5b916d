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


#include <string>
#include <vector>
#include <cctype>
#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>

#include "simpleprompt.hxx"

using SimpleConsole = simpleprompt::SimpleConsole;

class Tick {
	typedef std::vector<char> keys_t;
	std::thread _thread;
	int _tick;
	std::atomic<bool> _alive;
	keys_t _keys;
	SimpleConsole& _console;
public:
	Tick( SimpleConsole& console_, std::string const& keys_ = {} )
		: _thread()
		, _tick( 0 )
		, _alive( false )
		, _keys( keys_.begin(), keys_.end() )
		, _console( console_ ) {
	}
	void start() {
		_alive = true;
		_thread = std::thread( &Tick::run, this );
	}
	void stop() {
		_alive = false;
		_thread.join();
	}
	void run() {
		while ( _alive ) {
			if ( _keys.empty() ) {
				_console.print( "%d\n", _tick );
			} else if ( _tick < static_cast<int>( _keys.size() ) ) {
				char c( _keys[_tick] );
				if ( c == '\n' ) {
					_console.emulate_key_press( SimpleConsole::KeyEvent( SimpleConsole::KEY::ENTER ) );
				} else {
					_console.emulate_key_press( SimpleConsole::KeyEvent::character( static_cast<char16_t>( c ) ) );
				}
			} else {
				break;
			}
			++ _tick;
			std::this_thread::sleep_for( std::chrono::seconds( 1 ) );
		}
	}
};

// prototypes
SimpleConsole::KEY_HOOK_RESULT hook_key( SimpleConsole::KeyEvent const& key, SimpleConsole& console );
bool hook_yes_no( std::string& text );

SimpleConsole::KEY_HOOK_RESULT hook_key( SimpleConsole::KeyEvent const& key, SimpleConsole& console ) {
	if ( key.key == SimpleConsole::KEY::F1 ) {
		console.write_line( "F1 pressed, input stays where it was" );
		return ( SimpleConsole::KEY_HOOK_RESULT::HANDLED );
	}
	if ( key.key == SimpleConsole::KEY::F2 ) {
		// nested prompt owns the terminal until it finishes
		SimpleConsole::ReadLineOptions options( SimpleConsole::ReadLineOptions::single_line() );
		options.prompt = "Really cancel? (yes/no) ";
		options.inputColor = SimpleConsole::Color::BRIGHTRED;
		options.cancelOnEscape = true;
		options.textInputHook = &hook_yes_no;
		SimpleConsole::ReadLineResult answer( console.read_line( options ) );
		if ( answer.is_success() && ( answer.text() == "yes" ) ) {
			return ( SimpleConsole::KEY_HOOK_RESULT::CANCEL );
		}
		return ( SimpleConsole::KEY_HOOK_RESULT::HANDLED );
	}
	return ( SimpleConsole::KEY_HOOK_RESULT::NOT_HANDLED );
}

bool hook_yes_no( std::string& text ) {
	for ( char& c : text ) {
		c = static_cast<char>( std::tolower( static_cast<unsigned char>( c ) ) );
	}
	return ( ( text == "yes" ) || ( text == "no" ) );
}

int main( int argc_, char** argv_ ) {
	// init the console
	SimpleConsole console;
	// `-` prints a counter every second, anything else is typed in one key per second
	Tick tick( console, ( argc_ > 1 ) && ( std::string( argv_[1] ) != "-" ) ? argv_[1] : "" );

	// set the prompt used by every read
	SimpleConsole::ReadLineOptions options( SimpleConsole::ReadLineOptions::single_line() );
	options.prompt = "\x1b[1;32msimpleprompt\x1b[0m> ";
	options.allowEmptyLineInput = true;
	options.keyInputHook = [&console]( SimpleConsole::KeyEvent const& key ) {
		return ( hook_key( key, console ) );
	};
	console.set_default_options( options );

	// display initial welcome message
	std::cout
		<< "Welcome to SimplePrompt\n"
		<< "Press F1 to print a line above the input\n"
		<< "Press F2 to open a nested prompt\n"
		<< "Type '.help' for help\n"
		<< "Type '.quit' or '.exit' to exit\n\n";

	// main loop
	if ( argc_ > 1 ) {
		tick.start();
	}
	for (;;) {
		// display the prompt and retrieve input from the user
		SimpleConsole::ReadLineResult result( console.read_line( options ) );

		if ( result.kind() == SimpleConsole::ReadLineResult::KIND::TERMINATED ) {
			break;
		} else if ( result.kind() == SimpleConsole::ReadLineResult::KIND::CANCELED ) {
			console.write_line( "canceled" );
			continue;
		}

		std::string const& input( result.text() );

		if ( input.empty() ) {
			// user hit enter on an empty line

			continue;

		} else if ( input.compare( 0, 5, ".quit" ) == 0 || input.compare( 0, 5, ".exit" ) == 0 ) {
			// exit the loop

			break;

		} else if ( input.compare( 0, 5, ".help" ) == 0 ) {
			// display the help output
			console.write_line(
				".help\n    displays the help output\n"
				".quit\n    exit\n"
				".exit\n    exit\n"
				".multi\n    read multi-line input, use \"\"\" or a trailing \\\n"
				".password\n    read masked input\n"
				".prompt <str>\n    set the prompt to <str>"
			);
			continue;

		} else if ( input.compare( 0, 6, ".multi" ) == 0 ) {
			// multi-line input with a prompt spanning two lines
			SimpleConsole::ReadLineOptions multi( SimpleConsole::ReadLineOptions::multi_line() );
			multi.prompt = "Enter text, \"\"\" starts a block\n>>> ";
			multi.multilinePrompt = "... ";
			multi.cancelOnEscape = true;
			SimpleConsole::ReadLineResult text( console.read_line( multi ) );
			if ( text.is_success() ) {
				console.print( "got:\n%s\n", text.text().c_str() );
			}
			continue;

		} else if ( input.compare( 0, 9, ".password" ) == 0 ) {
			// masked input
			SimpleConsole::ReadLineOptions secret( SimpleConsole::ReadLineOptions::single_line() );
			secret.prompt = "password: ";
			secret.maskingCharacter = U'*';
			secret.inputColor = SimpleConsole::Color::DEFAULT;
			secret.cancelOnEscape = true;
			SimpleConsole::ReadLineResult password( console.read_line( secret ) );
			if ( password.is_success() ) {
				console.print( "password has %d bytes\n", static_cast<int>( password.text().length() ) );
			}
			continue;

		} else if ( input.compare( 0, 7, ".prompt" ) == 0 ) {
			// set the prompt text
			auto pos = input.find( " " );
			if ( pos == std::string::npos ) {
				console.write_line( "Error: '.prompt' missing argument" );
			} else {
				options.prompt = input.substr( pos + 1 ) + " ";
			}
			continue;

		} else {
			// default action
			// echo the input

			console.print( "%s\n", input.c_str() );
			continue;
		}
	}
	if ( argc_ > 1 ) {
		tick.stop();
	}

	std::cout << "\nExiting SimplePrompt\n";

	return 0;
}

