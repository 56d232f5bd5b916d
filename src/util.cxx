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


#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <cstdio>

#include "util.hxx"
#include "conversion.hxx"

namespace simpleprompt {

/*
 * Fill per code unit width buffer.
 * Surrogate pair stores ( 0, width ) so that the sum of widths
 * matches the number of occupied columns.
 */
void recompute_character_widths( char16_t const* text_, char* widths_, int count_ ) {
	int i( 0 );
	while ( i < count_ ) {
		char16_t c( text_[i] );
		if ( is_high_surrogate( c ) && ( ( i + 1 ) < count_ ) && is_low_surrogate( text_[i + 1] ) ) {
			widths_[i] = 0;
			widths_[i + 1] = static_cast<char>( display_width( combine_surrogates( c, text_[i + 1] ) ) );
			i += 2;
			continue;
		}
		widths_[i] = static_cast<char>( display_width( c ) );
		++ i;
	}
}

char const* ansi_color( SimpleConsole::Color color_ ) {
	static char const reset[] = "\033[0m";
	static char const black[] = "\033[0;22;30m";
	static char const red[] = "\033[0;22;31m";
	static char const green[] = "\033[0;22;32m";
	static char const brown[] = "\033[0;22;33m";
	static char const blue[] = "\033[0;22;34m";
	static char const magenta[] = "\033[0;22;35m";
	static char const cyan[] = "\033[0;22;36m";
	static char const lightgray[] = "\033[0;22;37m";

	static char const* TERM( getenv( "TERM" ) );
	static bool const has256color( TERM ? ( strstr( TERM, "256" ) != nullptr ) : false );
	static char const* gray = has256color ? "\033[0;1;90m" : "\033[0;1;30m";
	static char const* brightred = has256color ? "\033[0;1;91m" : "\033[0;1;31m";
	static char const* brightgreen = has256color ? "\033[0;1;92m" : "\033[0;1;32m";
	static char const* yellow = has256color ? "\033[0;1;93m" : "\033[0;1;33m";
	static char const* brightblue = has256color ? "\033[0;1;94m" : "\033[0;1;34m";
	static char const* brightmagenta = has256color ? "\033[0;1;95m" : "\033[0;1;35m";
	static char const* brightcyan = has256color ? "\033[0;1;96m" : "\033[0;1;36m";
	static char const* white = has256color ? "\033[0;1;97m" : "\033[0;1;37m";
	static char const error[] = "\033[101;1;33m";

	char const* code( reset );
	switch ( color_ ) {
		case SimpleConsole::Color::BLACK:         code = black;         break;
		case SimpleConsole::Color::RED:           code = red;           break;
		case SimpleConsole::Color::GREEN:         code = green;         break;
		case SimpleConsole::Color::BROWN:         code = brown;         break;
		case SimpleConsole::Color::BLUE:          code = blue;          break;
		case SimpleConsole::Color::MAGENTA:       code = magenta;       break;
		case SimpleConsole::Color::CYAN:          code = cyan;          break;
		case SimpleConsole::Color::LIGHTGRAY:     code = lightgray;     break;
		case SimpleConsole::Color::GRAY:          code = gray;          break;
		case SimpleConsole::Color::BRIGHTRED:     code = brightred;     break;
		case SimpleConsole::Color::BRIGHTGREEN:   code = brightgreen;   break;
		case SimpleConsole::Color::YELLOW:        code = yellow;        break;
		case SimpleConsole::Color::BRIGHTBLUE:    code = brightblue;    break;
		case SimpleConsole::Color::BRIGHTMAGENTA: code = brightmagenta; break;
		case SimpleConsole::Color::BRIGHTCYAN:    code = brightcyan;    break;
		case SimpleConsole::Color::WHITE:         code = white;         break;
		case SimpleConsole::Color::ERROR:         code = error;         break;
		case SimpleConsole::Color::DEFAULT:       code = reset;         break;
	}
	return ( code );
}

std::string now_ms_str( void ) {
	std::chrono::milliseconds ms( std::chrono::duration_cast<std::chrono::milliseconds>( std::chrono::system_clock::now().time_since_epoch() ) );
	time_t t( ms.count() / 1000 );
	tm broken;
	localtime_r( &t, &broken );
	static int const BUFF_SIZE( 32 );
	char str[BUFF_SIZE];
	strftime( str, BUFF_SIZE, "%Y-%m-%d %H:%M:%S.", &broken );
	snprintf( str + sizeof ( "YYYY-mm-dd HH:MM:SS" ), 5, "%03d", static_cast<int>( ms.count() % 1000 ) );
	return ( str );
}

}

