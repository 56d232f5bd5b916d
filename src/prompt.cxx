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


#include <algorithm>

#include "prompt.hxx"
#include "util.hxx"

namespace simpleprompt {

int sgr_sequence_length( char16_t const* text_, int count_ ) {
	if ( ( count_ < 3 ) || ( text_[0] != '\x1b' ) || ( text_[1] != '[' ) ) {
		return ( 0 );
	}
	int i( 2 );
	while ( ( i < count_ ) && ( ( text_[i] == ';' ) || ( ( text_[i] >= '0' ) && ( text_[i] <= '9' ) ) ) ) {
		++ i;
	}
	return ( ( ( i < count_ ) && ( text_[i] == 'm' ) ) ? i + 1 : 0 );
}

namespace {

UnicodeString filter_prompt_line( char16_t const* text_, int count_ ) {
	UnicodeString line;
	int i( 0 );
	while ( i < count_ ) {
		int sgr( sgr_sequence_length( text_ + i, count_ - i ) );
		if ( sgr > 0 ) {
			line.append( text_ + i, sgr );
			i += sgr;
			continue;
		}
		if ( ! is_control_code( text_[i] ) ) {
			line.push_back( text_[i] );
		}
		++ i;
	}
	return ( line );
}

}

prompt_lines_t split_prompt( std::string const& prompt_ ) {
	UnicodeString text( prompt_ );
	prompt_lines_t lines;
	int start( 0 );
	int const len( text.length() );
	for ( int i( 0 ); i <= len; ++ i ) {
		if ( ( i < len ) && ( text[i] != '\n' ) ) {
			continue;
		}
		int end( i );
		if ( ( end > start ) && ( text[end - 1] == '\r' ) ) {
			-- end;
		}
		lines.push_back( filter_prompt_line( text.get() + start, end - start ) );
		start = i + 1;
	}
	return ( lines );
}

void compute_prompt_widths( char16_t const* text_, char* widths_, int count_ ) {
	recompute_character_widths( text_, widths_, count_ );
	int i( 0 );
	while ( i < count_ ) {
		int sgr( sgr_sequence_length( text_ + i, count_ - i ) );
		if ( sgr > 0 ) {
			std::fill( widths_ + i, widths_ + i + sgr, 0 );
			i += sgr;
		} else {
			++ i;
		}
	}
}

}
