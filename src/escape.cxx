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


#include <cstdio>
#include <cstring>

#include "escape.hxx"

namespace simpleprompt {

namespace ansi {

char const HIDE_CURSOR[] = "\033[?25l";
char const SHOW_CURSOR[] = "\033[?25h";
char const ERASE_TO_END_OF_LINE[] = "\033[K";
char const ERASE_LINE[] = "\033[2K";
char const ERASE_BELOW[] = "\033[J";
/* write a space to make the terminal perform pending wrap, then step back */
char const FORCE_NEW_LINE[] = " \033[1D";
char const QUERY_CURSOR_POSITION[] = "\033[6n";

}

EscapeBuffer::EscapeBuffer( int capacity_ )
	: _data( capacity_ )
	, _size( 0 ) {
}

bool EscapeBuffer::append( char const* str_ ) {
	return ( append( str_, static_cast<int>( strlen( str_ ) ) ) );
}

bool EscapeBuffer::append( char const* data_, int size_ ) {
	if ( size_ > available() ) {
		return ( false );
	}
	memcpy( _data.data() + _size, data_, static_cast<size_t>( size_ ) );
	_size += size_;
	return ( true );
}

bool EscapeBuffer::append_repeated( char const* data_, int size_, int count_ ) {
	if ( ( size_ * count_ ) > available() ) {
		return ( false );
	}
	for ( int i( 0 ); i < count_; ++ i ) {
		memcpy( _data.data() + _size, data_, static_cast<size_t>( size_ ) );
		_size += size_;
	}
	return ( true );
}

/* CUP, 1 based coordinates on the wire */
bool EscapeBuffer::append_cursor_position( int row_, int column_ ) {
	char buf[32];
	int len( snprintf( buf, sizeof ( buf ), "\033[%d;%dH", row_ + 1, column_ + 1 ) );
	return ( append( buf, len ) );
}

}
