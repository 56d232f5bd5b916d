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


#ifndef SIMPLEPROMPT_ESCAPE_HXX_INCLUDED
#define SIMPLEPROMPT_ESCAPE_HXX_INCLUDED 1

#include <vector>

namespace simpleprompt {

/*
 * ANSI control sequences used by the renderer.
 */
namespace ansi {

extern char const HIDE_CURSOR[];
extern char const SHOW_CURSOR[];
extern char const ERASE_TO_END_OF_LINE[];
extern char const ERASE_LINE[];
extern char const ERASE_BELOW[];
extern char const FORCE_NEW_LINE[];
extern char const QUERY_CURSOR_POSITION[];

}

/*
 * Fixed capacity byte builder.
 * Append operations are all-or-nothing and fail when capacity would be exceeded.
 */
class EscapeBuffer {
public:
	typedef std::vector<char> data_t;
private:
	data_t _data;
	int _size;
public:
	explicit EscapeBuffer( int capacity_ );
	bool append( char const* str_ );
	bool append( char const* data_, int size_ );
	bool append_repeated( char const* data_, int size_, int count_ );
	bool append_cursor_position( int row_, int column_ );
	char const* data( void ) const {
		return ( _data.data() );
	}
	int size( void ) const {
		return ( _size );
	}
	int capacity( void ) const {
		return ( static_cast<int>( _data.size() ) );
	}
	int available( void ) const {
		return ( capacity() - _size );
	}
	bool is_empty( void ) const {
		return ( _size == 0 );
	}
	void clear( void ) {
		_size = 0;
	}
private:
	EscapeBuffer( EscapeBuffer const& ) = delete;
	EscapeBuffer& operator = ( EscapeBuffer const& ) = delete;
};

}

#endif
