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


#ifndef SIMPLEPROMPT_ROW_HXX_INCLUDED
#define SIMPLEPROMPT_ROW_HXX_INCLUDED 1

namespace simpleprompt {

/*
 * One screen row worth of a line buffer: [start, start + length).
 */
class Row {
	int _start;
	int _length;
	int _width;
	int _inputStart; /* -1 when row holds no input */
public:
	explicit Row( int start_ = 0 )
		: _start( start_ )
		, _length( 0 )
		, _width( 0 )
		, _inputStart( -1 ) {
	}
	int start( void ) const {
		return ( _start );
	}
	int length( void ) const {
		return ( _length );
	}
	int end( void ) const {
		return ( _start + _length );
	}
	int width( void ) const {
		return ( _width );
	}
	int input_start( void ) const {
		return ( _inputStart );
	}
	bool is_empty( void ) const {
		return ( _length == 0 );
	}
	void add_input( int length_, int width_ ) {
		_length += length_;
		_width += width_;
	}
	void move_start( int offset_ ) {
		_start += offset_;
	}
	void set_input_start( int inputStart_ ) {
		_inputStart = inputStart_;
	}
	bool operator == ( Row const& other_ ) const {
		return ( ( _start == other_._start ) && ( _length == other_._length ) && ( _width == other_._width ) );
	}
	bool operator != ( Row const& other_ ) const {
		return ( ! operator == ( other_ ) );
	}
};

}

#endif
