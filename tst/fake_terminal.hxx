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


#ifndef SIMPLEPROMPT_TST_FAKE_TERMINAL_HXX_INCLUDED
#define SIMPLEPROMPT_TST_FAKE_TERMINAL_HXX_INCLUDED 1

#include <string>
#include <vector>
#include <mutex>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <thread>
#include <chrono>

#include "io.hxx"
#include "keydecoder.hxx"

namespace simpleprompt {

/*
 * Scripted terminal: keeps every written byte, emulates the screen
 * closely enough to check what the user would see (cursor moves, EL, ED,
 * pending wrap, scrolling) and serves typed bytes through a key decoder.
 * Non ASCII characters occupy one cell shown as '?'.
 */
class FakeTerminal : public Terminal {
public:
	typedef std::vector<std::string> screen_t;
private:
	mutable std::mutex _mutex;
	std::string _output;
	screen_t _screen;
	int _columns;
	int _rows;
	int _left;
	int _top;
	bool _pendingWrap;
	bool _answersCursorQuery;
	bool _failsRawMode;
	int _rawModeDepth;
	int _rawModeCalls;
	KeyDecoder _decoder;
	std::string _escape;
	std::string _stdin;
	bool _stdinClosed;
public:
	FakeTerminal( int columns_ = 80, int rows_ = 24 )
		: _mutex()
		, _output()
		, _screen( static_cast<size_t>( rows_ ), std::string( static_cast<size_t>( columns_ ), ' ' ) )
		, _columns( columns_ )
		, _rows( rows_ )
		, _left( 0 )
		, _top( 0 )
		, _pendingWrap( false )
		, _answersCursorQuery( true )
		, _failsRawMode( false )
		, _rawModeDepth( 0 )
		, _rawModeCalls( 0 )
		, _decoder()
		, _escape()
		, _stdin()
		, _stdinClosed( false ) {
		_decoder.set_rxvt( false );
	}
	virtual bool is_interactive( void ) const override {
		return ( true );
	}
	virtual void write8( void const* data_, int size_ ) override {
		std::lock_guard<std::mutex> l( _mutex );
		char const* data( static_cast<char const*>( data_ ) );
		_output.append( data, static_cast<size_t>( size_ ) );
		for ( int i( 0 ); i < size_; ++ i ) {
			feed( data[i] );
		}
	}
	virtual int get_screen_columns( void ) override {
		std::lock_guard<std::mutex> l( _mutex );
		return ( _columns );
	}
	virtual int get_screen_rows( void ) override {
		std::lock_guard<std::mutex> l( _mutex );
		return ( _rows );
	}
	virtual bool get_cursor_position( int& left_, int& top_ ) override {
		std::lock_guard<std::mutex> l( _mutex );
		if ( ! _answersCursorQuery ) {
			return ( false );
		}
		left_ = _left;
		top_ = _top;
		return ( true );
	}
	virtual int enable_raw_mode( void ) override {
		std::lock_guard<std::mutex> l( _mutex );
		++ _rawModeCalls;
		if ( _failsRawMode ) {
			return ( -1 );
		}
		++ _rawModeDepth;
		return ( 0 );
	}
	virtual void disable_raw_mode( void ) override {
		std::lock_guard<std::mutex> l( _mutex );
		if ( _rawModeDepth > 0 ) {
			-- _rawModeDepth;
		}
	}
	virtual bool read_key( SimpleConsole::KeyEvent& key_ ) override {
		std::lock_guard<std::mutex> l( _mutex );
		return ( _decoder.next( key_ ) );
	}

	virtual int read_input( char* buffer_, int size_, int timeoutMs_ ) override {
		{
			std::lock_guard<std::mutex> l( _mutex );
			if ( ! _stdin.empty() ) {
				int count( std::min( size_, static_cast<int>( _stdin.size() ) ) );
				memcpy( buffer_, _stdin.data(), static_cast<size_t>( count ) );
				_stdin.erase( 0, static_cast<size_t>( count ) );
				return ( count );
			}
			if ( _stdinClosed ) {
				return ( -1 );
			}
		}
		std::this_thread::sleep_for( std::chrono::milliseconds( timeoutMs_ ) );
		return ( 0 );
	}

	/* Bytes arriving on a stdin that is not driven in raw mode. */
	void pipe_input( std::string const& bytes_ ) {
		std::lock_guard<std::mutex> l( _mutex );
		_stdin.append( bytes_ );
	}
	void close_input( void ) {
		std::lock_guard<std::mutex> l( _mutex );
		_stdinClosed = true;
	}
	/* Bytes as if typed on the keyboard. */
	void type( std::string const& bytes_ ) {
		std::lock_guard<std::mutex> l( _mutex );
		_decoder.feed( bytes_.data(), static_cast<int>( bytes_.size() ) );
	}
	void set_size( int columns_, int rows_ ) {
		std::lock_guard<std::mutex> l( _mutex );
		_columns = columns_;
		_rows = rows_;
		_screen.resize( static_cast<size_t>( rows_ ), std::string() );
		for ( std::string& row : _screen ) {
			row.resize( static_cast<size_t>( columns_ ), ' ' );
		}
		_left = std::min( _left, _columns - 1 );
		_top = std::min( _top, _rows - 1 );
		_pendingWrap = false;
	}
	void set_cursor( int left_, int top_ ) {
		std::lock_guard<std::mutex> l( _mutex );
		_left = left_;
		_top = top_;
		_pendingWrap = false;
	}
	void set_answers_cursor_query( bool answers_ ) {
		std::lock_guard<std::mutex> l( _mutex );
		_answersCursorQuery = answers_;
	}
	void set_fails_raw_mode( bool fails_ ) {
		std::lock_guard<std::mutex> l( _mutex );
		_failsRawMode = fails_;
	}
	std::string output( void ) const {
		std::lock_guard<std::mutex> l( _mutex );
		return ( _output );
	}
	void clear_output( void ) {
		std::lock_guard<std::mutex> l( _mutex );
		_output.clear();
	}
	/* Screen row without trailing blanks. */
	std::string row( int row_ ) const {
		std::lock_guard<std::mutex> l( _mutex );
		std::string const& r( _screen[static_cast<size_t>( row_ )] );
		std::string::size_type end( r.find_last_not_of( ' ' ) );
		return ( end == std::string::npos ? std::string() : r.substr( 0, end + 1 ) );
	}
	int cursor_left( void ) const {
		std::lock_guard<std::mutex> l( _mutex );
		return ( _left );
	}
	int cursor_top( void ) const {
		std::lock_guard<std::mutex> l( _mutex );
		return ( _top );
	}
	int raw_mode_depth( void ) const {
		std::lock_guard<std::mutex> l( _mutex );
		return ( _rawModeDepth );
	}
	int raw_mode_calls( void ) const {
		std::lock_guard<std::mutex> l( _mutex );
		return ( _rawModeCalls );
	}
private:
	void feed( char c_ ) {
		unsigned char c( static_cast<unsigned char>( c_ ) );
		if ( ! _escape.empty() ) {
			_escape.push_back( c_ );
			if ( _escape.size() == 2 ) {
				if ( c_ != '[' ) {
					_escape.clear();
				}
			} else if ( ( c >= 0x40 ) && ( c <= 0x7e ) ) {
				control();
				_escape.clear();
			}
			return;
		}
		if ( c == 0x1b ) {
			_escape.push_back( c_ );
		} else if ( c == '\r' ) {
			_left = 0;
			_pendingWrap = false;
		} else if ( c == '\n' ) {
			/* output post processing turns LF into CR LF */
			_left = 0;
			_pendingWrap = false;
			line_feed();
		} else if ( ( c >= 0x80 ) && ( c < 0xc0 ) ) {
			/* UTF-8 continuation byte */
		} else if ( c >= 0x20 ) {
			put( c < 0x80 ? c_ : '?' );
		}
	}
	void put( char c_ ) {
		if ( _pendingWrap ) {
			_left = 0;
			_pendingWrap = false;
			line_feed();
		}
		_screen[static_cast<size_t>( _top )][static_cast<size_t>( _left )] = c_;
		if ( _left == ( _columns - 1 ) ) {
			_pendingWrap = true;
		} else {
			++ _left;
		}
	}
	void line_feed( void ) {
		if ( _top < ( _rows - 1 ) ) {
			++ _top;
			return;
		}
		_screen.erase( _screen.begin() );
		_screen.push_back( std::string( static_cast<size_t>( _columns ), ' ' ) );
	}
	void clear_cells( int row_, int from_ ) {
		std::string& r( _screen[static_cast<size_t>( row_ )] );
		std::fill( r.begin() + from_, r.end(), ' ' );
	}
	void control( void ) {
		char final( _escape.back() );
		std::vector<int> params;
		std::string digits;
		for ( std::string::size_type i( 2 ); i < ( _escape.size() - 1 ); ++ i ) {
			char c( _escape[i] );
			if ( c == ';' ) {
				params.push_back( digits.empty() ? 0 : atoi( digits.c_str() ) );
				digits.clear();
			} else if ( ( c >= '0' ) && ( c <= '9' ) ) {
				digits.push_back( c );
			}
		}
		params.push_back( digits.empty() ? 0 : atoi( digits.c_str() ) );
		switch ( final ) {
			case ( 'H' ): {
				int top( params.size() > 0 ? params[0] : 1 );
				int left( params.size() > 1 ? params[1] : 1 );
				_top = std::max( 0, std::min( top - 1, _rows - 1 ) );
				_left = std::max( 0, std::min( left - 1, _columns - 1 ) );
				_pendingWrap = false;
			} break;
			case ( 'K' ): {
				clear_cells( _top, params[0] == 2 ? 0 : _left );
			} break;
			case ( 'J' ): {
				clear_cells( _top, _left );
				for ( int r( _top + 1 ); r < _rows; ++ r ) {
					clear_cells( r, 0 );
				}
			} break;
			case ( 'D' ): {
				_left = std::max( 0, _left - std::max( 1, params[0] ) );
				_pendingWrap = false;
			} break;
			default: break;
		}
	}
};

}

#endif

