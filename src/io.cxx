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


#include <memory>
#include <stdexcept>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <cstdio>

#include <strings.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/select.h>

#include "io.hxx"
#include "escape.hxx"
#include "log.hxx"

using namespace std;

namespace simpleprompt {

namespace tty {

bool is_a_tty( int fd_ ) {
	return ( isatty( fd_ ) != 0 );
}

bool in( is_a_tty( 0 ) );
bool out( is_a_tty( 1 ) );

}

namespace {

static const char* unsupported_term[] = {"dumb", "cons25", "emacs", NULL};

inline int notty( void ) {
	errno = ENOTTY;
	return ( -1 );
}

}

bool is_unsupported_term( void ) {
	char* term = getenv("TERM");
	if (term == NULL) {
		return false;
	}
	for (int j = 0; unsupported_term[j]; ++j) {
		if (!strcasecmp(term, unsupported_term[j])) {
			return true;
		}
	}
	return false;
}

Terminal::Terminal( void )
	: _origTermios()
	, _rawMode( false )
	, _keyDecoder() {
}

Terminal::~Terminal( void ) {
	if ( _rawMode ) {
		disable_raw_mode();
	}
}

bool Terminal::is_interactive( void ) const {
	return ( tty::in && ! is_unsupported_term() );
}

void Terminal::write8( void const* data_, int size_ ) {
	char const* data( static_cast<char const*>( data_ ) );
	while ( size_ > 0 ) {
		ssize_t count( write( 1, data, static_cast<size_t>( size_ ) ) );
		if ( ( count == -1 ) && ( errno == EINTR ) ) {
			continue;
		}
		if ( count <= 0 ) {
			throw std::runtime_error( "write failed" );
		}
		data += count;
		size_ -= static_cast<int>( count );
	}
	return;
}

int Terminal::get_screen_columns( void ) {
	int cols( 0 );
	struct winsize ws;
	cols = ( ioctl( 1, TIOCGWINSZ, &ws ) == -1 ) ? DEFAULT_COLUMNS : ws.ws_col;
	// cols is 0 in certain circumstances like inside debugger, which creates
	// further issues
	return ( cols > 0 ) ? cols : DEFAULT_COLUMNS;
}

int Terminal::get_screen_rows( void ) {
	int rows;
	struct winsize ws;
	rows = (ioctl(1, TIOCGWINSZ, &ws) == -1) ? DEFAULT_ROWS : ws.ws_row;
	return (rows > 0) ? rows : DEFAULT_ROWS;
}

int Terminal::enable_raw_mode( void ) {
	if ( ! _rawMode ) {
		struct termios raw;

		if ( ! tty::in ) {
			return ( notty() );
		}
		if ( tcgetattr( 0, &_origTermios ) == -1 ) {
			return ( notty() );
		}

		raw = _origTermios; /* modify the original mode */
		/* input modes: no break, no CR to NL, no parity check, no strip char,
		 * no start/stop output control. */
		raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
		/* output modes: keep post processing so that LF still moves to column 0 */
		/* control modes - set 8 bit chars */
		raw.c_cflag |= (CS8);
		/* local modes - echoing off, canonical off, no extended functions,
		 * no signal chars (^Z,^C) */
		raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
		/* control chars - set return condition: min number of bytes and timer.
		 * Reads are guarded by select() so they never block. */
		raw.c_cc[VMIN] = 1;
		raw.c_cc[VTIME] = 0; /* 1 byte, no timer */

		/* put terminal in raw mode after flushing */
		if ( tcsetattr(0, TCSADRAIN, &raw) < 0 ) {
			return ( notty() );
		}
		cc_t erase( _origTermios.c_cc[VERASE] );
		_keyDecoder.set_erase_char( erase != _POSIX_VDISABLE ? static_cast<char16_t>( erase ) : 0 );
		_rawMode = true;
	}
	return 0;
}

void Terminal::disable_raw_mode(void) {
	if ( _rawMode ) {
		if ( tcsetattr( 0, TCSADRAIN, &_origTermios ) == -1 ) {
			log_debug( "failed to restore terminal mode: %s", strerror( errno ) );
			return;
		}
		_rawMode = false;
	}
}

bool Terminal::wait_for_input( int timeoutMs_ ) {
	fd_set fdSet;
	while ( true ) {
		FD_ZERO( &fdSet );
		FD_SET( 0, &fdSet );
		struct timeval tv;
		tv.tv_sec = timeoutMs_ / 1000;
		tv.tv_usec = ( timeoutMs_ % 1000 ) * 1000;
		int err( select( 1, &fdSet, nullptr, nullptr, &tv ) );
		if ( ( err == -1 ) && ( errno == EINTR ) ) {
			continue;
		}
		return ( ( err > 0 ) && FD_ISSET( 0, &fdSet ) );
	}
}

/*
 * Non-blocking: returns false when no complete key is available.
 */
bool Terminal::read_key( SimpleConsole::KeyEvent& key_ ) {
	if ( _keyDecoder.next( key_ ) ) {
		return ( true );
	}
	char buf[256];
	int nread( read_input( buf, static_cast<int>( sizeof ( buf ) ), 0 ) );
	if ( nread <= 0 ) {
		return ( false );
	}
	_keyDecoder.feed( buf, nread );
	return ( _keyDecoder.next( key_ ) );
}

/*
 * Raw bytes from stdin, waits at most timeoutMs_.
 * Returns 0 when nothing arrived in time and -1 at end of input.
 */
int Terminal::read_input( char* buffer_, int size_, int timeoutMs_ ) {
	if ( ! wait_for_input( timeoutMs_ ) ) {
		return ( 0 );
	}
	ssize_t nread;
	do {
		nread = read( 0, buffer_, static_cast<size_t>( size_ ) );
	} while ( ( nread == -1 ) && ( errno == EINTR ) );
	if ( ( nread == -1 ) && ( ( errno == EAGAIN ) || ( errno == EWOULDBLOCK ) ) ) {
		return ( 0 );
	}
	return ( nread > 0 ? static_cast<int>( nread ) : -1 );
}

/*
 * Ask terminal for cursor position with `ESC [ 6 n`.
 * The `ESC [ row ; col R` reply may be preceded by user key presses,
 * those are handed over to the key decoder.
 */
bool Terminal::get_cursor_position( int& left_, int& top_ ) {
	if ( ! tty::in || ! tty::out ) {
		return ( false );
	}
	try {
		write8( ansi::QUERY_CURSOR_POSITION, static_cast<int>( strlen( ansi::QUERY_CURSOR_POSITION ) ) );
	} catch ( std::runtime_error const& e ) {
		log_debug( "cursor position query failed: %s", e.what() );
		return ( false );
	}
	typedef std::chrono::steady_clock steady_clock_t;
	steady_clock_t::time_point deadline( steady_clock_t::now() + std::chrono::milliseconds( CURSOR_QUERY_TIMEOUT_MS ) );
	std::string reply;
	std::string stray;
	bool complete( false );
	while ( ! complete ) {
		int remaining( static_cast<int>( std::chrono::duration_cast<std::chrono::milliseconds>( deadline - steady_clock_t::now() ).count() ) );
		if ( ( remaining <= 0 ) || ! wait_for_input( remaining ) ) {
			break;
		}
		char c( 0 );
		ssize_t nread( read( 0, &c, 1 ) );
		if ( nread != 1 ) {
			if ( ( nread == -1 ) && ( errno == EINTR ) ) {
				continue;
			}
			break;
		}
		if ( reply.empty() ) {
			if ( c == '\033' ) {
				reply.push_back( c );
			} else {
				stray.push_back( c );
			}
			continue;
		}
		if ( reply.size() == 1 ) {
			if ( c == '[' ) {
				reply.push_back( c );
			} else {
				stray.append( reply ).push_back( c );
				reply.clear();
			}
			continue;
		}
		if ( ( ( c >= '0' ) && ( c <= '9' ) ) || ( c == ';' ) ) {
			reply.push_back( c );
		} else if ( c == 'R' ) {
			complete = true;
		} else {
			stray.append( reply ).push_back( c );
			reply.clear();
		}
	}
	if ( ! stray.empty() ) {
		_keyDecoder.feed( stray.data(), static_cast<int>( stray.size() ) );
	}
	int row( 0 );
	int col( 0 );
	if ( ! complete || ( sscanf( reply.c_str() + 2, "%d;%d", &row, &col ) != 2 ) || ( row < 1 ) || ( col < 1 ) ) {
		log_debug( "no cursor position reply" );
		return ( false );
	}
	left_ = col - 1;
	top_ = row - 1;
	return ( true );
}

}
