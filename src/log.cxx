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
#include <cstdlib>
#include <cstdarg>
#include <mutex>

#include "log.hxx"
#include "util.hxx"

namespace simpleprompt {

namespace {

class DebugLog {
	FILE* _file;
	std::mutex _mutex;
public:
	DebugLog( void )
		: _file( nullptr )
		, _mutex() {
		char const* path( getenv( "SIMPLEPROMPT_DEBUG_LOG" ) );
		if ( path && *path ) {
			_file = fopen( path, "a" );
		}
	}
	~DebugLog( void ) {
		if ( _file ) {
			fclose( _file );
		}
	}
	bool enabled( void ) const {
		return ( _file != nullptr );
	}
	void write( char const* fmt_, va_list ap_ ) {
		std::lock_guard<std::mutex> l( _mutex );
		fprintf( _file, "%s ", now_ms_str().c_str() );
		vfprintf( _file, fmt_, ap_ );
		fputc( '\n', _file );
		fflush( _file );
	}
private:
	DebugLog( DebugLog const& ) = delete;
	DebugLog& operator = ( DebugLog const& ) = delete;
};

DebugLog& debug_log( void ) {
	static DebugLog debugLog;
	return ( debugLog );
}

}

void log_debug( char const* fmt_, ... ) {
	DebugLog& dl( debug_log() );
	if ( ! dl.enabled() ) {
		return;
	}
	va_list ap;
	va_start( ap, fmt_ );
	dl.write( fmt_, ap );
	va_end( ap );
}

}
