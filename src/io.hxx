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


#ifndef SIMPLEPROMPT_IO_HXX_INCLUDED
#define SIMPLEPROMPT_IO_HXX_INCLUDED 1

#include <termios.h>

#include "simpleprompt.hxx"
#include "keydecoder.hxx"

namespace simpleprompt {

/*
 * Access to the controlling terminal.
 *
 * Methods are virtual so that the whole console can be driven
 * by a scripted terminal.
 */
class Terminal {
	struct termios _origTermios; /* in order to restore at exit */
	bool _rawMode; /* for destructor to check if restore is needed */
	KeyDecoder _keyDecoder;
public:
	static int const DEFAULT_COLUMNS = 80;
	static int const DEFAULT_ROWS = 24;
	static int const CURSOR_QUERY_TIMEOUT_MS = 100;
public:
	Terminal( void );
	virtual ~Terminal( void );
	virtual bool is_interactive( void ) const;
	virtual void write8( void const*, int );
	virtual int get_screen_columns( void );
	virtual int get_screen_rows( void );
	virtual bool get_cursor_position( int& left_, int& top_ );
	virtual int enable_raw_mode( void );
	virtual void disable_raw_mode( void );
	virtual bool read_key( SimpleConsole::KeyEvent& key_ );
	virtual int read_input( char* buffer_, int size_, int timeoutMs_ );
private:
	bool wait_for_input( int timeoutMs_ );
	Terminal( Terminal const& ) = delete;
	Terminal& operator = ( Terminal const& ) = delete;
	Terminal( Terminal&& ) = delete;
	Terminal& operator = ( Terminal&& ) = delete;
};

bool is_unsupported_term( void );

namespace tty {

extern bool in;
extern bool out;

}

}

#endif
