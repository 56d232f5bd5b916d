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


#ifndef SIMPLEPROMPT_CONSOLE_IMPL_HXX_INCLUDED
#define SIMPLEPROMPT_CONSOLE_IMPL_HXX_INCLUDED 1

#include <vector>
#include <deque>
#include <memory>
#include <string>
#include <mutex>
#include <atomic>

#include "simpleprompt.hxx"
#include "io.hxx"
#include "keydecoder.hxx"
#include "unicodestring.hxx"
#include "renderer.hxx"
#include "session.hxx"
#include "pool.hxx"

namespace simpleprompt {

class SimpleConsole::SimpleConsoleImpl {
public:
	static int const INPUT_QUEUE_CAPACITY = 4096;
	static int const MAX_BATCH_SIZE = 256;
	static int const POLL_INTERVAL_MS = 10;
	typedef std::unique_ptr<Terminal> terminal_t;
	typedef Pool<Session> session_pool_t;
	typedef session_pool_t::item_t session_t;
	typedef std::vector<session_t> sessions_t;
	struct Input {
		enum class TYPE {
			KEY,
			TERMINATE
		};
		TYPE type;
		KeyEvent key;
		Input( TYPE type_, KeyEvent const& key_ = KeyEvent() )
			: type( type_ )
			, key( key_ ) {
		}
	};
	typedef std::deque<Input> input_queue_t;
private:
	enum class NEXT {
		KEY,
		SKIP,
		NONE,
		CANCEL,
		TERMINATE,
		END
	};
	terminal_t _terminal;
	Renderer _renderer;
	Session::line_pool_t _linePool;
	session_pool_t _sessionPool;
	sessions_t _sessions;
	input_queue_t _inputQueue;
	KeyDecoder _plainDecoder;
	bool _plainInputClosed;
	bool _skipLineFeed;
	ReadLineOptions _defaultOptions;
	std::atomic<bool> _terminated;
	mutable std::mutex _mutex;
public:
	explicit SimpleConsoleImpl( terminal_t terminal_ );
	ReadLineResult read_line( ReadLineOptions const& options_ );
	ReadLineResult read_line( std::string const& prompt_ );
	void write_line( std::string const& text_ );
	bool emulate_key_press( KeyEvent const& key_ );
	bool enqueue_input( std::string const& text_ );
	bool enqueue_termination( void );
	void terminate( void );
	bool is_terminated( void ) const;
	bool is_read_line_in_progress( void ) const;
	void set_default_options( ReadLineOptions const& options_ );
private:
	ReadLineResult read_plain( ReadLineOptions const& options_ );
	NEXT next_plain_input( KeyEvent& key_ );
	void feed_plain_input( char const* data_, int size_ );
	void write_raw( std::string const& text_ );
	ReadLineResult edit( Session& session_ );
	Session& open_session( ReadLineOptions const& options_ );
	void close_session( Session& session_ );
	NEXT next_input( KeyEvent& key_ );
	NEXT fetch( Session& session_, KeyEvent& key_ );
	NEXT filter( ReadLineOptions const& options_, KeyEvent& key_ );
	void handle_resize( void );
	bool is_focused( Session const& session_ ) const;
	SimpleConsoleImpl( SimpleConsoleImpl const& ) = delete;
	SimpleConsoleImpl& operator = ( SimpleConsoleImpl const& ) = delete;
};

}

#endif

