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
#include <stdexcept>
#include <thread>
#include <chrono>

#include "console_impl.hxx"
#include "unicodestring.hxx"
#include "log.hxx"

using namespace std;

namespace simpleprompt {

namespace {

inline bool is_text( SimpleConsole::KeyEvent const& key_ ) {
	return (
		( key_.key == SimpleConsole::KEY::CHARACTER )
		&& ! key_.has( SimpleConsole::MODIFIER::CONTROL | SimpleConsole::MODIFIER::ALT )
		&& ( key_.keyChar >= 0x20 )
		&& ( key_.keyChar != 0x7f )
	);
}

}

SimpleConsole::SimpleConsoleImpl::SimpleConsoleImpl( terminal_t terminal_ )
	: _terminal( std::move( terminal_ ) )
	, _renderer( *_terminal )
	, _linePool()
	, _sessionPool()
	, _sessions()
	, _inputQueue()
	, _plainDecoder()
	, _plainInputClosed( false )
	, _skipLineFeed( false )
	, _defaultOptions()
	, _terminated( false )
	, _mutex() {
}

SimpleConsole::ReadLineResult SimpleConsole::SimpleConsoleImpl::read_line( std::string const& prompt_ ) {
	ReadLineOptions options;
	{
		std::lock_guard<std::mutex> l( _mutex );
		options = _defaultOptions;
	}
	options.prompt = prompt_;
	return ( read_line( options ) );
}

SimpleConsole::ReadLineResult SimpleConsole::SimpleConsoleImpl::read_line( ReadLineOptions const& options_ ) {
	if ( _terminated ) {
		return ( ReadLineResult( ReadLineResult::KIND::TERMINATED ) );
	}
	if ( ! _terminal->is_interactive() ) {
		return ( read_plain( options_ ) );
	}
	Session* session( nullptr );
	try {
		{
			std::lock_guard<std::mutex> l( _mutex );
			if ( ! _sessions.empty() || ( _terminal->enable_raw_mode() != -1 ) ) {
				session = &open_session( options_ );
			}
		}
		if ( ! session ) {
			return ( read_plain( options_ ) );
		}
		ReadLineResult result( edit( *session ) );
		close_session( *session );
		return ( result );
	} catch ( std::exception const& e ) {
		log_debug( "read_line aborted: %s", e.what() );
	}
	if ( session ) {
		try {
			close_session( *session );
		} catch ( std::exception const& e ) {
			log_debug( "session cleanup failed: %s", e.what() );
		}
	}
	return ( ReadLineResult( ReadLineResult::KIND::TERMINATED ) );
}

/*
 * Pipes and terminals we do not know how to drive: no screen editing,
 * keys come one at a time from the injected queue and from stdin.
 */
SimpleConsole::ReadLineResult SimpleConsole::SimpleConsoleImpl::read_plain( ReadLineOptions const& options_ ) {
	write_raw( options_.prompt );
	UnicodeString text;
	while ( true ) {
		if ( _terminated ) {
			return ( ReadLineResult( ReadLineResult::KIND::TERMINATED ) );
		}
		KeyEvent key;
		NEXT next( next_plain_input( key ) );
		if ( next == NEXT::TERMINATE ) {
			return ( ReadLineResult( ReadLineResult::KIND::TERMINATED ) );
		} else if ( next == NEXT::NONE ) {
			continue;
		}
		bool submit( false );
		if ( next == NEXT::END ) {
			if ( text.is_empty() ) {
				return ( ReadLineResult( ReadLineResult::KIND::TERMINATED ) );
			}
			submit = true;
		} else {
			next = filter( options_, key );
			if ( next == NEXT::CANCEL ) {
				write_raw( "\n" );
				return ( ReadLineResult( ReadLineResult::KIND::CANCELED ) );
			} else if ( next == NEXT::SKIP ) {
				continue;
			}
			if ( key.key == KEY::ENTER ) {
				submit = options_.allowEmptyLineInput || ! text.is_empty();
			} else if ( key.key == KEY::BACKSPACE ) {
				int len( text.length() );
				if ( len > 0 ) {
					bool pair( ( len > 1 ) && is_low_surrogate( text[len - 1] ) && is_high_surrogate( text[len - 2] ) );
					text.resize( len - ( pair ? 2 : 1 ) );
				}
			} else if ( is_text( key ) && ( text.length() < options_.maxInputLength ) ) {
				text.push_back( key.keyChar );
			}
		}
		if ( ! submit ) {
			continue;
		}
		std::string line( text.to_utf8() );
		text.clear();
		if ( options_.textInputHook && ! options_.textInputHook( line ) ) {
			log_debug( "text input hook rejected input" );
			write_raw( options_.prompt );
			continue;
		}
		return ( ReadLineResult( ReadLineResult::KIND::SUCCESS, line ) );
	}
}

/*
 * Injected input goes first, stdin is polled for at most one poll interval.
 */
SimpleConsole::SimpleConsoleImpl::NEXT SimpleConsole::SimpleConsoleImpl::next_plain_input( KeyEvent& key_ ) {
	{
		std::lock_guard<std::mutex> l( _mutex );
		if ( ! _inputQueue.empty() ) {
			Input input( _inputQueue.front() );
			_inputQueue.pop_front();
			if ( input.type == Input::TYPE::TERMINATE ) {
				return ( NEXT::TERMINATE );
			}
			key_ = input.key;
			return ( NEXT::KEY );
		}
	}
	if ( _plainDecoder.next( key_ ) ) {
		return ( NEXT::KEY );
	}
	if ( _plainInputClosed ) {
		return ( NEXT::END );
	}
	char buf[256];
	int nread( _terminal->read_input( buf, static_cast<int>( sizeof ( buf ) ), POLL_INTERVAL_MS ) );
	if ( nread < 0 ) {
		log_debug( "end of plain input" );
		_plainInputClosed = true;
		return ( NEXT::END );
	}
	if ( nread > 0 ) {
		feed_plain_input( buf, nread );
	}
	return ( _plainDecoder.next( key_ ) ? NEXT::KEY : NEXT::NONE );
}

/* `\r\n` is one line break, also when split between two reads. */
void SimpleConsole::SimpleConsoleImpl::feed_plain_input( char const* data_, int size_ ) {
	std::string bytes;
	bytes.reserve( static_cast<size_t>( size_ ) );
	for ( int i( 0 ); i < size_; ++ i ) {
		char c( data_[i] );
		if ( ( c == '\n' ) && _skipLineFeed ) {
			_skipLineFeed = false;
			continue;
		}
		_skipLineFeed = ( c == '\r' );
		bytes.push_back( c );
	}
	_plainDecoder.feed( bytes.data(), static_cast<int>( bytes.size() ) );
}

void SimpleConsole::SimpleConsoleImpl::write_raw( std::string const& text_ ) {
	if ( text_.empty() ) {
		return;
	}
	try {
		_terminal->write8( text_.data(), static_cast<int>( text_.size() ) );
	} catch ( std::runtime_error const& e ) {
		log_debug( "terminal write failed: %s", e.what() );
	}
}

/* Called with the mutex held. */
Session& SimpleConsole::SimpleConsoleImpl::open_session( ReadLineOptions const& options_ ) {
	session_t session( _sessionPool.rent() );
	session->initialize( _renderer, _linePool, options_ );
	if ( _renderer.update_window_size() ) {
		handle_resize();
	}
	if ( _sessions.empty() ) {
		_renderer.sync_cursor_position();
	} else {
		_renderer.hide_cursor();
		_sessions.back()->finish();
	}
	Session& s( *session );
	_sessions.push_back( std::move( session ) );
	s.prepare();
	_renderer.commit();
	log_debug( "session opened, depth %d", static_cast<int>( _sessions.size() ) );
	return ( s );
}

void SimpleConsole::SimpleConsoleImpl::close_session( Session& session_ ) {
	std::lock_guard<std::mutex> l( _mutex );
	sessions_t::iterator it(
		std::find_if(
			_sessions.begin(), _sessions.end(),
			[&session_]( session_t const& s ) {
				return ( s.get() == &session_ );
			}
		)
	);
	if ( it == _sessions.end() ) {
		return;
	}
	bool wasFocused( ( it + 1 ) == _sessions.end() );
	_renderer.hide_cursor();
	session_.finish();
	_renderer.commit();
	session_t session( std::move( *it ) );
	_sessions.erase( it );
	if ( _sessions.empty() ) {
		_terminal->disable_raw_mode();
	} else if ( wasFocused ) {
		_sessions.back()->set_needs_redraw( true );
	}
	_sessionPool.give_back( std::move( session ) );
	log_debug( "session closed, depth %d", static_cast<int>( _sessions.size() ) );
}

bool SimpleConsole::SimpleConsoleImpl::is_focused( Session const& session_ ) const {
	return ( ! _sessions.empty() && ( _sessions.back().get() == &session_ ) );
}

/*
 * Window size changed: every session rewraps, the focused one repaints now,
 * the others when they get the focus back.
 * Called with the mutex held.
 */
void SimpleConsole::SimpleConsoleImpl::handle_resize( void ) {
	int const count( static_cast<int>( _sessions.size() ) );
	for ( int i( 0 ); i < ( count - 1 ); ++ i ) {
		_sessions[i]->reset_rows();
		_sessions[i]->set_needs_redraw( true );
	}
	if ( count > 0 ) {
		_renderer.hide_cursor();
		_sessions.back()->arrange_window();
		_renderer.commit();
	}
}

/* Called with the mutex held. */
SimpleConsole::SimpleConsoleImpl::NEXT SimpleConsole::SimpleConsoleImpl::next_input( KeyEvent& key_ ) {
	if ( ! _inputQueue.empty() ) {
		Input input( _inputQueue.front() );
		_inputQueue.pop_front();
		if ( input.type == Input::TYPE::TERMINATE ) {
			return ( NEXT::TERMINATE );
		}
		key_ = input.key;
		return ( NEXT::KEY );
	}
	return ( _terminal->read_key( key_ ) ? NEXT::KEY : NEXT::NONE );
}

SimpleConsole::SimpleConsoleImpl::NEXT SimpleConsole::SimpleConsoleImpl::fetch( Session& session_, KeyEvent& key_ ) {
	NEXT next( NEXT::NONE );
	{
		std::lock_guard<std::mutex> l( _mutex );
		next = next_input( key_ );
	}
	return ( next == NEXT::KEY ? filter( session_.options(), key_ ) : next );
}

/*
 * Key hook and Escape handling.
 * The hook runs without the mutex so it can write output or open a nested prompt.
 */
SimpleConsole::SimpleConsoleImpl::NEXT SimpleConsole::SimpleConsoleImpl::filter( ReadLineOptions const& options_, KeyEvent& key_ ) {
	if ( options_.keyInputHook ) {
		KEY_HOOK_RESULT hookResult( options_.keyInputHook( key_ ) );
		if ( hookResult == KEY_HOOK_RESULT::CANCEL ) {
			return ( NEXT::CANCEL );
		}
		if ( hookResult == KEY_HOOK_RESULT::HANDLED ) {
			return ( NEXT::SKIP );
		}
	}
	if ( key_.key == KEY::ESCAPE ) {
		return ( options_.cancelOnEscape ? NEXT::CANCEL : NEXT::SKIP );
	}
	return ( NEXT::KEY );
}

SimpleConsole::ReadLineResult SimpleConsole::SimpleConsoleImpl::edit( Session& session_ ) {
	char16_t batch[MAX_BATCH_SIZE + 1];
	KeyEvent pending;
	bool hasPending( false );
	std::string text;
	while ( true ) {
		if ( _terminated ) {
			return ( ReadLineResult( ReadLineResult::KIND::TERMINATED ) );
		}
		bool focused( false );
		{
			std::lock_guard<std::mutex> l( _mutex );
			focused = is_focused( session_ );
			if ( focused ) {
				if ( _renderer.update_window_size() ) {
					handle_resize();
				} else if ( session_.needs_redraw() ) {
					_renderer.hide_cursor();
					session_.move_to( _renderer.cursor_top() );
					_renderer.commit();
				}
			}
		}
		if ( ! focused ) {
			this_thread::sleep_for( chrono::milliseconds( POLL_INTERVAL_MS ) );
			continue;
		}
		KeyEvent key;
		NEXT next( NEXT::KEY );
		if ( hasPending ) {
			key = pending;
			hasPending = false;
			next = filter( session_.options(), key );
		} else {
			next = fetch( session_, key );
		}
		if ( next == NEXT::TERMINATE ) {
			return ( ReadLineResult( ReadLineResult::KIND::TERMINATED ) );
		} else if ( next == NEXT::CANCEL ) {
			return ( ReadLineResult( ReadLineResult::KIND::CANCELED ) );
		} else if ( next == NEXT::SKIP ) {
			continue;
		} else if ( next == NEXT::NONE ) {
			this_thread::sleep_for( chrono::milliseconds( POLL_INTERVAL_MS ) );
			continue;
		}
		int count( 0 );
		if ( is_text( key ) ) {
			batch[count ++] = key.keyChar;
			/* with a key hook installed every key is processed on its own */
			bool batching( ! session_.options().keyInputHook );
			while ( batching && ( ( count < MAX_BATCH_SIZE ) || ( ( count == MAX_BATCH_SIZE ) && is_high_surrogate( batch[count - 1] ) ) ) ) {
				KeyEvent more;
				NEXT n( NEXT::NONE );
				{
					std::lock_guard<std::mutex> l( _mutex );
					n = next_input( more );
				}
				if ( n == NEXT::TERMINATE ) {
					return ( ReadLineResult( ReadLineResult::KIND::TERMINATED ) );
				} else if ( n == NEXT::NONE ) {
					break;
				}
				if ( ! is_text( more ) ) {
					pending = more;
					hasPending = true;
					break;
				}
				batch[count ++] = more.keyChar;
			}
		}
		bool submitted( false );
		{
			std::lock_guard<std::mutex> l( _mutex );
			_renderer.hide_cursor();
			if ( session_.needs_redraw() ) {
				session_.move_to( _renderer.cursor_top() );
			}
			submitted = session_.process_input( key, count > 0 ? batch : nullptr, count, text );
			_renderer.commit();
		}
		if ( ! submitted ) {
			continue;
		}
		ReadLineOptions const& options( session_.options() );
		if ( options.textInputHook && ! options.textInputHook( text ) ) {
			log_debug( "text input hook rejected input" );
			std::lock_guard<std::mutex> l( _mutex );
			_renderer.hide_cursor();
			if ( session_.needs_redraw() ) {
				session_.move_to( _renderer.cursor_top() );
			}
			session_.reset();
			_renderer.commit();
			continue;
		}
		return ( ReadLineResult( ReadLineResult::KIND::SUCCESS, text ) );
	}
}

/*
 * Output above in-progress input, the edit region is repainted below it.
 */
void SimpleConsole::SimpleConsoleImpl::write_line( std::string const& text_ ) {
	std::lock_guard<std::mutex> l( _mutex );
	if ( _sessions.empty() ) {
		write_raw( text_ + "\n" );
		return;
	}
	Session& session( *_sessions.back() );
	_renderer.hide_cursor();
	_renderer.set_cursor_position( 0, std::max( 0, session.top() ) );
	_renderer.write_text( text_ );
	session.move_to( _renderer.cursor_top() );
	_renderer.commit();
}

bool SimpleConsole::SimpleConsoleImpl::emulate_key_press( KeyEvent const& key_ ) {
	std::lock_guard<std::mutex> l( _mutex );
	if ( static_cast<int>( _inputQueue.size() ) >= INPUT_QUEUE_CAPACITY ) {
		return ( false );
	}
	_inputQueue.emplace_back( Input::TYPE::KEY, key_ );
	return ( true );
}

/*
 * Line breaks become Enter, `\r\n` counts as one.
 */
bool SimpleConsole::SimpleConsoleImpl::enqueue_input( std::string const& text_ ) {
	UnicodeString text( text_ );
	std::vector<KeyEvent> keys;
	int const len( text.length() );
	for ( int i( 0 ); i < len; ++ i ) {
		char16_t c( text[i] );
		if ( c == u'\r' ) {
			if ( ( ( i + 1 ) < len ) && ( text[i + 1] == u'\n' ) ) {
				++ i;
			}
			keys.emplace_back( KEY::ENTER );
		} else if ( c == u'\n' ) {
			keys.emplace_back( KEY::ENTER );
		} else if ( c == u'\t' ) {
			keys.emplace_back( KEY::TAB );
		} else if ( c >= 0x20 ) {
			keys.push_back( KeyEvent::character( c ) );
		}
	}
	std::lock_guard<std::mutex> l( _mutex );
	if ( ( _inputQueue.size() + keys.size() ) > static_cast<size_t>( INPUT_QUEUE_CAPACITY ) ) {
		return ( false );
	}
	for ( KeyEvent const& key : keys ) {
		_inputQueue.emplace_back( Input::TYPE::KEY, key );
	}
	return ( true );
}

bool SimpleConsole::SimpleConsoleImpl::enqueue_termination( void ) {
	std::lock_guard<std::mutex> l( _mutex );
	if ( static_cast<int>( _inputQueue.size() ) >= INPUT_QUEUE_CAPACITY ) {
		return ( false );
	}
	_inputQueue.emplace_back( Input::TYPE::TERMINATE );
	return ( true );
}

void SimpleConsole::SimpleConsoleImpl::terminate( void ) {
	_terminated = true;
}

bool SimpleConsole::SimpleConsoleImpl::is_terminated( void ) const {
	return ( _terminated );
}

bool SimpleConsole::SimpleConsoleImpl::is_read_line_in_progress( void ) const {
	std::lock_guard<std::mutex> l( _mutex );
	return ( ! _sessions.empty() );
}

void SimpleConsole::SimpleConsoleImpl::set_default_options( ReadLineOptions const& options_ ) {
	std::lock_guard<std::mutex> l( _mutex );
	_defaultOptions = options_;
}

}

