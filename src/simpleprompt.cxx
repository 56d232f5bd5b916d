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
#include <cstdarg>
#include <cstdio>

#include "simpleprompt.hxx"
#include "console_impl.hxx"

using namespace std;

namespace simpleprompt {

namespace {

void delete_SimpleConsoleImpl( SimpleConsole::SimpleConsoleImpl* impl_ ) {
	delete impl_;
}

}

SimpleConsole::ReadLineOptions::ReadLineOptions( void )
	: inputColor( Color::YELLOW )
	, maxInputLength( 64 * 1024 )
	, prompt( "> " )
	, multilinePrompt( "# " )
	, multilineDelimiter( "\"\"\"" )
	, lineContinuation( 0 )
	, cancelOnEscape( false )
	, allowEmptyLineInput( false )
	, maskingCharacter( 0 )
	, keyInputHook()
	, textInputHook() {
}

SimpleConsole::ReadLineOptions SimpleConsole::ReadLineOptions::single_line( void ) {
	ReadLineOptions options;
	options.multilineDelimiter.clear();
	options.lineContinuation = 0;
	return ( options );
}

SimpleConsole::ReadLineOptions SimpleConsole::ReadLineOptions::multi_line( void ) {
	ReadLineOptions options;
	options.lineContinuation = U'\\';
	return ( options );
}

SimpleConsole::SimpleConsole( void )
	: _impl( new SimpleConsoleImpl( SimpleConsoleImpl::terminal_t( new Terminal() ) ), delete_SimpleConsoleImpl ) {
}

SimpleConsole::ReadLineResult SimpleConsole::read_line( ReadLineOptions const& options_ ) {
	return ( _impl->read_line( options_ ) );
}

SimpleConsole::ReadLineResult SimpleConsole::read_line( std::string const& prompt_ ) {
	return ( _impl->read_line( prompt_ ) );
}

void SimpleConsole::write_line( std::string const& text_ ) {
	_impl->write_line( text_ );
}

void SimpleConsole::print( char const* format_, ... ) {
	::std::va_list ap;
	va_start( ap, format_ );
	int size = vsnprintf( nullptr, 0, format_, ap );
	va_end( ap );
	if ( size < 0 ) {
		return;
	}
	va_start( ap, format_ );
	unique_ptr<char[]> buf( new char[size + 1] );
	vsnprintf( buf.get(), static_cast<size_t>( size + 1 ), format_, ap );
	va_end( ap );
	std::string text( buf.get(), static_cast<size_t>( size ) );
	if ( ! text.empty() && ( text.back() == '\n' ) ) {
		text.pop_back();
	}
	_impl->write_line( text );
}

bool SimpleConsole::emulate_key_press( KeyEvent const& key_ ) {
	return ( _impl->emulate_key_press( key_ ) );
}

bool SimpleConsole::enqueue_input( std::string const& text_ ) {
	return ( _impl->enqueue_input( text_ ) );
}

bool SimpleConsole::enqueue_termination( void ) {
	return ( _impl->enqueue_termination() );
}

void SimpleConsole::terminate( void ) {
	_impl->terminate();
}

bool SimpleConsole::is_terminated( void ) const {
	return ( _impl->is_terminated() );
}

bool SimpleConsole::is_read_line_in_progress( void ) const {
	return ( _impl->is_read_line_in_progress() );
}

void SimpleConsole::set_default_options( ReadLineOptions const& options_ ) {
	_impl->set_default_options( options_ );
}

}

