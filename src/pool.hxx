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


#ifndef SIMPLEPROMPT_POOL_HXX_INCLUDED
#define SIMPLEPROMPT_POOL_HXX_INCLUDED 1

#include <memory>
#include <vector>

namespace simpleprompt {

/*
 * Free list of reusable objects.
 * T must be default constructible and provide release() that drops its state.
 */
template<typename T>
class Pool {
public:
	typedef std::unique_ptr<T> item_t;
	typedef std::vector<item_t> items_t;
private:
	items_t _free;
	int _maxFree;
public:
	explicit Pool( int maxFree_ = 32 )
		: _free()
		, _maxFree( maxFree_ ) {
	}
	item_t rent( void ) {
		if ( _free.empty() ) {
			return ( item_t( new T() ) );
		}
		item_t item( std::move( _free.back() ) );
		_free.pop_back();
		return ( item );
	}
	void give_back( item_t&& item_ ) {
		if ( ! item_ ) {
			return;
		}
		item_->release();
		if ( static_cast<int>( _free.size() ) < _maxFree ) {
			_free.push_back( std::move( item_ ) );
		} else {
			item_.reset();
		}
	}
private:
	Pool( Pool const& ) = delete;
	Pool& operator = ( Pool const& ) = delete;
};

}

#endif
