/* quire.cpp
Compiles the quire implementation into a library
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#define QUIRE_SOURCE
#undef QUIRE_HEADERS_ONLY
#define QUIRE_HEADERS_ONLY 0

#include "../../../include/quire/quire.hpp"

#include "../../../include/quire/detail/impl/ErrorHandling.ipp"
#include "../../../include/quire/detail/impl/store_id.ipp"
#include "../../../include/quire/detail/impl/header.ipp"
#include "../../../include/quire/detail/impl/record.ipp"
#include "../../../include/quire/detail/impl/backend.ipp"
#include "../../../include/quire/detail/impl/entry_cache.ipp"
#include "../../../include/quire/detail/impl/store.ipp"
#include "../../../include/quire/detail/impl/iteration.ipp"
