/* quire.hpp
The entry store engine of the quire personal information suite
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_HPP
#define QUIRE_HPP

/*! \file quire.hpp
\brief Includes everything needed to open a store and work with its records

Define QUIRE_HEADERS_ONLY to 0 and link against the quire library to avoid compiling
the implementation into every translation unit.
*/

#include "config.hpp"
#include "error.hpp"
#include "store_id.hpp"
#include "header.hpp"
#include "record.hpp"
#include "backend.hpp"
#include "entry_cache.hpp"
#include "iteration.hpp"
#include "store.hpp"

#endif
