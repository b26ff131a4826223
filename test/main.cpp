/* main.cpp
The quire unit test runner
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#define BOOST_TEST_MODULE quire
#include "boost/test/unit_test.hpp"
