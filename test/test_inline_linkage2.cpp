#include "quire/quire.hpp"
#include <iostream>

void test_inline_linkage2()
{
    using namespace quire;
    std::cout << "\n\nTesting a headers-only store from a second translation unit:\n";
    auto b = make_inmemory_backend();
    store s("/linkage2", store_flags::create, b);
    {
        auto c = s.create("notes/second");
        c.header().set("title", "from the second unit");
        c.set_content("hello");
    }
    for(auto &i : s.entries("notes"))
        std::cout << "  " << i.value() << std::endl;
}
