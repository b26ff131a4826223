#include "quire/quire.hpp"
#include <iostream>

extern void test_inline_linkage2();

// Links two translation units which both include every header of the headers-only build
int main(void)
{
    using namespace quire;
    try
    {
        test_inline_linkage2();
        auto b = make_inmemory_backend();
        store s("/linkage1", store_flags::create, b);
        {
            auto c = s.create("notes/first");
            c.set_content("hello");
        }
        if("hello" != s.retrieve("notes/first").content())
        {
            std::cerr << "Record did not round trip" << std::endl;
            return 1;
        }
        std::cout << "Inline linkage works" << std::endl;
        return 0;
    }
    catch(const std::exception &e)
    {
        std::cerr << "FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
