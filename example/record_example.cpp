#include "quire/quire.hpp"
#include <iostream>

int main(void)
{
    try
    {
        //[record_example

        // A record is a TOML header between two --- lines, then free text
        quire::record r(quire::record::from_bytes("contacts/jo",
            "---\n"
            "name = \"Jo\"\n"
            "tags = [\"work\", \"friend\"]\n"
            "---\n"
            "Met at the conference."));
        std::cout << r.header().read("name")->as<std::string>() << ": " << r.content() << std::endl;

        // Header values are addressed by dotted paths, with tables created on demand
        r.header().set("phone.mobile", "+44 0000 000000");
        r.tag_module("contacts");

        // Serialises canonically, with the store's own [quire] table last
        std::cout << r.to_bytes() << std::endl;
        //]
    }
    catch(const std::exception &e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
