#include "quire/quire.hpp"
#include "boost/filesystem/operations.hpp"
#include <iostream>

int main(void)
{
    try
    {
        //[store_example

        quire::filesystem::path root(quire::filesystem::temp_directory_path()/"quire-store-example");
        quire::store notes(root, quire::store_flags::create|quire::store_flags::os_lockable);

        // A checkout is exclusive and writes back when it goes out of scope
        {
            auto entry = notes.create("diary/2019/05/01");
            entry.header().set("title", "x");
            entry.set_content("hello");
        }
        {
            auto entry = notes.retrieve("diary/2019/05/01");
            entry.set_content(entry.content() + ", again");
            // A second checkout of the same record is refused until this one ends
            try
            {
                notes.retrieve("diary/2019/05/01");
            }
            catch(const quire::store_error &e)
            {
                std::cout << "Refused: " << e.what() << std::endl;
            }
        }

        // Iteration is lazy, and a bad entry is an item rather than the end
        for(auto &i : notes.entries("diary").into_retrieve_iter(notes))
        {
            if(i.has_value())
                std::cout << i.value().id() << ": " << i.value().content() << std::endl;
            else
                std::cout << "Skipped a bad entry" << std::endl;
        }

        for(auto &i : notes.entries().into_delete_iter(notes))
            std::cout << "Deleted " << i.value() << std::endl;
        //]
    }
    catch(const std::exception &e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
