#include "quire/quire.hpp"
#include "boost/filesystem/operations.hpp"
#include <iostream>

int main(void)
{
    try
    {
        //[backend_example
        namespace filesystem = quire::filesystem;

        // Backends operate on full paths and cache nothing
        quire::backend_ptr backend(quire::make_filesystem_backend(true));
        filesystem::path root(filesystem::temp_directory_path()/filesystem::unique_path("quire-example-%%%%-%%%%"));
        backend->open_root(root, true);

        // Writes replace the old file atomically, creating directories as needed
        backend->write(root/"diary"/"today", "Wrote an example.");
        std::cout << backend->read(root/"diary"/"today") << std::endl;

        // Listing yields record files only, never lock or temporary files
        std::unique_ptr<quire::path_enumerator> files(backend->list(root));
        filesystem::path p;
        while(files->next(p))
            std::cout << "  " << p << std::endl;

        // Failures name the path and keep the operating system's error
        try
        {
            backend->read(root/"missing");
        }
        catch(const quire::store_error &e)
        {
            std::cout << e.what() << " (" << e.cause().message() << ")" << std::endl;
        }
        backend->remove(root/"diary"/"today");
        //]
        filesystem::remove_all(root);
    }
    catch(const std::exception &e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
