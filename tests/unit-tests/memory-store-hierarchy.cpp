#include "memory.store.hh"
#include "volume.store.checks.hh"

int
main()
{
    int retval = 0;

    try {
        dvid::mock::MemoryStore store;
        check_store_hierarchy(store);
        check_store_regions(store);
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
