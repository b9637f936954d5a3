#include <iostream>
#include "indentproc/indentproc.hpp"

#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

int main(int argc, char * argv[])
{
    Catch::Session session; // There must be exactly once instance

    // writing to session.configData() here sets defaults
    // this is the preferred way to set them

    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) // Indicates a command line error
        return returnCode;

    // Trace output from one test must not leak into the console or into
    // another test's captured stream.
    indentproc::Trace::setStream(nullptr);

    return session.run();
}
