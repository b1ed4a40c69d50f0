// The only translation unit that provides the doctest implementation and main()
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

int main(int argc, char** argv) {
    doctest::Context context;

    // Deterministic order; command-line flags override these defaults
    context.setOption("order-by", "name");
    context.setOption("duration", true);
    context.applyCommandLine(argc, argv);

    return context.run();
}
