#include "common.hh"
#include "selector.hh"
#include "stubs.hh"

using namespace forsale;

int main() {
    auto answer = signed_answer({
        "v=spf1 -all",
        "v=FORSALE1;{\"price\":\"USD:100\"}",
        "V=FORSALE1;{}",
        " v=FORSALE1;{}",
        "v=FORSALE1;",
        "v=FORSALE2;{}",
    });

    auto candidates = select(answer);
    ASSERT(candidates.size() == 2);
    ASSERT(candidates[0].content == "v=FORSALE1;{\"price\":\"USD:100\"}");
    ASSERT(candidates[0].version_tag == VERSION_TAG);
    ASSERT(candidates[0].source_ttl == 300);
    ASSERT(candidates[1].content == "v=FORSALE1;");

    ASSERT(select(signed_answer({})).empty());
    return EXIT_SUCCESS;
}
